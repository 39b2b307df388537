#include "nanocloud/error_codes.hpp"

#include <array>

namespace nanocloud
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view label;
            std::string_view message;
        };

        constexpr std::array<ErrorCodeDescription, 17> kDescriptions{{
            {ErrorCode::Ok, "ok", "OK."},
            {ErrorCode::InvalidRequest, "invalid_request", "Invalid request."},
            {ErrorCode::InvalidUploadId, "invalid_upload_id", "Invalid upload ID."},
            {ErrorCode::InvalidName, "invalid_name", "Invalid filename or path."},
            {ErrorCode::NotFound, "not_found", "Target path not found."},
            {ErrorCode::OutsideRoot, "outside_root", "Invalid path."},
            {ErrorCode::AlreadyExists, "already_exists", "A file with the same name already exists."},
            {ErrorCode::OperationDisabled, "operation_disabled", "Operation not allowed."},
            {ErrorCode::FileTooLarge, "file_too_large", "File exceeds the maximum allowed size."},
            {ErrorCode::SessionQuotaExceeded, "session_quota_exceeded", "Per-session upload limit exceeded."},
            {ErrorCode::InsufficientSpace, "insufficient_space", "Insufficient disk space on server."},
            {ErrorCode::IoError, "io_error", "Failed to write file to disk."},
            {ErrorCode::MissingChunks, "missing_chunks", "Upload incomplete: chunks are still missing."},
            {ErrorCode::SizeMismatch, "size_mismatch", "File size mismatch after merge; start the upload over."},
            {ErrorCode::Aborted, "aborted", "Upload aborted by client; rolled back."},
            {ErrorCode::Unsupported, "unsupported", "Unsupported request."},
            {ErrorCode::InternalError, "internal_error", "Internal server error."},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.label;
            }
        }
        return "unknown";
    }

    std::string_view user_message(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.message;
            }
        }
        return "Unknown error.";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

} // namespace nanocloud
