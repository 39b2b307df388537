/**
 * NanoCloud - Shared error codes used across client and server layers.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace nanocloud
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidRequest = 1,
        InvalidUploadId = 2,
        InvalidName = 3,
        NotFound = 4,
        OutsideRoot = 5,
        AlreadyExists = 6,
        OperationDisabled = 7,
        FileTooLarge = 8,
        SessionQuotaExceeded = 9,
        InsufficientSpace = 10,
        IoError = 11,
        MissingChunks = 12,
        SizeMismatch = 13,
        Aborted = 14,
        Unsupported = 15,
        InternalError = 16
    };

    std::string_view to_string(ErrorCode code) noexcept;

    // Generic text safe to show to a client; never contains paths.
    std::string_view user_message(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

} // namespace nanocloud
