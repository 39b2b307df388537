#include "nanocloud/server/merger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

#include "nanocloud/server/chunk_store.hpp"
#include "nanocloud/server/permissions.hpp"
#include "nanocloud/server/storage_error.hpp"
#include "nanocloud/server/storage_info.hpp"

namespace nanocloud::server
{

    namespace
    {
        struct FileCloser
        {
            void operator()(std::FILE *file) const noexcept
            {
                if (file)
                {
                    std::fclose(file);
                }
            }
        };

        using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

        MergeOutcome failure(nanocloud::ErrorCode code, std::string message)
        {
            return MergeOutcome{.error = code, .message = std::move(message)};
        }

        MergeOutcome failure(nanocloud::ErrorCode code)
        {
            return failure(code, std::string(nanocloud::user_message(code)));
        }

        void discard(const std::filesystem::path &path)
        {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            if (ec)
            {
                spdlog::error("Cannot remove incomplete file {}: {}", path.string(), ec.message());
            }
        }

    } // namespace

    Merger::Merger(ChunkStore &store, const PermissionPolicy &permissions, const StorageInfoProvider &storage,
                   std::size_t buffer_size)
        : store_(store), permissions_(permissions), storage_(storage), buffer_size_(buffer_size == 0 ? kDefaultBufferSize : buffer_size) {}

    MergeOutcome Merger::merge(const MergeRequest &request) const
    {
        const auto present = store_.present_indices(request.upload_id);
        for (std::uint64_t index = 0; index < request.total_chunks; ++index)
        {
            if (!present.contains(index))
            {
                return failure(nanocloud::ErrorCode::MissingChunks,
                               "Upload incomplete: chunk " + std::to_string(index) + " of " +
                                   std::to_string(request.total_chunks) + " is missing.");
            }
        }
        if (present.size() != request.total_chunks)
        {
            return failure(nanocloud::ErrorCode::MissingChunks,
                           "Upload has chunks beyond its declared count; start the upload over.");
        }

        std::uint64_t staged_bytes = 0;
        for (std::uint64_t index = 0; index < request.total_chunks; ++index)
        {
            const auto size = store_.chunk_size(request.upload_id, index);
            if (!size)
            {
                return failure(nanocloud::ErrorCode::MissingChunks,
                               "Upload incomplete: chunk " + std::to_string(index) + " disappeared.");
            }
            staged_bytes += *size;
        }
        if (staged_bytes > request.max_file_bytes)
        {
            return failure(nanocloud::ErrorCode::FileTooLarge);
        }
        if (staged_bytes > request.quota_remaining)
        {
            return failure(nanocloud::ErrorCode::SessionQuotaExceeded);
        }

        const auto &destination = request.destination.absolute();
        if (!storage_.has_room_for(destination.parent_path(), staged_bytes))
        {
            return failure(nanocloud::ErrorCode::InsufficientSpace);
        }

        // "x" makes creation exclusive: a file that already exists, including
        // one a concurrent merge just created, is never opened.
        FilePtr out(std::fopen(destination.c_str(), "wbx"));
        if (!out)
        {
            const auto err = errno;
            if (err == EEXIST)
            {
                return failure(nanocloud::ErrorCode::AlreadyExists);
            }
            spdlog::error("Cannot create {}: {}", destination.string(), std::strerror(err));
            return failure(nanocloud::ErrorCode::IoError, "Failed to create the destination file.");
        }

        std::vector<char> buffer(buffer_size_);
        for (std::uint64_t index = 0; index < request.total_chunks; ++index)
        {
            std::unique_ptr<std::istream> in;
            try
            {
                in = store_.open_chunk(request.upload_id, index);
            }
            catch (const StorageError &ex)
            {
                spdlog::error("Merge of {} failed: {}", request.upload_id, ex.what());
                out.reset();
                discard(destination);
                return failure(ex.code());
            }
            while (*in)
            {
                in->read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                const auto got = static_cast<std::size_t>(in->gcount());
                if (got == 0)
                {
                    break;
                }
                if (std::fwrite(buffer.data(), 1, got, out.get()) != got)
                {
                    spdlog::error("Short write while merging into {}: {}", destination.string(), std::strerror(errno));
                    out.reset();
                    discard(destination);
                    return failure(nanocloud::ErrorCode::IoError, "Failed to write the merged file.");
                }
            }
            if (in->bad())
            {
                spdlog::error("Cannot read chunk {} of {}", index, request.upload_id);
                out.reset();
                discard(destination);
                return failure(nanocloud::ErrorCode::IoError, "Failed to read a stored chunk.");
            }
        }
        if (std::fclose(out.release()) != 0)
        {
            spdlog::error("Cannot finish {}: {}", destination.string(), std::strerror(errno));
            discard(destination);
            return failure(nanocloud::ErrorCode::IoError, "Failed to write the merged file.");
        }

        std::error_code ec;
        const auto written = std::filesystem::file_size(destination, ec);
        const auto expected = request.expected_size.value_or(staged_bytes);
        if (ec || written != expected)
        {
            spdlog::warn("Size mismatch merging {}: wrote {} bytes, expected {}", request.upload_id,
                         ec ? 0 : written, expected);
            discard(destination);
            return failure(nanocloud::ErrorCode::SizeMismatch,
                           "File size mismatch after merge; start the upload over.");
        }

        permissions_.apply_to_file(destination);

        // Only a verified destination lets the chunks go.
        if (store_.remove_session(request.upload_id) == RemovalStatus::Failed)
        {
            spdlog::warn("Merged {} but its chunks could not be removed; the sweeper will retry",
                         request.upload_id);
        }
        return MergeOutcome{.message = "File uploaded successfully.", .final_size = static_cast<std::uint64_t>(written)};
    }

} // namespace nanocloud::server
