#include "nanocloud/server/small_file_uploader.hpp"

#include <fstream>
#include <random>
#include <sstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include "nanocloud/server/config.hpp"
#include "nanocloud/server/disconnect_signal.hpp"
#include "nanocloud/server/name_sanitizer.hpp"
#include "nanocloud/server/permissions.hpp"
#include "nanocloud/server/quota_ledger.hpp"
#include "nanocloud/server/storage_error.hpp"
#include "nanocloud/server/storage_info.hpp"

namespace nanocloud::server
{

    namespace
    {
        std::filesystem::path temp_path_for(const std::filesystem::path &destination)
        {
            thread_local std::mt19937_64 rng{std::random_device{}()};
            std::uniform_int_distribution<std::uint64_t> dist;
            std::ostringstream name;
            name << '.' << destination.filename().string() << '.' << std::hex << dist(rng) << ".part";
            return destination.parent_path() / name.str();
        }

        void remove_quietly(const std::filesystem::path &path)
        {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            if (ec)
            {
                spdlog::warn("Cannot remove {}: {}", path.string(), ec.message());
            }
        }

        // Publishes temp as destination without ever replacing an existing
        // file. Returns Ok, AlreadyExists or IoError.
        nanocloud::ErrorCode publish(const std::filesystem::path &temp, const std::filesystem::path &destination)
        {
            std::error_code ec;
            std::filesystem::create_hard_link(temp, destination, ec);
            if (!ec)
            {
                remove_quietly(temp);
                return nanocloud::ErrorCode::Ok;
            }
            if (ec == std::errc::file_exists)
            {
                return nanocloud::ErrorCode::AlreadyExists;
            }

            // Filesystems without hard links get a check-then-rename instead.
            spdlog::debug("Hard link unavailable for {} ({}); renaming", destination.string(), ec.message());
            if (std::filesystem::exists(destination, ec))
            {
                return nanocloud::ErrorCode::AlreadyExists;
            }
            std::filesystem::rename(temp, destination, ec);
            if (ec)
            {
                spdlog::error("Cannot publish {}: {}", destination.string(), ec.message());
                return nanocloud::ErrorCode::IoError;
            }
            return nanocloud::ErrorCode::Ok;
        }

    } // namespace

    SmallFileUploader::SmallFileUploader(UploadContext context) : context_(context) {}

    nanocloud::protocol::UploadResult SmallFileUploader::upload(const PathHandle &target_dir, const SmallFile &file,
                                                                UploadQuota &quota,
                                                                const DisconnectSignal &signal) const
    {
        nanocloud::protocol::UploadResult result{
            .original_name = file.relative_path.empty() ? file.original_name : file.relative_path,
        };
        auto fail = [&result](nanocloud::ErrorCode code)
        {
            result.success = false;
            result.message = std::string(nanocloud::user_message(code));
            return result;
        };

        const auto size = static_cast<std::uint64_t>(file.data.size());
        if (size > context_.config.max_file_bytes)
        {
            return fail(nanocloud::ErrorCode::FileTooLarge);
        }
        if (!quota.allows(size))
        {
            return fail(nanocloud::ErrorCode::SessionQuotaExceeded);
        }

        result.sanitized_name =
            sanitize_upload_name(file.relative_path, file.original_name, EmptyNamePolicy::TimestampDefault);
        if (result.sanitized_name.empty())
        {
            return fail(nanocloud::ErrorCode::InvalidName);
        }

        std::filesystem::path temp;
        try
        {
            const auto destination =
                context_.resolver.prepare_destination(target_dir, result.sanitized_name, context_.permissions);
            const auto &final_path = destination.absolute();

            std::error_code ec;
            if (std::filesystem::exists(final_path, ec))
            {
                return fail(nanocloud::ErrorCode::AlreadyExists);
            }
            if (!context_.storage.has_room_for(final_path.parent_path(), size))
            {
                return fail(nanocloud::ErrorCode::InsufficientSpace);
            }

            temp = temp_path_for(final_path);
            {
                std::ofstream out(temp, std::ios::binary | std::ios::trunc);
                out.write(file.data.data(), static_cast<std::streamsize>(file.data.size()));
                out.flush();
                if (!out)
                {
                    out.close();
                    remove_quietly(temp);
                    spdlog::error("Short write to {}", temp.string());
                    return fail(nanocloud::ErrorCode::IoError);
                }
            }

            if (signal.aborted())
            {
                remove_quietly(temp);
                spdlog::info("Client disconnected before '{}' was stored; temp file discarded",
                             destination.relative());
                return fail(nanocloud::ErrorCode::Aborted);
            }

            const auto published = publish(temp, final_path);
            if (published != nanocloud::ErrorCode::Ok)
            {
                remove_quietly(temp);
                return fail(published);
            }

            context_.permissions.apply_to_file(final_path);
            quota.charge(size);
            spdlog::info("Stored '{}' ({} bytes)", destination.relative(), size);
        }
        catch (const StorageError &ex)
        {
            spdlog::warn("Upload of '{}' rejected: {}", result.original_name, ex.what());
            if (!temp.empty())
            {
                remove_quietly(temp);
            }
            return fail(ex.code());
        }

        result.success = true;
        result.message = "File uploaded successfully.";
        result.size = size;
        return result;
    }

} // namespace nanocloud::server
