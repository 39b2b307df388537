#include "nanocloud/server/chunk_store.hpp"

#include <charconv>
#include <fstream>
#include <random>
#include <sstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include "nanocloud/server/storage_error.hpp"
#include "nanocloud/upload_identity.hpp"

namespace nanocloud::server
{

    namespace
    {
        constexpr auto kChunksDir = "chunks";
        constexpr std::string_view kChunkSuffix = ".part";

        std::string random_suffix()
        {
            thread_local std::mt19937_64 rng{std::random_device{}()};
            std::uniform_int_distribution<std::uint64_t> dist;
            std::ostringstream oss;
            oss << std::hex << dist(rng);
            return oss.str();
        }

        // "<digits>.part" -> index; anything else (temp files, strays) -> nullopt.
        std::optional<std::uint64_t> parse_chunk_name(std::string_view name)
        {
            if (!name.ends_with(kChunkSuffix))
            {
                return std::nullopt;
            }
            name.remove_suffix(kChunkSuffix.size());
            if (name.empty())
            {
                return std::nullopt;
            }
            std::uint64_t value{};
            const auto *end = name.data() + name.size();
            const auto [ptr, ec] = std::from_chars(name.data(), end, value);
            if (ec != std::errc{} || ptr != end)
            {
                return std::nullopt;
            }
            return value;
        }

    } // namespace

    FilesystemChunkStore::FilesystemChunkStore(const std::filesystem::path &chunk_root)
        : root_(chunk_root / kChunksDir)
    {
        std::filesystem::create_directories(root_);
    }

    std::filesystem::path FilesystemChunkStore::session_dir(std::string_view upload_id) const
    {
        if (!nanocloud::is_valid_upload_id(upload_id))
        {
            throw StorageError(nanocloud::ErrorCode::InvalidUploadId, "Rejected upload id");
        }
        return root_ / std::string(upload_id);
    }

    std::filesystem::path FilesystemChunkStore::chunk_path(std::string_view upload_id, std::uint64_t index) const
    {
        return session_dir(upload_id) / (std::to_string(index) + std::string(kChunkSuffix));
    }

    void FilesystemChunkStore::write_chunk(std::string_view upload_id, std::uint64_t index, std::string_view bytes)
    {
        const auto dir = session_dir(upload_id);
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            throw StorageError(nanocloud::ErrorCode::IoError, "Cannot create " + dir.string() + ": " + ec.message());
        }

        const auto final_path = chunk_path(upload_id, index);
        auto temp_path = final_path;
        temp_path += ".tmp-" + random_suffix();
        {
            std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
            out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            out.flush();
            if (!out)
            {
                out.close();
                std::filesystem::remove(temp_path, ec);
                throw StorageError(nanocloud::ErrorCode::IoError, "Short write to " + temp_path.string());
            }
        }
        // rename() replaces a previous copy of the same index in one step.
        std::filesystem::rename(temp_path, final_path, ec);
        if (ec)
        {
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            throw StorageError(nanocloud::ErrorCode::IoError,
                               "Cannot store " + final_path.string() + ": " + ec.message());
        }
    }

    std::set<std::uint64_t> FilesystemChunkStore::present_indices(std::string_view upload_id) const
    {
        std::set<std::uint64_t> indices;
        const auto dir = session_dir(upload_id);
        std::error_code ec;
        for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
        {
            if (!it->is_regular_file(ec))
            {
                continue;
            }
            if (const auto index = parse_chunk_name(it->path().filename().string()))
            {
                indices.insert(*index);
            }
        }
        return indices;
    }

    bool FilesystemChunkStore::has_session(std::string_view upload_id) const
    {
        std::error_code ec;
        return std::filesystem::is_directory(session_dir(upload_id), ec);
    }

    std::optional<std::uint64_t> FilesystemChunkStore::chunk_size(std::string_view upload_id, std::uint64_t index) const
    {
        std::error_code ec;
        const auto size = std::filesystem::file_size(chunk_path(upload_id, index), ec);
        if (ec)
        {
            return std::nullopt;
        }
        return static_cast<std::uint64_t>(size);
    }

    std::unique_ptr<std::istream> FilesystemChunkStore::open_chunk(std::string_view upload_id, std::uint64_t index) const
    {
        const auto path = chunk_path(upload_id, index);
        auto stream = std::make_unique<std::ifstream>(path, std::ios::binary);
        if (!stream->is_open())
        {
            throw StorageError(nanocloud::ErrorCode::MissingChunks, "Cannot open " + path.string());
        }
        return stream;
    }

    RemovalStatus FilesystemChunkStore::remove_session(std::string_view upload_id)
    {
        const auto dir = session_dir(upload_id);
        std::error_code ec;
        const auto removed = std::filesystem::remove_all(dir, ec);
        if (ec)
        {
            spdlog::error("Failed to remove chunk session {}: {}", dir.string(), ec.message());
            return RemovalStatus::Failed;
        }
        return removed == 0 ? RemovalStatus::Absent : RemovalStatus::Removed;
    }

    std::optional<std::filesystem::file_time_type> FilesystemChunkStore::last_modified(std::string_view upload_id) const
    {
        const auto dir = session_dir(upload_id);
        std::error_code ec;
        auto newest = std::filesystem::last_write_time(dir, ec);
        if (ec)
        {
            return std::nullopt;
        }
        for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
        {
            std::error_code entry_ec;
            const auto stamp = it->last_write_time(entry_ec);
            if (!entry_ec && stamp > newest)
            {
                newest = stamp;
            }
        }
        return newest;
    }

    std::vector<std::string> FilesystemChunkStore::list_sessions() const
    {
        std::vector<std::string> sessions;
        std::error_code ec;
        for (std::filesystem::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec))
        {
            auto name = it->path().filename().string();
            if (it->is_directory(ec) && nanocloud::is_valid_upload_id(name))
            {
                sessions.push_back(std::move(name));
            }
        }
        return sessions;
    }

} // namespace nanocloud::server
