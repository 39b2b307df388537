#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace nanocloud::server
{

    enum class RemovalStatus
    {
        Removed,
        Absent,
        Failed
    };

    // Staging area for the chunks of in-flight uploads, keyed by upload id.
    // Every method that takes an id throws StorageError(InvalidUploadId) for
    // ids outside [A-Za-z0-9-]{1,128}.
    class ChunkStore
    {
    public:
        virtual ~ChunkStore() = default;

        // Stores chunk `index`, replacing any earlier copy. Throws
        // StorageError(IoError) when the bytes cannot be persisted.
        virtual void write_chunk(std::string_view upload_id, std::uint64_t index, std::string_view bytes) = 0;

        virtual std::set<std::uint64_t> present_indices(std::string_view upload_id) const = 0;

        virtual bool has_session(std::string_view upload_id) const = 0;

        // Size of a stored chunk, or nullopt when it is missing.
        virtual std::optional<std::uint64_t> chunk_size(std::string_view upload_id, std::uint64_t index) const = 0;

        virtual std::unique_ptr<std::istream> open_chunk(std::string_view upload_id, std::uint64_t index) const = 0;

        virtual RemovalStatus remove_session(std::string_view upload_id) = 0;

        // Newest modification time over the session and its chunks.
        virtual std::optional<std::filesystem::file_time_type> last_modified(std::string_view upload_id) const = 0;

        virtual std::vector<std::string> list_sessions() const = 0;
    };

    // Layout: <chunk_root>/chunks/<upload_id>/<index>.part
    class FilesystemChunkStore : public ChunkStore
    {
    public:
        explicit FilesystemChunkStore(const std::filesystem::path &chunk_root);

        const std::filesystem::path &root() const noexcept { return root_; }

        std::filesystem::path session_dir(std::string_view upload_id) const;
        std::filesystem::path chunk_path(std::string_view upload_id, std::uint64_t index) const;

        void write_chunk(std::string_view upload_id, std::uint64_t index, std::string_view bytes) override;
        std::set<std::uint64_t> present_indices(std::string_view upload_id) const override;
        bool has_session(std::string_view upload_id) const override;
        std::optional<std::uint64_t> chunk_size(std::string_view upload_id, std::uint64_t index) const override;
        std::unique_ptr<std::istream> open_chunk(std::string_view upload_id, std::uint64_t index) const override;
        RemovalStatus remove_session(std::string_view upload_id) override;
        std::optional<std::filesystem::file_time_type> last_modified(std::string_view upload_id) const override;
        std::vector<std::string> list_sessions() const override;

    private:
        std::filesystem::path root_;
    };

} // namespace nanocloud::server
