#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

#include "nanocloud/error_codes.hpp"
#include "nanocloud/server/path_resolver.hpp"

namespace nanocloud::server
{

    class ChunkStore;
    class PermissionPolicy;
    class StorageInfoProvider;

    struct MergeRequest
    {
        std::string upload_id;
        std::uint64_t total_chunks{};
        PathHandle destination;
        // Declared total size; the summed chunk size is used when absent.
        std::optional<std::uint64_t> expected_size{};
        std::uint64_t max_file_bytes{std::numeric_limits<std::uint64_t>::max()};
        std::uint64_t quota_remaining{std::numeric_limits<std::uint64_t>::max()};
    };

    struct MergeOutcome
    {
        nanocloud::ErrorCode error{nanocloud::ErrorCode::Ok};
        std::string message;
        std::uint64_t final_size{};

        bool ok() const noexcept { return error == nanocloud::ErrorCode::Ok; }
    };

    // Concatenates a complete chunk session into its destination. The
    // destination is created exclusively, so of two concurrent merges only one
    // can win. On any failure the chunks stay in place for a retry.
    class Merger
    {
    public:
        static constexpr std::size_t kDefaultBufferSize = 64 * 1024;

        Merger(ChunkStore &store, const PermissionPolicy &permissions, const StorageInfoProvider &storage,
               std::size_t buffer_size = kDefaultBufferSize);

        MergeOutcome merge(const MergeRequest &request) const;

    private:
        ChunkStore &store_;
        const PermissionPolicy &permissions_;
        const StorageInfoProvider &storage_;
        std::size_t buffer_size_;
    };

} // namespace nanocloud::server
