#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "nanocloud/error_codes.hpp"
#include "nanocloud/protocol.hpp"
#include "nanocloud/server/merger.hpp"
#include "nanocloud/server/stale_sweeper.hpp"
#include "nanocloud/server/upload_context.hpp"

namespace nanocloud::server
{

    class DisconnectSignal;
    class UploadQuota;

    // Upper bound on totalChunks; a larger count is rejected as malformed.
    inline constexpr std::uint64_t kMaxTotalChunks = 1'000'000;

    enum class SessionState
    {
        Unknown,
        InProgress,
        ReadyToMerge
    };

    struct SessionStatus
    {
        bool exists{};
        std::uint64_t next_chunk_index{};
    };

    struct ChunkRequest
    {
        std::string upload_id;
        std::uint64_t chunk_index{};
        std::uint64_t total_chunks{};
        std::string filename;
        std::string relative_path;
        std::string target_path;
        std::optional<std::uint64_t> file_size{};
        std::string_view data;
    };

    enum class ChunkStatus
    {
        Acknowledged,
        Merged,
        Rejected,
        Aborted,
        MergeFailed
    };

    struct ChunkOutcome
    {
        ChunkStatus status{ChunkStatus::Rejected};
        nanocloud::ErrorCode error{nanocloud::ErrorCode::Ok};
        std::string message;
        std::uint64_t chunk_index{};
        std::uint64_t total_chunks{};
        // Set once the file has been merged.
        std::optional<nanocloud::protocol::UploadResult> result{};
    };

    // Chunked-upload coordinator. Holds no per-upload state in memory: what is
    // on disk in the chunk store is the whole session.
    class UploadSession
    {
    public:
        explicit UploadSession(UploadContext context);

        // Throws StorageError(InvalidUploadId) for malformed ids.
        SessionStatus check_status(std::string_view upload_id) const;

        SessionState state(std::string_view upload_id, std::uint64_t total_chunks) const;

        ChunkOutcome receive_chunk(const ChunkRequest &request, UploadQuota &quota, const DisconnectSignal &signal);

    private:
        UploadContext context_;
        StaleSweeper sweeper_;
        Merger merger_;

        ChunkOutcome merge(const ChunkRequest &request, const PathHandle &target_dir, const std::string &name,
                           UploadQuota &quota);
    };

} // namespace nanocloud::server
