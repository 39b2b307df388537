#include "nanocloud/server/upload_session.hpp"

#include <system_error>

#include <spdlog/spdlog.h>

#include "nanocloud/server/chunk_store.hpp"
#include "nanocloud/server/config.hpp"
#include "nanocloud/server/disconnect_signal.hpp"
#include "nanocloud/server/name_sanitizer.hpp"
#include "nanocloud/server/path_resolver.hpp"
#include "nanocloud/server/quota_ledger.hpp"
#include "nanocloud/server/storage_error.hpp"
#include "nanocloud/server/storage_info.hpp"
#include "nanocloud/upload_identity.hpp"

namespace nanocloud::server
{

    UploadSession::UploadSession(UploadContext context)
        : context_(context),
          sweeper_(context.chunks, context.config.chunk_stale_age),
          merger_(context.chunks, context.permissions, context.storage)
    {
    }

    SessionStatus UploadSession::check_status(std::string_view upload_id) const
    {
        if (!context_.chunks.has_session(upload_id))
        {
            return {};
        }
        const auto present = context_.chunks.present_indices(upload_id);
        std::uint64_t next = 0;
        while (present.contains(next))
        {
            ++next;
        }
        return SessionStatus{.exists = true, .next_chunk_index = next};
    }

    SessionState UploadSession::state(std::string_view upload_id, std::uint64_t total_chunks) const
    {
        if (!context_.chunks.has_session(upload_id))
        {
            return SessionState::Unknown;
        }
        const auto status = check_status(upload_id);
        return status.next_chunk_index >= total_chunks ? SessionState::ReadyToMerge : SessionState::InProgress;
    }

    ChunkOutcome UploadSession::receive_chunk(const ChunkRequest &request, UploadQuota &quota,
                                              const DisconnectSignal &signal)
    {
        ChunkOutcome outcome{.chunk_index = request.chunk_index, .total_chunks = request.total_chunks};
        auto reject = [&outcome](nanocloud::ErrorCode code, std::string_view message = {})
        {
            outcome.status = ChunkStatus::Rejected;
            outcome.error = code;
            outcome.message = std::string(message.empty() ? nanocloud::user_message(code) : message);
            return outcome;
        };

        if (!nanocloud::is_valid_upload_id(request.upload_id))
        {
            return reject(nanocloud::ErrorCode::InvalidUploadId);
        }
        if (request.total_chunks == 0 || request.total_chunks > kMaxTotalChunks ||
            request.chunk_index >= request.total_chunks)
        {
            return reject(nanocloud::ErrorCode::InvalidRequest, "Invalid chunk parameters.");
        }
        // Chunked names must be stable across requests, so no timestamp fallback.
        const auto name = sanitize_upload_name(request.relative_path, request.filename, EmptyNamePolicy::Reject);
        if (name.empty())
        {
            return reject(nanocloud::ErrorCode::InvalidName);
        }

        try
        {
            const auto target_dir = context_.resolver.resolve_directory(request.target_path);

            if (request.chunk_index == 0)
            {
                if (request.file_size && *request.file_size > context_.config.max_file_bytes)
                {
                    return reject(nanocloud::ErrorCode::FileTooLarge);
                }
                if (request.file_size && !quota.allows(*request.file_size))
                {
                    return reject(nanocloud::ErrorCode::SessionQuotaExceeded);
                }
                std::error_code ec;
                if (std::filesystem::exists(target_dir.absolute() / name, ec))
                {
                    return reject(nanocloud::ErrorCode::AlreadyExists);
                }
                const auto report = sweeper_.sweep();
                if (report.removed > 0 || report.failed > 0)
                {
                    spdlog::info("Stale sweep: {} examined, {} removed, {} failed", report.examined,
                                 report.removed, report.failed);
                }
            }

            if (!context_.storage.has_room_for(context_.config.chunk_root, request.data.size()))
            {
                return reject(nanocloud::ErrorCode::InsufficientSpace);
            }

            context_.chunks.write_chunk(request.upload_id, request.chunk_index, request.data);
            spdlog::debug("Stored chunk {}/{} of {}", request.chunk_index + 1, request.total_chunks,
                          request.upload_id);

            if (signal.aborted())
            {
                // The client never saw an acknowledgement; nothing staged so far
                // is trusted.
                if (context_.chunks.remove_session(request.upload_id) == RemovalStatus::Failed)
                {
                    spdlog::warn("Rollback of {} left chunks behind", request.upload_id);
                }
                spdlog::info("Client disconnected during chunk {} of {}; session discarded", request.chunk_index,
                             request.upload_id);
                outcome.status = ChunkStatus::Aborted;
                outcome.error = nanocloud::ErrorCode::Aborted;
                outcome.message = std::string(nanocloud::user_message(nanocloud::ErrorCode::Aborted));
                return outcome;
            }

            if (request.chunk_index + 1 == request.total_chunks)
            {
                return merge(request, target_dir, name, quota);
            }
        }
        catch (const StorageError &ex)
        {
            spdlog::warn("Chunk {} of {} rejected: {}", request.chunk_index, request.upload_id, ex.what());
            return reject(ex.code());
        }

        outcome.status = ChunkStatus::Acknowledged;
        outcome.message = "Chunk received.";
        return outcome;
    }

    ChunkOutcome UploadSession::merge(const ChunkRequest &request, const PathHandle &target_dir,
                                      const std::string &name, UploadQuota &quota)
    {
        ChunkOutcome outcome{.chunk_index = request.chunk_index, .total_chunks = request.total_chunks};
        const auto original_name = request.relative_path.empty() ? request.filename : request.relative_path;

        MergeOutcome merged;
        try
        {
            const auto destination = context_.resolver.prepare_destination(target_dir, name, context_.permissions);
            merged = merger_.merge(MergeRequest{
                .upload_id = request.upload_id,
                .total_chunks = request.total_chunks,
                .destination = destination,
                .expected_size = request.file_size,
                .max_file_bytes = context_.config.max_file_bytes,
                .quota_remaining = quota.remaining(),
            });
            if (merged.ok())
            {
                spdlog::info("Merged upload {} into '{}' ({} bytes)", request.upload_id, destination.relative(),
                             merged.final_size);
            }
        }
        catch (const StorageError &ex)
        {
            spdlog::warn("Cannot place merged upload {}: {}", request.upload_id, ex.what());
            merged = MergeOutcome{.error = ex.code(), .message = std::string(nanocloud::user_message(ex.code()))};
        }

        if (!merged.ok())
        {
            spdlog::warn("Merge of {} failed: {}", request.upload_id, merged.message);
            outcome.status = ChunkStatus::MergeFailed;
            outcome.error = merged.error;
            outcome.message = merged.message;
            return outcome;
        }

        quota.charge(merged.final_size);
        outcome.status = ChunkStatus::Merged;
        outcome.message = merged.message;
        outcome.result = nanocloud::protocol::UploadResult{
            .original_name = original_name,
            .sanitized_name = name,
            .success = true,
            .message = merged.message,
            .size = merged.final_size,
        };
        return outcome;
    }

} // namespace nanocloud::server
