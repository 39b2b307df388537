#include "nanocloud/server/api.hpp"

#include <charconv>

#include <spdlog/spdlog.h>

#include "nanocloud/server/disconnect_signal.hpp"
#include "nanocloud/server/operation_gate.hpp"
#include "nanocloud/server/storage_error.hpp"

namespace nanocloud::server
{

    namespace
    {
        constexpr auto kSessionHeader = "X-Session-Token";
        constexpr std::string_view kSessionCookie = "nanocloud_session";

        bool is_api_path(std::string_view path) noexcept
        {
            return path == "/api" || path == "/api.php";
        }

        std::optional<std::uint64_t> parse_unsigned(std::string_view text)
        {
            while (!text.empty() && text.front() == ' ')
            {
                text.remove_prefix(1);
            }
            while (!text.empty() && text.back() == ' ')
            {
                text.remove_suffix(1);
            }
            if (text.empty())
            {
                return std::nullopt;
            }
            std::uint64_t value{};
            const auto *end = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(text.data(), end, value);
            if (ec != std::errc{} || ptr != end)
            {
                return std::nullopt;
            }
            return value;
        }

        nanocloud::ErrorCode gate_for(const ServerConfig &config, protocol::Action action) noexcept
        {
            const auto operation = operation_for(action);
            return operation ? check_operation_allowed(config, *operation) : nanocloud::ErrorCode::Ok;
        }

    } // namespace

    void write_json(httplib::Response &response, int status, const nlohmann::json &body)
    {
        response.status = status;
        response.set_content(body.dump(), "application/json");
    }

    const std::array<Api::Handler, protocol::kActionCount> Api::handlers_{
        &Api::handle_upload,
        &Api::handle_upload_chunk,
        &Api::handle_upload_check,
        &Api::handle_info,
    };

    static_assert(protocol::to_index(protocol::Action::Upload) == 0);
    static_assert(protocol::to_index(protocol::Action::UploadChunk) == 1);
    static_assert(protocol::to_index(protocol::Action::UploadCheck) == 2);
    static_assert(protocol::to_index(protocol::Action::Info) == 3);

    Api::Api(ServerConfig config)
        : config_(std::move(config)),
          resolver_(config_.storage_root),
          chunks_(config_.chunk_root),
          storage_(resolver_.root()),
          permissions_(PermissionPolicy::from_config(config_)),
          ledger_(config_.chunk_root),
          uploads_(UploadContext{config_, resolver_, chunks_, storage_, permissions_}),
          small_files_(UploadContext{config_, resolver_, chunks_, storage_, permissions_})
    {
    }

    bool Api::admit(const httplib::Request &request, httplib::Response &response) const
    {
        if (!is_api_path(request.path) || !request.has_param("action"))
        {
            return true;
        }
        const auto action = protocol::action_from_string(request.get_param_value("action"));
        if (!action)
        {
            return true;
        }
        const auto gate = gate_for(config_, *action);
        if (gate == nanocloud::ErrorCode::Ok)
        {
            return true;
        }
        spdlog::debug("Refused {} before reading its body", protocol::to_string(*action));
        write_json(response, 403, protocol::make_error(gate));
        // The unread body must not be taken for the next request.
        response.set_header("Connection", "close");
        return false;
    }

    void Api::handle(const httplib::Request &request, httplib::Response &response, const DisconnectSignal &signal)
    {
        const auto reply = dispatch(request, signal);
        write_json(response, reply.status, reply.body);
        if (!reply.allow.empty())
        {
            response.set_header("Allow", reply.allow);
        }
    }

    Api::Reply Api::dispatch(const httplib::Request &request, const DisconnectSignal &signal)
    {
        const bool is_get = request.method == "GET";
        if (!is_get && request.method != "POST")
        {
            return Reply{405, protocol::make_error("Method not allowed."), "GET, POST"};
        }

        try
        {
            const auto fields = RequestFields::from(request);
            const auto action_name = fields.field_or("action", "");
            const auto action = protocol::action_from_string(action_name);
            if (!action)
            {
                spdlog::debug("Unknown action '{}'", action_name);
                return Reply{400, protocol::make_error("Unknown action.")};
            }
            if (is_get && *action != protocol::Action::Info)
            {
                return Reply{405, protocol::make_error("Method not allowed."), "POST"};
            }
            if (const auto gate = gate_for(config_, *action); gate != nanocloud::ErrorCode::Ok)
            {
                return Reply{403, protocol::make_error(gate)};
            }

            spdlog::debug("{} {} action={} from {}", request.method, request.path, protocol::to_string(*action),
                          request.remote_addr);
            const Call call{.request = request, .fields = fields, .signal = signal};
            return (this->*handlers_[protocol::to_index(*action)])(call);
        }
        catch (const RequestError &ex)
        {
            spdlog::debug("Rejected request: {}", ex.what());
            return Reply{ex.status(), protocol::make_error(ex.what())};
        }
        catch (const StorageError &ex)
        {
            spdlog::warn("Storage error: {}", ex.what());
            return Reply{200, protocol::make_error(ex.code())};
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Unhandled error while serving {}: {}", request.target, ex.what());
            return Reply{500, protocol::make_error(nanocloud::ErrorCode::InternalError)};
        }
    }

    Api::Reply Api::handle_upload(const Call &call)
    {
        protocol::UploadResponse response{.storage = storage_.storage_info()};
        const auto files = call.fields.files_named("files");
        if (files.empty())
        {
            response.message = "No files provided.";
            return Reply{400, response};
        }

        std::optional<PathHandle> target_dir;
        try
        {
            target_dir = resolver_.resolve_directory(call.fields.field_or("path", ""));
        }
        catch (const StorageError &ex)
        {
            spdlog::debug("Upload target rejected: {}", ex.what());
            response.message = "Target path not found.";
            return Reply{200, response};
        }

        const auto relative_paths = call.fields.fields_named("relativePaths");
        auto quota = quota_for(call.request);
        for (std::size_t i = 0; i < files.size(); ++i)
        {
            const SmallFile file{
                .original_name = files[i]->filename,
                .relative_path = i < relative_paths.size() ? relative_paths[i] : std::string{},
                .data = files[i]->content,
            };
            response.results.push_back(small_files_.upload(*target_dir, file, quota, call.signal));
        }

        response.success = true;
        response.message = "Upload processed.";
        response.storage = storage_.storage_info();
        return Reply{200, response};
    }

    Api::Reply Api::handle_upload_chunk(const Call &call)
    {
        const auto &fields = call.fields;
        const auto upload_id = fields.field_or("uploadId", "");
        const auto index_text = fields.field_or("chunkIndex", "");
        const auto total_text = fields.field_or("totalChunks", "");
        const auto filename = fields.field_or("filename", "");
        const auto *chunk = fields.file("chunk");
        if (upload_id.empty() || index_text.empty() || total_text.empty() || filename.empty() || !chunk)
        {
            return Reply{400, protocol::make_error("Missing required chunk parameters.")};
        }

        const auto index = parse_unsigned(index_text);
        const auto total = parse_unsigned(total_text);
        std::optional<std::uint64_t> file_size;
        if (const auto declared = fields.field("fileSize"); declared && !declared->empty())
        {
            file_size = parse_unsigned(*declared);
            if (!file_size)
            {
                return Reply{400, protocol::make_error("Invalid chunk parameters.")};
            }
        }
        if (!index || !total)
        {
            return Reply{400, protocol::make_error("Invalid chunk parameters.")};
        }

        const ChunkRequest request{
            .upload_id = upload_id,
            .chunk_index = *index,
            .total_chunks = *total,
            .filename = filename,
            .relative_path = fields.field_or("relativePath", ""),
            .target_path = fields.field_or("path", ""),
            .file_size = file_size,
            .data = chunk->content,
        };
        auto quota = quota_for(call.request);
        const auto outcome = uploads_.receive_chunk(request, quota, call.signal);

        protocol::ChunkResponse response{.message = outcome.message};
        switch (outcome.status)
        {
        case ChunkStatus::Acknowledged:
            response.success = true;
            response.chunk_index = outcome.chunk_index;
            response.total_chunks = outcome.total_chunks;
            break;
        case ChunkStatus::Merged:
            response.success = true;
            response.filename = outcome.result->sanitized_name;
            response.size = outcome.result->size;
            response.storage = storage_.storage_info();
            break;
        case ChunkStatus::Rejected:
        case ChunkStatus::Aborted:
        case ChunkStatus::MergeFailed:
            return Reply{200, protocol::make_error(outcome.message)};
        }
        return Reply{200, response};
    }

    Api::Reply Api::handle_upload_check(const Call &call)
    {
        const auto upload_id = call.fields.field_or("uploadId", "");
        if (upload_id.empty())
        {
            return Reply{400, protocol::make_error("Missing upload ID.")};
        }

        const auto status = uploads_.check_status(upload_id);
        const protocol::UploadCheckResponse response{
            .success = true,
            .exists = status.exists,
            .next_chunk_index = status.next_chunk_index,
            .message = status.exists ? "Upload in progress." : "No upload in progress.",
        };
        return Reply{200, response};
    }

    Api::Reply Api::handle_info(const Call &)
    {
        const protocol::InfoResponse response{
            .read_only = config_.read_only,
            .upload_enabled = config_.upload_enabled && !config_.read_only,
            .chunk_size = config_.chunk_size,
            .chunk_threshold = config_.chunk_threshold,
            .max_file_bytes = config_.max_file_bytes,
            .max_session_bytes = config_.max_session_bytes,
            .storage = storage_.storage_info(),
        };
        return Reply{200, response};
    }

    UploadQuota Api::quota_for(const httplib::Request &request)
    {
        std::optional<std::string> token;
        if (request.has_header(kSessionHeader))
        {
            token = request.get_header_value(kSessionHeader);
        }
        else
        {
            token = cookie_value(request, kSessionCookie);
        }
        if (token && !QuotaLedger::is_valid_token(*token))
        {
            spdlog::debug("Ignoring malformed session token");
            token.reset();
        }
        return UploadQuota(config_.max_session_bytes, token ? &ledger_ : nullptr, std::move(token));
    }

} // namespace nanocloud::server
