#include "nanocloud/protocol.hpp"

#include <array>

namespace nanocloud::protocol
{

    namespace
    {

        struct ActionMapping
        {
            Action action;
            std::string_view label;
        };

        constexpr std::array<ActionMapping, kActionCount> kActionMappings{{
            {Action::Upload, "upload"},
            {Action::UploadChunk, "upload_chunk"},
            {Action::UploadCheck, "upload_check"},
            {Action::Info, "info"},
        }};

        template <typename T>
        void put_optional(nlohmann::json &json, const char *key, const std::optional<T> &value)
        {
            if (value)
            {
                json[key] = *value;
            }
        }

        template <typename T>
        std::optional<T> get_optional(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                return it->get<T>();
            }
            return std::nullopt;
        }

    } // namespace

    std::string_view to_string(Action action) noexcept
    {
        for (const auto &mapping : kActionMappings)
        {
            if (mapping.action == action)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<Action> action_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kActionMappings)
        {
            if (mapping.label == value)
            {
                return mapping.action;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const StorageInfo &info)
    {
        json = {
            {"totalBytes", info.total_bytes},
            {"freeBytes", info.free_bytes},
            {"usedBytes", info.used_bytes},
            {"usedPercent", info.used_percent},
        };
    }

    void from_json(const nlohmann::json &json, StorageInfo &info)
    {
        info.total_bytes = json.value("totalBytes", 0ULL);
        info.free_bytes = json.value("freeBytes", 0ULL);
        info.used_bytes = json.value("usedBytes", 0ULL);
        info.used_percent = json.value("usedPercent", 0.0);
    }

    void to_json(nlohmann::json &json, const UploadResult &result)
    {
        json = {
            {"filename", result.success ? result.sanitized_name : result.original_name},
            {"originalName", result.original_name},
            {"success", result.success},
            {"message", result.message},
        };
        if (result.success)
        {
            json["size"] = result.size;
        }
    }

    void from_json(const nlohmann::json &json, UploadResult &result)
    {
        result.success = json.value("success", false);
        const auto filename = json.value("filename", std::string{});
        result.original_name = json.value("originalName", filename);
        result.sanitized_name = result.success ? filename : std::string{};
        result.message = json.value("message", std::string{});
        result.size = json.value("size", 0ULL);
    }

    void to_json(nlohmann::json &json, const UploadCheckResponse &response)
    {
        json = {
            {"success", response.success},
            {"exists", response.exists},
            {"nextChunkIndex", response.next_chunk_index},
            {"message", response.message},
        };
    }

    void from_json(const nlohmann::json &json, UploadCheckResponse &response)
    {
        response.success = json.value("success", false);
        response.exists = json.value("exists", false);
        response.next_chunk_index = json.value("nextChunkIndex", 0ULL);
        response.message = json.value("message", std::string{});
    }

    void to_json(nlohmann::json &json, const ChunkResponse &response)
    {
        json = {
            {"success", response.success},
            {"message", response.message},
        };
        put_optional(json, "chunkIndex", response.chunk_index);
        put_optional(json, "totalChunks", response.total_chunks);
        put_optional(json, "filename", response.filename);
        put_optional(json, "size", response.size);
        put_optional(json, "storage", response.storage);
    }

    void from_json(const nlohmann::json &json, ChunkResponse &response)
    {
        response.success = json.value("success", false);
        response.message = json.value("message", std::string{});
        response.chunk_index = get_optional<std::uint64_t>(json, "chunkIndex");
        response.total_chunks = get_optional<std::uint64_t>(json, "totalChunks");
        response.filename = get_optional<std::string>(json, "filename");
        response.size = get_optional<std::uint64_t>(json, "size");
        response.storage = get_optional<StorageInfo>(json, "storage");
    }

    void to_json(nlohmann::json &json, const UploadResponse &response)
    {
        json = {
            {"success", response.success},
            {"message", response.message},
            {"results", response.results},
        };
        put_optional(json, "storage", response.storage);
    }

    void from_json(const nlohmann::json &json, UploadResponse &response)
    {
        response.success = json.value("success", false);
        response.message = json.value("message", std::string{});
        response.results = json.value("results", std::vector<UploadResult>{});
        response.storage = get_optional<StorageInfo>(json, "storage");
    }

    void to_json(nlohmann::json &json, const InfoResponse &response)
    {
        json = {
            {"success", true},
            {"readOnly", response.read_only},
            {"uploadEnabled", response.upload_enabled},
            {"chunkSize", response.chunk_size},
            {"chunkThreshold", response.chunk_threshold},
            {"maxFileBytes", response.max_file_bytes},
            {"maxSessionBytes", response.max_session_bytes},
            {"storage", response.storage},
        };
    }

    void from_json(const nlohmann::json &json, InfoResponse &response)
    {
        response.read_only = json.value("readOnly", false);
        response.upload_enabled = json.value("uploadEnabled", true);
        response.chunk_size = json.value("chunkSize", 0ULL);
        response.chunk_threshold = json.value("chunkThreshold", 0ULL);
        response.max_file_bytes = json.value("maxFileBytes", 0ULL);
        response.max_session_bytes = json.value("maxSessionBytes", 0ULL);
        response.storage = json.value("storage", StorageInfo{});
    }

    nlohmann::json make_error(std::string_view message)
    {
        return {
            {"success", false},
            {"message", message},
        };
    }

    nlohmann::json make_error(ErrorCode code)
    {
        return make_error(user_message(code));
    }

} // namespace nanocloud::protocol
