/**
 * NanoCloud - Shared API schema and JSON serialization helpers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "nanocloud/error_codes.hpp"

namespace nanocloud::protocol
{

    enum class Action : std::uint8_t
    {
        Upload,
        UploadChunk,
        UploadCheck,
        Info
    };

    inline constexpr std::size_t kActionCount = 4;

    std::string_view to_string(Action action) noexcept;
    std::optional<Action> action_from_string(std::string_view value) noexcept;

    constexpr std::size_t to_index(Action action) noexcept
    {
        return static_cast<std::size_t>(action);
    }

    struct StorageInfo
    {
        std::uint64_t total_bytes{};
        std::uint64_t free_bytes{};
        std::uint64_t used_bytes{};
        double used_percent{};
    };

    void to_json(nlohmann::json &json, const StorageInfo &info);
    void from_json(const nlohmann::json &json, StorageInfo &info);

    // Per-file outcome of either the small-file path or a completed merge.
    struct UploadResult
    {
        std::string original_name;
        std::string sanitized_name;
        bool success{};
        std::string message;
        std::uint64_t size{};
    };

    void to_json(nlohmann::json &json, const UploadResult &result);
    void from_json(const nlohmann::json &json, UploadResult &result);

    struct UploadCheckResponse
    {
        bool success{};
        bool exists{};
        std::uint64_t next_chunk_index{};
        std::string message;
    };

    void to_json(nlohmann::json &json, const UploadCheckResponse &response);
    void from_json(const nlohmann::json &json, UploadCheckResponse &response);

    // Reply to upload_chunk. Intermediate chunks carry the index pair; the final
    // chunk carries the merged file's name, size and storage figures.
    struct ChunkResponse
    {
        bool success{};
        std::string message;
        std::optional<std::uint64_t> chunk_index{};
        std::optional<std::uint64_t> total_chunks{};
        std::optional<std::string> filename{};
        std::optional<std::uint64_t> size{};
        std::optional<StorageInfo> storage{};

        bool is_final() const noexcept { return filename.has_value(); }
    };

    void to_json(nlohmann::json &json, const ChunkResponse &response);
    void from_json(const nlohmann::json &json, ChunkResponse &response);

    struct UploadResponse
    {
        bool success{};
        std::string message;
        std::vector<UploadResult> results;
        std::optional<StorageInfo> storage{};
    };

    void to_json(nlohmann::json &json, const UploadResponse &response);
    void from_json(const nlohmann::json &json, UploadResponse &response);

    struct InfoResponse
    {
        bool read_only{};
        bool upload_enabled{true};
        std::uint64_t chunk_size{};
        std::uint64_t chunk_threshold{};
        std::uint64_t max_file_bytes{};
        std::uint64_t max_session_bytes{};
        StorageInfo storage{};
    };

    void to_json(nlohmann::json &json, const InfoResponse &response);
    void from_json(const nlohmann::json &json, InfoResponse &response);

    nlohmann::json make_error(std::string_view message);
    nlohmann::json make_error(ErrorCode code);

} // namespace nanocloud::protocol
