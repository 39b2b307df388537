#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <spdlog/common.h>

namespace nanocloud::server
{

    inline constexpr std::uint64_t kMiB = 1024ULL * 1024ULL;
    inline constexpr std::uint64_t kGiB = 1024ULL * kMiB;

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path storage_root;
        std::filesystem::path chunk_root{std::filesystem::temp_directory_path() / "nanocloud-chunks"};
        std::chrono::hours chunk_stale_age{2};

        std::filesystem::perms dir_permissions{static_cast<std::filesystem::perms>(0755)};
        std::filesystem::perms file_permissions{static_cast<std::filesystem::perms>(0644)};
        std::optional<std::string> file_owner;
        std::optional<std::string> file_group;

        bool read_only{false};
        bool upload_enabled{true};

        std::uint64_t max_file_bytes{5 * kGiB};
        std::uint64_t max_session_bytes{5 * kGiB};
        std::uint64_t chunk_size{2 * kMiB};
        std::uint64_t chunk_threshold{2 * kMiB};
        std::uint64_t max_request_bytes{64 * kMiB};

        std::size_t worker_threads{0};
        std::chrono::seconds request_timeout{std::chrono::seconds{300}};
        std::optional<std::filesystem::path> log_file;
        spdlog::level::level_enum log_level{spdlog::level::info};
    };

    // Overlays the keys present in a JSON config file onto `config`. Unknown
    // keys and ill-typed values throw std::runtime_error.
    void load_config_file(const std::filesystem::path &path, ServerConfig &config);

    // Rejects configurations the server cannot run with.
    void validate_config(const ServerConfig &config);

} // namespace nanocloud::server
