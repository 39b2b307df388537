#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace nanocloud::client
{

    struct ClientConfig
    {
        std::string host;
        std::uint16_t port{};
        // Destination folder on the server, relative to its storage root.
        std::string target_path;
        // Overrides the chunk size the server advertises.
        std::optional<std::uint64_t> chunk_size;
        unsigned retries{3};
        std::chrono::milliseconds retry_delay{1000};
        std::optional<std::string> session_token;
        std::optional<std::filesystem::path> log_path;
        std::vector<std::filesystem::path> inputs;
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

    std::string usage(const char *program_name);

} // namespace nanocloud::client
