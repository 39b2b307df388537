#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "nanocloud/server/config.hpp"
#include "nanocloud/server/server.hpp"
#include "nanocloud/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "NanoCloud server " << nanocloud::version() << "\n"
                  << "Usage: " << program_name
                  << " [--config <FILE>] --port <PORT> --root <ROOT> [--address <ADDRESS>] [--chunk-root <DIR>]"
                     " [--threads <N>] [--log <FILE>] [--log-level <LEVEL>] [--read-only]\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

    // --config has to be applied before the other flags so they can override it.
    std::optional<std::filesystem::path> find_config_flag(int argc, char *argv[])
    {
        for (int i = 1; i + 1 < argc; ++i)
        {
            if (std::string(argv[i]) == "--config")
            {
                return std::filesystem::path(argv[i + 1]);
            }
        }
        return std::nullopt;
    }

    void install_logger(const nanocloud::server::ServerConfig &config)
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), /*truncate=*/false));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(config.log_level);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    }

} // namespace

int main(int argc, char *argv[])
{
    using nanocloud::server::Server;
    using nanocloud::server::ServerConfig;

    ServerConfig config;

    try
    {
        if (const auto config_file = find_config_flag(argc, argv))
        {
            nanocloud::server::load_config_file(*config_file, config);
        }
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }
        if (arg == "--read-only")
        {
            config.read_only = true;
            continue;
        }

        const bool takes_value = arg == "--config" || arg == "--port" || arg == "--root" || arg == "--address" ||
                                 arg == "--chunk-root" || arg == "--threads" || arg == "--log" ||
                                 arg == "--log-level";
        if (!takes_value)
        {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
        const auto value = read_option(i, argc, argv);
        if (!value)
        {
            std::cerr << "Missing value for " << arg << std::endl;
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }

        try
        {
            if (arg == "--port")
            {
                config.port = static_cast<std::uint16_t>(std::stoi(*value));
            }
            else if (arg == "--root")
            {
                config.storage_root = std::filesystem::path(*value);
            }
            else if (arg == "--address")
            {
                config.address = *value;
            }
            else if (arg == "--chunk-root")
            {
                config.chunk_root = std::filesystem::path(*value);
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(*value);
            }
            else if (arg == "--log-level")
            {
                config.log_level = spdlog::level::from_str(*value);
            }
        }
        catch (const std::logic_error &)
        {
            std::cerr << "Invalid value for " << arg << ": " << *value << std::endl;
            return EXIT_FAILURE;
        }
    }

    if (config.port == 0 || config.storage_root.empty())
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        nanocloud::server::validate_config(config);
        install_logger(config);
        spdlog::info("Starting NanoCloud server {} on {}:{}", nanocloud::version(), config.address, config.port);

        Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
