#include "nanocloud/client/config.hpp"

#include <stdexcept>
#include <string>

namespace nanocloud::client
{

    namespace
    {
        std::string require_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[index++];
        }

        std::uint64_t parse_count(const std::string &text, const std::string &flag)
        {
            try
            {
                std::size_t used = 0;
                const auto value = std::stoull(text, &used);
                if (used != text.size())
                {
                    throw std::invalid_argument(text);
                }
                return value;
            }
            catch (const std::logic_error &)
            {
                throw std::runtime_error("Invalid value for " + flag + ": " + text);
            }
        }

    } // namespace

    std::string usage(const char *program_name)
    {
        return std::string("Usage: ") + program_name +
               " <server>:<port> [--path <dir>] [--chunk-size <bytes>] [--retries <n>] [--session <token>]"
               " [--log <file>] <file-or-folder>...";
    }

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 3)
        {
            throw std::runtime_error(usage(argv[0]));
        }

        ClientConfig config;
        int index = 1;
        const std::string endpoint = argv[index++];

        const auto colon_pos = endpoint.rfind(':');
        if (colon_pos == std::string::npos || colon_pos == 0)
        {
            throw std::runtime_error("Expected endpoint format host:port");
        }
        config.host = endpoint.substr(0, colon_pos);
        const auto port = parse_count(endpoint.substr(colon_pos + 1), "port");
        if (port == 0 || port > 65535)
        {
            throw std::runtime_error("Port out of range: " + endpoint.substr(colon_pos + 1));
        }
        config.port = static_cast<std::uint16_t>(port);

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--path")
            {
                config.target_path = require_value(index, argc, argv, arg);
            }
            else if (arg == "--chunk-size")
            {
                const auto size = parse_count(require_value(index, argc, argv, arg), arg);
                if (size == 0)
                {
                    throw std::runtime_error("--chunk-size must be positive");
                }
                config.chunk_size = size;
            }
            else if (arg == "--retries")
            {
                const auto retries = parse_count(require_value(index, argc, argv, arg), arg);
                config.retries = retries == 0 ? 1u : static_cast<unsigned>(retries);
            }
            else if (arg == "--session")
            {
                config.session_token = require_value(index, argc, argv, arg);
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg.starts_with("--"))
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else
            {
                config.inputs.emplace_back(arg);
            }
        }

        if (config.inputs.empty())
        {
            throw std::runtime_error("Nothing to upload");
        }
        return config;
    }

} // namespace nanocloud::client
