#include "nanocloud/server/config.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace nanocloud::server
{

    namespace
    {

        std::filesystem::perms parse_mode(const nlohmann::json &value, const std::string &key)
        {
            unsigned long mode = 0;
            if (value.is_number_unsigned())
            {
                mode = value.get<unsigned long>();
            }
            else if (value.is_string())
            {
                // Octal string such as "0755".
                mode = std::stoul(value.get<std::string>(), nullptr, 8);
            }
            else
            {
                throw std::runtime_error("Config key '" + key + "' must be an octal string or number");
            }
            if (mode > 07777)
            {
                throw std::runtime_error("Config key '" + key + "' is not a valid permission mode");
            }
            return static_cast<std::filesystem::perms>(mode);
        }

        std::optional<std::string> optional_string(const nlohmann::json &value)
        {
            if (value.is_null())
            {
                return std::nullopt;
            }
            return value.get<std::string>();
        }

    } // namespace

    void load_config_file(const std::filesystem::path &path, ServerConfig &config)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Cannot open config file: " + path.string());
        }
        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            throw std::runtime_error("Config file is not valid JSON: " + std::string(ex.what()));
        }
        if (!json.is_object())
        {
            throw std::runtime_error("Config file must contain a JSON object");
        }

        for (const auto &[key, value] : json.items())
        {
            try
            {
                if (key == "address")
                {
                    config.address = value.get<std::string>();
                }
                else if (key == "port")
                {
                    config.port = value.get<std::uint16_t>();
                }
                else if (key == "storage_root")
                {
                    config.storage_root = value.get<std::string>();
                }
                else if (key == "chunk_root")
                {
                    config.chunk_root = value.get<std::string>();
                }
                else if (key == "chunk_stale_hours")
                {
                    config.chunk_stale_age = std::chrono::hours(value.get<std::int64_t>());
                }
                else if (key == "dir_permissions")
                {
                    config.dir_permissions = parse_mode(value, key);
                }
                else if (key == "file_permissions")
                {
                    config.file_permissions = parse_mode(value, key);
                }
                else if (key == "file_owner")
                {
                    config.file_owner = optional_string(value);
                }
                else if (key == "file_group")
                {
                    config.file_group = optional_string(value);
                }
                else if (key == "read_only")
                {
                    config.read_only = value.get<bool>();
                }
                else if (key == "upload_enabled")
                {
                    config.upload_enabled = value.get<bool>();
                }
                else if (key == "max_file_bytes")
                {
                    config.max_file_bytes = value.get<std::uint64_t>();
                }
                else if (key == "max_session_bytes")
                {
                    config.max_session_bytes = value.get<std::uint64_t>();
                }
                else if (key == "chunk_size")
                {
                    config.chunk_size = value.get<std::uint64_t>();
                }
                else if (key == "chunk_threshold")
                {
                    config.chunk_threshold = value.get<std::uint64_t>();
                }
                else if (key == "max_request_bytes")
                {
                    config.max_request_bytes = value.get<std::uint64_t>();
                }
                else if (key == "worker_threads")
                {
                    config.worker_threads = value.get<std::size_t>();
                }
                else if (key == "request_timeout_seconds")
                {
                    config.request_timeout = std::chrono::seconds(value.get<std::int64_t>());
                }
                else if (key == "log_file")
                {
                    const auto file = optional_string(value);
                    config.log_file = file ? std::optional<std::filesystem::path>(*file) : std::nullopt;
                }
                else if (key == "log_level")
                {
                    config.log_level = spdlog::level::from_str(value.get<std::string>());
                }
                else
                {
                    throw std::runtime_error("Unknown config key '" + key + "'");
                }
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw std::runtime_error("Invalid value for config key '" + key + "': " + ex.what());
            }
        }
    }

    void validate_config(const ServerConfig &config)
    {
        if (config.storage_root.empty())
        {
            throw std::runtime_error("storage_root is required");
        }
        if (config.chunk_root.empty())
        {
            throw std::runtime_error("chunk_root is required");
        }
        if (config.chunk_size == 0)
        {
            throw std::runtime_error("chunk_size must be positive");
        }
        if (config.chunk_stale_age.count() <= 0)
        {
            throw std::runtime_error("chunk_stale_hours must be positive");
        }
        // A chunk plus its multipart envelope has to fit in one request body.
        if (config.max_request_bytes < config.chunk_size + 64 * 1024)
        {
            throw std::runtime_error("max_request_bytes must exceed chunk_size by at least 64 KiB");
        }
    }

} // namespace nanocloud::server
