#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace nanocloud::server
{

    struct ServerConfig;

    // Mode and ownership applied to everything the server creates inside the
    // storage root. Failures are logged and otherwise ignored.
    class PermissionPolicy
    {
    public:
        PermissionPolicy(std::filesystem::perms dir_mode, std::filesystem::perms file_mode,
                         std::optional<std::string> owner = std::nullopt,
                         std::optional<std::string> group = std::nullopt);

        static PermissionPolicy from_config(const ServerConfig &config);

        void apply_to_file(const std::filesystem::path &path) const;
        void apply_to_directory(const std::filesystem::path &path) const;

        std::filesystem::perms file_mode() const noexcept { return file_mode_; }
        std::filesystem::perms dir_mode() const noexcept { return dir_mode_; }

    private:
        std::filesystem::perms dir_mode_;
        std::filesystem::perms file_mode_;
        std::optional<std::string> owner_;
        std::optional<std::string> group_;

        void apply(const std::filesystem::path &path, std::filesystem::perms mode) const;
    };

} // namespace nanocloud::server
