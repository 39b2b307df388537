#include "nanocloud/server/permissions.hpp"

#include <grp.h>
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

#include <spdlog/spdlog.h>

#include "nanocloud/server/config.hpp"

namespace nanocloud::server
{

    namespace
    {
        std::optional<uid_t> lookup_user(const std::string &name)
        {
            if (const auto *entry = ::getpwnam(name.c_str()))
            {
                return entry->pw_uid;
            }
            return std::nullopt;
        }

        std::optional<gid_t> lookup_group(const std::string &name)
        {
            if (const auto *entry = ::getgrnam(name.c_str()))
            {
                return entry->gr_gid;
            }
            return std::nullopt;
        }

    } // namespace

    PermissionPolicy::PermissionPolicy(std::filesystem::perms dir_mode, std::filesystem::perms file_mode,
                                       std::optional<std::string> owner, std::optional<std::string> group)
        : dir_mode_(dir_mode), file_mode_(file_mode), owner_(std::move(owner)), group_(std::move(group)) {}

    PermissionPolicy PermissionPolicy::from_config(const ServerConfig &config)
    {
        return PermissionPolicy(config.dir_permissions, config.file_permissions, config.file_owner,
                                config.file_group);
    }

    void PermissionPolicy::apply_to_file(const std::filesystem::path &path) const
    {
        apply(path, file_mode_);
    }

    void PermissionPolicy::apply_to_directory(const std::filesystem::path &path) const
    {
        apply(path, dir_mode_);
    }

    void PermissionPolicy::apply(const std::filesystem::path &path, std::filesystem::perms mode) const
    {
        std::error_code ec;
        std::filesystem::permissions(path, mode, std::filesystem::perm_options::replace, ec);
        if (ec)
        {
            spdlog::warn("chmod {} failed: {}", path.string(), ec.message());
        }

        if (!owner_ && !group_)
        {
            return;
        }
        uid_t uid = static_cast<uid_t>(-1);
        gid_t gid = static_cast<gid_t>(-1);
        if (owner_)
        {
            const auto resolved = lookup_user(*owner_);
            if (!resolved)
            {
                spdlog::warn("Unknown file owner '{}'", *owner_);
            }
            else
            {
                uid = *resolved;
            }
        }
        if (group_)
        {
            const auto resolved = lookup_group(*group_);
            if (!resolved)
            {
                spdlog::warn("Unknown file group '{}'", *group_);
            }
            else
            {
                gid = *resolved;
            }
        }
        if (uid == static_cast<uid_t>(-1) && gid == static_cast<gid_t>(-1))
        {
            return;
        }
        if (::chown(path.c_str(), uid, gid) != 0)
        {
            spdlog::warn("chown {} failed: {}", path.string(), std::strerror(errno));
        }
    }

} // namespace nanocloud::server
