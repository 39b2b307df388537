#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace nanocloud::server
{

    class PermissionPolicy;
    class PathResolver;

    // A location proven to lie inside the storage root. Only PathResolver
    // creates these.
    class PathHandle
    {
    public:
        const std::filesystem::path &absolute() const noexcept { return absolute_; }
        // Root-relative form with '/' separators; "" for the root itself.
        const std::string &relative() const noexcept { return relative_; }

    private:
        friend class PathResolver;

        PathHandle(std::filesystem::path absolute, std::string relative)
            : absolute_(std::move(absolute)), relative_(std::move(relative)) {}

        std::filesystem::path absolute_;
        std::string relative_;
    };

    // Maps client-supplied relative paths onto the storage root. Every segment
    // is sanitized, the result is canonicalized, and anything that does not
    // end up under the root is refused. Failures throw StorageError with
    // NotFound or OutsideRoot.
    class PathResolver
    {
    public:
        // Creates the root when missing.
        explicit PathResolver(std::filesystem::path storage_root);

        const std::filesystem::path &root() const noexcept { return root_; }

        PathHandle resolve(std::string_view relative) const;

        // Like resolve() but the target must be an existing directory.
        PathHandle resolve_directory(std::string_view relative) const;

        // The final segment need not exist; its parent must.
        PathHandle resolve_for_new_entry(std::string_view relative) const;

        // Resolves `sanitized_name` (may contain '/') below `directory`,
        // creating any missing intermediate folders with the policy's mode.
        // The returned handle names a file that may or may not exist.
        PathHandle prepare_destination(const PathHandle &directory, std::string_view sanitized_name,
                                       const PermissionPolicy &permissions) const;

    private:
        std::filesystem::path root_;
        std::string root_key_;

        bool is_within_root(const std::filesystem::path &candidate) const;
        PathHandle make_handle(const std::filesystem::path &canonical) const;
    };

} // namespace nanocloud::server
