#include "nanocloud/server/path_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <vector>

#include "nanocloud/server/name_sanitizer.hpp"
#include "nanocloud/server/permissions.hpp"
#include "nanocloud/server/storage_error.hpp"

namespace nanocloud::server
{

    StorageError::StorageError(nanocloud::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    namespace
    {
        std::vector<std::string> clean_segments(std::string_view relative)
        {
            std::vector<std::string> segments;
            std::string current;
            auto flush = [&]()
            {
                auto clean = sanitize_segment(current);
                if (!clean.empty())
                {
                    segments.push_back(std::move(clean));
                }
                current.clear();
            };
            for (const char ch : relative)
            {
                if (ch == '/' || ch == '\\')
                {
                    flush();
                }
                else
                {
                    current.push_back(ch);
                }
            }
            flush();
            return segments;
        }

        std::string lowercase(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            return value;
        }

    } // namespace

    PathResolver::PathResolver(std::filesystem::path storage_root)
    {
        std::filesystem::create_directories(storage_root);
        root_ = std::filesystem::canonical(storage_root);
        root_key_ = lowercase(root_.string());
    }

    PathHandle PathResolver::resolve(std::string_view relative) const
    {
        auto candidate = root_;
        for (const auto &segment : clean_segments(relative))
        {
            candidate /= segment;
        }
        std::error_code ec;
        const auto canonical = std::filesystem::canonical(candidate, ec);
        if (ec)
        {
            throw StorageError(nanocloud::ErrorCode::NotFound, "No such path: " + candidate.string());
        }
        if (!is_within_root(canonical))
        {
            throw StorageError(nanocloud::ErrorCode::OutsideRoot, "Escapes storage root: " + canonical.string());
        }
        return make_handle(canonical);
    }

    PathHandle PathResolver::resolve_directory(std::string_view relative) const
    {
        auto handle = resolve(relative);
        if (!std::filesystem::is_directory(handle.absolute()))
        {
            throw StorageError(nanocloud::ErrorCode::NotFound, "Not a directory: " + handle.absolute().string());
        }
        return handle;
    }

    PathHandle PathResolver::resolve_for_new_entry(std::string_view relative) const
    {
        auto segments = clean_segments(relative);
        if (segments.empty())
        {
            throw StorageError(nanocloud::ErrorCode::InvalidName, "Empty entry name");
        }
        const auto leaf = segments.back();
        segments.pop_back();

        auto parent = root_;
        for (const auto &segment : segments)
        {
            parent /= segment;
        }
        std::error_code ec;
        const auto canonical_parent = std::filesystem::canonical(parent, ec);
        if (ec)
        {
            throw StorageError(nanocloud::ErrorCode::NotFound, "No such directory: " + parent.string());
        }
        const auto candidate = canonical_parent / leaf;
        if (!is_within_root(candidate))
        {
            throw StorageError(nanocloud::ErrorCode::OutsideRoot, "Escapes storage root: " + candidate.string());
        }
        // An existing leaf may itself be a link out of the root.
        if (std::filesystem::is_symlink(candidate, ec))
        {
            const auto target = std::filesystem::weakly_canonical(candidate, ec);
            if (ec || !is_within_root(target))
            {
                throw StorageError(nanocloud::ErrorCode::OutsideRoot, "Link escapes storage root: " + candidate.string());
            }
        }
        return make_handle(candidate);
    }

    PathHandle PathResolver::prepare_destination(const PathHandle &directory, std::string_view sanitized_name,
                                                 const PermissionPolicy &permissions) const
    {
        auto segments = clean_segments(sanitized_name);
        if (segments.empty())
        {
            throw StorageError(nanocloud::ErrorCode::InvalidName, "Empty file name");
        }
        segments.pop_back();

        auto current = directory.absolute();
        for (const auto &segment : segments)
        {
            current /= segment;
            std::error_code ec;
            if (std::filesystem::create_directory(current, ec))
            {
                permissions.apply_to_directory(current);
            }
            else if (ec)
            {
                throw StorageError(nanocloud::ErrorCode::IoError,
                                   "Cannot create " + current.string() + ": " + ec.message());
            }
            // Re-check each level so a pre-existing link cannot lead outside.
            const auto canonical = std::filesystem::canonical(current, ec);
            if (ec || !is_within_root(canonical) || !std::filesystem::is_directory(canonical))
            {
                throw StorageError(nanocloud::ErrorCode::OutsideRoot, "Unusable folder: " + current.string());
            }
            current = canonical;
        }

        std::string joined = directory.relative();
        if (!joined.empty())
        {
            joined.push_back('/');
        }
        joined.append(sanitized_name);
        return resolve_for_new_entry(joined);
    }

    bool PathResolver::is_within_root(const std::filesystem::path &candidate) const
    {
        const auto key = lowercase(candidate.string());
        if (key == root_key_)
        {
            return true;
        }
        const auto prefix = root_key_.ends_with('/') ? root_key_ : root_key_ + '/';
        return key.starts_with(prefix);
    }

    PathHandle PathResolver::make_handle(const std::filesystem::path &canonical) const
    {
        auto relative = canonical.lexically_relative(root_).generic_string();
        if (relative == ".")
        {
            relative.clear();
        }
        return PathHandle(canonical, std::move(relative));
    }

} // namespace nanocloud::server
