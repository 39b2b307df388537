#include "nanocloud/server/name_sanitizer.hpp"

#include <vector>

namespace nanocloud::server
{

    namespace
    {
        constexpr char kFiller = '_';

        bool is_safe_char(char ch) noexcept
        {
            if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9'))
            {
                return true;
            }
            switch (ch)
            {
            case '.':
            case '_':
            case ' ':
            case '-':
            case '(':
            case ')':
            case '[':
            case ']':
            case '+':
                return true;
            default:
                return false;
            }
        }

        std::string filter_and_trim(std::string_view raw)
        {
            std::string result;
            result.reserve(raw.size());
            for (const char ch : raw)
            {
                // Separators become filler before the general filter runs.
                if (ch == '/' || ch == '\\')
                {
                    result.push_back(kFiller);
                }
                else
                {
                    result.push_back(is_safe_char(ch) ? ch : kFiller);
                }
            }
            const auto begin = result.find_first_not_of(' ');
            if (begin == std::string::npos)
            {
                return {};
            }
            const auto end = result.find_last_not_of(' ');
            return result.substr(begin, end - begin + 1);
        }

        bool is_unusable(std::string_view name) noexcept
        {
            return name.empty() || name == "." || name == "..";
        }

        std::vector<std::string_view> split_path(std::string_view raw, std::string &storage)
        {
            storage.assign(raw);
            for (auto &ch : storage)
            {
                if (ch == '\\')
                {
                    ch = '/';
                }
            }
            std::vector<std::string_view> segments;
            std::string_view view = storage;
            std::size_t start = 0;
            while (start <= view.size())
            {
                auto end = view.find('/', start);
                if (end == std::string_view::npos)
                {
                    end = view.size();
                }
                segments.push_back(view.substr(start, end - start));
                start = end + 1;
            }
            return segments;
        }

    } // namespace

    std::string sanitize_segment(std::string_view raw)
    {
        auto segment = filter_and_trim(raw);
        if (is_unusable(segment))
        {
            return {};
        }
        return segment;
    }

    std::string sanitize_filename(std::string_view raw, EmptyNamePolicy policy, std::chrono::system_clock::time_point now)
    {
        const auto last_separator = raw.find_last_of("/\\");
        if (last_separator != std::string_view::npos)
        {
            raw.remove_prefix(last_separator + 1);
        }
        auto name = filter_and_trim(raw);
        if (!is_unusable(name))
        {
            return name;
        }
        if (policy == EmptyNamePolicy::Reject)
        {
            return {};
        }
        const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
        return "file_" + std::to_string(seconds);
    }

    std::string sanitize_relative_path(std::string_view raw, EmptyNamePolicy policy)
    {
        std::string storage;
        const auto segments = split_path(raw, storage);
        std::string result;
        for (std::size_t i = 0; i + 1 < segments.size(); ++i)
        {
            const auto clean = sanitize_segment(segments[i]);
            if (clean.empty())
            {
                continue;
            }
            result += clean;
            result.push_back('/');
        }

        // The last raw segment names the file, so an unusable one is never
        // replaced by its parent folder.
        const auto name = sanitize_filename(segments.back(), policy);
        if (name.empty())
        {
            return {};
        }
        return result + name;
    }

    std::string sanitize_upload_name(std::string_view relative_path, std::string_view filename, EmptyNamePolicy policy)
    {
        if (!relative_path.empty())
        {
            return sanitize_relative_path(relative_path, policy);
        }
        return sanitize_filename(filename, policy);
    }

} // namespace nanocloud::server
