#include "nanocloud/server/request_fields.hpp"

#include <algorithm>
#include <cctype>

#include <nlohmann/json.hpp>

namespace nanocloud::server
{

    namespace
    {

        bool same_field(std::string_view stored, std::string_view wanted) noexcept
        {
            if (stored.ends_with("[]"))
            {
                stored.remove_suffix(2);
            }
            if (wanted.ends_with("[]"))
            {
                wanted.remove_suffix(2);
            }
            return stored == wanted;
        }

        std::string_view trim(std::string_view value) noexcept
        {
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
            {
                value.remove_prefix(1);
            }
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
            {
                value.remove_suffix(1);
            }
            return value;
        }

        // "Multipart/Form-Data; boundary=x" -> "multipart/form-data"
        std::string media_type(std::string_view content_type)
        {
            std::string result(trim(content_type.substr(0, content_type.find(';'))));
            std::transform(result.begin(), result.end(), result.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            return result;
        }

    } // namespace

    RequestFields RequestFields::from(const httplib::Request &request)
    {
        RequestFields fields;
        // Query parameters, plus the body of an urlencoded POST, which httplib
        // decodes into the same map.
        for (const auto &[name, value] : request.params)
        {
            fields.fields_.emplace_back(name, value);
        }

        if (request.is_multipart_form_data())
        {
            for (const auto &[name, part] : request.files)
            {
                if (part.filename.empty())
                {
                    fields.fields_.emplace_back(name, part.content);
                }
                else
                {
                    fields.files_.emplace_back(name, &part);
                }
            }
            return fields;
        }

        if (request.body.empty())
        {
            return fields;
        }
        const auto type = media_type(request.get_header_value("Content-Type"));
        if (type == "application/x-www-form-urlencoded")
        {
            return fields;
        }
        if (type != "application/json")
        {
            throw RequestError(415, "Unsupported content type.");
        }

        const auto json = nlohmann::json::parse(request.body, nullptr, false);
        if (json.is_discarded() || !json.is_object())
        {
            throw RequestError(400, "Request body must be a JSON object.");
        }
        for (const auto &[key, value] : json.items())
        {
            if (value.is_string())
            {
                fields.fields_.emplace_back(key, value.get<std::string>());
            }
            else if (value.is_array())
            {
                for (const auto &item : value)
                {
                    fields.fields_.emplace_back(key, item.is_string() ? item.get<std::string>() : item.dump());
                }
            }
            else if (!value.is_null())
            {
                fields.fields_.emplace_back(key, value.dump());
            }
        }
        return fields;
    }

    std::optional<std::string> RequestFields::field(std::string_view name) const
    {
        const auto it = std::find_if(fields_.begin(), fields_.end(), [name](const auto &entry)
                                     { return same_field(entry.first, name); });
        if (it == fields_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::string RequestFields::field_or(std::string_view name, std::string fallback) const
    {
        auto value = field(name);
        return value ? std::move(*value) : std::move(fallback);
    }

    std::vector<std::string> RequestFields::fields_named(std::string_view name) const
    {
        std::vector<std::string> values;
        for (const auto &[stored, value] : fields_)
        {
            if (same_field(stored, name))
            {
                values.push_back(value);
            }
        }
        return values;
    }

    const httplib::MultipartFormData *RequestFields::file(std::string_view name) const
    {
        for (const auto &[stored, part] : files_)
        {
            if (same_field(stored, name))
            {
                return part;
            }
        }
        return nullptr;
    }

    std::vector<const httplib::MultipartFormData *> RequestFields::files_named(std::string_view name) const
    {
        std::vector<const httplib::MultipartFormData *> parts;
        for (const auto &[stored, part] : files_)
        {
            if (same_field(stored, name))
            {
                parts.push_back(part);
            }
        }
        return parts;
    }

    std::optional<std::string> cookie_value(const httplib::Request &request, std::string_view name)
    {
        const auto header = request.get_header_value("Cookie");
        std::string_view remaining = header;
        while (!remaining.empty())
        {
            const auto end = remaining.find(';');
            const auto item = trim(remaining.substr(0, end));
            const auto eq = item.find('=');
            if (eq != std::string_view::npos && trim(item.substr(0, eq)) == name)
            {
                return std::string(trim(item.substr(eq + 1)));
            }
            if (end == std::string_view::npos)
            {
                break;
            }
            remaining.remove_prefix(end + 1);
        }
        return std::nullopt;
    }

} // namespace nanocloud::server
