#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <httplib.h>

namespace nanocloud::server
{

    // A request the Api refuses before any handler runs; carries the HTTP status.
    class RequestError : public std::runtime_error
    {
    public:
        RequestError(int status, const std::string &message) : std::runtime_error(message), status_(status) {}

        int status() const noexcept { return status_; }

    private:
        int status_;
    };

    // Flat view over everything a client may send as named values: query string,
    // urlencoded body, multipart text parts and the scalar members of a JSON body.
    // Multipart parts that carry a filename are files. Lookups treat "name" and
    // "name[]" as the same field, and repeated values keep their order.
    class RequestFields
    {
    public:
        // Throws RequestError(415) for body types it cannot decode and
        // RequestError(400) for a malformed JSON body.
        static RequestFields from(const httplib::Request &request);

        std::optional<std::string> field(std::string_view name) const;
        std::string field_or(std::string_view name, std::string fallback) const;
        std::vector<std::string> fields_named(std::string_view name) const;

        const httplib::MultipartFormData *file(std::string_view name) const;
        std::vector<const httplib::MultipartFormData *> files_named(std::string_view name) const;

    private:
        std::vector<std::pair<std::string, std::string>> fields_;
        std::vector<std::pair<std::string, const httplib::MultipartFormData *>> files_;
    };

    // Value of one cookie from the Cookie header, if present.
    std::optional<std::string> cookie_value(const httplib::Request &request, std::string_view name);

} // namespace nanocloud::server
