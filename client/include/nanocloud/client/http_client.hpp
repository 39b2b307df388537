#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <httplib.h>
#include <nlohmann/json.hpp>

namespace nanocloud::client
{

    // The request never got a JSON reply: connection failure, timeout, or a
    // response body that is not a JSON object.
    class TransportError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // Blocking client for the /api endpoint. Failures surface as TransportError;
    // a JSON reply is returned whatever its HTTP status.
    class HttpClient
    {
    public:
        HttpClient(const std::string &host, std::uint16_t port, std::optional<std::string> session_token = std::nullopt);

        // POSTs a multipart form to /api?action=<action>.
        nlohmann::json call(std::string_view action, const httplib::MultipartFormDataItems &form);

        nlohmann::json get_info();

    private:
        static nlohmann::json decode(const httplib::Result &result);

        httplib::Client client_;
    };

} // namespace nanocloud::client
