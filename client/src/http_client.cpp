#include "nanocloud/client/http_client.hpp"

#include <chrono>

namespace nanocloud::client
{

    namespace
    {
        constexpr auto kSessionHeader = "X-Session-Token";
        constexpr std::chrono::seconds kConnectTimeout{10};
        constexpr std::chrono::seconds kReadTimeout{300};

        // Action labels are plain identifiers and need no escaping.
        std::string api_target(std::string_view action)
        {
            return "/api?action=" + std::string(action);
        }
    } // namespace

    HttpClient::HttpClient(const std::string &host, std::uint16_t port, std::optional<std::string> session_token)
        : client_(host, port)
    {
        client_.set_connection_timeout(kConnectTimeout);
        client_.set_read_timeout(kReadTimeout);
        client_.set_write_timeout(kReadTimeout);
        client_.set_keep_alive(false);

        httplib::Headers headers{{"Accept", "application/json"}};
        if (session_token)
        {
            headers.emplace(kSessionHeader, *session_token);
        }
        client_.set_default_headers(std::move(headers));
    }

    nlohmann::json HttpClient::call(std::string_view action, const httplib::MultipartFormDataItems &form)
    {
        return decode(client_.Post(api_target(action), form));
    }

    nlohmann::json HttpClient::get_info()
    {
        return decode(client_.Get(api_target("info")));
    }

    nlohmann::json HttpClient::decode(const httplib::Result &result)
    {
        if (!result)
        {
            throw TransportError("Request failed: " + httplib::to_string(result.error()));
        }
        auto json = nlohmann::json::parse(result->body, nullptr, false);
        if (json.is_discarded() || !json.is_object())
        {
            throw TransportError("Server replied with HTTP " + std::to_string(result->status) + " and no JSON body");
        }
        return json;
    }

} // namespace nanocloud::client
