#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "firestarter/client/api_config.hpp"
#include "firestarter/client/authorized_client.hpp"
#include "firestarter/client/credential_store.hpp"
#include "firestarter/client/http_transport.hpp"
#include "firestarter/client/logger.hpp"

namespace firestarter::client
{

    // URLs starting with "http" pass through, anything else is joined to api_base_url.
    std::string resolve_proxy_url(const ApiConfig &config, const std::string &url);

    // String-valued members of a JSON object; other members are ignored.
    HttpHeaders headers_from_json(const nlohmann::json &object);

    // Forwards arbitrary GET/POST calls to the remote service on behalf of the UI and returns
    // the decoded JSON response.
    class ApiProxy
    {
    public:
        ApiProxy(ApiConfig config, AuthorizedClient &client, const CredentialStore &store, Logger logger);

        nlohmann::json get(const std::string &url, const HttpHeaders &headers = {});

        nlohmann::json post(const std::string &url, const HttpHeaders &headers = {},
                            std::optional<nlohmann::json> body = std::nullopt);

    private:
        nlohmann::json execute(const std::string &method, const std::string &url, const HttpHeaders &headers,
                               const std::optional<nlohmann::json> &body);

        ApiConfig config_;
        AuthorizedClient &client_;
        const CredentialStore &store_;
        Logger logger_;
    };

    // 2xx with a JSON body, else RemoteError / InvalidResponse.
    nlohmann::json decode_proxy_response(const HttpResponse &response);

} // namespace firestarter::client
