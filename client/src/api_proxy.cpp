#include "firestarter/client/api_proxy.hpp"

#include "firestarter/error_codes.hpp"

namespace firestarter::client
{

    std::string resolve_proxy_url(const ApiConfig &config, const std::string &url)
    {
        if (url.rfind("http", 0) == 0)
        {
            return url;
        }
        return config.url(url);
    }

    HttpHeaders headers_from_json(const nlohmann::json &object)
    {
        HttpHeaders headers;
        if (!object.is_object())
        {
            return headers;
        }
        for (const auto &[key, value] : object.items())
        {
            if (value.is_string())
            {
                headers[key] = value.get<std::string>();
            }
        }
        return headers;
    }

    nlohmann::json decode_proxy_response(const HttpResponse &response)
    {
        if (!response.success())
        {
            throw Error(ErrorCode::RemoteError, "HTTP " + std::to_string(response.status_code) + ": " + response.body,
                        response.status_code);
        }
        auto json = nlohmann::json::parse(response.body, nullptr, false);
        if (json.is_discarded())
        {
            throw Error(ErrorCode::InvalidResponse, "Success but response is not valid JSON: " + response.body,
                        response.status_code);
        }
        return json;
    }

    ApiProxy::ApiProxy(ApiConfig config, AuthorizedClient &client, const CredentialStore &store, Logger logger)
        : config_(std::move(config)), client_(client), store_(store), logger_(std::move(logger)) {}

    nlohmann::json ApiProxy::get(const std::string &url, const HttpHeaders &headers)
    {
        return execute("GET", url, headers, std::nullopt);
    }

    nlohmann::json ApiProxy::post(const std::string &url, const HttpHeaders &headers,
                                  std::optional<nlohmann::json> body)
    {
        return execute("POST", url, headers, body);
    }

    nlohmann::json ApiProxy::execute(const std::string &method, const std::string &url, const HttpHeaders &headers,
                                     const std::optional<nlohmann::json> &body)
    {
        const auto full_url = resolve_proxy_url(config_, url);

        const auto build = [&](const Credentials *credentials)
        {
            HttpRequest request;
            request.method = method;
            request.url = full_url;
            request.headers = headers;
            if (method != "POST")
            {
                return request;
            }

            auto payload = body.value_or(nlohmann::json());
            if (credentials && !credentials->auth_tokens)
            {
                if (payload.is_null())
                {
                    payload = nlohmann::json::object();
                }
                if (payload.is_object())
                {
                    payload["user_id"] = credentials->user_id;
                    payload["user_app_key"] = credentials->user_app_key;
                }
            }
            if (!payload.is_null())
            {
                request.body = payload.dump();
                if (!find_header(request.headers, "Content-Type"))
                {
                    request.headers["Content-Type"] = "application/json";
                }
            }
            return request;
        };

        logger_.log("proxy", method, " ", full_url);

        std::optional<Credentials> credentials;
        if (!find_header(headers, "Authorization"))
        {
            credentials = store_.load();
        }

        HttpResponse response;
        if (credentials)
        {
            response = client_.send(
                *credentials, [&](const Credentials &current)
                { return build(&current); },
                AuthInjection::BearerOnly);
        }
        else
        {
            response = client_.transport().send(build(nullptr));
        }

        if (!response.success())
        {
            logger_.warn("proxy", method, " ", full_url, " returned ", response.status_code);
        }
        return decode_proxy_response(response);
    }

} // namespace firestarter::client
