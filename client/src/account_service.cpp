#include "firestarter/client/account_service.hpp"

#include "firestarter/client/api_proxy.hpp"
#include "firestarter/encoding/url.hpp"
#include "firestarter/error_codes.hpp"

namespace firestarter::client
{

    namespace
    {

        HttpRequest json_post(std::string url, const nlohmann::json &body)
        {
            HttpRequest request;
            request.method = "POST";
            request.url = std::move(url);
            request.headers["Content-Type"] = "application/json";
            request.body = body.dump();
            return request;
        }

        std::string failure_message(const std::string &prefix, const HttpResponse &response)
        {
            return prefix + " failed. Status: " + std::to_string(response.status_code) + ", Error: " + response.body;
        }

    } // namespace

    AccountService::AccountService(ApiConfig config, AuthorizedClient &client, const CredentialStore &store,
                                   Logger logger)
        : config_(std::move(config)), client_(client), store_(store), logger_(std::move(logger)) {}

    AuthTokens AccountService::parse_tokens(const HttpResponse &response, const std::string &failure) const
    {
        if (!response.success())
        {
            throw Error(ErrorCode::RemoteError, failure_message(failure, response), response.status_code);
        }
        AuthTokens tokens;
        try
        {
            tokens = nlohmann::json::parse(response.body).get<AuthTokens>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw Error(ErrorCode::InvalidResponse, std::string("Failed to parse response: ") + ex.what());
        }
        tokens.stamp_expiry(client_.tokens().now());
        return tokens;
    }

    AuthTokens AccountService::login(const std::string &username, const std::string &password)
    {
        const auto url = config_.url(config_.auth_login);
        logger_.log("account", "login for ", username, " at ", url);
        const auto response =
            client_.transport().send(json_post(url, {{"username", username}, {"password", password}}));
        if (!response.success())
        {
            logger_.error("account", "login failed with status ", response.status_code);
        }
        auto tokens = parse_tokens(response, "Login");
        logger_.log("account", "login succeeded, token expires at ", tokens.expires_at.value_or("?"));
        return tokens;
    }

    CreateUserResponse AccountService::register_user(const std::string &username)
    {
        const auto url = config_.url(config_.auth_register);
        logger_.log("account", "registering ", username);
        const auto response = client_.transport().send(json_post(url, {{"username", username}}));
        if (!response.success())
        {
            throw Error(ErrorCode::RemoteError, failure_message("Registration", response), response.status_code);
        }

        CreateUserResponse created;
        try
        {
            created = nlohmann::json::parse(response.body).get<CreateUserResponse>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw Error(ErrorCode::InvalidResponse, std::string("Failed to parse response: ") + ex.what());
        }

        store_.save(Credentials{created.user_id, created.user_app_key, std::nullopt, username});
        logger_.log("account", "registered ", username, " as ", created.user_id);
        return created;
    }

    AuthTokens AccountService::set_password(const std::string &user_id, const std::string &user_app_key,
                                            const std::string &new_password)
    {
        const auto url = config_.url(config_.auth_reset_password);
        logger_.log("account", "setting password for ", user_id);
        const auto response = client_.transport().send(json_post(
            url, {{"user_id", user_id}, {"user_app_key", user_app_key}, {"new_password", new_password}}));
        return parse_tokens(response, "Set password");
    }

    std::string AccountService::test_connection(const std::string &base_url)
    {
        auto trimmed = base_url;
        while (!trimmed.empty() && trimmed.back() == '/')
        {
            trimmed.pop_back();
        }

        HttpRequest request;
        request.url = trimmed + "/health";
        request.timeout = std::chrono::seconds(30);
        logger_.log("account", "testing connection to ", request.url);

        HttpResponse response;
        try
        {
            response = client_.transport().send(request);
        }
        catch (const Error &ex)
        {
            switch (ex.code())
            {
            case ErrorCode::TransportDns:
                throw Error(ex.code(), "DNS resolution failed. Please check the URL.");
            case ErrorCode::TransportConnection:
                throw Error(ex.code(), "Connection timeout. Please check the URL and network.");
            case ErrorCode::TransportCertificate:
                throw Error(ex.code(), "SSL/TLS certificate error. Please check the HTTPS URL.");
            case ErrorCode::Transport:
                throw Error(ex.code(), std::string("Network error: ") + ex.what());
            default:
                throw;
            }
        }

        if (!response.success())
        {
            throw Error(ErrorCode::RemoteError, "Server responded with status: " + std::to_string(response.status_code),
                        response.status_code);
        }

        const auto health = nlohmann::json::parse(response.body, nullptr, false);
        if (health.is_discarded())
        {
            return "Connection successful! Server responded with status " + std::to_string(response.status_code);
        }
        const auto status = health.is_object() ? health.find("status") : health.end();
        const auto version = health.is_object() ? health.find("version") : health.end();
        if (status != health.end() && status->is_string() && version != health.end() && version->is_string())
        {
            return "Connection successful! Server is " + status->get<std::string>() + " (v" +
                   version->get<std::string>() + ")";
        }
        return "Connection successful! Server responded normally.";
    }

    nlohmann::json AccountService::token_usage(Credentials &credentials, const std::string &period)
    {
        const auto url = config_.url(config_.token_usage) + "?user_id=" +
                         encoding::encode_query_component(credentials.user_id) +
                         "&period=" + encoding::encode_query_component(period) + "&detailed=false";
        const auto response = client_.send(
            credentials, [&](const Credentials &)
            {
                HttpRequest request;
                request.url = url;
                request.headers["Content-Type"] = "application/json";
                return request; },
            AuthInjection::BearerOnly);
        return decode_proxy_response(response);
    }

    nlohmann::json AccountService::tier_pricing()
    {
        if (!config_.get_tier_pricing)
        {
            throw Error(ErrorCode::Unsupported, "Tier pricing endpoint is not configured");
        }
        HttpRequest request;
        request.url = config_.url(*config_.get_tier_pricing);
        return decode_proxy_response(client_.transport().send(request));
    }

} // namespace firestarter::client
