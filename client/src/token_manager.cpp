#include "firestarter/client/token_manager.hpp"

#include <nlohmann/json.hpp>

#include "firestarter/error_codes.hpp"
#include "firestarter/time_format.hpp"

namespace firestarter::client
{

    bool is_token_expired(const AuthTokens &tokens, Clock::time_point now)
    {
        if (!tokens.expires_at)
        {
            return true;
        }
        const auto expires_at = time_format::parse_rfc3339(*tokens.expires_at);
        if (!expires_at)
        {
            return true;
        }
        return now + kRefreshBuffer >= *expires_at;
    }

    TokenManager::TokenManager(ApiConfig config, HttpTransport &transport, const CredentialStore &store, Logger logger,
                               ClockFn clock)
        : config_(std::move(config)),
          transport_(transport),
          store_(store),
          logger_(std::move(logger)),
          clock_(std::move(clock)) {}

    AuthTokens TokenManager::refresh(const AuthTokens &tokens)
    {
        HttpRequest request;
        request.method = "POST";
        request.url = config_.url(config_.auth_refresh);
        request.headers["Content-Type"] = "application/json";
        request.body = nlohmann::json{{"refresh_token", tokens.refresh_token}}.dump();
        request.timeout = std::chrono::seconds(30);

        const auto response = transport_.send(request);
        if (!response.success())
        {
            throw Error(ErrorCode::AuthenticationFailed,
                        "Token refresh failed: " + response.body, response.status_code);
        }

        const auto json = nlohmann::json::parse(response.body, nullptr, false);
        if (json.is_discarded() || !json.contains("access_token") || !json.contains("expires_in"))
        {
            throw Error(ErrorCode::AuthenticationFailed, "Failed to parse refresh response: " + response.body);
        }

        AuthTokens refreshed = tokens;
        try
        {
            refreshed.access_token = json.at("access_token").get<std::string>();
            refreshed.expires_in = json.at("expires_in").get<std::int64_t>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw Error(ErrorCode::AuthenticationFailed, std::string("Failed to parse refresh response: ") + ex.what());
        }
        refreshed.stamp_expiry(clock_());
        return refreshed;
    }

    void TokenManager::ensure_valid_token(Credentials &credentials)
    {
        if (!credentials.auth_tokens)
        {
            return;
        }
        if (!is_token_expired(*credentials.auth_tokens, clock_()))
        {
            return;
        }
        logger_.log("token", "token expired or expiring soon for ", credentials.user_id, ", refreshing");
        refresh_and_store(credentials);
    }

    void TokenManager::force_refresh(Credentials &credentials)
    {
        if (!credentials.auth_tokens)
        {
            throw Error(ErrorCode::AuthenticationRequired, "No auth tokens to refresh, please login");
        }
        logger_.log("token", "forcing refresh for ", credentials.user_id);
        refresh_and_store(credentials);
    }

    void TokenManager::refresh_and_store(Credentials &credentials)
    {
        AuthTokens refreshed;
        try
        {
            refreshed = refresh(*credentials.auth_tokens);
        }
        catch (const Error &ex)
        {
            if (ex.code() != ErrorCode::AuthenticationFailed)
            {
                throw;
            }
            logger_.error("token", "refresh failed for ", credentials.user_id, ": ", ex.what());
            credentials.auth_tokens.reset();
            store_.save(credentials);
            throw Error(ErrorCode::AuthenticationFailed, "Token refresh failed, please login again",
                        ex.http_status());
        }

        credentials.auth_tokens = std::move(refreshed);
        store_.save(credentials);
        logger_.log("token", "token refreshed for ", credentials.user_id, ", expires at ",
                    credentials.auth_tokens->expires_at.value_or("?"));
    }

} // namespace firestarter::client
