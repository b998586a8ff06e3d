#include "firestarter/client/authorized_client.hpp"

namespace firestarter::client
{

    namespace
    {
        constexpr int kUnauthorized = 401;
    } // namespace

    bool apply_auth_headers(HttpHeaders &headers, const Credentials &credentials, AuthInjection mode)
    {
        if (mode == AuthInjection::None)
        {
            return false;
        }
        if (credentials.auth_tokens)
        {
            headers["Authorization"] = "Bearer " + credentials.auth_tokens->access_token;
            return true;
        }
        if (mode == AuthInjection::BearerOrLegacyHeaders)
        {
            headers["X-User-Id"] = credentials.user_id;
            headers["X-User-App-Key"] = credentials.user_app_key;
        }
        return false;
    }

    AuthorizedClient::AuthorizedClient(HttpTransport &transport, TokenManager &tokens, Logger logger)
        : transport_(transport), tokens_(tokens), logger_(std::move(logger)) {}

    HttpResponse AuthorizedClient::send(Credentials &credentials, const RequestBuilder &build, AuthInjection mode)
    {
        tokens_.ensure_valid_token(credentials);

        auto request = build(credentials);
        const bool token_auth = apply_auth_headers(request.headers, credentials, mode);
        auto response = transport_.send(request);
        if (response.status_code != kUnauthorized || !token_auth)
        {
            return response;
        }

        logger_.warn("auth", "401 from ", request.url, ", refreshing token and retrying once");
        tokens_.force_refresh(credentials);

        auto retry = build(credentials);
        apply_auth_headers(retry.headers, credentials, mode);
        return transport_.send(retry);
    }

} // namespace firestarter::client
