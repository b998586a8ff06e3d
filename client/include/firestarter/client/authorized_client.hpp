#pragma once

#include <functional>

#include "firestarter/client/http_transport.hpp"
#include "firestarter/client/logger.hpp"
#include "firestarter/client/models.hpp"
#include "firestarter/client/token_manager.hpp"

namespace firestarter::client
{

    enum class AuthInjection
    {
        // Bearer token, else X-User-Id / X-User-App-Key.
        BearerOrLegacyHeaders,
        // Bearer token only; legacy identity is the caller's business.
        BearerOnly,
        // The caller already set its own Authorization header.
        None
    };

    // Adds auth headers for the credentials. Returns true when a bearer token was used.
    bool apply_auth_headers(HttpHeaders &headers, const Credentials &credentials, AuthInjection mode);

    // Sends requests on behalf of stored credentials with the single refresh-and-retry policy:
    // a 401 answered to a bearer-authenticated request forces one token refresh and one resend.
    // Any second failure is returned to the caller as is.
    class AuthorizedClient
    {
    public:
        using RequestBuilder = std::function<HttpRequest(const Credentials &)>;

        AuthorizedClient(HttpTransport &transport, TokenManager &tokens, Logger logger);

        HttpResponse send(Credentials &credentials, const RequestBuilder &build,
                          AuthInjection mode = AuthInjection::BearerOrLegacyHeaders);

        HttpTransport &transport() noexcept { return transport_; }
        TokenManager &tokens() noexcept { return tokens_; }

    private:
        HttpTransport &transport_;
        TokenManager &tokens_;
        Logger logger_;
    };

} // namespace firestarter::client
