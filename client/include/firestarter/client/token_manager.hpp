#pragma once

#include <chrono>
#include <functional>

#include "firestarter/client/api_config.hpp"
#include "firestarter/client/credential_store.hpp"
#include "firestarter/client/http_transport.hpp"
#include "firestarter/client/logger.hpp"
#include "firestarter/client/models.hpp"

namespace firestarter::client
{

    using Clock = std::chrono::system_clock;

    // Tokens are refreshed this long before their hard expiry.
    inline constexpr std::chrono::minutes kRefreshBuffer{5};

    // Absent or unparsable expires_at counts as expired.
    bool is_token_expired(const AuthTokens &tokens, Clock::time_point now);

    class TokenManager
    {
    public:
        using ClockFn = std::function<Clock::time_point()>;

        TokenManager(ApiConfig config, HttpTransport &transport, const CredentialStore &store, Logger logger,
                     ClockFn clock = [] { return Clock::now(); });

        // Exchanges the refresh token for a new access token. The result keeps refresh_token,
        // token_type and csrf_token of the input. Throws AuthenticationFailed on rejection.
        AuthTokens refresh(const AuthTokens &tokens);

        // No-op for legacy credentials or unexpired tokens. Otherwise refreshes and persists; on
        // failure the tokens are dropped, the cleared session is persisted and
        // AuthenticationFailed is thrown.
        void ensure_valid_token(Credentials &credentials);

        // Same as ensure_valid_token but ignores the expiry check.
        void force_refresh(Credentials &credentials);

        Clock::time_point now() const { return clock_(); }

    private:
        void refresh_and_store(Credentials &credentials);

        ApiConfig config_;
        HttpTransport &transport_;
        const CredentialStore &store_;
        Logger logger_;
        ClockFn clock_;
    };

} // namespace firestarter::client
