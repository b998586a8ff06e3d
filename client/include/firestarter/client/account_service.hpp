#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "firestarter/client/api_config.hpp"
#include "firestarter/client/authorized_client.hpp"
#include "firestarter/client/credential_store.hpp"
#include "firestarter/client/logger.hpp"
#include "firestarter/client/models.hpp"

namespace firestarter::client
{

    // Account level calls: login, registration, password reset, health and usage queries.
    class AccountService
    {
    public:
        AccountService(ApiConfig config, AuthorizedClient &client, const CredentialStore &store, Logger logger);

        // Returns freshly stamped tokens. Nothing is persisted here.
        AuthTokens login(const std::string &username, const std::string &password);

        // Creates the account and persists its credentials.
        CreateUserResponse register_user(const std::string &username);

        AuthTokens set_password(const std::string &user_id, const std::string &user_app_key,
                                const std::string &new_password);

        // GET <base_url>/health. Transport failures are rethrown with a user facing message.
        std::string test_connection(const std::string &base_url);

        nlohmann::json token_usage(Credentials &credentials, const std::string &period);

        nlohmann::json tier_pricing();

    private:
        AuthTokens parse_tokens(const HttpResponse &response, const std::string &failure) const;

        ApiConfig config_;
        AuthorizedClient &client_;
        const CredentialStore &store_;
        Logger logger_;
    };

} // namespace firestarter::client
