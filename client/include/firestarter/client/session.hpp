#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "firestarter/client/account_service.hpp"
#include "firestarter/client/api_config.hpp"
#include "firestarter/client/api_proxy.hpp"
#include "firestarter/client/authorized_client.hpp"
#include "firestarter/client/cancellation.hpp"
#include "firestarter/client/config.hpp"
#include "firestarter/client/credential_store.hpp"
#include "firestarter/client/events.hpp"
#include "firestarter/client/http_transport.hpp"
#include "firestarter/client/link_service.hpp"
#include "firestarter/client/logger.hpp"
#include "firestarter/client/public_link_store.hpp"
#include "firestarter/client/token_manager.hpp"
#include "firestarter/client/transfer_engine.hpp"
#include "firestarter/client/transfer_log.hpp"

namespace firestarter::client
{

    // Positional words plus "--name value" pairs of one command line.
    struct CommandArgs
    {
        std::vector<std::string> positional;
        std::map<std::string, std::string> options;

        static CommandArgs parse(const std::vector<std::string> &args);

        std::optional<std::string> option(const std::string &name) const;
        std::optional<std::string> optional_at(std::size_t index) const;
        // Throws InvalidArgument with the usage line when the word is missing.
        const std::string &at(std::size_t index, const std::string &usage) const;
    };

    // Wires every component for one invocation and maps command names onto them.
    class ClientSession
    {
    public:
        ClientSession(ClientConfig config, ApiConfig api, HttpTransport &transport, Logger logger);

        nlohmann::json execute(const std::string &command, const std::vector<std::string> &args,
                               const CancellationToken &cancel = CancellationToken());

        bool has_command(const std::string &command) const;

        EventDispatcher &events() noexcept { return events_; }
        const CredentialStore &credentials() const noexcept { return store_; }

    private:
        using Handler = nlohmann::json (ClientSession::*)(const CommandArgs &, const CancellationToken &);

        Credentials current_credentials(const CommandArgs &args) const;
        bool merge_tokens(const std::function<bool(const Credentials &)> &matches, const AuthTokens &tokens);

        nlohmann::json handle_get_config(const CommandArgs &args, const CancellationToken &cancel);
        nlohmann::json handle_config_path(const CommandArgs &args, const CancellationToken &cancel);
        nlohmann::json handle_test_connection(const CommandArgs &args, const CancellationToken &cancel);
        nlohmann::json handle_proxy_get(const CommandArgs &args, const CancellationToken &cancel);
        nlohmann::json handle_proxy_post(const CommandArgs &args, const CancellationToken &cancel);
        nlohmann::json handle_token_usage(const CommandArgs &args, const CancellationToken &cancel);
        nlohmann::json handle_register(const CommandArgs &args, const CancellationToken &cancel);
        nlohmann::json handle_login(const CommandArgs &args, const CancellationToken &cancel);
        nlohmann::json handle_set_password(const CommandArgs &args, const CancellationToken &cancel);
        nlohmann::json handle_save_credentials(const CommandArgs &args, const CancellationToken &cancel);
        nlohmann::json handle_load_credentials(const CommandArgs &args, const CancellationToken &cancel);
        nlohmann::json handle_clear_credentials(const CommandArgs &args, const CancellationToken &cancel);
        nlohmann::json handle_list_users(const CommandArgs &args, const CancellationToken &cancel);
        nlohmann::json handle_refresh_token(const CommandArgs &args, const CancellationToken &cancel);
        nlohmann::json handle_create_link(const CommandArgs &args, const CancellationToken &cancel);
        nlohmann::json handle_delete_link(const CommandArgs &args, const CancellationToken &cancel);
        nlohmann::json handle_list_links(const CommandArgs &args, const CancellationToken &cancel);
        nlohmann::json handle_tier_pricing(const CommandArgs &args, const CancellationToken &cancel);

        nlohmann::json handle_upload(const CommandArgs &args, const CancellationToken &cancel);
        nlohmann::json handle_download(const CommandArgs &args, const CancellationToken &cancel);
        nlohmann::json handle_upload_history(const CommandArgs &args, const CancellationToken &cancel);
        nlohmann::json handle_file_size(const CommandArgs &args, const CancellationToken &cancel);

        ClientConfig config_;
        ApiConfig api_;
        Logger logger_;
        EventDispatcher events_;
        CredentialStore store_;
        TransferLog ledger_;
        PublicLinkStore link_store_;
        TokenManager tokens_;
        AuthorizedClient client_;
        TransferEngine transfers_;
        ApiProxy proxy_;
        AccountService accounts_;
        LinkService links_;
        std::map<std::string, Handler> handlers_;
    };

} // namespace firestarter::client
