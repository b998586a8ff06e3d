#include "firestarter/client/session.hpp"

#include "firestarter/error_codes.hpp"

namespace firestarter::client
{

    namespace
    {

        nlohmann::json parse_json_argument(const std::string &text, const std::string &what)
        {
            auto json = nlohmann::json::parse(text, nullptr, false);
            if (json.is_discarded())
            {
                throw Error(ErrorCode::InvalidArgument, "Invalid JSON for " + what);
            }
            return json;
        }

    } // namespace

    nlohmann::json ClientSession::handle_get_config(const CommandArgs &, const CancellationToken &)
    {
        return api_;
    }

    nlohmann::json ClientSession::handle_config_path(const CommandArgs &, const CancellationToken &)
    {
        if (config_.api_config_path)
        {
            return config_.api_config_path->string();
        }
        return "<bundled>/config/api_endpoints.json";
    }

    nlohmann::json ClientSession::handle_test_connection(const CommandArgs &args, const CancellationToken &)
    {
        return accounts_.test_connection(args.optional_at(0).value_or(api_.api_base_url));
    }

    nlohmann::json ClientSession::handle_proxy_get(const CommandArgs &args, const CancellationToken &)
    {
        const auto &url = args.at(0, "proxy-get <url> [headers_json]");
        HttpHeaders headers;
        if (const auto raw = args.optional_at(1))
        {
            headers = headers_from_json(parse_json_argument(*raw, "headers"));
        }
        return proxy_.get(url, headers);
    }

    nlohmann::json ClientSession::handle_proxy_post(const CommandArgs &args, const CancellationToken &)
    {
        const auto &url = args.at(0, "proxy-post <url> [body_json] [headers_json]");
        std::optional<nlohmann::json> body;
        if (const auto raw = args.optional_at(1))
        {
            body = parse_json_argument(*raw, "body");
        }
        HttpHeaders headers;
        if (const auto raw = args.optional_at(2))
        {
            headers = headers_from_json(parse_json_argument(*raw, "headers"));
        }
        return proxy_.post(url, headers, body);
    }

    nlohmann::json ClientSession::handle_token_usage(const CommandArgs &args, const CancellationToken &)
    {
        const auto &period = args.at(0, "token-usage <period> [--user U]");
        auto credentials = current_credentials(args);
        return accounts_.token_usage(credentials, period);
    }

    nlohmann::json ClientSession::handle_register(const CommandArgs &args, const CancellationToken &)
    {
        return accounts_.register_user(args.at(0, "register <username>"));
    }

    nlohmann::json ClientSession::handle_login(const CommandArgs &args, const CancellationToken &)
    {
        const std::string usage = "login <username> <password>";
        const auto &username = args.at(0, usage);
        const auto tokens = accounts_.login(username, args.at(1, usage));
        merge_tokens([&](const Credentials &credentials)
                     { return credentials.username == username || credentials.user_id == username; },
                     tokens);
        return tokens;
    }

    nlohmann::json ClientSession::handle_set_password(const CommandArgs &args, const CancellationToken &)
    {
        const std::string usage = "set-password <user_id> <user_app_key> <new_password>";
        const auto &user_id = args.at(0, usage);
        const auto tokens = accounts_.set_password(user_id, args.at(1, usage), args.at(2, usage));
        merge_tokens([&](const Credentials &credentials)
                     { return credentials.user_id == user_id; },
                     tokens);
        return tokens;
    }

    nlohmann::json ClientSession::handle_save_credentials(const CommandArgs &args, const CancellationToken &)
    {
        const auto json = parse_json_argument(args.at(0, "save-credentials <credentials_json>"), "credentials");
        Credentials credentials;
        try
        {
            credentials = json.get<Credentials>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw Error(ErrorCode::InvalidArgument, std::string("Invalid credentials: ") + ex.what());
        }
        store_.save(credentials);
        return "Credentials saved";
    }

    nlohmann::json ClientSession::handle_load_credentials(const CommandArgs &args, const CancellationToken &)
    {
        const auto credentials = store_.load(args.optional_at(0).value_or(""));
        if (!credentials)
        {
            return nullptr;
        }
        return *credentials;
    }

    nlohmann::json ClientSession::handle_clear_credentials(const CommandArgs &args, const CancellationToken &)
    {
        store_.clear(args.at(0, "clear-credentials <user_id>"));
        return "Credentials cleared";
    }

    nlohmann::json ClientSession::handle_list_users(const CommandArgs &, const CancellationToken &)
    {
        return store_.list();
    }

    nlohmann::json ClientSession::handle_refresh_token(const CommandArgs &args, const CancellationToken &)
    {
        auto credentials = store_.require(args.optional_at(0).value_or(""));
        tokens_.ensure_valid_token(credentials);
        return "Token refreshed successfully";
    }

    nlohmann::json ClientSession::handle_create_link(const CommandArgs &args, const CancellationToken &)
    {
        const auto &remote_path = args.at(0, "create-link <remote_path> [--title T] [--description D] [--user U]");
        auto credentials = current_credentials(args);
        return links_.create(credentials, remote_path, args.option("title"), args.option("description"));
    }

    nlohmann::json ClientSession::handle_delete_link(const CommandArgs &args, const CancellationToken &)
    {
        const auto &link_hash = args.at(0, "delete-link <link_hash> [--user U]");
        auto credentials = current_credentials(args);
        return links_.remove(credentials, link_hash);
    }

    nlohmann::json ClientSession::handle_list_links(const CommandArgs &args, const CancellationToken &)
    {
        if (const auto user_id = args.optional_at(0))
        {
            return links_.list(*user_id);
        }
        return links_.list(current_credentials(args).user_id);
    }

    nlohmann::json ClientSession::handle_tier_pricing(const CommandArgs &, const CancellationToken &)
    {
        return accounts_.tier_pricing();
    }

} // namespace firestarter::client
