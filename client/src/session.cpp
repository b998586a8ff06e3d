#include "firestarter/client/session.hpp"

#include "firestarter/error_codes.hpp"

namespace firestarter::client
{

    CommandArgs CommandArgs::parse(const std::vector<std::string> &args)
    {
        CommandArgs parsed;
        for (std::size_t i = 0; i < args.size(); ++i)
        {
            const auto &arg = args[i];
            if (arg.size() > 2 && arg.rfind("--", 0) == 0)
            {
                if (i + 1 >= args.size())
                {
                    throw Error(ErrorCode::InvalidArgument, arg + " requires a value");
                }
                parsed.options[arg.substr(2)] = args[++i];
                continue;
            }
            parsed.positional.push_back(arg);
        }
        return parsed;
    }

    std::optional<std::string> CommandArgs::option(const std::string &name) const
    {
        if (auto it = options.find(name); it != options.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    std::optional<std::string> CommandArgs::optional_at(std::size_t index) const
    {
        if (index < positional.size())
        {
            return positional[index];
        }
        return std::nullopt;
    }

    const std::string &CommandArgs::at(std::size_t index, const std::string &usage) const
    {
        if (index >= positional.size())
        {
            throw Error(ErrorCode::InvalidArgument, "Usage: " + usage);
        }
        return positional[index];
    }

    ClientSession::ClientSession(ClientConfig config, ApiConfig api, HttpTransport &transport, Logger logger)
        : config_(std::move(config)),
          api_(std::move(api)),
          logger_(std::move(logger)),
          events_(logger_),
          store_(config_.data_dir, logger_),
          ledger_(config_.data_dir, logger_),
          link_store_(config_.data_dir),
          tokens_(api_, transport, store_, logger_),
          client_(transport, tokens_, logger_),
          transfers_(api_, client_, ledger_, events_, logger_, TransferOptions{config_.chunk_size}),
          proxy_(api_, client_, store_, logger_),
          accounts_(api_, client_, store_, logger_),
          links_(api_, client_, link_store_, logger_)
    {
        handlers_ = {
            {"get-config", &ClientSession::handle_get_config},
            {"config-path", &ClientSession::handle_config_path},
            {"test-connection", &ClientSession::handle_test_connection},
            {"proxy-get", &ClientSession::handle_proxy_get},
            {"proxy-post", &ClientSession::handle_proxy_post},
            {"token-usage", &ClientSession::handle_token_usage},
            {"register", &ClientSession::handle_register},
            {"login", &ClientSession::handle_login},
            {"upload", &ClientSession::handle_upload},
            {"download", &ClientSession::handle_download},
            {"set-password", &ClientSession::handle_set_password},
            {"save-credentials", &ClientSession::handle_save_credentials},
            {"load-credentials", &ClientSession::handle_load_credentials},
            {"clear-credentials", &ClientSession::handle_clear_credentials},
            {"list-users", &ClientSession::handle_list_users},
            {"refresh-token", &ClientSession::handle_refresh_token},
            {"upload-history", &ClientSession::handle_upload_history},
            {"create-link", &ClientSession::handle_create_link},
            {"delete-link", &ClientSession::handle_delete_link},
            {"list-links", &ClientSession::handle_list_links},
            {"tier-pricing", &ClientSession::handle_tier_pricing},
            {"file-size", &ClientSession::handle_file_size},
        };
    }

    bool ClientSession::has_command(const std::string &command) const
    {
        return handlers_.count(command) != 0;
    }

    nlohmann::json ClientSession::execute(const std::string &command, const std::vector<std::string> &args,
                                          const CancellationToken &cancel)
    {
        const auto it = handlers_.find(command);
        if (it == handlers_.end())
        {
            throw Error(ErrorCode::InvalidArgument, "Unknown command: " + command);
        }
        logger_.log("session", "running ", command);
        auto result = (this->*(it->second))(CommandArgs::parse(args), cancel);
        events_.flush();
        return result;
    }

    Credentials ClientSession::current_credentials(const CommandArgs &args) const
    {
        return store_.require(args.option("user").value_or(""));
    }

    bool ClientSession::merge_tokens(const std::function<bool(const Credentials &)> &matches, const AuthTokens &tokens)
    {
        for (auto credentials : store_.list())
        {
            if (!matches(credentials))
            {
                continue;
            }
            credentials.auth_tokens = tokens;
            store_.save(credentials);
            logger_.log("session", "stored new tokens for ", credentials.user_id);
            return true;
        }
        return false;
    }

} // namespace firestarter::client
