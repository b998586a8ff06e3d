#include "firestarter/client/models.hpp"

#include <stdexcept>

#include "firestarter/time_format.hpp"

namespace firestarter::client
{

    namespace
    {

        std::optional<std::string> optional_string(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                return it->get<std::string>();
            }
            return std::nullopt;
        }

    } // namespace

    void AuthTokens::stamp_expiry(std::chrono::system_clock::time_point issued_at)
    {
        expires_at = time_format::format_rfc3339(issued_at + std::chrono::seconds(expires_in));
    }

    void to_json(nlohmann::json &json, const AuthTokens &tokens)
    {
        json = {
            {"access_token", tokens.access_token},
            {"refresh_token", tokens.refresh_token},
            {"token_type", tokens.token_type},
            {"expires_in", tokens.expires_in},
        };
        if (tokens.expires_at)
        {
            json["expires_at"] = *tokens.expires_at;
        }
        if (tokens.csrf_token)
        {
            json["csrf_token"] = *tokens.csrf_token;
        }
    }

    void from_json(const nlohmann::json &json, AuthTokens &tokens)
    {
        tokens.access_token = json.at("access_token").get<std::string>();
        tokens.refresh_token = json.at("refresh_token").get<std::string>();
        tokens.token_type = json.value("token_type", std::string{"Bearer"});
        tokens.expires_in = json.at("expires_in").get<std::int64_t>();
        tokens.expires_at = optional_string(json, "expires_at");
        tokens.csrf_token = optional_string(json, "csrf_token");
    }

    void to_json(nlohmann::json &json, const Credentials &credentials)
    {
        json = {
            {"user_id", credentials.user_id},
            {"user_app_key", credentials.user_app_key},
        };
        if (credentials.auth_tokens)
        {
            json["auth_tokens"] = *credentials.auth_tokens;
        }
        if (credentials.username)
        {
            json["username"] = *credentials.username;
        }
    }

    void from_json(const nlohmann::json &json, Credentials &credentials)
    {
        credentials.user_id = json.at("user_id").get<std::string>();
        credentials.user_app_key = json.at("user_app_key").get<std::string>();
        if (auto it = json.find("auth_tokens"); it != json.end() && !it->is_null())
        {
            credentials.auth_tokens = it->get<AuthTokens>();
        }
        else
        {
            credentials.auth_tokens.reset();
        }
        credentials.username = optional_string(json, "username");
    }

    std::string_view to_string(TransferStatus status) noexcept
    {
        return status == TransferStatus::Success ? "success" : "failed";
    }

    void to_json(nlohmann::json &json, const TransferLogEntry &entry)
    {
        json = {
            {"local_path", entry.local_path},
            {"remote_path", entry.remote_path},
            {"status", to_string(entry.status)},
            {"message", entry.message},
            {"content_hash", entry.content_hash},
            {"file_size", entry.file_size},
            {"timestamp", entry.timestamp},
        };
    }

    void from_json(const nlohmann::json &json, TransferLogEntry &entry)
    {
        entry.local_path = json.at("local_path").get<std::string>();
        entry.remote_path = json.at("remote_path").get<std::string>();
        const auto status = json.at("status").get<std::string>();
        if (status == "success")
        {
            entry.status = TransferStatus::Success;
        }
        else if (status == "failed")
        {
            entry.status = TransferStatus::Failed;
        }
        else
        {
            throw std::runtime_error("Unknown transfer status: " + status);
        }
        entry.message = json.value("message", std::string{});
        // Ledgers written before the hash rename carry "blake3_hash".
        if (auto it = json.find("content_hash"); it != json.end())
        {
            entry.content_hash = it->get<std::string>();
        }
        else
        {
            entry.content_hash = json.value("blake3_hash", std::string{});
        }
        entry.file_size = json.value("file_size", 0ULL);
        entry.timestamp = json.value("timestamp", std::string{});
    }

    void to_json(nlohmann::json &json, const PublicLinkEntry &entry)
    {
        json = {
            {"remote_path", entry.remote_path},
            {"link_hash", entry.link_hash},
            {"created_at", entry.created_at},
            {"custom_title", nullptr},
            {"custom_description", nullptr},
        };
        if (entry.custom_title)
        {
            json["custom_title"] = *entry.custom_title;
        }
        if (entry.custom_description)
        {
            json["custom_description"] = *entry.custom_description;
        }
    }

    void from_json(const nlohmann::json &json, PublicLinkEntry &entry)
    {
        entry.remote_path = json.at("remote_path").get<std::string>();
        entry.link_hash = json.at("link_hash").get<std::string>();
        entry.created_at = json.value("created_at", std::string{});
        entry.custom_title = optional_string(json, "custom_title");
        entry.custom_description = optional_string(json, "custom_description");
    }

    void to_json(nlohmann::json &json, const CreateUserResponse &response)
    {
        json = {
            {"user_id", response.user_id},
            {"user_app_key", response.user_app_key},
            {"solana_pubkey", response.solana_pubkey},
        };
    }

    void from_json(const nlohmann::json &json, CreateUserResponse &response)
    {
        response.user_id = json.at("user_id").get<std::string>();
        response.user_app_key = json.at("user_app_key").get<std::string>();
        response.solana_pubkey = json.value("solana_pubkey", std::string{});
    }

} // namespace firestarter::client
