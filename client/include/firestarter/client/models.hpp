#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace firestarter::client
{

    struct AuthTokens
    {
        std::string access_token;
        std::string refresh_token;
        std::string token_type;
        std::int64_t expires_in{};
        std::optional<std::string> expires_at;
        std::optional<std::string> csrf_token;

        // Recomputes expires_at from issued_at + expires_in. Every writer of expires_in goes through here.
        void stamp_expiry(std::chrono::system_clock::time_point issued_at);
    };

    void to_json(nlohmann::json &json, const AuthTokens &tokens);
    void from_json(const nlohmann::json &json, AuthTokens &tokens);

    struct Credentials
    {
        std::string user_id;
        std::string user_app_key;
        std::optional<AuthTokens> auth_tokens;
        std::optional<std::string> username;

        const std::string &display_name() const { return username ? *username : user_id; }
    };

    void to_json(nlohmann::json &json, const Credentials &credentials);
    void from_json(const nlohmann::json &json, Credentials &credentials);

    enum class TransferStatus : std::uint8_t
    {
        Success,
        Failed
    };

    std::string_view to_string(TransferStatus status) noexcept;

    struct TransferLogEntry
    {
        std::string local_path;
        std::string remote_path;
        TransferStatus status{TransferStatus::Failed};
        std::string message;
        std::string content_hash;
        std::uint64_t file_size{};
        std::string timestamp;
    };

    void to_json(nlohmann::json &json, const TransferLogEntry &entry);
    void from_json(const nlohmann::json &json, TransferLogEntry &entry);

    struct PublicLinkEntry
    {
        std::string remote_path;
        std::string link_hash;
        std::string created_at;
        std::optional<std::string> custom_title;
        std::optional<std::string> custom_description;
    };

    void to_json(nlohmann::json &json, const PublicLinkEntry &entry);
    void from_json(const nlohmann::json &json, PublicLinkEntry &entry);

    struct CreateUserResponse
    {
        std::string user_id;
        std::string user_app_key;
        std::string solana_pubkey;
    };

    void to_json(nlohmann::json &json, const CreateUserResponse &response);
    void from_json(const nlohmann::json &json, CreateUserResponse &response);

} // namespace firestarter::client
