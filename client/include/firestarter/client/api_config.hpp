#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace firestarter::client
{

    // Endpoint paths of the remote service. Constructed once at startup and passed by value to
    // every component; nothing mutates it afterwards.
    struct ApiConfig
    {
        std::string api_base_url;
        std::string auth_login;
        std::string auth_refresh;
        std::string auth_register;
        std::string auth_reset_password;
        std::string upload;
        std::optional<std::string> get_tier_pricing;
        std::string download;
        std::string check_wallet;
        std::string check_custom_token;
        std::string exchange_sol_for_tokens;
        std::string token_usage;
        std::string withdraw_sol;
        std::string create_public_link;
        std::string delete_public_link;

        // Absolute URL for an endpoint path relative to api_base_url.
        std::string url(std::string_view path) const;

        // All three throw firestarter::Error(ErrorCode::Configuration) on malformed input.
        static ApiConfig parse(std::string_view text);
        static ApiConfig load(const std::filesystem::path &path);
        static ApiConfig bundled();
    };

    void to_json(nlohmann::json &json, const ApiConfig &config);
    void from_json(const nlohmann::json &json, ApiConfig &config);

} // namespace firestarter::client
