#include "firestarter/client/api_config.hpp"

#include <fstream>
#include <sstream>

#include "firestarter/client/bundled_api_endpoints.hpp"
#include "firestarter/encoding/url.hpp"
#include "firestarter/error_codes.hpp"

namespace firestarter::client
{

    namespace
    {

        std::string required_string(const nlohmann::json &json, const char *key)
        {
            const auto it = json.find(key);
            if (it == json.end() || !it->is_string())
            {
                throw Error(ErrorCode::Configuration, std::string("API config field '") + key + "' is missing or not a string");
            }
            return it->get<std::string>();
        }

    } // namespace

    std::string ApiConfig::url(std::string_view path) const
    {
        return encoding::join_url(api_base_url, path);
    }

    ApiConfig ApiConfig::parse(std::string_view text)
    {
        const auto json = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
        if (json.is_discarded() || !json.is_object())
        {
            throw Error(ErrorCode::Configuration, "API config is not a JSON object");
        }
        return json.get<ApiConfig>();
    }

    ApiConfig ApiConfig::load(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw Error(ErrorCode::Configuration, "Failed to open API config: " + path.string());
        }
        std::ostringstream content;
        content << in.rdbuf();
        return parse(content.str());
    }

    ApiConfig ApiConfig::bundled()
    {
        return parse(detail::kBundledApiEndpoints);
    }

    void to_json(nlohmann::json &json, const ApiConfig &config)
    {
        json = {
            {"api_base_url", config.api_base_url},
            {"auth_login", config.auth_login},
            {"auth_refresh", config.auth_refresh},
            {"auth_register", config.auth_register},
            {"auth_reset_password", config.auth_reset_password},
            {"upload", config.upload},
            {"get_tier_pricing", nullptr},
            {"download", config.download},
            {"check_wallet", config.check_wallet},
            {"check_custom_token", config.check_custom_token},
            {"exchange_sol_for_tokens", config.exchange_sol_for_tokens},
            {"token_usage", config.token_usage},
            {"withdraw_sol", config.withdraw_sol},
            {"create_public_link", config.create_public_link},
            {"delete_public_link", config.delete_public_link},
        };
        if (config.get_tier_pricing)
        {
            json["get_tier_pricing"] = *config.get_tier_pricing;
        }
    }

    void from_json(const nlohmann::json &json, ApiConfig &config)
    {
        config.api_base_url = required_string(json, "api_base_url");
        config.auth_login = required_string(json, "auth_login");
        config.auth_refresh = required_string(json, "auth_refresh");
        config.auth_register = required_string(json, "auth_register");
        config.auth_reset_password = required_string(json, "auth_reset_password");
        config.upload = required_string(json, "upload");
        config.download = required_string(json, "download");
        config.check_wallet = required_string(json, "check_wallet");
        config.check_custom_token = required_string(json, "check_custom_token");
        config.exchange_sol_for_tokens = required_string(json, "exchange_sol_for_tokens");
        config.token_usage = required_string(json, "token_usage");
        config.withdraw_sol = required_string(json, "withdraw_sol");
        config.create_public_link = required_string(json, "create_public_link");
        config.delete_public_link = required_string(json, "delete_public_link");

        config.get_tier_pricing.reset();
        if (auto it = json.find("get_tier_pricing"); it != json.end() && !it->is_null())
        {
            if (!it->is_string())
            {
                throw Error(ErrorCode::Configuration, "API config field 'get_tier_pricing' is not a string");
            }
            auto value = it->get<std::string>();
            if (!value.empty())
            {
                config.get_tier_pricing = std::move(value);
            }
        }

        if (config.api_base_url.empty())
        {
            throw Error(ErrorCode::Configuration, "API config field 'api_base_url' is empty");
        }
    }

} // namespace firestarter::client
