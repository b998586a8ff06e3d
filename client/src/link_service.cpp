#include "firestarter/client/link_service.hpp"

#include <nlohmann/json.hpp>

#include "firestarter/error_codes.hpp"
#include "firestarter/time_format.hpp"

namespace firestarter::client
{

    LinkService::LinkService(ApiConfig config, AuthorizedClient &client, const PublicLinkStore &store, Logger logger)
        : config_(std::move(config)), client_(client), store_(store), logger_(std::move(logger)) {}

    HttpResponse LinkService::post(Credentials &credentials, const std::string &url, const nlohmann::json &body)
    {
        client_.tokens().ensure_valid_token(credentials);
        if (!credentials.auth_tokens)
        {
            throw Error(ErrorCode::AuthenticationRequired, "No valid auth tokens");
        }

        const auto response = client_.send(
            credentials, [&](const Credentials &current)
            {
                HttpRequest request;
                request.method = "POST";
                request.url = url;
                request.headers["Content-Type"] = "application/json";
                if (current.auth_tokens && current.auth_tokens->csrf_token)
                {
                    request.headers["X-Csrf-Token"] = *current.auth_tokens->csrf_token;
                }
                request.body = body.dump();
                return request; },
            AuthInjection::BearerOnly);

        if (!response.success())
        {
            logger_.error("links", "POST ", url, " returned ", response.status_code);
            throw Error(ErrorCode::RemoteError, "HTTP " + std::to_string(response.status_code) + ": " + response.body,
                        response.status_code);
        }
        return response;
    }

    PublicLinkEntry LinkService::create(Credentials &credentials, const std::string &remote_path,
                                        const std::optional<std::string> &title,
                                        const std::optional<std::string> &description)
    {
        nlohmann::json body = {{"file_name", remote_path}};
        if (title)
        {
            body["custom_title"] = *title;
        }
        if (description)
        {
            body["custom_description"] = *description;
        }

        const auto response = post(credentials, config_.url(config_.create_public_link), body);
        const auto json = nlohmann::json::parse(response.body, nullptr, false);
        if (json.is_discarded())
        {
            throw Error(ErrorCode::InvalidResponse, "Invalid JSON: " + response.body);
        }
        const auto hash = json.is_object() ? json.find("link_hash") : json.end();
        if (hash == json.end() || !hash->is_string())
        {
            throw Error(ErrorCode::InvalidResponse, "No link_hash in response");
        }

        PublicLinkEntry entry{remote_path, hash->get<std::string>(), time_format::now_rfc3339(), title, description};
        try
        {
            store_.add(credentials.user_id, entry);
        }
        catch (const Error &ex)
        {
            logger_.error("links", "link ", entry.link_hash, " created but not saved locally: ", ex.what());
        }
        logger_.log("links", "created link ", entry.link_hash, " for ", remote_path);
        return entry;
    }

    std::string LinkService::remove(Credentials &credentials, const std::string &link_hash)
    {
        post(credentials, config_.url(config_.delete_public_link), {{"link_hash", link_hash}});
        const auto [before, after] = store_.remove(credentials.user_id, link_hash);
        logger_.log("links", "deleted link ", link_hash);
        return "Deleted " + link_hash + " (" + std::to_string(before) + " -> " + std::to_string(after) + ")";
    }

    std::vector<PublicLinkEntry> LinkService::list(const std::string &user_id) const
    {
        return store_.list(user_id);
    }

} // namespace firestarter::client
