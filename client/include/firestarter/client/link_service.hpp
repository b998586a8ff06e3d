#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "firestarter/client/api_config.hpp"
#include "firestarter/client/authorized_client.hpp"
#include "firestarter/client/logger.hpp"
#include "firestarter/client/models.hpp"
#include "firestarter/client/public_link_store.hpp"

namespace firestarter::client
{

    // Public share links. Both remote calls need token auth; the local link file is a cache of
    // what this client created.
    class LinkService
    {
    public:
        LinkService(ApiConfig config, AuthorizedClient &client, const PublicLinkStore &store, Logger logger);

        PublicLinkEntry create(Credentials &credentials, const std::string &remote_path,
                               const std::optional<std::string> &title = std::nullopt,
                               const std::optional<std::string> &description = std::nullopt);

        // Returns "Deleted <hash> (<before> -> <after>)".
        std::string remove(Credentials &credentials, const std::string &link_hash);

        std::vector<PublicLinkEntry> list(const std::string &user_id) const;

    private:
        HttpResponse post(Credentials &credentials, const std::string &url, const nlohmann::json &body);

        ApiConfig config_;
        AuthorizedClient &client_;
        const PublicLinkStore &store_;
        Logger logger_;
    };

} // namespace firestarter::client
