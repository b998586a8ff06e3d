#include "firestarter/client/public_link_store.hpp"

#include <algorithm>
#include <fstream>

#include <nlohmann/json.hpp>

#include "firestarter/client/credential_store.hpp"
#include "firestarter/error_codes.hpp"

namespace firestarter::client
{

    PublicLinkStore::PublicLinkStore(std::filesystem::path root)
        : root_(std::move(root)) {}

    std::vector<PublicLinkEntry> PublicLinkStore::list(const std::string &user_id) const
    {
        validate_user_id(user_id);
        const auto path = user_paths(root_, user_id).links;
        std::ifstream in(path);
        if (!in.is_open())
        {
            return {};
        }
        try
        {
            nlohmann::json json;
            in >> json;
            return json.get<std::vector<PublicLinkEntry>>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw Error(ErrorCode::LocalIo, std::string("Failed to parse link file: ") + ex.what());
        }
    }

    void PublicLinkStore::add(const std::string &user_id, const PublicLinkEntry &entry) const
    {
        auto links = list(user_id);
        links.push_back(entry);
        write(user_id, links);
    }

    std::pair<std::size_t, std::size_t> PublicLinkStore::remove(const std::string &user_id,
                                                                const std::string &link_hash) const
    {
        auto links = list(user_id);
        const auto before = links.size();
        links.erase(std::remove_if(links.begin(), links.end(), [&](const PublicLinkEntry &link)
                                   { return link.link_hash == link_hash; }),
                    links.end());
        write(user_id, links);
        return {before, links.size()};
    }

    void PublicLinkStore::write(const std::string &user_id, const std::vector<PublicLinkEntry> &links) const
    {
        const auto paths = user_paths(root_, user_id);
        std::error_code ec;
        std::filesystem::create_directories(paths.directory, ec);
        if (ec)
        {
            throw Error(ErrorCode::LocalIo, "Failed to create user dir: " + ec.message());
        }
        std::ofstream out(paths.links, std::ios::trunc);
        if (!out.is_open())
        {
            throw Error(ErrorCode::LocalIo, "Failed to write link file: " + paths.links.string());
        }
        out << nlohmann::json(links).dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
        if (!out)
        {
            throw Error(ErrorCode::LocalIo, "Failed to write link file: " + paths.links.string());
        }
    }

} // namespace firestarter::client
