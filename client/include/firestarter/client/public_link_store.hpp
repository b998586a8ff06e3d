#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "firestarter/client/models.hpp"

namespace firestarter::client
{

    // link-<user_id>.json holds a JSON array rewritten wholesale on every change.
    class PublicLinkStore
    {
    public:
        explicit PublicLinkStore(std::filesystem::path root);

        std::vector<PublicLinkEntry> list(const std::string &user_id) const;

        void add(const std::string &user_id, const PublicLinkEntry &entry) const;

        // Returns the number of entries before and after the removal.
        std::pair<std::size_t, std::size_t> remove(const std::string &user_id, const std::string &link_hash) const;

    private:
        void write(const std::string &user_id, const std::vector<PublicLinkEntry> &links) const;

        std::filesystem::path root_;
    };

} // namespace firestarter::client
