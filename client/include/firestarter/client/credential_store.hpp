#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "firestarter/client/logger.hpp"
#include "firestarter/client/models.hpp"

namespace firestarter::client
{

    // Per-user files under <root>/<user_id>/.
    struct UserPaths
    {
        std::filesystem::path directory;
        std::filesystem::path credentials;
        std::filesystem::path transfer_log;
        std::filesystem::path links;
    };

    UserPaths user_paths(const std::filesystem::path &root, const std::string &user_id);

    // Credential files are rewritten atomically (temp file + rename) but are not locked across
    // processes: two invocations refreshing at once resolve as last writer wins.
    class CredentialStore
    {
    public:
        CredentialStore(std::filesystem::path root, Logger logger);

        const std::filesystem::path &root() const noexcept { return root_; }

        void save(const Credentials &credentials) const;

        // Credentials of user_id, or of the most recently modified credential file when empty.
        std::optional<Credentials> load(const std::string &user_id = {}) const;

        // Like load(), but throws AuthenticationRequired when nothing is stored.
        Credentials require(const std::string &user_id = {}) const;

        // Removes the whole user directory, logs and links included.
        void clear(const std::string &user_id) const;

        // Sorted by username, falling back to user_id.
        std::vector<Credentials> list() const;

    private:
        std::optional<Credentials> read_file(const std::filesystem::path &path) const;

        std::filesystem::path root_;
        mutable Logger logger_;
    };

    // Rejects ids that would escape the data root.
    void validate_user_id(const std::string &user_id);

} // namespace firestarter::client
