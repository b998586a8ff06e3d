#include "firestarter/client/credential_store.hpp"

#include <algorithm>
#include <fstream>

#include <nlohmann/json.hpp>

#include "firestarter/error_codes.hpp"

namespace firestarter::client
{

    UserPaths user_paths(const std::filesystem::path &root, const std::string &user_id)
    {
        const auto directory = root / user_id;
        return UserPaths{
            directory,
            directory / (user_id + ".json"),
            directory / ("list-upload-" + user_id + ".json"),
            directory / ("link-" + user_id + ".json"),
        };
    }

    void validate_user_id(const std::string &user_id)
    {
        if (user_id.empty() || user_id == "." || user_id == ".." ||
            user_id.find_first_of("/\\") != std::string::npos)
        {
            throw Error(ErrorCode::InvalidArgument, "Invalid user id: '" + user_id + "'");
        }
    }

    CredentialStore::CredentialStore(std::filesystem::path root, Logger logger)
        : root_(std::move(root)), logger_(std::move(logger)) {}

    void CredentialStore::save(const Credentials &credentials) const
    {
        validate_user_id(credentials.user_id);
        const auto paths = user_paths(root_, credentials.user_id);

        std::error_code ec;
        std::filesystem::create_directories(paths.directory, ec);
        if (ec)
        {
            throw Error(ErrorCode::LocalIo, "Failed to create user directory: " + ec.message());
        }

        auto temp_path = paths.credentials;
        temp_path += ".tmp";
        {
            std::ofstream out(temp_path, std::ios::trunc);
            if (!out.is_open())
            {
                throw Error(ErrorCode::LocalIo, "Failed to write credentials file: " + temp_path.string());
            }
            out << nlohmann::json(credentials).dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
            if (!out)
            {
                throw Error(ErrorCode::LocalIo, "Failed to write credentials file: " + temp_path.string());
            }
        }
        std::filesystem::rename(temp_path, paths.credentials, ec);
        if (ec)
        {
            std::filesystem::remove(temp_path, ec);
            throw Error(ErrorCode::LocalIo, "Failed to replace credentials file: " + paths.credentials.string());
        }
        logger_.log("credentials", "saved credentials for ", credentials.user_id);
    }

    std::optional<Credentials> CredentialStore::load(const std::string &user_id) const
    {
        if (!user_id.empty())
        {
            validate_user_id(user_id);
            return read_file(user_paths(root_, user_id).credentials);
        }

        std::error_code ec;
        if (!std::filesystem::is_directory(root_, ec))
        {
            return std::nullopt;
        }

        std::optional<Credentials> latest;
        std::filesystem::file_time_type latest_time = std::filesystem::file_time_type::min();
        for (const auto &entry : std::filesystem::directory_iterator(root_, ec))
        {
            if (!entry.is_directory(ec))
            {
                continue;
            }
            const auto id = entry.path().filename().string();
            const auto path = user_paths(root_, id).credentials;
            const auto modified = std::filesystem::last_write_time(path, ec);
            if (ec || (latest && modified <= latest_time))
            {
                continue;
            }
            if (auto credentials = read_file(path))
            {
                latest = std::move(credentials);
                latest_time = modified;
            }
        }
        if (latest)
        {
            logger_.log("credentials", "current session: ", latest->user_id);
        }
        return latest;
    }

    Credentials CredentialStore::require(const std::string &user_id) const
    {
        auto credentials = load(user_id);
        if (!credentials)
        {
            throw Error(ErrorCode::AuthenticationRequired, "No saved credentials found");
        }
        return std::move(*credentials);
    }

    void CredentialStore::clear(const std::string &user_id) const
    {
        validate_user_id(user_id);
        const auto directory = user_paths(root_, user_id).directory;
        std::error_code ec;
        if (!std::filesystem::exists(directory, ec))
        {
            return;
        }
        std::filesystem::remove_all(directory, ec);
        if (ec)
        {
            throw Error(ErrorCode::LocalIo, "Failed to remove user directory: " + ec.message());
        }
        logger_.log("credentials", "cleared user ", user_id);
    }

    std::vector<Credentials> CredentialStore::list() const
    {
        std::vector<Credentials> users;
        std::error_code ec;
        if (!std::filesystem::is_directory(root_, ec))
        {
            return users;
        }
        for (const auto &entry : std::filesystem::directory_iterator(root_, ec))
        {
            if (!entry.is_directory(ec))
            {
                continue;
            }
            if (auto credentials = read_file(user_paths(root_, entry.path().filename().string()).credentials))
            {
                users.push_back(std::move(*credentials));
            }
        }
        std::sort(users.begin(), users.end(), [](const Credentials &a, const Credentials &b)
                  { return a.display_name() < b.display_name(); });
        return users;
    }

    std::optional<Credentials> CredentialStore::read_file(const std::filesystem::path &path) const
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            return std::nullopt;
        }
        try
        {
            nlohmann::json json;
            in >> json;
            return json.get<Credentials>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            logger_.warn("credentials", "ignoring unreadable ", path.string(), ": ", ex.what());
            return std::nullopt;
        }
    }

} // namespace firestarter::client
