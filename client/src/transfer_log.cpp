#include "firestarter/client/transfer_log.hpp"

#include <fstream>

#include <nlohmann/json.hpp>

#include "firestarter/client/credential_store.hpp"
#include "firestarter/error_codes.hpp"

namespace firestarter::client
{

    namespace
    {

        bool is_blank(const std::string &line)
        {
            return line.find_first_not_of(" \t\r\n") == std::string::npos;
        }

    } // namespace

    TransferLog::TransferLog(std::filesystem::path root, Logger logger)
        : root_(std::move(root)), logger_(std::move(logger)) {}

    void TransferLog::append(const std::string &user_id, const TransferLogEntry &entry) const
    {
        validate_user_id(user_id);
        const auto paths = user_paths(root_, user_id);
        std::error_code ec;
        std::filesystem::create_directories(paths.directory, ec);
        if (ec)
        {
            throw Error(ErrorCode::LocalIo, "Failed to create user dir: " + ec.message());
        }

        std::ofstream out(paths.transfer_log, std::ios::app);
        if (!out.is_open())
        {
            throw Error(ErrorCode::LocalIo, "Failed to open log file: " + paths.transfer_log.string());
        }
        out << nlohmann::json(entry).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
        out.flush();
        if (!out)
        {
            throw Error(ErrorCode::LocalIo, "Failed to write log: " + paths.transfer_log.string());
        }
        logger_.log("ledger", to_string(entry.status), " ", entry.local_path, " -> ", entry.remote_path);
    }

    std::vector<TransferLogEntry> TransferLog::read(const std::string &user_id) const
    {
        validate_user_id(user_id);
        std::vector<TransferLogEntry> entries;
        const auto path = user_paths(root_, user_id).transfer_log;
        std::ifstream in(path);
        if (!in.is_open())
        {
            return entries;
        }

        std::string line;
        std::size_t line_number = 0;
        while (std::getline(in, line))
        {
            ++line_number;
            if (is_blank(line))
            {
                continue;
            }
            const auto json = nlohmann::json::parse(line, nullptr, false);
            if (json.is_discarded() || !json.is_object())
            {
                logger_.warn("ledger", "skipping malformed line ", line_number, " in ", path.string());
                continue;
            }
            try
            {
                entries.push_back(json.get<TransferLogEntry>());
            }
            catch (const std::exception &ex)
            {
                logger_.warn("ledger", "skipping line ", line_number, ": ", ex.what());
            }
        }
        return entries;
    }

} // namespace firestarter::client
