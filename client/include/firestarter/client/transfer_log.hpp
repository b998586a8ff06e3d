#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "firestarter/client/logger.hpp"
#include "firestarter/client/models.hpp"

namespace firestarter::client
{

    // Append-only JSON-lines ledger, one file per user (list-upload-<user_id>.json).
    class TransferLog
    {
    public:
        TransferLog(std::filesystem::path root, Logger logger);

        void append(const std::string &user_id, const TransferLogEntry &entry) const;

        // Blank lines are skipped; malformed lines are logged and skipped.
        std::vector<TransferLogEntry> read(const std::string &user_id) const;

    private:
        std::filesystem::path root_;
        mutable Logger logger_;
    };

} // namespace firestarter::client
