#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "firestarter/client/api_config.hpp"
#include "firestarter/client/authorized_client.hpp"
#include "firestarter/client/cancellation.hpp"
#include "firestarter/client/events.hpp"
#include "firestarter/client/logger.hpp"
#include "firestarter/client/models.hpp"
#include "firestarter/client/transfer_log.hpp"

namespace firestarter::client
{

    struct UploadRequest
    {
        std::filesystem::path local_path;
        std::optional<std::string> remote_name;
        std::optional<std::string> tier;
        std::optional<std::uint32_t> epochs;
        // Echoed in upload_progress events so the UI can tell concurrent bars apart.
        std::optional<std::string> upload_id;
    };

    struct DownloadRequest
    {
        std::string remote_name;
        std::string output_path;
    };

    struct TransferSummary
    {
        std::string message;
        std::string local_path;
        std::string remote_path;
        std::uint64_t bytes{};
        std::string content_hash;
    };

    void to_json(nlohmann::json &json, const TransferSummary &summary);

    struct TransferOptions
    {
        std::size_t chunk_size{128 * 1024};
    };

    // Non-blank override, else the base name of the local file.
    std::string resolve_remote_name(const std::filesystem::path &local_path,
                                    const std::optional<std::string> &remote_name);

    // Empty output -> base name in the working directory; trailing separator or an existing
    // directory -> that directory plus the base name; anything else is the destination file.
    std::filesystem::path resolve_download_destination(const std::string &output_path, const std::string &remote_name);

    std::string build_upload_url(const ApiConfig &config, const std::string &file_name,
                                 const std::optional<std::string> &tier, const std::optional<std::uint32_t> &epochs);

    std::string build_download_url(const ApiConfig &config, const std::string &file_name);

    class TransferEngine
    {
    public:
        TransferEngine(ApiConfig config, AuthorizedClient &client, const TransferLog &ledger, EventDispatcher &events,
                       Logger logger, TransferOptions options = {});

        // Streams the file to the upload endpoint while hashing it. Exactly one ledger entry is
        // written per call once the file has been looked at, whatever the outcome.
        TransferSummary upload(Credentials &credentials, const UploadRequest &request,
                               const CancellationToken &cancel = CancellationToken());

        // Streams the remote file into <destination>.part and renames it on success.
        TransferSummary download(Credentials &credentials, const DownloadRequest &request,
                                 const CancellationToken &cancel = CancellationToken());

    private:
        void record(const std::string &user_id, const TransferLogEntry &entry);

        ApiConfig config_;
        AuthorizedClient &client_;
        const TransferLog &ledger_;
        EventDispatcher &events_;
        Logger logger_;
        TransferOptions options_;
    };

} // namespace firestarter::client
