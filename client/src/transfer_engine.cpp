#include "firestarter/client/transfer_engine.hpp"

#include <algorithm>
#include <fstream>
#include <mutex>
#include <span>
#include <vector>

#include "firestarter/crypto.hpp"
#include "firestarter/encoding/url.hpp"
#include "firestarter/error_codes.hpp"
#include "firestarter/time_format.hpp"

namespace firestarter::client
{

    namespace
    {

        bool is_blank(const std::string &value)
        {
            return value.find_first_not_of(" \t\r\n") == std::string::npos;
        }

        std::string base_name(const std::string &remote_name)
        {
            const auto name = std::filesystem::path(remote_name).filename().string();
            if (name.empty() || name == "." || name == "..")
            {
                throw Error(ErrorCode::InvalidArgument, "Invalid file name: '" + remote_name + "'");
            }
            return name;
        }

        // Hash and byte counter of one upload. The chunk reader and the completion path both
        // touch them, always under the mutex.
        struct UploadAccumulator
        {
            std::mutex mutex;
            crypto::StreamHasher hasher;
            std::uint64_t uploaded{0};

            std::uint64_t add(std::span<const std::byte> chunk)
            {
                std::lock_guard<std::mutex> lock(mutex);
                hasher.update(chunk);
                uploaded += chunk.size();
                return uploaded;
            }

            std::string finalize()
            {
                std::lock_guard<std::mutex> lock(mutex);
                return hasher.finalize();
            }
        };

        // Removes the partial download unless it was committed.
        class PartFile
        {
        public:
            explicit PartFile(std::filesystem::path path) : path_(std::move(path)) {}

            ~PartFile()
            {
                if (out_.is_open())
                {
                    out_.close();
                }
                if (!committed_)
                {
                    std::error_code ec;
                    std::filesystem::remove(path_, ec);
                }
            }

            PartFile(const PartFile &) = delete;
            PartFile &operator=(const PartFile &) = delete;

            void write(std::span<const char> chunk)
            {
                if (!out_.is_open())
                {
                    const auto parent = path_.parent_path();
                    if (!parent.empty())
                    {
                        std::error_code ec;
                        std::filesystem::create_directories(parent, ec);
                        if (ec)
                        {
                            throw Error(ErrorCode::LocalIo, "Failed to create directory: " + ec.message());
                        }
                    }
                    out_.open(path_, std::ios::binary | std::ios::trunc);
                    if (!out_.is_open())
                    {
                        throw Error(ErrorCode::LocalIo, "Failed to write file: " + path_.string());
                    }
                }
                out_.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
                if (!out_)
                {
                    throw Error(ErrorCode::LocalIo, "Failed to write file: " + path_.string());
                }
            }

            void commit(const std::filesystem::path &destination)
            {
                out_.close();
                if (!out_)
                {
                    throw Error(ErrorCode::LocalIo, "Failed to write file: " + path_.string());
                }
                std::error_code ec;
                std::filesystem::rename(path_, destination, ec);
                if (ec)
                {
                    // Windows refuses to rename onto an existing file.
                    std::filesystem::remove(destination, ec);
                    std::filesystem::rename(path_, destination, ec);
                }
                if (ec)
                {
                    throw Error(ErrorCode::LocalIo, "Failed to write file: " + ec.message());
                }
                committed_ = true;
            }

        private:
            std::filesystem::path path_;
            std::ofstream out_;
            bool committed_{false};
        };

    } // namespace

    void to_json(nlohmann::json &json, const TransferSummary &summary)
    {
        json = {
            {"message", summary.message},
            {"local_path", summary.local_path},
            {"remote_path", summary.remote_path},
            {"bytes", summary.bytes},
            {"content_hash", summary.content_hash},
        };
    }

    std::string resolve_remote_name(const std::filesystem::path &local_path,
                                    const std::optional<std::string> &remote_name)
    {
        if (remote_name && !is_blank(*remote_name))
        {
            return *remote_name;
        }
        const auto fallback = local_path.filename().string();
        if (fallback.empty())
        {
            throw Error(ErrorCode::InvalidArgument, "Invalid file name: " + local_path.string());
        }
        return fallback;
    }

    std::filesystem::path resolve_download_destination(const std::string &output_path, const std::string &remote_name)
    {
        const auto name = base_name(remote_name);
        if (output_path.empty())
        {
            return std::filesystem::path(name);
        }
        std::error_code ec;
        if (output_path.back() == '/' || output_path.back() == '\\' ||
            std::filesystem::is_directory(output_path, ec))
        {
            auto directory = output_path;
            while (directory.size() > 1 && (directory.back() == '/' || directory.back() == '\\'))
            {
                directory.pop_back();
            }
            return std::filesystem::path(directory) / name;
        }
        return std::filesystem::path(output_path);
    }

    std::string build_upload_url(const ApiConfig &config, const std::string &file_name,
                                 const std::optional<std::string> &tier, const std::optional<std::uint32_t> &epochs)
    {
        std::string url = config.url(config.upload);
        url += "?file_name=" + encoding::encode_query_component(file_name);
        if (tier)
        {
            url += "&tier=" + encoding::encode_query_component(*tier);
        }
        if (epochs)
        {
            url += "&epochs=" + std::to_string(*epochs);
        }
        return url;
    }

    std::string build_download_url(const ApiConfig &config, const std::string &file_name)
    {
        return config.url(config.download) + "?file_name=" + encoding::encode_query_component(file_name);
    }

    TransferEngine::TransferEngine(ApiConfig config, AuthorizedClient &client, const TransferLog &ledger,
                                   EventDispatcher &events, Logger logger, TransferOptions options)
        : config_(std::move(config)),
          client_(client),
          ledger_(ledger),
          events_(events),
          logger_(std::move(logger)),
          options_(options)
    {
        if (options_.chunk_size == 0)
        {
            throw Error(ErrorCode::InvalidArgument, "Chunk size must be positive");
        }
    }

    void TransferEngine::record(const std::string &user_id, const TransferLogEntry &entry)
    {
        try
        {
            ledger_.append(user_id, entry);
        }
        catch (const Error &ex)
        {
            logger_.error("upload", "failed to append ledger entry: ", ex.what());
        }
    }

    TransferSummary TransferEngine::upload(Credentials &credentials, const UploadRequest &request,
                                           const CancellationToken &cancel)
    {
        const auto local_display = request.local_path.string();
        const auto started_at = time_format::now_rfc3339();

        const auto fail_before_transfer = [&](ErrorCode code, const std::string &message)
        {
            record(credentials.user_id, TransferLogEntry{local_display, "", TransferStatus::Failed, message, "", 0,
                                                         started_at});
            logger_.error("upload", message);
            return Error(code, message);
        };

        std::error_code ec;
        if (!std::filesystem::is_regular_file(request.local_path, ec))
        {
            throw fail_before_transfer(ErrorCode::NotFound, "File not found: " + local_display);
        }
        std::ifstream in(request.local_path, std::ios::binary);
        if (!in.is_open())
        {
            throw fail_before_transfer(ErrorCode::LocalIo, "Failed to open file: " + local_display);
        }
        const auto file_size = static_cast<std::uint64_t>(std::filesystem::file_size(request.local_path, ec));
        if (ec)
        {
            throw fail_before_transfer(ErrorCode::LocalIo, "Failed to open file: " + ec.message());
        }

        const auto file_name = resolve_remote_name(request.local_path, request.remote_name);
        client_.tokens().ensure_valid_token(credentials);

        HttpRequest http;
        http.method = "POST";
        http.url = build_upload_url(config_, file_name, request.tier, request.epochs);
        http.headers["Content-Type"] = "application/octet-stream";
        apply_auth_headers(http.headers, credentials, AuthInjection::BearerOrLegacyHeaders);
        http.body_size = file_size;
        http.abort_requested = [cancel]
        { return cancel.cancelled(); };

        UploadAccumulator accumulator;
        http.body_source = [&](char *buffer, std::size_t capacity) -> std::size_t
        {
            cancel.throw_if_cancelled();
            const auto wanted = std::min(capacity, options_.chunk_size);
            in.read(buffer, static_cast<std::streamsize>(wanted));
            const auto read_count = static_cast<std::size_t>(in.gcount());
            if (read_count == 0)
            {
                if (in.bad())
                {
                    throw Error(ErrorCode::LocalIo, "Failed to read file: " + local_display);
                }
                return 0;
            }
            const auto uploaded = accumulator.add(std::as_bytes(std::span(buffer, read_count)));
            events_.emit(UploadProgress{request.upload_id, progress_percent(uploaded, file_size), uploaded, file_size});
            return read_count;
        };

        logger_.log("upload", "uploading '", file_name, "' (", file_size, " bytes) to ", http.url);

        HttpResponse response;
        try
        {
            response = client_.transport().send(http);
        }
        catch (const Error &ex)
        {
            record(credentials.user_id, TransferLogEntry{local_display, file_name, TransferStatus::Failed,
                                                         ex.what(), accumulator.finalize(), file_size, started_at});
            logger_.error("upload", "upload request failed: ", ex.what());
            throw Error(ex.code(), std::string("Upload request failed: ") + ex.what(), ex.http_status());
        }

        const auto content_hash = accumulator.finalize();
        const auto status = response.success() ? TransferStatus::Success : TransferStatus::Failed;
        record(credentials.user_id, TransferLogEntry{local_display, file_name, status, response.body, content_hash,
                                                     file_size, started_at});

        if (!response.success())
        {
            logger_.error("upload", "upload of '", file_name, "' failed with status ", response.status_code);
            throw Error(ErrorCode::RemoteError,
                        "Upload failed - Status: " + std::to_string(response.status_code) + ", Response: " + response.body,
                        response.status_code);
        }

        events_.emit(UploadProgress{request.upload_id, 100, file_size, file_size});
        logger_.log("upload", "uploaded '", file_name, "' hash ", content_hash);
        return TransferSummary{"File '" + file_name + "' uploaded successfully", local_display, file_name, file_size,
                               content_hash};
    }

    TransferSummary TransferEngine::download(Credentials &credentials, const DownloadRequest &request,
                                             const CancellationToken &cancel)
    {
        const auto destination = resolve_download_destination(request.output_path, request.remote_name);
        const auto destination_display = destination.string();
        const auto url = build_download_url(config_, request.remote_name);

        auto part_path = destination;
        part_path += ".part";
        PartFile part(part_path);
        crypto::StreamHasher hasher;
        std::uint64_t downloaded = 0;

        logger_.log("download", "downloading '", request.remote_name, "' from ", url);

        const auto build = [&](const Credentials &) -> HttpRequest
        {
            HttpRequest http;
            http.method = "GET";
            http.url = url;
            http.abort_requested = [cancel]
            { return cancel.cancelled(); };
            http.body_sink = [&](std::span<const char> chunk, std::optional<std::uint64_t> total)
            {
                cancel.throw_if_cancelled();
                part.write(chunk);
                hasher.update(std::as_bytes(chunk));
                downloaded += chunk.size();
                events_.emit(DownloadProgress{request.remote_name, downloaded, total,
                                              total ? progress_percent(downloaded, *total) : 0u,
                                              destination_display});
            };
            return http;
        };

        const auto response = client_.send(credentials, build);
        if (!response.success())
        {
            logger_.error("download", "download of '", request.remote_name, "' failed with status ",
                          response.status_code);
            throw Error(ErrorCode::RemoteError,
                        "Download failed - Status: " + std::to_string(response.status_code) + ", Response: " + response.body,
                        response.status_code);
        }
        if (downloaded == 0)
        {
            throw Error(ErrorCode::InvalidResponse, "No file data received");
        }

        part.commit(destination);
        const auto content_hash = hasher.finalize();
        logger_.log("download", "saved '", request.remote_name, "' to ", destination_display, " hash ", content_hash);
        return TransferSummary{"File '" + request.remote_name + "' downloaded to '" + destination_display + "'",
                               destination_display, request.remote_name, downloaded, content_hash};
    }

} // namespace firestarter::client
