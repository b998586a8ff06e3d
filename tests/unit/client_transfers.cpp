#include <cassert>
#include <filesystem>
#include <mutex>
#include <span>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "firestarter/client/authorized_client.hpp"
#include "firestarter/client/cancellation.hpp"
#include "firestarter/client/credential_store.hpp"
#include "firestarter/client/events.hpp"
#include "firestarter/client/logger.hpp"
#include "firestarter/client/token_manager.hpp"
#include "firestarter/client/transfer_engine.hpp"
#include "firestarter/client/transfer_log.hpp"
#include "firestarter/crypto.hpp"
#include "firestarter/error_codes.hpp"
#include "test_support.hpp"

using namespace firestarter;
using namespace firestarter::client;
using namespace firestarter::testing;

namespace
{

    std::string make_content(std::size_t size)
    {
        std::string content(size, '\0');
        for (std::size_t i = 0; i < size; ++i)
        {
            content[i] = static_cast<char>((i * 131 + 17) % 256);
        }
        return content;
    }

    std::string hash_of(const std::string &content)
    {
        crypto::StreamHasher hasher;
        hasher.update(std::as_bytes(std::span(content.data(), content.size())));
        return hasher.finalize();
    }

    struct Harness
    {
        explicit Harness(const std::string &name, std::size_t chunk_size = 128 * 1024)
            : temp(name),
              store(temp.path() / "data", Logger()),
              ledger(temp.path() / "data", Logger()),
              events(Logger()),
              tokens(test_api_config(), transport, store, Logger()),
              client(transport, tokens, Logger()),
              engine(test_api_config(), client, ledger, events, Logger(), TransferOptions{chunk_size})
        {
            events.set_listener([this](const Event &event)
                                {
                                    std::lock_guard<std::mutex> lock(mutex);
                                    received.push_back(event); });
        }

        std::vector<Event> drain_events()
        {
            events.flush();
            std::lock_guard<std::mutex> lock(mutex);
            return received;
        }

        TempDir temp;
        FakeTransport transport;
        std::mutex mutex;
        std::vector<Event> received;
        CredentialStore store;
        TransferLog ledger;
        EventDispatcher events;
        TokenManager tokens;
        AuthorizedClient client;
        TransferEngine engine;
    };

    void test_upload_hash_is_chunk_size_independent()
    {
        const auto content = make_content(300001);
        std::vector<std::string> hashes;
        for (const std::size_t chunk : {std::size_t{1024}, std::size_t{128 * 1024}, std::size_t{1 << 20}})
        {
            Harness harness("upload_chunks", chunk);
            const auto file = harness.temp.path() / "input.bin";
            write_file(file, content);

            auto credentials = token_credentials();
            harness.transport.push(200, "stored");
            const auto summary = harness.engine.upload(credentials, UploadRequest{file, std::nullopt, std::nullopt,
                                                                                  std::nullopt, std::nullopt});
            assert(summary.bytes == content.size());
            assert(summary.remote_path == "input.bin");
            assert(summary.message == "File 'input.bin' uploaded successfully");
            assert(harness.transport.requests.size() == 1);
            assert(harness.transport.requests[0].body == content);
            hashes.push_back(summary.content_hash);
        }
        assert(hashes[0] == hash_of(content));
        assert(hashes[1] == hashes[0]);
        assert(hashes[2] == hashes[0]);
    }

    void test_upload_request_shape()
    {
        Harness harness("upload_shape");
        const auto file = harness.temp.path() / "plain.txt";
        write_file(file, "hello");

        auto credentials = token_credentials();
        harness.transport.push(200, "ok");
        harness.engine.upload(credentials,
                              UploadRequest{file, std::string("100% done #1.txt"), std::string("pro"), 3u, std::nullopt});

        const auto &request = harness.transport.requests.at(0);
        assert(request.method == "POST");
        assert(request.url == "https://api.test/upload?file_name=100%25%20done%20%231.txt&tier=pro&epochs=3");
        assert(request.headers.at("Authorization") == "Bearer access-1");
        assert(request.headers.count("X-User-Id") == 0);

        auto legacy = legacy_credentials();
        harness.transport.push(200, "ok");
        harness.engine.upload(legacy, UploadRequest{file, std::string("  "), std::nullopt, std::nullopt, std::nullopt});
        const auto &legacy_request = harness.transport.requests.at(1);
        assert(legacy_request.url == "https://api.test/upload?file_name=plain.txt");
        assert(legacy_request.headers.count("Authorization") == 0);
        assert(legacy_request.headers.at("X-User-Id") == "user-1");
        assert(legacy_request.headers.at("X-User-App-Key") == "app-key-1");
    }

    void test_upload_missing_file_is_logged()
    {
        Harness harness("upload_missing");
        auto credentials = token_credentials();
        const auto missing = harness.temp.path() / "nope.bin";

        const auto error = capture_error([&]
                                         { harness.engine.upload(credentials, UploadRequest{missing, std::nullopt,
                                                                                            std::nullopt, std::nullopt,
                                                                                            std::nullopt}); });
        assert(error && error->code() == ErrorCode::NotFound);
        assert(harness.transport.requests.empty());

        const auto entries = harness.ledger.read("user-1");
        assert(entries.size() == 1);
        assert(entries[0].status == TransferStatus::Failed);
        assert(entries[0].file_size == 0);
        assert(entries[0].content_hash.empty());
        assert(entries[0].remote_path.empty());
        assert(entries[0].local_path == missing.string());
    }

    void test_upload_failure_is_logged_without_retry()
    {
        Harness harness("upload_failure");
        const auto file = harness.temp.path() / "report.pdf";
        write_file(file, "pdf-bytes");

        auto credentials = token_credentials();
        harness.transport.push(401, "token expired");
        const auto error = capture_error([&]
                                         { harness.engine.upload(credentials, UploadRequest{file, std::nullopt,
                                                                                            std::nullopt, std::nullopt,
                                                                                            std::nullopt}); });
        assert(error && error->code() == ErrorCode::RemoteError);
        assert(error->http_status() == 401);
        assert(std::string(error->what()) == "Upload failed - Status: 401, Response: token expired");
        assert(harness.transport.requests.size() == 1);

        harness.transport.push_failure(ErrorCode::Transport, "HTTP error: Failure when receiving data from the peer");
        const auto transport_error = capture_error([&]
                                                   { harness.engine.upload(credentials, UploadRequest{file, std::nullopt,
                                                                                                      std::nullopt, std::nullopt,
                                                                                                      std::nullopt}); });
        assert(transport_error && transport_error->code() == ErrorCode::Transport);

        const auto entries = harness.ledger.read("user-1");
        assert(entries.size() == 2);
        assert(entries[0].status == TransferStatus::Failed);
        assert(entries[0].message == "token expired");
        assert(entries[0].content_hash == hash_of("pdf-bytes"));
        assert(entries[0].file_size == 9);
        assert(entries[1].status == TransferStatus::Failed);
        assert(entries[1].remote_path == "report.pdf");
    }

    void test_upload_failure_with_binary_body_is_logged()
    {
        Harness harness("upload_binary_body");
        const auto file = harness.temp.path() / "report.pdf";
        write_file(file, "pdf-bytes");

        auto credentials = token_credentials();
        harness.transport.push(500, "\xff\xfe");
        const auto error = capture_error([&]
                                         { harness.engine.upload(credentials, UploadRequest{file, std::nullopt,
                                                                                            std::nullopt, std::nullopt,
                                                                                            std::nullopt}); });
        assert(error && error->code() == ErrorCode::RemoteError);
        assert(error->http_status() == 500);

        const auto entries = harness.ledger.read("user-1");
        assert(entries.size() == 1);
        assert(entries[0].status == TransferStatus::Failed);
        // Invalid bytes are stored as U+FFFD.
        assert(entries[0].message == "\xEF\xBF\xBD\xEF\xBF\xBD");
    }

    void test_upload_success_is_logged_with_progress()
    {
        Harness harness("upload_progress", 1000);
        const auto content = make_content(4500);
        const auto file = harness.temp.path() / "progress.bin";
        write_file(file, content);
        harness.transport.read_capacity = 4096;

        auto credentials = token_credentials();
        harness.transport.push(200, "stored");
        harness.engine.upload(credentials, UploadRequest{file, std::nullopt, std::nullopt, std::nullopt,
                                                         std::string("bar-7")});

        const auto entries = harness.ledger.read("user-1");
        assert(entries.size() == 1);
        assert(entries[0].status == TransferStatus::Success);
        assert(entries[0].message == "stored");
        assert(entries[0].content_hash == hash_of(content));

        const auto events = harness.drain_events();
        assert(events.size() == 6);
        unsigned last_percent = 0;
        for (const auto &event : events)
        {
            assert(event.name == "upload_progress");
            assert(event.payload.at("id") == "bar-7");
            assert(event.payload.at("total") == 4500);
            const auto percent = event.payload.at("percent").get<unsigned>();
            assert(percent >= last_percent && percent <= 100);
            last_percent = percent;
        }
        assert(events.front().payload.at("uploaded") == 1000);
        assert(events.back().payload.at("percent") == 100);
        assert(events.back().payload.at("uploaded") == 4500);
    }

    void test_upload_cancellation_is_logged()
    {
        Harness harness("upload_cancel");
        const auto file = harness.temp.path() / "big.bin";
        write_file(file, make_content(1000));

        auto credentials = token_credentials();
        CancellationToken cancel;
        cancel.cancel();
        harness.transport.push(200, "unused");
        const auto error = capture_error([&]
                                         { harness.engine.upload(credentials,
                                                                 UploadRequest{file, std::nullopt, std::nullopt,
                                                                               std::nullopt, std::nullopt},
                                                                 cancel); });
        assert(error && error->code() == ErrorCode::Cancelled);
        const auto entries = harness.ledger.read("user-1");
        assert(entries.size() == 1);
        assert(entries[0].status == TransferStatus::Failed);
    }

    void test_download_streams_to_destination()
    {
        Harness harness("download_ok");
        harness.transport.sink_chunk = 256;
        const auto content = make_content(1234);
        const auto destination = harness.temp.path() / "out" / "nested" / "copy.bin";

        auto credentials = token_credentials();
        harness.transport.push(200, content);
        const auto summary = harness.engine.download(credentials,
                                                     DownloadRequest{"folder/my file.bin", destination.string()});

        assert(harness.transport.requests.size() == 1);
        assert(harness.transport.requests[0].method == "GET");
        assert(harness.transport.requests[0].url ==
               "https://api.test/download-stream?file_name=folder/my%20file.bin");
        assert(harness.transport.requests[0].headers.at("Authorization") == "Bearer access-1");

        assert(read_file(destination) == content);
        assert(!std::filesystem::exists(destination.string() + ".part"));
        assert(summary.bytes == content.size());
        assert(summary.content_hash == hash_of(content));
        assert(summary.message == "File 'folder/my file.bin' downloaded to '" + destination.string() + "'");

        const auto events = harness.drain_events();
        assert(!events.empty());
        assert(events.back().name == "download_progress");
        assert(events.back().payload.at("downloaded") == 1234);
        assert(events.back().payload.at("total") == 1234);
        assert(events.back().payload.at("percent") == 100);
        assert(events.back().payload.at("output_path") == destination.string());

        // Downloads are not part of the upload ledger.
        assert(harness.ledger.read("user-1").empty());
    }

    void test_download_without_content_length()
    {
        Harness harness("download_no_length");
        harness.transport.announce_length = false;
        const auto destination = harness.temp.path() / "unknown.txt";

        auto legacy = legacy_credentials();
        harness.transport.push(200, "abcdefgh");
        harness.engine.download(legacy, DownloadRequest{"unknown.txt", destination.string()});

        assert(harness.transport.requests[0].headers.at("X-User-Id") == "user-1");
        const auto events = harness.drain_events();
        assert(events.size() == 2);
        for (const auto &event : events)
        {
            assert(event.payload.at("total").is_null());
            assert(event.payload.at("percent") == 0);
        }
    }

    void test_download_retries_once_after_refresh()
    {
        Harness harness("download_retry");
        const auto destination = harness.temp.path() / "retry.txt";

        auto credentials = token_credentials();
        harness.store.save(credentials);
        harness.transport.push(401, "expired");
        harness.transport.push(200, R"({"access_token":"access-2","expires_in":3600})");
        harness.transport.push(200, "payload");

        const auto summary = harness.engine.download(credentials, DownloadRequest{"retry.txt", destination.string()});
        assert(summary.bytes == 7);
        assert(harness.transport.requests.size() == 3);
        assert(harness.transport.requests[1].url == "https://api.test/auth/refresh");
        assert(harness.transport.requests[2].headers.at("Authorization") == "Bearer access-2");
        assert(harness.store.load("user-1")->auth_tokens->access_token == "access-2");
        assert(read_file(destination) == "payload");
    }

    void test_download_second_unauthorized_fails()
    {
        Harness harness("download_retry_fail");
        const auto destination = harness.temp.path() / "denied.txt";

        auto credentials = token_credentials();
        harness.transport.push(401, "expired");
        harness.transport.push(200, R"({"access_token":"access-2","expires_in":3600})");
        harness.transport.push(401, "still denied");

        const auto error = capture_error([&]
                                         { harness.engine.download(credentials,
                                                                   DownloadRequest{"denied.txt", destination.string()}); });
        assert(error && error->code() == ErrorCode::RemoteError);
        assert(error->http_status() == 401);
        assert(harness.transport.requests.size() == 3);
        assert(harness.transport.remaining() == 0);
        assert(!std::filesystem::exists(destination));
    }

    void test_download_legacy_unauthorized_is_not_retried()
    {
        Harness harness("download_legacy_401");
        auto legacy = legacy_credentials();
        harness.transport.push(401, "nope");
        const auto error = capture_error([&]
                                         { harness.engine.download(legacy, DownloadRequest{"a.txt", (harness.temp.path() / "a.txt").string()}); });
        assert(error && error->http_status() == 401);
        assert(harness.transport.requests.size() == 1);
    }

    void test_download_empty_body_fails()
    {
        Harness harness("download_empty");
        const auto destination = harness.temp.path() / "empty.txt";

        auto credentials = token_credentials();
        harness.transport.push(200, "");
        const auto error = capture_error([&]
                                         { harness.engine.download(credentials,
                                                                   DownloadRequest{"empty.txt", destination.string()}); });
        assert(error && error->code() == ErrorCode::InvalidResponse);
        assert(std::string(error->what()) == "No file data received");
        assert(!std::filesystem::exists(destination));
        assert(!std::filesystem::exists(destination.string() + ".part"));
    }

    void test_download_cancellation_removes_partial_file()
    {
        Harness harness("download_cancel");
        const auto destination = harness.temp.path() / "cancelled.bin";

        auto credentials = token_credentials();
        CancellationToken cancel;
        cancel.cancel();
        harness.transport.push(200, make_content(64));
        const auto error = capture_error([&]
                                         { harness.engine.download(credentials,
                                                                   DownloadRequest{"cancelled.bin", destination.string()},
                                                                   cancel); });
        assert(error && error->code() == ErrorCode::Cancelled);
        assert(!std::filesystem::exists(destination));
        assert(!std::filesystem::exists(destination.string() + ".part"));
    }

    void test_download_destination_rules()
    {
        TempDir temp("download_destination");
        const auto existing = temp.path() / "existing";
        std::filesystem::create_directories(existing);

        assert(resolve_download_destination("", "docs/report.pdf") == std::filesystem::path("report.pdf"));
        assert(resolve_download_destination("downloads/", "docs/report.pdf") ==
               std::filesystem::path("downloads") / "report.pdf");
        assert(resolve_download_destination(existing.string(), "report.pdf") == existing / "report.pdf");
        assert(resolve_download_destination((temp.path() / "renamed.pdf").string(), "report.pdf") ==
               temp.path() / "renamed.pdf");

        const auto error = capture_error([]
                                         { resolve_download_destination("", "folder/"); });
        assert(error && error->code() == ErrorCode::InvalidArgument);
    }

} // namespace

void run_transfer_engine_tests()
{
    test_upload_hash_is_chunk_size_independent();
    test_upload_request_shape();
    test_upload_missing_file_is_logged();
    test_upload_failure_is_logged_without_retry();
    test_upload_failure_with_binary_body_is_logged();
    test_upload_success_is_logged_with_progress();
    test_upload_cancellation_is_logged();
    test_download_streams_to_destination();
    test_download_without_content_length();
    test_download_retries_once_after_refresh();
    test_download_second_unauthorized_fails();
    test_download_legacy_unauthorized_is_not_retried();
    test_download_empty_body_fails();
    test_download_cancellation_removes_partial_file();
    test_download_destination_rules();
}
