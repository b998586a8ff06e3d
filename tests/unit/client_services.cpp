#include <cassert>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "firestarter/client/account_service.hpp"
#include "firestarter/client/api_proxy.hpp"
#include "firestarter/client/authorized_client.hpp"
#include "firestarter/client/config.hpp"
#include "firestarter/client/credential_store.hpp"
#include "firestarter/client/link_service.hpp"
#include "firestarter/client/logger.hpp"
#include "firestarter/client/public_link_store.hpp"
#include "firestarter/client/session.hpp"
#include "firestarter/client/token_manager.hpp"
#include "firestarter/error_codes.hpp"
#include "firestarter/time_format.hpp"
#include "test_support.hpp"

using namespace firestarter;
using namespace firestarter::client;
using namespace firestarter::testing;

namespace
{

    struct ServiceHarness
    {
        explicit ServiceHarness(const std::string &name)
            : temp(name),
              store(temp.path(), Logger()),
              link_store(temp.path()),
              tokens(test_api_config(), transport, store, Logger()),
              client(transport, tokens, Logger()),
              proxy(test_api_config(), client, store, Logger()),
              accounts(test_api_config(), client, store, Logger()),
              links(test_api_config(), client, link_store, Logger())
        {
        }

        TempDir temp;
        FakeTransport transport;
        CredentialStore store;
        PublicLinkStore link_store;
        TokenManager tokens;
        AuthorizedClient client;
        ApiProxy proxy;
        AccountService accounts;
        LinkService links;
    };

    ClientConfig parse(std::vector<std::string> words)
    {
        std::vector<char *> argv;
        for (auto &word : words)
        {
            argv.push_back(word.data());
        }
        return parse_arguments(static_cast<int>(argv.size()), argv.data());
    }

    void test_proxy_get_injects_bearer()
    {
        ServiceHarness harness("proxy_bearer");
        harness.store.save(token_credentials());
        harness.transport.push(200, R"({"balance":5})");

        const auto result = harness.proxy.get("/checkWallet");
        assert(result.at("balance") == 5);
        const auto &request = harness.transport.requests.at(0);
        assert(request.method == "GET");
        assert(request.url == "https://api.test/checkWallet");
        assert(request.headers.at("Authorization") == "Bearer access-1");

        harness.transport.push(200, "[]");
        harness.proxy.get("http://elsewhere.test/status", {{"X-Trace", "t-1"}});
        assert(harness.transport.requests.at(1).url == "http://elsewhere.test/status");
        assert(harness.transport.requests.at(1).headers.at("X-Trace") == "t-1");
    }

    void test_proxy_respects_caller_authorization()
    {
        ServiceHarness harness("proxy_caller_auth");
        harness.store.save(token_credentials());
        harness.transport.push(200, "{}");

        harness.proxy.get("/checkWallet", {{"authorization", "Bearer custom"}});
        const auto &headers = harness.transport.requests.at(0).headers;
        assert(headers.at("authorization") == "Bearer custom");
        assert(headers.count("Authorization") == 0);
    }

    void test_proxy_legacy_post_body_injection()
    {
        ServiceHarness harness("proxy_legacy");
        harness.store.save(legacy_credentials());

        harness.transport.push(200, R"({"ok":true})");
        harness.proxy.post("/withdrawSol", {}, nlohmann::json{{"amount", 2}});
        auto body = nlohmann::json::parse(harness.transport.requests.at(0).body);
        assert(body.at("amount") == 2);
        assert(body.at("user_id") == "user-1");
        assert(body.at("user_app_key") == "app-key-1");
        assert(harness.transport.requests.at(0).headers.count("Authorization") == 0);
        assert(harness.transport.requests.at(0).headers.at("Content-Type") == "application/json");

        harness.transport.push(200, R"({"ok":true})");
        harness.proxy.post("/checkCustomToken");
        body = nlohmann::json::parse(harness.transport.requests.at(1).body);
        assert(body == nlohmann::json({{"user_id", "user-1"}, {"user_app_key", "app-key-1"}}));
    }

    void test_proxy_requires_json_success()
    {
        ServiceHarness harness("proxy_errors");

        harness.transport.push(200, "hello");
        auto error = capture_error([&]
                                   { harness.proxy.get("/checkWallet"); });
        assert(error && error->code() == ErrorCode::InvalidResponse);
        assert(std::string(error->what()) == "Success but response is not valid JSON: hello");

        harness.transport.push(404, "missing");
        error = capture_error([&]
                              { harness.proxy.get("/checkWallet"); });
        assert(error && error->code() == ErrorCode::RemoteError);
        assert(error->http_status() == 404);
        assert(std::string(error->what()) == "HTTP 404: missing");

        assert(harness.transport.requests.at(0).headers.empty());
    }

    void test_proxy_retries_once_on_unauthorized()
    {
        ServiceHarness harness("proxy_retry");
        harness.store.save(token_credentials());
        harness.transport.push(401, "expired");
        harness.transport.push(200, R"({"access_token":"access-2","expires_in":3600})");
        harness.transport.push(200, R"({"value":1})");

        const auto result = harness.proxy.get("/api/token-usage");
        assert(result.at("value") == 1);
        assert(harness.transport.requests.size() == 3);
        assert(harness.transport.requests.at(2).headers.at("Authorization") == "Bearer access-2");

        harness.transport.push(401, "expired");
        harness.transport.push(200, R"({"access_token":"access-3","expires_in":3600})");
        harness.transport.push(401, "expired again");
        const auto error = capture_error([&]
                                         { harness.proxy.get("/api/token-usage"); });
        assert(error && error->http_status() == 401);
        assert(harness.transport.requests.size() == 6);
    }

    void test_account_login()
    {
        ServiceHarness harness("account_login");
        harness.transport.push(200, R"({"access_token":"a","refresh_token":"r","token_type":"Bearer","expires_in":3600})");

        const auto before = std::chrono::system_clock::now();
        const auto tokens = harness.accounts.login("alice", "secret");
        assert(tokens.access_token == "a");
        assert(tokens.expires_at);
        const auto expires_at = time_format::parse_rfc3339(*tokens.expires_at);
        assert(expires_at);
        assert(*expires_at >= before + std::chrono::seconds(3599));
        assert(*expires_at <= std::chrono::system_clock::now() + std::chrono::seconds(3601));

        const auto &request = harness.transport.requests.at(0);
        assert(request.url == "https://api.test/auth/login");
        assert(nlohmann::json::parse(request.body) == nlohmann::json({{"username", "alice"}, {"password", "secret"}}));

        harness.transport.push(401, "bad credentials");
        const auto error = capture_error([&]
                                         { harness.accounts.login("alice", "wrong"); });
        assert(error && error->code() == ErrorCode::RemoteError);
        assert(std::string(error->what()) == "Login failed. Status: 401, Error: bad credentials");
    }

    void test_account_register_and_password()
    {
        ServiceHarness harness("account_register");
        harness.transport.push(200, R"({"user_id":"u9","user_app_key":"k9","solana_pubkey":"pk"})");
        const auto created = harness.accounts.register_user("bob");
        assert(created.user_id == "u9");
        const auto stored = harness.store.load("u9");
        assert(stored && stored->username == std::string("bob"));
        assert(stored->user_app_key == "k9");
        assert(!stored->auth_tokens);

        harness.transport.push(200, R"({"access_token":"a","refresh_token":"r","token_type":"Bearer","expires_in":60})");
        const auto tokens = harness.accounts.set_password("u9", "k9", "new-secret");
        assert(tokens.expires_at);
        const auto body = nlohmann::json::parse(harness.transport.requests.at(1).body);
        assert(body.at("new_password") == "new-secret");
        assert(harness.transport.requests.at(1).url == "https://api.test/auth/reset_password");
    }

    void test_account_test_connection()
    {
        ServiceHarness harness("account_health");
        harness.transport.push(200, R"({"status":"healthy","version":"1.2.3"})");
        assert(harness.accounts.test_connection("https://example.test/") ==
               "Connection successful! Server is healthy (v1.2.3)");
        assert(harness.transport.requests.at(0).url == "https://example.test/health");

        harness.transport.push(200, "plain text");
        assert(harness.accounts.test_connection("https://example.test") ==
               "Connection successful! Server responded with status 200");

        harness.transport.push_failure(ErrorCode::TransportDns, "HTTP error: Could not resolve host");
        auto error = capture_error([&]
                                   { harness.accounts.test_connection("https://nowhere.test"); });
        assert(error && error->code() == ErrorCode::TransportDns);
        assert(std::string(error->what()) == "DNS resolution failed. Please check the URL.");

        harness.transport.push_failure(ErrorCode::TransportCertificate, "HTTP error: SSL certificate problem");
        error = capture_error([&]
                              { harness.accounts.test_connection("https://self-signed.test"); });
        assert(error && error->code() == ErrorCode::TransportCertificate);
        assert(std::string(error->what()) == "SSL/TLS certificate error. Please check the HTTPS URL.");

        harness.transport.push(503, "down");
        error = capture_error([&]
                              { harness.accounts.test_connection("https://example.test"); });
        assert(error && error->http_status() == 503);
    }

    void test_account_usage_and_pricing()
    {
        ServiceHarness harness("account_usage");
        auto credentials = token_credentials();
        harness.transport.push(200, R"({"total":10})");
        const auto usage = harness.accounts.token_usage(credentials, "30d");
        assert(usage.at("total") == 10);
        assert(harness.transport.requests.at(0).url ==
               "https://api.test/api/token-usage?user_id=user-1&period=30d&detailed=false");
        assert(harness.transport.requests.at(0).headers.at("Authorization") == "Bearer access-1");

        harness.transport.push(200, R"([{"tier":"normal"}])");
        const auto pricing = harness.accounts.tier_pricing();
        assert(pricing.is_array() && pricing.size() == 1);

        auto config = test_api_config();
        config.get_tier_pricing.reset();
        AccountService without_pricing(config, harness.client, harness.store, Logger());
        const auto error = capture_error([&]
                                         { without_pricing.tier_pricing(); });
        assert(error && error->code() == ErrorCode::Unsupported);
    }

    void test_public_links()
    {
        ServiceHarness harness("links_service");
        auto credentials = token_credentials();

        harness.transport.push(200, R"({"link_hash":"h1"})");
        const auto entry = harness.links.create(credentials, "docs/a.pdf", std::string("Quarterly"));
        assert(entry.link_hash == "h1");
        assert(entry.custom_title == std::string("Quarterly"));
        assert(!entry.custom_description);

        const auto &request = harness.transport.requests.at(0);
        assert(request.url == "https://api.test/createPublicLink");
        assert(request.headers.at("X-Csrf-Token") == "csrf-1");
        assert(request.headers.at("Authorization") == "Bearer access-1");
        const auto body = nlohmann::json::parse(request.body);
        assert(body.at("file_name") == "docs/a.pdf");
        assert(body.at("custom_title") == "Quarterly");
        assert(!body.contains("custom_description"));
        assert(harness.links.list("user-1").size() == 1);

        harness.transport.push(200, R"({"status":"created"})");
        auto error = capture_error([&]
                                   { harness.links.create(credentials, "docs/b.pdf"); });
        assert(error && error->code() == ErrorCode::InvalidResponse);
        assert(harness.links.list("user-1").size() == 1);

        harness.transport.push(200, "{}");
        assert(harness.links.remove(credentials, "h1") == "Deleted h1 (1 -> 0)");
        assert(nlohmann::json::parse(harness.transport.requests.at(2).body) ==
               nlohmann::json({{"link_hash", "h1"}}));
        assert(harness.links.list("user-1").empty());

        auto legacy = legacy_credentials();
        const auto requests_before = harness.transport.requests.size();
        error = capture_error([&]
                              { harness.links.create(legacy, "docs/c.pdf"); });
        assert(error && error->code() == ErrorCode::AuthenticationRequired);
        assert(harness.transport.requests.size() == requests_before);
    }

    void test_parse_arguments()
    {
        const auto config = parse({"firestarter", "--data-dir", "/tmp/fs-data", "--chunk-size", "4096", "--verbose",
                                   "upload", "a.txt", "--tier", "pro"});
        assert(config.data_dir == std::filesystem::path("/tmp/fs-data"));
        assert(config.chunk_size == 4096);
        assert(config.verbose);
        assert(config.command == "upload");
        assert((config.arguments == std::vector<std::string>{"a.txt", "--tier", "pro"}));

        assert(parse({"firestarter", "--help"}).show_help);

        for (const auto &words : std::vector<std::vector<std::string>>{
                 {"firestarter", "--log"},
                 {"firestarter", "--bogus", "list-users"},
                 {"firestarter", "--chunk-size", "0", "upload"},
                 {"firestarter", "--chunk-size", "lots", "upload"},
                 {"firestarter"},
             })
        {
            const auto error = capture_error([&]
                                             { parse(words); });
            assert(error && error->code() == ErrorCode::InvalidArgument);
        }
    }

    void test_command_args()
    {
        const auto args = CommandArgs::parse({"docs/a.pdf", "--title", "Report", "out/"});
        assert((args.positional == std::vector<std::string>{"docs/a.pdf", "out/"}));
        assert(args.option("title") == std::string("Report"));
        assert(!args.option("description"));
        assert(args.optional_at(1) == std::string("out/"));
        assert(!args.optional_at(2));

        const auto error = capture_error([&]
                                         { args.at(5, "thing <x>"); });
        assert(error && std::string(error->what()) == "Usage: thing <x>");

        const auto dangling = capture_error([]
                                            { CommandArgs::parse({"--title"}); });
        assert(dangling && dangling->code() == ErrorCode::InvalidArgument);
    }

    void test_session_commands()
    {
        TempDir temp("session");
        FakeTransport transport;
        ClientConfig config;
        config.data_dir = temp.path() / "data";
        ClientSession session(config, test_api_config(), transport, Logger());

        assert(session.has_command("upload"));
        assert(!session.has_command("sync"));
        auto error = capture_error([&]
                                   { session.execute("sync", {}); });
        assert(error && error->code() == ErrorCode::InvalidArgument);

        assert(session.execute("get-config", {}).at("api_base_url") == "https://api.test");
        assert(session.execute("load-credentials", {}).is_null());

        auto stored = legacy_credentials();
        stored.username = "alice";
        assert(session.execute("save-credentials", {nlohmann::json(stored).dump()}) == "Credentials saved");
        assert(session.execute("load-credentials", {}).at("user_id") == "user-1");
        assert(session.execute("list-users", {}).size() == 1);

        transport.push(200, R"({"access_token":"a","refresh_token":"r","token_type":"Bearer","expires_in":3600})");
        session.execute("login", {"alice", "secret"});
        const auto merged = session.credentials().load("user-1");
        assert(merged && merged->auth_tokens && merged->auth_tokens->access_token == "a");

        const auto file = temp.path() / "five.txt";
        write_file(file, "12345");
        assert(session.execute("file-size", {file.string()}) == 5);

        error = capture_error([&]
                              { session.execute("upload", {}); });
        assert(error && error->code() == ErrorCode::InvalidArgument);

        assert(session.execute("upload-history", {}).empty());

        for (const std::string epochs : {"-1", "4294967296", "3x", ""})
        {
            error = capture_error([&]
                                  { session.execute("upload", {file.string(), "--epochs", epochs}); });
            assert(error && error->code() == ErrorCode::InvalidArgument);
        }
        assert(transport.requests.size() == 1);

        transport.push(200, "stored");
        session.execute("upload", {file.string(), "--epochs", "4294967295"});
        assert(transport.requests.at(1).url.find("epochs=4294967295") != std::string::npos);
        assert(session.execute("upload-history", {}).size() == 1);
        assert(session.execute("clear-credentials", {"user-1"}) == "Credentials cleared");
        assert(session.execute("load-credentials", {}).is_null());
    }

} // namespace

void run_client_service_tests()
{
    test_proxy_get_injects_bearer();
    test_proxy_respects_caller_authorization();
    test_proxy_legacy_post_body_injection();
    test_proxy_requires_json_success();
    test_proxy_retries_once_on_unauthorized();
    test_account_login();
    test_account_register_and_password();
    test_account_test_connection();
    test_account_usage_and_pricing();
    test_public_links();
    test_parse_arguments();
    test_command_args();
    test_session_commands();
}
