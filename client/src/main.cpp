#include <asio/signal_set.hpp>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <optional>

#include <nlohmann/json.hpp>

#include "firestarter/client/api_config.hpp"
#include "firestarter/client/cancellation.hpp"
#include "firestarter/client/config.hpp"
#include "firestarter/client/http_transport.hpp"
#include "firestarter/client/logger.hpp"
#include "firestarter/client/session.hpp"
#include "firestarter/error_codes.hpp"

namespace
{

    constexpr int kExitFailure = 1;
    constexpr int kExitConfiguration = 2;

    std::mutex stdout_mutex;

    void print_line(const nlohmann::json &json)
    {
        std::lock_guard<std::mutex> lock(stdout_mutex);
        // Server text is not guaranteed to be UTF-8.
        std::cout << json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    }

    void print_error(firestarter::ErrorCode code, const std::string &message, std::optional<int> status)
    {
        nlohmann::json error = {
            {"code", std::string(firestarter::to_string(code))},
            {"message", message},
            {"status", nullptr},
        };
        if (status)
        {
            error["status"] = *status;
        }
        print_line({{"error", error}});
    }

} // namespace

int main(int argc, char *argv[])
{
    using namespace firestarter::client;
    using firestarter::Error;
    using firestarter::ErrorCode;

    ClientConfig config;
    try
    {
        config = parse_arguments(argc, argv);
    }
    catch (const Error &ex)
    {
        std::cerr << ex.what() << "\n"
                  << usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (config.show_help)
    {
        std::cout << usage(argv[0]);
        return EXIT_SUCCESS;
    }

    Logger logger(config.log_path, config.verbose);

    std::optional<ApiConfig> api;
    try
    {
        api = config.api_config_path ? ApiConfig::load(*config.api_config_path) : ApiConfig::bundled();
    }
    catch (const Error &ex)
    {
        logger.error("config", ex.what());
        print_error(ex.code(), ex.what(), ex.http_status());
        return kExitConfiguration;
    }

    try
    {
        CurlTransport transport;
        ClientSession session(config, *api, transport, logger);
        if (!session.has_command(config.command))
        {
            throw Error(ErrorCode::InvalidArgument, "Unknown command: " + config.command);
        }

        session.events().set_listener([](const Event &event)
                                      { print_line({{"event", event.name}, {"payload", event.payload}}); });

        CancellationToken cancel;
        asio::signal_set signals(session.events().context(), SIGINT, SIGTERM);
        signals.async_wait([cancel, &logger](const std::error_code &ec, int signal_number)
                           {
                               if (ec)
                               {
                                   return;
                               }
                               logger.warn("session", "signal ", signal_number, " received, cancelling");
                               cancel.cancel(); });

        const auto result = session.execute(config.command, config.arguments, cancel);
        signals.cancel();
        print_line({{"result", result}});
        return EXIT_SUCCESS;
    }
    catch (const Error &ex)
    {
        logger.error("session", config.command, " failed: ", ex.what());
        print_error(ex.code(), ex.what(), ex.http_status());
        return kExitFailure;
    }
    catch (const std::exception &ex)
    {
        logger.error("session", config.command, " failed: ", ex.what());
        print_error(ErrorCode::InternalError, ex.what(), std::nullopt);
        return kExitFailure;
    }
}
