#include "firestarter/client/config.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

#include "firestarter/error_codes.hpp"
#include "firestarter/version.hpp"

namespace firestarter::client
{

    namespace
    {

        std::string read_value(int &index, int argc, char *argv[], const std::string &option)
        {
            if (index + 1 >= argc)
            {
                throw Error(ErrorCode::InvalidArgument, option + " requires a value");
            }
            ++index;
            return std::string(argv[index]);
        }

    } // namespace

    std::filesystem::path default_data_root()
    {
        if (const char *override_dir = std::getenv("FIRESTARTER_DATA_DIR"); override_dir && *override_dir)
        {
            return std::filesystem::path(override_dir);
        }
#ifdef _WIN32
        if (const char *appdata = std::getenv("APPDATA"))
        {
            return std::filesystem::path(appdata) / "Firestarter";
        }
#endif
        if (const char *home = std::getenv("HOME"))
        {
            return std::filesystem::path(home) / ".firestarter";
        }
        return std::filesystem::path(".firestarter");
    }

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        ClientConfig config;
        int index = 1;
        for (; index < argc; ++index)
        {
            const std::string arg = argv[index];
            if (arg.rfind("--", 0) != 0 && arg != "-h")
            {
                break;
            }
            if (arg == "--data-dir")
            {
                config.data_dir = std::filesystem::path(read_value(index, argc, argv, arg));
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(read_value(index, argc, argv, arg));
            }
            else if (arg == "--api-config")
            {
                config.api_config_path = std::filesystem::path(read_value(index, argc, argv, arg));
            }
            else if (arg == "--chunk-size")
            {
                const auto value = read_value(index, argc, argv, arg);
                try
                {
                    config.chunk_size = static_cast<std::size_t>(std::stoull(value));
                }
                catch (const std::logic_error &)
                {
                    throw Error(ErrorCode::InvalidArgument, "Invalid --chunk-size: " + value);
                }
                if (config.chunk_size == 0)
                {
                    throw Error(ErrorCode::InvalidArgument, "--chunk-size must be positive");
                }
            }
            else if (arg == "--verbose")
            {
                config.verbose = true;
            }
            else if (arg == "--help" || arg == "-h")
            {
                config.show_help = true;
            }
            else
            {
                throw Error(ErrorCode::InvalidArgument, "Unknown argument: " + arg);
            }
        }

        if (index < argc)
        {
            config.command = argv[index++];
        }
        for (; index < argc; ++index)
        {
            config.arguments.emplace_back(argv[index]);
        }

        if (config.command.empty() && !config.show_help)
        {
            throw Error(ErrorCode::InvalidArgument, "Missing command");
        }
        if (config.data_dir.empty())
        {
            config.data_dir = default_data_root();
        }
        return config;
    }

    std::string usage(const std::string &program_name)
    {
        return "Firestarter client " + std::string(firestarter::version()) + "\n"
               "Usage: " + program_name +
               " [--data-dir <DIR>] [--log <FILE>] [--api-config <FILE>] [--chunk-size <BYTES>] [--verbose]"
               " <command> [args...]\n"
               "Commands:\n"
               "  get-config | config-path | test-connection [base_url]\n"
               "  proxy-get <url> [headers_json] | proxy-post <url> [body_json] [headers_json]\n"
               "  register <username> | login <username> <password>\n"
               "  set-password <user_id> <user_app_key> <new_password>\n"
               "  upload <local_path> [remote_name] [--tier T] [--epochs N] [--id ID] [--user U]\n"
               "  download <remote_name> [output_path] [--user U]\n"
               "  save-credentials <json> | load-credentials [user_id] | clear-credentials <user_id>\n"
               "  list-users | refresh-token [user_id] | upload-history [user_id]\n"
               "  create-link <remote_path> [--title T] [--description D] [--user U]\n"
               "  delete-link <link_hash> [--user U] | list-links [user_id]\n"
               "  token-usage <period> [--user U] | tier-pricing | file-size <path>\n";
    }

} // namespace firestarter::client
