#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace firestarter::client
{

    struct ClientConfig
    {
        std::filesystem::path data_dir;
        std::optional<std::filesystem::path> log_path;
        std::optional<std::filesystem::path> api_config_path;
        std::size_t chunk_size{128 * 1024};
        bool verbose{false};
        bool show_help{false};
        std::string command;
        std::vector<std::string> arguments;
    };

    // $FIRESTARTER_DATA_DIR, else %APPDATA%/Firestarter on Windows, else $HOME/.firestarter.
    std::filesystem::path default_data_root();

    // Global options come first; the first non-option word is the command and everything after
    // it belongs to the command. Throws Error(InvalidArgument) on malformed input.
    ClientConfig parse_arguments(int argc, char *argv[]);

    std::string usage(const std::string &program_name);

} // namespace firestarter::client
