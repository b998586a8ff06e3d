#include "firestarter/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <vector>

namespace firestarter::client
{

    Logger::Logger(const std::optional<std::filesystem::path> &path, bool console)
    {
        try
        {
            std::vector<spdlog::sink_ptr> sinks;
            if (path)
            {
                if (path->has_parent_path())
                {
                    std::error_code ec;
                    std::filesystem::create_directories(path->parent_path(), ec);
                }
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), false));
            }
            if (console)
            {
                sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
            }
            if (sinks.empty())
            {
                sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
            }
            logger_ = std::make_shared<spdlog::logger>("client", sinks.begin(), sinks.end());
            logger_->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
            logger_->set_level(spdlog::level::info);
            logger_->flush_on(spdlog::level::warn);
        }
        catch (const spdlog::spdlog_ex &ex)
        {
            std::cerr << "WARNING: logging disabled: " << ex.what() << std::endl;
            logger_.reset();
        }
    }

} // namespace firestarter::client
