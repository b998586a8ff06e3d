#pragma once

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "firestarter/client/logger.hpp"

namespace firestarter::client
{

    struct UploadProgress
    {
        std::optional<std::string> id;
        unsigned percent{};
        std::uint64_t uploaded{};
        std::uint64_t total{};
    };

    void to_json(nlohmann::json &json, const UploadProgress &progress);

    struct DownloadProgress
    {
        std::string file_name;
        std::uint64_t downloaded{};
        std::optional<std::uint64_t> total;
        unsigned percent{};
        std::string output_path;
    };

    void to_json(nlohmann::json &json, const DownloadProgress &progress);

    struct Event
    {
        std::string name;
        nlohmann::json payload;
    };

    // min(100, done * 100 / total); 0 when total is 0.
    unsigned progress_percent(std::uint64_t done, std::uint64_t total) noexcept;

    // Delivers events to a single listener on a background asio thread. Emitting never blocks
    // and never fails: with no listener, or with max_pending events already queued, the event is
    // dropped. Listener exceptions are logged and discarded.
    class EventDispatcher
    {
    public:
        using Listener = std::function<void(const Event &)>;

        explicit EventDispatcher(Logger logger, std::size_t max_pending = 256);
        ~EventDispatcher();

        EventDispatcher(const EventDispatcher &) = delete;
        EventDispatcher &operator=(const EventDispatcher &) = delete;

        void set_listener(Listener listener);

        void emit(const std::string &name, nlohmann::json payload);
        void emit(const UploadProgress &progress);
        void emit(const DownloadProgress &progress);

        // Blocks until every queued event has been delivered.
        void flush();

        asio::io_context &context() noexcept { return io_context_; }

    private:
        void deliver(const Event &event);
        void finish_one();

        Logger logger_;
        std::size_t max_pending_;
        asio::io_context io_context_;
        asio::executor_work_guard<asio::io_context::executor_type> work_;
        std::thread worker_;

        std::mutex mutex_;
        std::condition_variable drained_;
        Listener listener_;
        std::size_t pending_{0};
    };

} // namespace firestarter::client
