#include "firestarter/client/events.hpp"

#include <asio/post.hpp>

#include <algorithm>

namespace firestarter::client
{

    void to_json(nlohmann::json &json, const UploadProgress &progress)
    {
        json = {
            {"percent", progress.percent},
            {"uploaded", progress.uploaded},
            {"total", progress.total},
        };
        if (progress.id)
        {
            json["id"] = *progress.id;
        }
    }

    void to_json(nlohmann::json &json, const DownloadProgress &progress)
    {
        json = {
            {"file_name", progress.file_name},
            {"downloaded", progress.downloaded},
            {"total", nullptr},
            {"percent", progress.percent},
            {"output_path", progress.output_path},
        };
        if (progress.total)
        {
            json["total"] = *progress.total;
        }
    }

    unsigned progress_percent(std::uint64_t done, std::uint64_t total) noexcept
    {
        if (total == 0)
        {
            return 0;
        }
        const double ratio = static_cast<double>(done) / static_cast<double>(total) * 100.0;
        return static_cast<unsigned>(std::min(ratio, 100.0));
    }

    EventDispatcher::EventDispatcher(Logger logger, std::size_t max_pending)
        : logger_(std::move(logger)),
          max_pending_(max_pending),
          work_(asio::make_work_guard(io_context_))
    {
        worker_ = std::thread([this]
                              { io_context_.run(); });
    }

    EventDispatcher::~EventDispatcher()
    {
        flush();
        work_.reset();
        io_context_.stop();
        if (worker_.joinable())
        {
            worker_.join();
        }
    }

    void EventDispatcher::set_listener(Listener listener)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener_ = std::move(listener);
    }

    void EventDispatcher::emit(const std::string &name, nlohmann::json payload)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!listener_ || pending_ >= max_pending_)
            {
                return;
            }
            ++pending_;
        }
        try
        {
            asio::post(io_context_, [this, event = Event{name, std::move(payload)}]()
                       {
                deliver(event);
                finish_one(); });
        }
        catch (const std::exception &ex)
        {
            logger_.warn("events", "dropping ", name, ": ", ex.what());
            finish_one();
        }
    }

    void EventDispatcher::emit(const UploadProgress &progress)
    {
        emit("upload_progress", nlohmann::json(progress));
    }

    void EventDispatcher::emit(const DownloadProgress &progress)
    {
        emit("download_progress", nlohmann::json(progress));
    }

    void EventDispatcher::flush()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        drained_.wait(lock, [this]
                      { return pending_ == 0; });
    }

    void EventDispatcher::deliver(const Event &event)
    {
        Listener listener;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            listener = listener_;
        }
        if (!listener)
        {
            return;
        }
        try
        {
            listener(event);
        }
        catch (const std::exception &ex)
        {
            logger_.warn("events", "listener failed on ", event.name, ": ", ex.what());
        }
    }

    void EventDispatcher::finish_one()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --pending_;
        if (pending_ == 0)
        {
            drained_.notify_all();
        }
    }

} // namespace firestarter::client
