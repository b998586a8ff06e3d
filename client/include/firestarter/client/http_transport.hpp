#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace firestarter::client
{

    using HttpHeaders = std::map<std::string, std::string>;

    struct HttpRequest
    {
        std::string method{"GET"};
        std::string url;
        HttpHeaders headers;
        std::string body;

        // Streaming request body, pulled until it returns 0. Replaces body when set.
        std::function<std::size_t(char *buffer, std::size_t capacity)> body_source;
        std::optional<std::uint64_t> body_size;

        // Streaming response body, only invoked for 2xx responses. Other responses land in
        // HttpResponse::body. Throwing from a callback aborts the request and the exception
        // propagates out of send().
        std::function<void(std::span<const char> chunk, std::optional<std::uint64_t> content_length)> body_sink;

        // Polled while the request is in flight; true aborts with ErrorCode::Cancelled.
        std::function<bool()> abort_requested;

        std::chrono::milliseconds timeout{0};
    };

    struct HttpResponse
    {
        int status_code{};
        std::string body;
        HttpHeaders headers;

        bool success() const noexcept { return status_code >= 200 && status_code < 300; }
    };

    // Case-insensitive header lookup.
    std::optional<std::string> find_header(const HttpHeaders &headers, const std::string &name);

    // Transport failures (DNS, connect, TLS, timeout) throw firestarter::Error with a transport
    // error code. Any HTTP status, including 4xx/5xx, is returned as a response.
    class HttpTransport
    {
    public:
        virtual ~HttpTransport() = default;

        virtual HttpResponse send(const HttpRequest &request) = 0;
    };

    class CurlTransport : public HttpTransport
    {
    public:
        explicit CurlTransport(std::chrono::milliseconds connect_timeout = std::chrono::seconds(30));
        ~CurlTransport() override;

        CurlTransport(const CurlTransport &) = delete;
        CurlTransport &operator=(const CurlTransport &) = delete;

        HttpResponse send(const HttpRequest &request) override;

    private:
        struct Impl;
        std::unique_ptr<Impl> impl_;
        std::chrono::milliseconds connect_timeout_;
    };

} // namespace firestarter::client
