#include "firestarter/client/http_transport.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <exception>
#include <mutex>
#include <string_view>

#include "firestarter/error_codes.hpp"

namespace firestarter::client
{

    namespace
    {

        std::string to_lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            return value;
        }

        std::string trim(std::string_view input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string_view::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return std::string(input.substr(begin, end - begin + 1));
        }

        void ensure_curl_global_init()
        {
            static std::once_flag flag;
            std::call_once(flag, []()
                           {
                if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
                {
                    throw Error(ErrorCode::InternalError, "curl_global_init failed");
                } });
        }

        // State shared with the libcurl callbacks of one request.
        struct Exchange
        {
            CURL *curl{};
            const HttpRequest *request{};
            HttpResponse response;
            std::optional<std::uint64_t> content_length;
            std::exception_ptr failure;
            bool aborted{false};
        };

        long current_status(const Exchange &exchange)
        {
            long status = 0;
            curl_easy_getinfo(exchange.curl, CURLINFO_RESPONSE_CODE, &status);
            return status;
        }

        std::size_t write_callback(char *data, std::size_t size, std::size_t nmemb, void *userp)
        {
            auto *exchange = static_cast<Exchange *>(userp);
            const auto total = size * nmemb;
            const auto status = current_status(*exchange);
            if (!exchange->request->body_sink || status < 200 || status >= 300)
            {
                exchange->response.body.append(data, total);
                return total;
            }
            try
            {
                exchange->request->body_sink(std::span<const char>(data, total), exchange->content_length);
                return total;
            }
            catch (...)
            {
                exchange->failure = std::current_exception();
                return 0;
            }
        }

        std::size_t header_callback(char *buffer, std::size_t size, std::size_t nitems, void *userdata)
        {
            auto *exchange = static_cast<Exchange *>(userdata);
            const auto total = size * nitems;
            const std::string_view line(buffer, total);

            // A new status line starts a new response (redirects, 100-continue).
            if (line.rfind("HTTP/", 0) == 0)
            {
                exchange->response.headers.clear();
                exchange->response.body.clear();
                exchange->content_length.reset();
                return total;
            }

            const auto colon_pos = line.find(':');
            if (colon_pos == std::string_view::npos)
            {
                return total;
            }
            auto name = to_lower(trim(line.substr(0, colon_pos)));
            auto value = trim(line.substr(colon_pos + 1));
            if (name == "content-length")
            {
                try
                {
                    exchange->content_length = std::stoull(value);
                }
                catch (const std::exception &)
                {
                    exchange->content_length.reset();
                }
            }
            exchange->response.headers[std::move(name)] = std::move(value);
            return total;
        }

        std::size_t read_callback(char *buffer, std::size_t size, std::size_t nitems, void *userdata)
        {
            auto *exchange = static_cast<Exchange *>(userdata);
            try
            {
                return exchange->request->body_source(buffer, size * nitems);
            }
            catch (...)
            {
                exchange->failure = std::current_exception();
                return CURL_READFUNC_ABORT;
            }
        }

        int progress_callback(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
        {
            auto *exchange = static_cast<Exchange *>(clientp);
            if (exchange->request->abort_requested && exchange->request->abort_requested())
            {
                exchange->aborted = true;
                return 1;
            }
            return 0;
        }

    } // namespace

    std::optional<std::string> find_header(const HttpHeaders &headers, const std::string &name)
    {
        const auto wanted = to_lower(name);
        for (const auto &[key, value] : headers)
        {
            if (to_lower(key) == wanted)
            {
                return value;
            }
        }
        return std::nullopt;
    }

    struct CurlTransport::Impl
    {
        CURL *curl{};

        Impl()
        {
            ensure_curl_global_init();
            curl = curl_easy_init();
            if (!curl)
            {
                throw Error(ErrorCode::InternalError, "Failed to initialize CURL");
            }
        }

        ~Impl()
        {
            if (curl)
            {
                curl_easy_cleanup(curl);
            }
        }
    };

    CurlTransport::CurlTransport(std::chrono::milliseconds connect_timeout)
        : impl_(std::make_unique<Impl>()), connect_timeout_(connect_timeout) {}

    CurlTransport::~CurlTransport() = default;

    HttpResponse CurlTransport::send(const HttpRequest &request)
    {
        CURL *curl = impl_->curl;
        curl_easy_reset(curl);

        Exchange exchange;
        exchange.curl = curl;
        exchange.request = &request;

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout_.count()));
        if (request.timeout.count() > 0)
        {
            curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
        }

        if (request.method == "POST")
        {
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            if (request.body_source)
            {
                curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
                curl_easy_setopt(curl, CURLOPT_READDATA, &exchange);
                if (request.body_size)
                {
                    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(*request.body_size));
                }
            }
            else
            {
                curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
            }
        }
        else if (request.method == "GET")
        {
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        }
        else
        {
            throw Error(ErrorCode::Unsupported, "Unsupported HTTP method: " + request.method);
        }

        struct curl_slist *curl_headers = nullptr;
        for (const auto &[key, value] : request.headers)
        {
            const std::string header_line = key + ": " + value;
            curl_headers = curl_slist_append(curl_headers, header_line.c_str());
        }
        if (request.body_source)
        {
            if (!request.body_size)
            {
                curl_headers = curl_slist_append(curl_headers, "Transfer-Encoding: chunked");
            }
            curl_headers = curl_slist_append(curl_headers, "Expect:");
        }
        if (curl_headers)
        {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, curl_headers);
        }

        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &exchange);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &exchange);
        if (request.abort_requested)
        {
            curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
            curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
            curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &exchange);
        }

        const CURLcode res = curl_easy_perform(curl);

        if (curl_headers)
        {
            curl_slist_free_all(curl_headers);
        }

        if (exchange.failure)
        {
            std::rethrow_exception(exchange.failure);
        }
        if (exchange.aborted)
        {
            throw Error(ErrorCode::Cancelled, "Transfer cancelled");
        }
        if (res != CURLE_OK)
        {
            const std::string message = std::string("HTTP error: ") + curl_easy_strerror(res);
            throw Error(classify_transport_error(curl_easy_strerror(res)), message);
        }

        exchange.response.status_code = static_cast<int>(current_status(exchange));
        return std::move(exchange.response);
    }

} // namespace firestarter::client
