/**
 * Firestarter - Error taxonomy shared by every client layer.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace firestarter
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidArgument = 1,
        Configuration = 2,
        NotFound = 3,
        LocalIo = 4,
        AuthenticationRequired = 5,
        AuthenticationFailed = 6,
        TransportDns = 7,
        TransportConnection = 8,
        TransportCertificate = 9,
        Transport = 10,
        RemoteError = 11,
        InvalidResponse = 12,
        Cancelled = 13,
        Unsupported = 14,
        InternalError = 15
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    // Maps a transport failure description onto the DNS / connection / certificate buckets.
    ErrorCode classify_transport_error(std::string_view message);

    class Error : public std::runtime_error
    {
    public:
        Error(ErrorCode code, const std::string &message, std::optional<int> http_status = std::nullopt)
            : std::runtime_error(message), code_(code), http_status_(http_status) {}

        ErrorCode code() const noexcept { return code_; }
        std::optional<int> http_status() const noexcept { return http_status_; }

    private:
        ErrorCode code_;
        std::optional<int> http_status_;
    };

} // namespace firestarter
