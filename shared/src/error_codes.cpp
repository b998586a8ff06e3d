#include "firestarter/error_codes.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace firestarter
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 16> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidArgument, "invalid_argument"},
            {ErrorCode::Configuration, "configuration"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::LocalIo, "local_io"},
            {ErrorCode::AuthenticationRequired, "authentication_required"},
            {ErrorCode::AuthenticationFailed, "authentication_failed"},
            {ErrorCode::TransportDns, "transport_dns"},
            {ErrorCode::TransportConnection, "transport_connection"},
            {ErrorCode::TransportCertificate, "transport_certificate"},
            {ErrorCode::Transport, "transport"},
            {ErrorCode::RemoteError, "remote_error"},
            {ErrorCode::InvalidResponse, "invalid_response"},
            {ErrorCode::Cancelled, "cancelled"},
            {ErrorCode::Unsupported, "unsupported"},
            {ErrorCode::InternalError, "internal_error"},
        }};

        bool contains(const std::string &haystack, std::string_view needle)
        {
            return haystack.find(needle) != std::string::npos;
        }
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

    ErrorCode classify_transport_error(std::string_view message)
    {
        std::string lowered(message);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch)
                       { return static_cast<char>(std::tolower(ch)); });

        if (contains(lowered, "dns") || contains(lowered, "resolve"))
        {
            return ErrorCode::TransportDns;
        }
        if (contains(lowered, "connect") || contains(lowered, "timeout") || contains(lowered, "timed out"))
        {
            return ErrorCode::TransportConnection;
        }
        if (contains(lowered, "certificate") || contains(lowered, "tls") || contains(lowered, "ssl"))
        {
            return ErrorCode::TransportCertificate;
        }
        return ErrorCode::Transport;
    }

} // namespace firestarter
