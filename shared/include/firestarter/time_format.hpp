/**
 * Firestarter - RFC 3339 timestamps as stored in credential, log and link files.
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace firestarter::time_format
{

    using Clock = std::chrono::system_clock;

    // Formats with second precision in UTC, e.g. "2025-03-01T12:00:00+00:00".
    std::string format_rfc3339(Clock::time_point time);

    // Accepts "YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM)"; a space is accepted in place of 'T'.
    std::optional<Clock::time_point> parse_rfc3339(std::string_view text);

    inline std::string now_rfc3339()
    {
        return format_rfc3339(Clock::now());
    }

} // namespace firestarter::time_format
