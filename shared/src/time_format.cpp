#include "firestarter/time_format.hpp"

#include <cstdio>

namespace firestarter::time_format
{

    namespace
    {

        bool read_digits(std::string_view text, std::size_t &pos, std::size_t count, int &value)
        {
            if (pos + count > text.size())
            {
                return false;
            }
            value = 0;
            for (std::size_t i = 0; i < count; ++i)
            {
                const char ch = text[pos + i];
                if (ch < '0' || ch > '9')
                {
                    return false;
                }
                value = value * 10 + (ch - '0');
            }
            pos += count;
            return true;
        }

        bool expect(std::string_view text, std::size_t &pos, char ch)
        {
            if (pos >= text.size() || text[pos] != ch)
            {
                return false;
            }
            ++pos;
            return true;
        }

    } // namespace

    std::string format_rfc3339(Clock::time_point time)
    {
        using namespace std::chrono;
        const auto whole = floor<std::chrono::seconds>(time);
        const auto day_point = floor<days>(whole);
        const year_month_day ymd{day_point};
        const hh_mm_ss hms{whole - day_point};

        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02uT%02d:%02d:%02d+00:00",
                      static_cast<int>(ymd.year()),
                      static_cast<unsigned>(ymd.month()),
                      static_cast<unsigned>(ymd.day()),
                      static_cast<int>(hms.hours().count()),
                      static_cast<int>(hms.minutes().count()),
                      static_cast<int>(hms.seconds().count()));
        return buffer;
    }

    std::optional<Clock::time_point> parse_rfc3339(std::string_view text)
    {
        using namespace std::chrono;
        std::size_t pos = 0;
        int year = 0;
        int month = 0;
        int day = 0;
        int hour = 0;
        int minute = 0;
        int second = 0;
        if (!read_digits(text, pos, 4, year) || !expect(text, pos, '-') ||
            !read_digits(text, pos, 2, month) || !expect(text, pos, '-') ||
            !read_digits(text, pos, 2, day))
        {
            return std::nullopt;
        }
        if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' '))
        {
            return std::nullopt;
        }
        ++pos;
        if (!read_digits(text, pos, 2, hour) || !expect(text, pos, ':') ||
            !read_digits(text, pos, 2, minute) || !expect(text, pos, ':') ||
            !read_digits(text, pos, 2, second))
        {
            return std::nullopt;
        }
        if (hour > 23 || minute > 59 || second > 60)
        {
            return std::nullopt;
        }

        // Fractional seconds are truncated.
        if (pos < text.size() && text[pos] == '.')
        {
            ++pos;
            const auto start = pos;
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9')
            {
                ++pos;
            }
            if (pos == start)
            {
                return std::nullopt;
            }
        }

        int offset_minutes = 0;
        if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z'))
        {
            ++pos;
        }
        else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-'))
        {
            const int sign = text[pos] == '-' ? -1 : 1;
            ++pos;
            int offset_hours = 0;
            int offset_mins = 0;
            if (!read_digits(text, pos, 2, offset_hours) || !expect(text, pos, ':') ||
                !read_digits(text, pos, 2, offset_mins))
            {
                return std::nullopt;
            }
            offset_minutes = sign * (offset_hours * 60 + offset_mins);
        }
        else
        {
            return std::nullopt;
        }
        if (pos != text.size())
        {
            return std::nullopt;
        }

        const year_month_day ymd{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
                                 std::chrono::day{static_cast<unsigned>(day)}};
        if (!ymd.ok())
        {
            return std::nullopt;
        }
        const auto local = sys_days{ymd} + hours{hour} + minutes{minute} + seconds{second};
        return time_point_cast<Clock::duration>(local - minutes{offset_minutes});
    }

} // namespace firestarter::time_format
