#include "firestarter/encoding/url.hpp"

namespace firestarter::encoding
{

    namespace
    {

        constexpr std::string_view kQueryReserved = " \"#<>?`{}|\\^[]%";

        bool needs_escape(unsigned char ch)
        {
            if (ch < 0x20 || ch >= 0x7F)
            {
                return true;
            }
            return kQueryReserved.find(static_cast<char>(ch)) != std::string_view::npos;
        }

    } // namespace

    std::string encode_query_component(std::string_view input)
    {
        static constexpr char kHexDigits[] = "0123456789ABCDEF";
        std::string output;
        output.reserve(input.size());
        for (const char raw : input)
        {
            const auto ch = static_cast<unsigned char>(raw);
            if (needs_escape(ch))
            {
                output.push_back('%');
                output.push_back(kHexDigits[(ch >> 4) & 0x0F]);
                output.push_back(kHexDigits[ch & 0x0F]);
            }
            else
            {
                output.push_back(raw);
            }
        }
        return output;
    }

    std::string join_url(std::string_view base, std::string_view path)
    {
        while (!base.empty() && base.back() == '/')
        {
            base.remove_suffix(1);
        }
        while (!path.empty() && path.front() == '/')
        {
            path.remove_prefix(1);
        }
        std::string url(base);
        if (!path.empty())
        {
            url.push_back('/');
            url.append(path);
        }
        return url;
    }

} // namespace firestarter::encoding
