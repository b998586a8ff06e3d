#pragma once

#include <string>
#include <string_view>

namespace firestarter::encoding
{

    // Percent-encodes a query parameter value. Escapes C0 controls, DEL, non-ASCII bytes and
    // ' ' '"' '#' '<' '>' '?' '`' '{' '}' '|' '\' '^' '[' ']' '%'. Everything else is kept as is.
    std::string encode_query_component(std::string_view input);

    // Joins a base URL and a path with exactly one slash between them.
    std::string join_url(std::string_view base, std::string_view path);

} // namespace firestarter::encoding
