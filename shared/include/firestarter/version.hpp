#pragma once

#include <string_view>

#ifndef FIRESTARTER_VERSION
#define FIRESTARTER_VERSION "0.0.0"
#endif

namespace firestarter
{

    constexpr std::string_view version() noexcept
    {
        return FIRESTARTER_VERSION;
    }

} // namespace firestarter
