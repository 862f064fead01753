#pragma once

#include "config.hpp"
#include "format.hpp"
#include "utils.hpp"

namespace relay {
    inline constexpr auto server_name = "relay"sv;
    inline constexpr auto server_version = "0.1.0"sv;
    inline constexpr auto protocol_version = "2024-11-05"sv;
}  // namespace relay
