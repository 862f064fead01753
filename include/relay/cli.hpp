#pragma once

#include "relay.hpp"

#include <optional>

namespace relay::cli {

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg);

}  // namespace relay::cli
