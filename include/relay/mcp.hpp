#pragma once

#include "config.hpp"

namespace relay::mcp {

    // Serves line-delimited JSON-RPC on stdin/stdout until EOF or a shutdown signal.
    int run_mcp_server(startup_config& cfg);

}  // namespace relay::mcp
