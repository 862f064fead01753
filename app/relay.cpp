#include "relay/cli.hpp"
#include "relay/mcp.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        relay::startup_config cfg{};
        if (auto cli_result = relay::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        return relay::mcp::run_mcp_server(cfg);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
