#include "relay/cli.hpp"

#include "relay/invocation.hpp"
#include "relay/models.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <string>

namespace relay::cli {

    namespace detail {

        static void print_config(const startup_config& cfg, std::ostream& os) {
            os << "claude=" << cfg.claude_path.string() << '\n';
            os << "model=" << cfg.default_model << '\n';
            os << "output_format=" << to_string(cfg.default_output_format) << '\n';
            os << "timeout_s=" << cfg.default_timeout_s << '\n';
            os << "max_retries=" << cfg.default_max_retries << '\n';
            os << "timeout_backoff_ms=" << cfg.timeout_backoff.count() << '\n';
            os << "failure_backoff_ms=" << cfg.failure_backoff.count() << '\n';
            os << "json_backoff_ms=" << cfg.json_backoff.count() << '\n';
            os << "jobs=" << cfg.jobs << '\n';
        }

    }  // namespace detail

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg) {
        CLI::App app{"relay: MCP stdio server for the Claude Code CLI"};

        bool show_version = false;
        std::string claude_arg{cfg.claude_path.string()};
        std::string model_arg{cfg.default_model};
        std::string format_arg{std::string{to_string(cfg.default_output_format)}};
        std::size_t jobs_arg{cfg.jobs};
        long long timeout_backoff_arg{cfg.timeout_backoff.count()};
        long long failure_backoff_arg{cfg.failure_backoff.count()};
        long long json_backoff_arg{cfg.json_backoff.count()};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("--claude", claude_arg, "Claude CLI executable name or path");
        app.add_option("--model", model_arg, "Default model alias: haiku|sonnet|opus");
        app.add_option("--output-format", format_arg, "Default output format: text|json|stream-json");
        app.add_option("--timeout", cfg.default_timeout_s, "Default per-attempt timeout in seconds");
        app.add_option("--max-retries", cfg.default_max_retries, "Default attempt count");
        app.add_option("-j,--jobs", jobs_arg, "Concurrent tool calls");
        app.add_option("--timeout-backoff-ms", timeout_backoff_arg, "Wait after a timed-out attempt");
        app.add_option("--failure-backoff-ms", failure_backoff_arg, "Wait after a failed attempt");
        app.add_option("--json-backoff-ms", json_backoff_arg, "Wait between JSON validation attempts");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Only log warnings and errors");
        app.add_flag("--verbose", cfg.verbose, "Log the full command line of every attempt");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }
        if (!try_parse_output_format(format_arg, cfg.default_output_format)) {
            std::cerr << "invalid --output-format value: " << format_arg << " (expected text|json|stream-json)\n";
            return std::optional<int>{2};
        }
        model_family family{};
        if (!models::try_parse_model_family(model_arg, family)) {
            std::cerr << "invalid --model value: " << model_arg << " (expected haiku|sonnet|opus)\n";
            return std::optional<int>{2};
        }
        if (!(cfg.default_timeout_s > 0.0) || cfg.default_timeout_s > limits::max_timeout_s) {
            std::cerr << "--timeout must be positive and at most " << limits::max_timeout_s << " seconds\n";
            return std::optional<int>{2};
        }
        if (cfg.default_max_retries < 0) {
            std::cerr << "--max-retries must not be negative\n";
            return std::optional<int>{2};
        }
        if (jobs_arg == 0U) {
            std::cerr << "--jobs must be at least 1\n";
            return std::optional<int>{2};
        }
        if (timeout_backoff_arg < 0 || failure_backoff_arg < 0 || json_backoff_arg < 0) {
            std::cerr << "backoff durations must not be negative\n";
            return std::optional<int>{2};
        }

        cfg.claude_path = claude_arg;
        cfg.default_model = model_arg;
        cfg.jobs = jobs_arg;
        cfg.timeout_backoff = std::chrono::milliseconds{timeout_backoff_arg};
        cfg.failure_backoff = std::chrono::milliseconds{failure_backoff_arg};
        cfg.json_backoff = std::chrono::milliseconds{json_backoff_arg};

        if (show_version) {
            std::cout << server_name << ' ' << server_version << '\n';
            return std::optional<int>{0};
        }

        if (cfg.print_config) {
            detail::print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        return std::nullopt;
    }

}  // namespace relay::cli
