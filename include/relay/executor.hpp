#pragma once

#include "config.hpp"
#include "invocation.hpp"
#include "process.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace relay::executor {

    struct backoff_policy {
        std::chrono::milliseconds on_timeout{5'000};
        std::chrono::milliseconds on_failure{2'000};
        std::chrono::milliseconds on_invalid_json{2'000};
    };

    inline backoff_policy backoff_from(const startup_config& cfg) {
        return {.on_timeout = cfg.timeout_backoff,
                .on_failure = cfg.failure_backoff,
                .on_invalid_json = cfg.json_backoff};
    }

    struct execution_result {
        int exit_code{1};
        std::string output{};
        int attempts{};

        bool ok() const { return exit_code == 0; }
    };

    // Runs one attempt. The default runs the AI CLI through process::run; tests inject stubs.
    using attempt_fn = std::function<process::process_result(
            const std::vector<std::string>& argv, std::string_view input, std::chrono::milliseconds timeout)>;

    struct engine_context {
        std::filesystem::path executable{};
        backoff_policy backoff{};
        process::process_registry* registry{nullptr};
        attempt_fn run_attempt{};
        bool log_argv{false};
    };

    /*
     * Retry loop for one invocation. Attempts are strictly sequential.
     *
     *   exit 0            -> success, stop
     *   exit 124 / 137    -> timeout; wait backoff.on_timeout unless last attempt
     *   other non-zero    -> failure; wait backoff.on_failure unless last attempt,
     *                        on the last attempt return its output and exit code
     *
     * Exhausting inv.max_retries on timeouts yields "Max retries reached after N attempts".
     */
    execution_result run_with_retry(const engine_context& ctx, const tool_invocation& inv);

    struct json_result {
        bool ok{false};
        // the validated JSON object on success, the {error, attempts, errors} summary otherwise
        std::string payload{};
        std::vector<std::string> errors{};
        int attempts{};
    };

    /*
     * JSON-mode loop: up to inv.max_retries generations, each a single engine
     * attempt with --output-format json. The first JSON object that parses wins.
     */
    json_result run_json_with_retry(const engine_context& ctx, const tool_invocation& inv);

}  // namespace relay::executor
