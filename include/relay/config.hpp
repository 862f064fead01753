#pragma once

#include "utils.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace relay {

    using namespace std::string_view_literals;

    /*
     * Relay Startup Config Options
     *
     * External executable
     * - claude_path: Name or path of the AI CLI; bare names are searched on PATH per call.
     *
     * Per-call defaults (overridable by tool arguments)
     * - default_model: Model alias used when a call omits "model".
     * - default_output_format: --output-format passed when a call omits "outputFormat".
     * - default_timeout_s: Wall-time limit of one attempt, in seconds.
     * - default_max_retries: Attempt count for text tools, validation count for JSON tools.
     *
     * Retry backoff
     * - timeout_backoff_ms: Wait after an attempt killed by timeout (exit 124/137).
     * - failure_backoff_ms: Wait after any other non-zero exit.
     * - json_backoff_ms: Wait between JSON extraction/validation attempts.
     *
     * Concurrency
     * - jobs: Worker threads; at most this many calls run the AI CLI at once.
     *
     * Diagnostics
     * - quiet/verbose: stderr log verbosity; verbose also logs full argv per attempt.
     * - print_config: Print resolved startup config and exit.
     */

    enum class output_format { text, json, stream_json };
    enum class model_family { haiku, sonnet, opus };

    inline constexpr std::string_view to_string(output_format format) {
        switch (format) {
            case output_format::text:
                return "text"sv;
            case output_format::json:
                return "json"sv;
            case output_format::stream_json:
                return "stream-json"sv;
        }
        return "json"sv;
    }

    inline constexpr bool try_parse_output_format(std::string_view text, output_format& out) {
        if (utils::str_case_eq(text, "text"sv)) {
            out = output_format::text;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_format::json;
            return true;
        }
        if (utils::str_case_eq(text, "stream-json"sv) || utils::str_case_eq(text, "stream_json"sv)) {
            out = output_format::stream_json;
            return true;
        }
        return false;
    }

    inline constexpr std::string_view to_string(model_family family) {
        switch (family) {
            case model_family::haiku:
                return "haiku"sv;
            case model_family::sonnet:
                return "sonnet"sv;
            case model_family::opus:
                return "opus"sv;
        }
        return "haiku"sv;
    }

    struct startup_config {
        std::filesystem::path claude_path{"claude"};

        std::string default_model{"haiku"};
        output_format default_output_format{output_format::json};
        double default_timeout_s{660.0};
        int default_max_retries{3};

        std::chrono::milliseconds timeout_backoff{5'000};
        std::chrono::milliseconds failure_backoff{2'000};
        std::chrono::milliseconds json_backoff{2'000};

        std::size_t jobs{8U};

        bool quiet{false};
        bool verbose{false};
        bool print_config{false};
    };

}  // namespace relay
