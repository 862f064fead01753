#include "relay/executor.hpp"

#include "relay/extract.hpp"
#include "relay/format.hpp"

#include <optional>
#include <thread>

using namespace relay::literals;

namespace relay::executor {

    namespace detail {

        static bool is_timeout_status(int exit_code) {
            return exit_code == process::exit_timeout || exit_code == process::exit_killed;
        }

        static process::process_result invoke(
                const engine_context& ctx, const std::vector<std::string>& cmd, const tool_invocation& inv) {
            if (ctx.run_attempt) {
                return ctx.run_attempt(cmd, inv.prompt, inv.timeout);
            }
            return process::run(cmd, inv.prompt, inv.timeout, ctx.registry);
        }

        static void backoff(std::chrono::milliseconds delay) {
            if (delay.count() <= 0) {
                return;
            }
            log_info("Waiting {}ms before retry..."_format(delay.count()));
            std::this_thread::sleep_for(delay);
        }

    }  // namespace detail

    execution_result run_with_retry(const engine_context& ctx, const tool_invocation& inv) {
        auto cmd = build_claude_command(ctx.executable, inv);

        if (ctx.log_argv) {
            log_info("Command args: ", utils::join_with_separator(cmd, " "));
        }
        log_info("Timeout: {}ms, Max retries: {}"_format(inv.timeout.count(), inv.max_retries));
        log_info("Prompt preview: ", utils::preview(inv.prompt, 100));

        for (int attempt = 1; attempt <= inv.max_retries; ++attempt) {
            log_info("Attempt {}/{}"_format(attempt, inv.max_retries));
            auto result = detail::invoke(ctx, cmd, inv);
            bool last = attempt == inv.max_retries;

            if (result.exit_code == 0) {
                log_info("Success on attempt ", attempt);
                return {.exit_code = 0, .output = std::move(result.output), .attempts = attempt};
            }

            if (detail::is_timeout_status(result.exit_code)) {
                log_warning("Command timeout on attempt ", attempt, " (exit ", result.exit_code, ")");
                if (!last) {
                    detail::backoff(ctx.backoff.on_timeout);
                }
                continue;
            }

            log_error("Command failed with exit code {} on attempt {}"_format(result.exit_code, attempt));
            log_error("Error output: ", utils::preview(result.output, 200));
            if (last) {
                return {.exit_code = result.exit_code, .output = std::move(result.output), .attempts = attempt};
            }
            detail::backoff(ctx.backoff.on_failure);
        }

        log_error("Max retries (", inv.max_retries, ") reached");
        return {.exit_code = 1,
                .output = "Max retries reached after {} attempts"_format(inv.max_retries),
                .attempts = inv.max_retries > 0 ? inv.max_retries : 0};
    }

    json_result run_json_with_retry(const engine_context& ctx, const tool_invocation& inv) {
        // JSON generations carry only the prompt, model, schema and system prompts
        auto single = inv;
        single.max_retries = 1;
        single.format = output_format::json;
        single.max_turns.reset();
        single.allowed_tools.clear();
        single.disallowed_tools.clear();
        single.add_dirs.clear();
        single.verbose = false;

        json_result out{};
        for (int attempt = 1; attempt <= inv.max_retries; ++attempt) {
            out.attempts = attempt;
            log_info("JSON attempt {}/{}"_format(attempt, inv.max_retries));
            bool last = attempt == inv.max_retries;

            auto exec = run_with_retry(ctx, single);
            if (!exec.ok()) {
                auto message = "[{}] AI execution failed: {}"_format(attempt, utils::preview(exec.output, 200));
                log_error(message);
                out.errors.push_back(std::move(message));
                continue;
            }

            auto result_text = extract::unwrap_result(exec.output);
            std::optional<std::string> json{};
            if (!extract::is_empty_envelope(exec.output)) {
                json = extract::find_json_object(result_text);
            }
            if (json) {
                log_info("JSON validation successful");
                out.ok = true;
                out.payload = std::move(*json);
                return out;
            }

            auto message = "[{}] JSON parsing failed"_format(attempt);
            log_error(message);
            out.errors.push_back(std::move(message));
            if (!last) {
                detail::backoff(ctx.backoff.on_invalid_json);
            }
        }

        log_error("Max JSON retries (", inv.max_retries, ") reached");
        out.payload = extract::failure_summary("Max retries reached", inv.max_retries, out.errors);
        return out;
    }

}  // namespace relay::executor
