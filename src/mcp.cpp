#include "relay/mcp.hpp"

#include "relay/executor.hpp"
#include "relay/extract.hpp"
#include "relay/format.hpp"
#include "relay/relay.hpp"

#include "internal/catalog.hpp"
#include "internal/output.hpp"
#include "internal/signals.hpp"
#include "internal/worker_pool.hpp"

#include <glaze/ext/jsonrpc.hpp>
#include <glaze/glaze.hpp>

#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace relay::literals;
using namespace std::string_view_literals;
namespace fs = std::filesystem;

namespace relay::mcp {

    namespace detail {

        // ── MCP protocol types ──────────────────────────────────────────

        struct server_info {
            std::string name{};
            std::string version{};
            struct glaze {
                using T = server_info;
                static constexpr auto value = glz::object(&T::name, &T::version);
            };
        };

        struct tools_capability {
            struct glaze {
                using T = tools_capability;
                static constexpr auto value = glz::object();
            };
        };

        struct server_capabilities {
            tools_capability tools{};
            struct glaze {
                using T = server_capabilities;
                static constexpr auto value = glz::object(&T::tools);
            };
        };

        struct initialize_result {
            std::string protocolVersion{};
            server_capabilities capabilities{};
            server_info serverInfo{};
            struct glaze {
                using T = initialize_result;
                static constexpr auto value = glz::object(
                        "protocolVersion",
                        &T::protocolVersion,
                        "capabilities",
                        &T::capabilities,
                        "serverInfo",
                        &T::serverInfo);
            };
        };

        struct tool_definition {
            std::string name{};
            std::string description{};
            glz::raw_json inputSchema{};
            struct glaze {
                using T = tool_definition;
                static constexpr auto value = glz::object(&T::name, &T::description, "inputSchema", &T::inputSchema);
            };
        };

        struct tools_list_result {
            std::vector<tool_definition> tools{};
            struct glaze {
                using T = tools_list_result;
                static constexpr auto value = glz::object(&T::tools);
            };
        };

        struct tool_call_params {
            std::string name{};
            glz::raw_json arguments{};
            struct glaze {
                using T = tool_call_params;
                static constexpr auto value = glz::object(&T::name, &T::arguments);
            };
        };

        struct text_content {
            std::string type{"text"};
            std::string text{};
            struct glaze {
                using T = text_content;
                static constexpr auto value = glz::object(&T::type, &T::text);
            };
        };

        struct tool_call_result {
            std::vector<text_content> content{};
            struct glaze {
                using T = tool_call_result;
                static constexpr auto value = glz::object(&T::content);
            };
        };

        // ── Tool argument type ───────────────────────────────────────────

        // numbers arrive as JSON numbers of either kind; integers are narrowed after validation
        struct tool_arguments {
            std::optional<std::string> prompt{};
            std::optional<std::string> model{};
            std::optional<double> timeout{};
            std::optional<double> max_retries{};
            std::optional<double> max_turns{};
            std::optional<std::string> output_format{};
            std::optional<std::string> json_schema{};
            std::optional<std::string> system_prompt{};
            std::optional<std::string> append_system_prompt{};
            std::optional<std::vector<std::string>> allowed_tools{};
            std::optional<std::vector<std::string>> disallowed_tools{};
            std::optional<std::vector<std::string>> add_dirs{};
            std::optional<bool> verbose{};
            struct glaze {
                using T = tool_arguments;
                static constexpr auto value = glz::object(
                        "prompt",
                        &T::prompt,
                        "model",
                        &T::model,
                        "timeout",
                        &T::timeout,
                        "maxRetries",
                        &T::max_retries,
                        "maxTurns",
                        &T::max_turns,
                        "outputFormat",
                        &T::output_format,
                        "jsonSchema",
                        &T::json_schema,
                        "systemPrompt",
                        &T::system_prompt,
                        "appendSystemPrompt",
                        &T::append_system_prompt,
                        "allowedTools",
                        &T::allowed_tools,
                        "disallowedTools",
                        &T::disallowed_tools,
                        "addDirs",
                        &T::add_dirs,
                        "verbose",
                        &T::verbose);
            };
        };

        // ── Response helpers ────────────────────────────────────────────

        template <typename T>
        static std::string make_response(const glz::rpc::id_t& id, T&& result) {
            glz::rpc::response_t<std::decay_t<T>> resp{};
            resp.id = id;
            resp.result = std::forward<T>(result);
            std::string json{};
            (void)glz::write_json(resp, json);
            return json;
        }

        static std::string make_error_response(
                const glz::rpc::id_t& id,
                glz::rpc::error_e code,
                const std::string& message,
                std::optional<std::string> data = std::nullopt) {
            glz::rpc::response_t<glz::raw_json> resp{};
            resp.id = id;
            resp.error = glz::rpc::error{code, std::move(data), message};
            std::string json{};
            (void)glz::write_json(resp, json);
            return json;
        }

        static std::string make_text_response(const glz::rpc::id_t& id, std::string text) {
            tool_call_result result{};
            result.content.push_back(text_content{.text = std::move(text)});
            return make_response(id, std::move(result));
        }

        static std::string id_text(const glz::rpc::id_t& id) {
            std::string json{};
            (void)glz::write_json(id, json);
            return json;
        }

        // ── Server state ────────────────────────────────────────────────

        // Declaration order is construction order: the signal mask is set
        // before the pool starts its threads, and the pool drains before
        // the output channel and registry go away.
        struct server_state {
            startup_config& cfg;
            internal::output_channel out{STDOUT_FILENO};
            process::process_registry registry{};
            internal::signal_watcher watcher{registry};
            internal::worker_pool pool{cfg.jobs};

            explicit server_state(startup_config& c) : cfg{c} {}
        };

        // One tools/call. Owns the request line so the views parsed out of it
        // stay valid on the worker thread.
        struct pending_call {
            std::string line{};
            glz::rpc::generic_request_t request{};
            tool_call_params params{};
            tool_invocation invocation{};
            fs::path executable{};
        };

        // ── Request validation ──────────────────────────────────────────

        static bool try_build_invocation(
                tool_kind kind,
                const tool_arguments& args,
                const startup_config& cfg,
                tool_invocation& inv,
                std::string& error) {
            inv.tool = kind;

            if (!args.prompt || args.prompt->empty()) {
                error = "{} requires a prompt"_format(kind);
                return false;
            }
            inv.prompt = *args.prompt;
            inv.model = args.model.value_or(cfg.default_model);

            auto timeout_s = args.timeout.value_or(cfg.default_timeout_s);
            if (!(timeout_s > 0.0) || timeout_s > limits::max_timeout_s) {
                error = "timeout must be a positive number of seconds up to {}"_format(limits::max_timeout_s);
                return false;
            }
            inv.timeout = std::chrono::milliseconds{static_cast<long long>(timeout_s * 1000.0)};

            auto retries = args.max_retries.value_or(static_cast<double>(cfg.default_max_retries));
            if (!(retries >= 0.0) || retries > limits::max_count) {
                error = "maxRetries must be between 0 and {}"_format(limits::max_count);
                return false;
            }
            inv.max_retries = static_cast<int>(retries);

            if (args.max_turns) {
                if (!(*args.max_turns >= 1.0) || *args.max_turns > limits::max_count) {
                    error = "maxTurns must be between 1 and {}"_format(limits::max_count);
                    return false;
                }
                inv.max_turns = static_cast<int>(*args.max_turns);
            }

            inv.format = cfg.default_output_format;
            if (args.output_format && !try_parse_output_format(*args.output_format, inv.format)) {
                error = "invalid outputFormat: {} (expected text|json|stream-json)"_format(*args.output_format);
                return false;
            }

            inv.json_schema = args.json_schema;
            inv.system_prompt = args.system_prompt;
            inv.append_system_prompt = args.append_system_prompt;
            inv.allowed_tools = args.allowed_tools.value_or(std::vector<std::string>{});
            inv.disallowed_tools = args.disallowed_tools.value_or(std::vector<std::string>{});
            inv.add_dirs = args.add_dirs.value_or(std::vector<std::string>{});
            inv.verbose = args.verbose.value_or(false);
            return true;
        }

        // Cheap checks run on the read loop. Returns the error response to send, if any.
        static std::optional<std::string> prepare_call(pending_call& call, const startup_config& cfg) {
            const auto& id = call.request.id;

            std::string_view raw_params = call.request.params.str;
            if (utils::trim_view(raw_params).empty()) {
                raw_params = "{}"sv;
            }
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(call.params, raw_params);
            if (ec) {
                return make_error_response(id, glz::rpc::error_e::invalid_params, "Failed to parse tool call params");
            }

            auto kind = internal::catalog::find_tool(call.params.name);
            if (!kind) {
                log_error("Unknown tool: ", call.params.name);
                return make_error_response(
                        id, glz::rpc::error_e::method_not_found, "Unknown tool: {}"_format(call.params.name));
            }

            auto executable = process::resolve_executable(cfg.claude_path);
            if (!executable) {
                log_error("claude CLI not found: ", cfg.claude_path.string());
                return make_error_response(id, glz::rpc::error_e::internal, "claude CLI not found");
            }
            call.executable = std::move(*executable);

            tool_arguments args{};
            std::string_view raw_arguments = call.params.arguments.str;
            if (utils::trim_view(raw_arguments).empty()) {
                raw_arguments = "{}"sv;
            }
            if (glz::read<glz::opts{.error_on_unknown_keys = false}>(args, raw_arguments)) {
                return make_error_response(
                        id, glz::rpc::error_e::invalid_params, "Failed to parse {} arguments"_format(*kind));
            }

            std::string error{};
            if (!try_build_invocation(*kind, args, cfg, call.invocation, error)) {
                return make_error_response(id, glz::rpc::error_e::invalid_params, error);
            }

            log_info("Tool: {} (id={})"_format(*kind, id_text(id)));
            log_info("Model: {}, Timeout: {}ms, Max retries: {}"_format(
                    call.invocation.model, call.invocation.timeout.count(), call.invocation.max_retries));
            log_info("Max turns: {}, Output format: {}"_format(
                    call.invocation.max_turns ? std::to_string(*call.invocation.max_turns) : "unlimited",
                    call.invocation.format));
            return std::nullopt;
        }

        // ── Tool execution (worker thread) ──────────────────────────────

        static std::string execute_call(const pending_call& call, server_state& state) {
            const auto& id = call.request.id;
            const auto& inv = call.invocation;

            executor::engine_context ctx{
                    .executable = call.executable,
                    .backoff = executor::backoff_from(state.cfg),
                    .registry = &state.registry,
                    .run_attempt = {},
                    .log_argv = state.cfg.verbose || inv.verbose};

            if (is_json_mode(inv.tool)) {
                auto result = executor::run_json_with_retry(ctx, inv);
                if (!result.ok) {
                    log_error("[BG {}] JSON generation/validation failed"_format(id_text(id)));
                    return make_error_response(
                            id, glz::rpc::error_e::internal, "JSON validation error", std::move(result.payload));
                }
                log_info("[BG {}] Success: Valid JSON response received"_format(id_text(id)));
                return make_text_response(id, std::move(result.payload));
            }

            auto result = executor::run_with_retry(ctx, inv);
            if (!result.ok()) {
                log_error("[BG {}] AI execution failed"_format(id_text(id)));
                return make_error_response(id, glz::rpc::error_e::internal, "Claude CLI error", std::move(result.output));
            }
            log_info("[BG {}] Success: Response received"_format(id_text(id)));
            return make_text_response(id, extract::unwrap_result(result.output));
        }

        // ── Handlers ────────────────────────────────────────────────────

        static std::string handle_initialize(const glz::rpc::id_t& id) {
            initialize_result result{};
            result.protocolVersion = std::string{protocol_version};
            result.capabilities = server_capabilities{};
            result.serverInfo = server_info{.name = std::string{server_name}, .version = std::string{server_version}};

            return make_response(id, std::move(result));
        }

        static std::string handle_tools_list(const glz::rpc::id_t& id) {
            tools_list_result result{};
            for (const auto& tool : internal::catalog::tools) {
                result.tools.push_back(
                        tool_definition{
                                .name = std::string{to_string(tool.kind)},
                                .description = std::string{tool.description},
                                .inputSchema = glz::raw_json{tool.input_schema},
                        });
            }
            return make_response(id, std::move(result));
        }

        static void respond(server_state& state, std::string_view json) {
            if (!state.out.send(json)) {
                log_warning("response dropped, stdout is closed");
            }
        }

        static void handle_tools_call(server_state& state, std::shared_ptr<pending_call> call) {
            if (auto error = prepare_call(*call, state.cfg)) {
                respond(state, *error);
                return;
            }

            state.pool.submit([call = std::move(call), &state] {
                auto tag = id_text(call->request.id);
                log_info("[BG {}] Starting {}"_format(tag, call->invocation.tool));
                std::string response{};
                try {
                    response = execute_call(*call, state);
                } catch (const std::exception& e) {
                    log_error("[BG {}] {}"_format(tag, e.what()));
                    response = make_error_response(call->request.id, glz::rpc::error_e::internal, e.what());
                }
                if (state.out.send(response)) {
                    log_info("[BG {}] Response sent"_format(tag));
                }
                else {
                    log_warning("[BG {}] response dropped, stdout is closed"_format(tag));
                }
            });
        }

        static void handle_line(server_state& state, std::string line) {
            log_info("Received: ", utils::preview(line, 100));

            auto call = std::make_shared<pending_call>();
            call->line = std::move(line);

            auto& request = call->request;
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(request, call->line);
            if (ec) {
                log_error("JSON parse error");
                respond(state, make_error_response({}, glz::rpc::error_e::parse_error, "JSON parse error"));
                return;
            }

            bool is_notification = std::holds_alternative<glz::generic::null_t>(request.id);

            if (request.method == "initialize"sv) {
                log_info("Handling initialize request");
                respond(state, handle_initialize(request.id));
            }
            else if (request.method == "initialized"sv || request.method == "notifications/initialized"sv) {
                log_info("Received initialized notification");
            }
            else if (request.method == "tools/list"sv) {
                log_info("Listing available tools");
                respond(state, handle_tools_list(request.id));
            }
            else if (request.method == "tools/call"sv) {
                if (is_notification) {
                    log_warning("Ignoring tools/call without an id");
                    return;
                }
                handle_tools_call(state, std::move(call));
            }
            else if (!is_notification) {
                log_error("Unsupported method: ", request.method);
                respond(
                        state,
                        make_error_response(
                                request.id,
                                glz::rpc::error_e::method_not_found,
                                "Method not found: {}"_format(std::string{request.method})));
            }
        }

    }  // namespace detail

    // ── Server entry point ──────────────────────────────────────────

    int run_mcp_server(startup_config& cfg) {
        ::signal(SIGPIPE, SIG_IGN);
        set_log_quiet(cfg.quiet);

        detail::server_state state{cfg};
        log_info("Starting {} MCP server {} ({} workers)"_format(server_name, server_version, state.pool.size()));

        std::string line{};
        while (!state.out.broken() && std::getline(std::cin, line)) {
            if (utils::trim_view(line).empty()) {
                continue;
            }
            detail::handle_line(state, std::move(line));
            line.clear();
        }

        if (state.out.broken()) {
            log_error("stdout closed, no further responses can be delivered");
        }
        log_info("input finished, completing {} queued call(s)"_format(state.pool.pending()));
        state.pool.drain();
        return 0;
    }

}  // namespace relay::mcp
