#pragma once

#include "config.hpp"

#include <chrono>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace relay {

    enum class tool_kind { generate, edit, refactor, generate_json, edit_json };

    inline constexpr std::string_view to_string(tool_kind kind) {
        switch (kind) {
            case tool_kind::generate:
                return "claude_generate"sv;
            case tool_kind::edit:
                return "claude_edit"sv;
            case tool_kind::refactor:
                return "claude_refactor"sv;
            case tool_kind::generate_json:
                return "claude_generate_json"sv;
            case tool_kind::edit_json:
                return "claude_edit_json"sv;
        }
        return "claude_generate"sv;
    }

    inline constexpr bool try_parse_tool_kind(std::string_view text, tool_kind& out) {
        for (auto kind :
             {tool_kind::generate, tool_kind::edit, tool_kind::refactor, tool_kind::generate_json, tool_kind::edit_json}) {
            if (text == to_string(kind)) {
                out = kind;
                return true;
            }
        }
        return false;
    }

    inline constexpr bool is_json_mode(tool_kind kind) {
        return kind == tool_kind::generate_json || kind == tool_kind::edit_json;
    }

    // One tools/call request, fully defaulted. Built on the read loop, consumed by one worker.
    struct tool_invocation {
        tool_kind tool{tool_kind::generate};
        std::string prompt{};
        std::string model{"haiku"};
        std::chrono::milliseconds timeout{660'000};
        int max_retries{3};
        std::optional<int> max_turns{};
        output_format format{output_format::json};
        std::optional<std::string> json_schema{};
        std::optional<std::string> system_prompt{};
        std::optional<std::string> append_system_prompt{};
        std::vector<std::string> allowed_tools{};
        std::vector<std::string> disallowed_tools{};
        std::vector<std::string> add_dirs{};
        bool verbose{false};
    };

    // Largest values accepted from tool arguments. Timeouts travel as int milliseconds.
    namespace limits {
        inline constexpr double max_timeout_s = std::numeric_limits<int>::max() / 1000.0;
        inline constexpr double max_count = std::numeric_limits<int>::max();
    }  // namespace limits

    namespace flags {
        inline constexpr auto model = "--model"sv;
        inline constexpr auto skip_permissions = "--dangerously-skip-permissions"sv;
        inline constexpr auto print = "-p"sv;
        inline constexpr auto output_format = "--output-format"sv;
        inline constexpr auto max_turns = "--max-turns"sv;
        inline constexpr auto json_schema = "--json-schema"sv;
        inline constexpr auto system_prompt = "--system-prompt"sv;
        inline constexpr auto append_system_prompt = "--append-system-prompt"sv;
        inline constexpr auto allowed_tools = "--allowedTools"sv;
        inline constexpr auto disallowed_tools = "--disallowedTools"sv;
        inline constexpr auto add_dir = "--add-dir"sv;
        inline constexpr auto verbose = "--verbose"sv;
    }  // namespace flags

    /*
     * Builds the AI CLI argv for one invocation. Every user-supplied value is a
     * separate argv element; nothing passes through a shell. The prompt is not
     * part of argv, it is written to the child's stdin.
     */
    std::vector<std::string> build_claude_command(const std::filesystem::path& executable, const tool_invocation& inv);

}  // namespace relay
