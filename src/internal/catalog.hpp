#pragma once

#include "relay/invocation.hpp"

#include <array>
#include <optional>
#include <string_view>

namespace relay::internal::catalog {

    using namespace std::string_view_literals;

    struct tool_entry {
        tool_kind kind;
        std::string_view description;
        std::string_view input_schema;
    };

    inline constexpr auto generate_schema =
            R"json({"type":"object","properties":{"prompt":{"type":"string","description":"Prompt to pass to Claude CLI"},"model":{"type":"string","description":"Model to use (haiku, sonnet, opus). Default: haiku","enum":["haiku","sonnet","opus","Haiku","Sonnet","Opus","Opus 4.5"]},"timeout":{"type":"number","description":"Timeout in seconds. Default: 660"},"maxRetries":{"type":"number","description":"Maximum retry attempts. Default: 3"},"maxTurns":{"type":"number","description":"Maximum agent turns (iterations). Default: unlimited"},"outputFormat":{"type":"string","description":"Output format: text, json, stream-json. Default: json","enum":["text","json","stream-json"]},"systemPrompt":{"type":"string","description":"Replace default system prompt"},"appendSystemPrompt":{"type":"string","description":"Append to default system prompt"},"allowedTools":{"type":"array","items":{"type":"string"},"description":"Additional tools to allow without asking"},"disallowedTools":{"type":"array","items":{"type":"string"},"description":"Tools to disallow"},"addDirs":{"type":"array","items":{"type":"string"},"description":"Additional directories to access"},"verbose":{"type":"boolean","description":"Enable verbose logging. Default: false"}},"required":["prompt"]})json"sv;

    inline constexpr auto edit_schema =
            R"json({"type":"object","properties":{"prompt":{"type":"string","description":"Edit instructions"},"model":{"type":"string","description":"Model to use (haiku, sonnet, opus). Default: haiku"},"timeout":{"type":"number","description":"Timeout in seconds. Default: 660"},"maxRetries":{"type":"number","description":"Maximum retry attempts. Default: 3"},"maxTurns":{"type":"number","description":"Maximum agent turns. Default: unlimited"},"outputFormat":{"type":"string","description":"Output format. Default: json","enum":["text","json","stream-json"]},"systemPrompt":{"type":"string","description":"Replace default system prompt"},"appendSystemPrompt":{"type":"string","description":"Append to default system prompt"},"allowedTools":{"type":"array","items":{"type":"string"},"description":"Additional tools to allow"},"disallowedTools":{"type":"array","items":{"type":"string"},"description":"Tools to disallow"},"addDirs":{"type":"array","items":{"type":"string"},"description":"Additional directories"},"verbose":{"type":"boolean","description":"Enable verbose logging"}},"required":["prompt"]})json"sv;

    inline constexpr auto refactor_schema =
            R"json({"type":"object","properties":{"prompt":{"type":"string","description":"Refactoring instructions"},"model":{"type":"string","description":"Model to use (haiku, sonnet, opus). Default: haiku"},"timeout":{"type":"number","description":"Timeout in seconds. Default: 660"},"maxRetries":{"type":"number","description":"Maximum retry attempts. Default: 3"},"maxTurns":{"type":"number","description":"Maximum agent turns. Default: unlimited"},"outputFormat":{"type":"string","description":"Output format. Default: json","enum":["text","json","stream-json"]},"systemPrompt":{"type":"string","description":"Replace default system prompt"},"appendSystemPrompt":{"type":"string","description":"Append to default system prompt"},"allowedTools":{"type":"array","items":{"type":"string"},"description":"Additional tools to allow"},"disallowedTools":{"type":"array","items":{"type":"string"},"description":"Tools to disallow"},"addDirs":{"type":"array","items":{"type":"string"},"description":"Additional directories"},"verbose":{"type":"boolean","description":"Enable verbose logging"}},"required":["prompt"]})json"sv;

    inline constexpr auto generate_json_schema =
            R"json({"type":"object","properties":{"prompt":{"type":"string","description":"Prompt for JSON generation"},"model":{"type":"string","description":"Model to use. Default: haiku"},"maxRetries":{"type":"number","description":"Maximum retry attempts for JSON validation. Default: 3"},"jsonSchema":{"type":"string","description":"JSON Schema to validate output against"},"systemPrompt":{"type":"string","description":"Replace default system prompt"},"appendSystemPrompt":{"type":"string","description":"Append to default system prompt"}},"required":["prompt"]})json"sv;

    inline constexpr auto edit_json_schema =
            R"json({"type":"object","properties":{"prompt":{"type":"string","description":"Edit instructions expecting JSON response"},"model":{"type":"string","description":"Model to use. Default: haiku"},"maxRetries":{"type":"number","description":"Maximum retry attempts for JSON validation. Default: 3"},"jsonSchema":{"type":"string","description":"JSON Schema to validate output against"},"systemPrompt":{"type":"string","description":"Replace default system prompt"},"appendSystemPrompt":{"type":"string","description":"Append to default system prompt"}},"required":["prompt"]})json"sv;

    inline constexpr std::array<tool_entry, 5> tools{{
            {tool_kind::generate,
             "Generate code or text via Claude Code CLI with retry and model selection"sv,
             generate_schema},
            {tool_kind::edit, "Edit files via Claude Code CLI with retry and model selection"sv, edit_schema},
            {tool_kind::refactor, "Refactor code via Claude Code CLI with retry and model selection"sv, refactor_schema},
            {tool_kind::generate_json, "Generate JSON response with validation and retry"sv, generate_json_schema},
            {tool_kind::edit_json, "Edit with JSON response validation and retry"sv, edit_json_schema},
    }};

    inline constexpr std::optional<tool_kind> find_tool(std::string_view name) {
        tool_kind kind{};
        if (try_parse_tool_kind(name, kind)) {
            return kind;
        }
        return std::nullopt;
    }

}  // namespace relay::internal::catalog
