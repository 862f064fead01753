#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace relay::extract {

    // The AI CLI's json envelope carries the answer in "result". Returns that
    // member (strings verbatim, anything else re-serialized) or `text` itself.
    std::string unwrap_result(std::string_view text);

    // An envelope whose "result" is null or "". It carries no answer of its own
    // and must not be mistaken for one.
    bool is_empty_envelope(std::string_view text);

    // Span of a balanced {...} starting at text[start], honouring string literals
    // and escapes. nullopt when text[start] is not '{' or the braces never close.
    std::optional<std::string_view> balanced_object_at(std::string_view text, std::size_t start);

    bool is_valid_json(std::string_view text);

    // First balanced object, scanning left to right, that parses as JSON.
    std::optional<std::string> find_json_object(std::string_view text);

    // {"error":..., "attempts":N, "errors":[...]}
    std::string failure_summary(std::string_view error, int attempts, const std::vector<std::string>& errors);

}  // namespace relay::extract
