#include "relay/extract.hpp"

#include "relay/utils.hpp"

#include <glaze/glaze.hpp>

namespace relay::extract {

    namespace detail {

        struct failure_payload {
            std::string error{};
            int attempts{};
            std::vector<std::string> errors{};
            struct glaze {
                using T = failure_payload;
                static constexpr auto value = glz::object(&T::error, &T::attempts, &T::errors);
            };
        };

        static bool parse_generic(std::string_view text, glz::generic& doc) {
            std::string buffer{text};
            auto ec = glz::read_json(doc, buffer);
            return !ec;
        }

    }  // namespace detail

    bool is_empty_envelope(std::string_view text) {
        auto trimmed = utils::trim_view(text);
        if (trimmed.empty() || trimmed.front() != '{') {
            return false;
        }

        glz::generic doc{};
        if (!detail::parse_generic(trimmed, doc) || !doc.is_object()) {
            return false;
        }

        auto& object = doc.get_object();
        auto it = object.find("result");
        if (it == object.end()) {
            return false;
        }
        return it->second.is_null() || (it->second.is_string() && it->second.get_string().empty());
    }

    std::string unwrap_result(std::string_view text) {
        auto trimmed = utils::trim_view(text);
        if (trimmed.empty() || trimmed.front() != '{') {
            return std::string{text};
        }

        glz::generic doc{};
        if (!detail::parse_generic(trimmed, doc) || !doc.is_object()) {
            return std::string{text};
        }

        auto& object = doc.get_object();
        auto it = object.find("result");
        if (it == object.end() || it->second.is_null()) {
            return std::string{text};
        }

        if (it->second.is_string()) {
            const auto& result = it->second.get_string();
            return result.empty() ? std::string{text} : result;
        }

        std::string serialized{};
        if (glz::write_json(it->second, serialized)) {
            return std::string{text};
        }
        return serialized;
    }

    std::optional<std::string_view> balanced_object_at(std::string_view text, std::size_t start) {
        if (start >= text.size() || text[start] != '{') {
            return std::nullopt;
        }

        int depth = 0;
        bool in_string = false;
        bool escape_next = false;

        for (std::size_t i = start; i < text.size(); ++i) {
            char c = text[i];
            if (in_string) {
                if (escape_next) {
                    escape_next = false;
                }
                else if (c == '\\') {
                    escape_next = true;
                }
                else if (c == '"') {
                    in_string = false;
                }
                continue;
            }

            if (c == '"') {
                in_string = true;
            }
            else if (c == '{') {
                ++depth;
            }
            else if (c == '}') {
                if (--depth == 0) {
                    return text.substr(start, i - start + 1);
                }
            }
        }
        return std::nullopt;
    }

    bool is_valid_json(std::string_view text) {
        glz::generic doc{};
        return detail::parse_generic(text, doc);
    }

    std::optional<std::string> find_json_object(std::string_view text) {
        for (auto pos = text.find('{'); pos != std::string_view::npos; pos = text.find('{', pos + 1)) {
            auto candidate = balanced_object_at(text, pos);
            if (candidate && is_valid_json(*candidate)) {
                return std::string{*candidate};
            }
        }
        return std::nullopt;
    }

    std::string failure_summary(std::string_view error, int attempts, const std::vector<std::string>& errors) {
        detail::failure_payload payload{.error = std::string{error}, .attempts = attempts, .errors = errors};
        std::string json{};
        if (auto ec = glz::write_json(payload, json)) {
            log_error("failed to serialize failure summary: ", glz::format_error(ec, json));
            return R"({"error":"Max retries reached"})";
        }
        return json;
    }

}  // namespace relay::extract
