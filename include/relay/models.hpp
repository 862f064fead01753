#pragma once

#include "config.hpp"

#include <array>
#include <string_view>

namespace relay::models {

    struct model_alias {
        std::string_view alias;
        model_family family;
    };

    // every accepted spelling, compared case-insensitively
    inline constexpr std::array<model_alias, 4> alias_table{{
            {"haiku"sv, model_family::haiku},
            {"sonnet"sv, model_family::sonnet},
            {"opus"sv, model_family::opus},
            {"opus 4.5"sv, model_family::opus},
    }};

    inline constexpr model_family fallback_family = model_family::haiku;

    inline constexpr std::string_view model_id(model_family family) {
        switch (family) {
            case model_family::haiku:
                return "claude-haiku-4-5-20251001"sv;
            case model_family::sonnet:
                return "claude-sonnet-4-5-20250929"sv;
            case model_family::opus:
                return "claude-opus-4-5-20251101"sv;
        }
        return "claude-haiku-4-5-20251001"sv;
    }

    inline constexpr bool try_parse_model_family(std::string_view text, model_family& out) {
        auto trimmed = utils::trim_view(text);
        for (const auto& entry : alias_table) {
            if (utils::str_case_eq(trimmed, entry.alias)) {
                out = entry.family;
                return true;
            }
        }
        return false;
    }

    struct resolved_model {
        model_family family{fallback_family};
        std::string_view id{model_id(fallback_family)};
        bool fell_back{false};
    };

    // Unknown aliases resolve to the fallback family and log a warning.
    resolved_model resolve(std::string_view alias);

}  // namespace relay::models
