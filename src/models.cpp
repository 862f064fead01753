#include "relay/models.hpp"

namespace relay::models {

    resolved_model resolve(std::string_view alias) {
        model_family family{fallback_family};
        if (try_parse_model_family(alias, family)) {
            return {.family = family, .id = model_id(family), .fell_back = false};
        }
        log_warning("Unknown model '", alias, "', using ", to_string(fallback_family), " as default");
        return {.family = fallback_family, .id = model_id(fallback_family), .fell_back = true};
    }

}  // namespace relay::models
