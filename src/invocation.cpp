#include "relay/invocation.hpp"

#include "relay/models.hpp"

namespace relay {

    namespace detail {

        static void append_flag(std::vector<std::string>& cmd, std::string_view flag, std::string_view value) {
            cmd.emplace_back(flag);
            cmd.emplace_back(value);
        }

        static void append_optional(
                std::vector<std::string>& cmd, std::string_view flag, const std::optional<std::string>& value) {
            if (value && !value->empty()) {
                append_flag(cmd, flag, *value);
            }
        }

        static void append_repeated(
                std::vector<std::string>& cmd, std::string_view flag, const std::vector<std::string>& values) {
            for (const auto& value : values) {
                if (!value.empty()) {
                    append_flag(cmd, flag, value);
                }
            }
        }

    }  // namespace detail

    std::vector<std::string> build_claude_command(const std::filesystem::path& executable, const tool_invocation& inv) {
        auto model = models::resolve(inv.model);

        std::vector<std::string> cmd{};
        cmd.push_back(executable.string());
        detail::append_flag(cmd, flags::model, model.id);
        cmd.emplace_back(flags::skip_permissions);
        cmd.emplace_back(flags::print);
        detail::append_flag(cmd, flags::output_format, to_string(inv.format));

        if (inv.max_turns) {
            detail::append_flag(cmd, flags::max_turns, std::to_string(*inv.max_turns));
        }

        detail::append_optional(cmd, flags::json_schema, inv.json_schema);
        detail::append_optional(cmd, flags::system_prompt, inv.system_prompt);
        detail::append_optional(cmd, flags::append_system_prompt, inv.append_system_prompt);

        detail::append_repeated(cmd, flags::allowed_tools, inv.allowed_tools);
        detail::append_repeated(cmd, flags::disallowed_tools, inv.disallowed_tools);
        detail::append_repeated(cmd, flags::add_dir, inv.add_dirs);

        if (inv.verbose) {
            cmd.emplace_back(flags::verbose);
        }

        return cmd;
    }

}  // namespace relay
