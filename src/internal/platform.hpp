#pragma once

#include <climits>
#include <cstddef>
#include <string_view>

namespace relay::internal::platform {
    using namespace std::string_view_literals;

    inline constexpr bool is_linux = RELAY_PLATFORM_LINUX != 0;
    inline constexpr bool is_macos = RELAY_PLATFORM_MACOS != 0;

    // a single write() of at most this many bytes to a pipe is atomic
    inline constexpr std::size_t atomic_pipe_write = PIPE_BUF;

    // used when PATH is unset
    inline constexpr auto default_search_path =
            is_macos ? "/opt/homebrew/bin:/usr/local/bin:/usr/bin:/bin"sv : "/usr/local/bin:/usr/bin:/bin"sv;

}  // namespace relay::internal::platform
