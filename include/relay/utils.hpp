#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <optional>
#include <ranges>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace relay {

// Debug logger; no-op on release builds
#ifndef NDEBUG
    constexpr std::string_view sloc_fname(const std::source_location& loc) {
        std::string_view sv{loc.file_name()};
        if (auto p = sv.rfind('/'); p != sv.npos)
            sv.remove_prefix(p + 1);
        return sv;
    }

    inline void prepend_location(std::ostream& os, const std::source_location& loc) {
        os << '[' << sloc_fname(loc) << ':' << loc.line() << "] ";
    }

    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(
                Args&&... args, const std::source_location& loc = std::source_location::current()) {
            std::ostringstream line{};
            prepend_location(line, loc);
            (line << ... << std::forward<Args>(args)) << '\n';
            std::cerr << line.str() << std::flush;
        }
    };
#else
    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(Args&&...) {}
    };
#endif

    // deduction guide
    template <typename... Args>
    debug_log(Args&&...) -> debug_log<Args...>;

    // Operational log: timestamped, one whole line per write on stderr
    enum class log_level { info, warning, error };

    namespace detail {
        inline std::atomic<bool> log_quiet{false};
        inline std::mutex log_mutex{};

        inline void append_timestamp(std::ostream& os) {
            auto now = std::chrono::system_clock::now();
            auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
            auto tt = std::chrono::system_clock::to_time_t(now);
            std::tm local{};
            ::localtime_r(&tt, &local);
            char buf[16]{};
            std::strftime(buf, sizeof(buf), "%H:%M:%S", &local);
            char ms[8]{};
            std::snprintf(ms, sizeof(ms), ".%03d", static_cast<int>(millis));
            os << '[' << buf << ms << "] ";
        }

        template <typename... Args>
        void emit_log(log_level level, Args&&... args) {
            if (level == log_level::info && log_quiet.load(std::memory_order_relaxed)) {
                return;
            }
            std::ostringstream line{};
            append_timestamp(line);
            if (level == log_level::warning) {
                line << "WARNING: ";
            }
            else if (level == log_level::error) {
                line << "ERROR: ";
            }
            (line << ... << std::forward<Args>(args)) << '\n';

            std::lock_guard lock{log_mutex};
            std::cerr << line.str() << std::flush;
        }
    }  // namespace detail

    inline void set_log_quiet(bool quiet) {
        detail::log_quiet.store(quiet, std::memory_order_relaxed);
    }

    template <typename... Args>
    void log_info(Args&&... args) {
        detail::emit_log(log_level::info, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void log_warning(Args&&... args) {
        detail::emit_log(log_level::warning, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void log_error(Args&&... args) {
        detail::emit_log(log_level::error, std::forward<Args>(args)...);
    }

    namespace utils {
        constexpr char char_tolower(char c) {
            if (c >= 'A' && c <= 'Z') {
                return c + ('a' - 'A');
            }
            return c;
        }

        constexpr bool str_case_eq(std::string_view lhs, std::string_view rhs) {
            return std::ranges::equal(
                    lhs | std::views::transform(char_tolower), rhs | std::views::transform(char_tolower));
        }

        constexpr std::string_view trim_view(std::string_view value) {
            auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos) {
                return {};
            }
            auto last = value.find_last_not_of(" \t\r\n");
            return value.substr(first, (last - first) + 1U);
        }

        // log previews: prompts and outputs are clipped, never dumped whole
        inline std::string preview(std::string_view text, std::size_t limit) {
            if (text.size() <= limit) {
                return std::string{text};
            }
            std::string clipped{text.substr(0, limit)};
            clipped.append("...");
            return clipped;
        }

        inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
            if (values.empty()) {
                return {};
            }
            return values | std::views::join_with(separator) | std::ranges::to<std::string>();
        }

    }  // namespace utils

}  // namespace relay
