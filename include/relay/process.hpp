#pragma once

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include <sys/types.h>

namespace relay::process {

    // exit statuses the retry engine treats as "ran out of time"
    inline constexpr int exit_timeout = 124;
    inline constexpr int exit_killed = 137;

    struct process_result {
        int exit_code{};
        std::string output{};
        bool timed_out{false};
    };

    /*
     * Tracks the process groups of running children. A shutdown path calls
     * terminate_all() so no child outlives the server.
     */
    class process_registry {
      public:
        void add(pid_t pgid);
        void remove(pid_t pgid);
        std::size_t size() const;

        // Sends `sig` to every tracked group; returns how many were signalled.
        std::size_t terminate_all(int sig);

      private:
        mutable std::mutex mutex_{};
        std::unordered_set<pid_t> groups_{};
    };

    // Returns an absolute path to an executable file, or nullopt.
    // Names containing '/' are checked directly, bare names are searched on PATH.
    std::optional<std::filesystem::path> resolve_executable(const std::filesystem::path& name);

    /*
     * Runs argv[0] (an executable path, not searched) with `input` plus a
     * trailing newline on stdin. stdout and stderr are captured together.
     *
     * When `timeout` elapses the child's process group is SIGKILLed and the
     * result carries exit_timeout. A child killed by signal N reports 128+N.
     * Trailing newlines are stripped from the output.
     */
    process_result run(
            const std::vector<std::string>& argv,
            std::string_view input,
            std::chrono::milliseconds timeout,
            process_registry* registry = nullptr);

}  // namespace relay::process
