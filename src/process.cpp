#include "relay/process.hpp"

#include "internal/platform.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <algorithm>
#include <cstdlib>
#include <limits>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace relay::process {

    namespace detail {

        struct pipe_pair {
            int read_end{-1};
            int write_end{-1};
        };

        static void close_fd(int& fd) {
            if (fd >= 0) {
                ::close(fd);
                fd = -1;
            }
        }

        // O_CLOEXEC: concurrent workers fork too, and a stray inherited write
        // end would keep another call's output pipe from ever reaching EOF
        static bool open_pipe(pipe_pair& p) {
            int fds[2]{};
#if RELAY_PLATFORM_MACOS
            if (::pipe(fds) != 0) {
                return false;
            }
            if (::fcntl(fds[0], F_SETFD, FD_CLOEXEC) != 0 || ::fcntl(fds[1], F_SETFD, FD_CLOEXEC) != 0) {
                ::close(fds[0]);
                ::close(fds[1]);
                return false;
            }
#else
            if (::pipe2(fds, O_CLOEXEC) != 0) {
                return false;
            }
#endif
            p = {.read_end = fds[0], .write_end = fds[1]};
            return true;
        }

        static void ignore_sigpipe() {
            static std::once_flag once{};
            std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
        }

        static bool is_executable_file(const fs::path& path) {
            std::error_code ec{};
            return fs::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
        }

        static void strip_trailing_newlines(std::string& text) {
            while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
                text.pop_back();
            }
        }

        // Reaps `pid` if it exits before `deadline`. Covers children that close
        // their output early but keep running.
        static bool reap_before(pid_t pid, int& status, std::chrono::steady_clock::time_point deadline) {
            for (;;) {
                auto r = ::waitpid(pid, &status, WNOHANG);
                if (r == pid) {
                    return true;
                }
                if (r < 0 && errno != EINTR) {
                    return false;
                }
                if (std::chrono::steady_clock::now() >= deadline) {
                    return false;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds{10});
            }
        }

        static int decode_status(int status) {
            if (WIFEXITED(status)) {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status)) {
                return 128 + WTERMSIG(status);
            }
            return 1;
        }

    }  // namespace detail

    void process_registry::add(pid_t pgid) {
        std::lock_guard lock{mutex_};
        groups_.insert(pgid);
    }

    void process_registry::remove(pid_t pgid) {
        std::lock_guard lock{mutex_};
        groups_.erase(pgid);
    }

    std::size_t process_registry::size() const {
        std::lock_guard lock{mutex_};
        return groups_.size();
    }

    std::size_t process_registry::terminate_all(int sig) {
        std::lock_guard lock{mutex_};
        std::size_t signalled = 0;
        for (auto pgid : groups_) {
            if (::kill(-pgid, sig) == 0) {
                ++signalled;
            }
        }
        return signalled;
    }

    std::optional<fs::path> resolve_executable(const fs::path& name) {
        if (name.empty()) {
            return std::nullopt;
        }

        if (name.string().find('/') != std::string::npos) {
            if (detail::is_executable_file(name)) {
                std::error_code ec{};
                auto absolute = fs::absolute(name, ec);
                return ec ? name : absolute;
            }
            return std::nullopt;
        }

        const char* path_env = std::getenv("PATH");
        std::string_view search{path_env != nullptr ? std::string_view{path_env} : internal::platform::default_search_path};

        while (!search.empty()) {
            auto sep = search.find(':');
            auto dir = search.substr(0, sep);
            search = sep == std::string_view::npos ? std::string_view{} : search.substr(sep + 1);

            auto candidate = (dir.empty() ? fs::path{"."} : fs::path{dir}) / name;
            if (detail::is_executable_file(candidate)) {
                std::error_code ec{};
                auto absolute = fs::absolute(candidate, ec);
                return ec ? candidate : absolute;
            }
        }
        return std::nullopt;
    }

    process_result run(
            const std::vector<std::string>& argv,
            std::string_view input,
            std::chrono::milliseconds timeout,
            process_registry* registry) {
        if (argv.empty()) {
            return {.exit_code = 127, .output = "empty command"};
        }
        detail::ignore_sigpipe();

        detail::pipe_pair in_pipe{};
        detail::pipe_pair out_pipe{};
        if (!detail::open_pipe(in_pipe)) {
            return {.exit_code = 1, .output = "pipe() failed"};
        }
        if (!detail::open_pipe(out_pipe)) {
            detail::close_fd(in_pipe.read_end);
            detail::close_fd(in_pipe.write_end);
            return {.exit_code = 1, .output = "pipe() failed"};
        }

        // built before fork: the child may only make async-signal-safe calls
        std::vector<char*> c_argv{};
        c_argv.reserve(argv.size() + 1);
        for (const auto& arg : argv) {
            c_argv.push_back(const_cast<char*>(arg.c_str()));
        }
        c_argv.push_back(nullptr);

        sigset_t child_mask{};
        ::sigemptyset(&child_mask);

        auto pid = ::fork();
        if (pid < 0) {
            detail::close_fd(in_pipe.read_end);
            detail::close_fd(in_pipe.write_end);
            detail::close_fd(out_pipe.read_end);
            detail::close_fd(out_pipe.write_end);
            return {.exit_code = 1, .output = "fork() failed"};
        }

        if (pid == 0) {
            ::setpgid(0, 0);
            ::sigprocmask(SIG_SETMASK, &child_mask, nullptr);
            ::signal(SIGPIPE, SIG_DFL);
            ::dup2(in_pipe.read_end, STDIN_FILENO);
            ::dup2(out_pipe.write_end, STDOUT_FILENO);
            ::dup2(out_pipe.write_end, STDERR_FILENO);
            ::execv(c_argv[0], c_argv.data());
            _exit(127);
        }

        // parent; set the group here as well so a signal never races the child's setpgid
        (void)::setpgid(pid, pid);
        if (registry != nullptr) {
            registry->add(pid);
        }

        detail::close_fd(in_pipe.read_end);
        detail::close_fd(out_pipe.write_end);

        std::string payload{input};
        payload.push_back('\n');
        std::size_t written = 0;

        std::string out_buf{};
        bool timed_out = false;
        bool poll_failed = false;
        if (::fcntl(in_pipe.write_end, F_SETFL, O_NONBLOCK) != 0) {
            out_buf = "fcntl() failed";
            detail::close_fd(out_pipe.read_end);
            poll_failed = true;
        }
        auto deadline = std::chrono::steady_clock::now() + timeout;

        while (out_pipe.read_end >= 0) {
            auto remaining =
                    std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now())
                            .count();
            if (remaining <= 0) {
                timed_out = true;
                break;
            }

            pollfd fds[2]{};
            nfds_t nfds = 0;
            fds[nfds++] = {.fd = out_pipe.read_end, .events = POLLIN, .revents = 0};
            int stdin_slot = -1;
            if (in_pipe.write_end >= 0) {
                stdin_slot = static_cast<int>(nfds);
                fds[nfds++] = {.fd = in_pipe.write_end, .events = POLLOUT, .revents = 0};
            }

            auto poll_ms = std::min<long long>(remaining, std::numeric_limits<int>::max());
            int ret = ::poll(fds, nfds, static_cast<int>(poll_ms));
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                poll_failed = true;
                break;
            }
            if (ret == 0) {
                timed_out = true;
                break;
            }

            if (stdin_slot >= 0 && fds[stdin_slot].revents != 0) {
                if ((fds[stdin_slot].revents & (POLLERR | POLLHUP)) != 0) {
                    detail::close_fd(in_pipe.write_end);
                }
                else {
                    auto n = ::write(in_pipe.write_end, payload.data() + written, payload.size() - written);
                    if (n > 0) {
                        written += static_cast<std::size_t>(n);
                        if (written == payload.size()) {
                            detail::close_fd(in_pipe.write_end);
                        }
                    }
                    else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                        // EPIPE: the child exited or closed stdin without reading the prompt
                        detail::close_fd(in_pipe.write_end);
                    }
                }
            }

            if ((fds[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
                char chunk[4096]{};
                auto n = ::read(out_pipe.read_end, chunk, sizeof(chunk));
                if (n > 0) {
                    out_buf.append(chunk, static_cast<size_t>(n));
                }
                else if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
                    continue;
                }
                else {
                    detail::close_fd(out_pipe.read_end);
                }
            }
        }

        int status = 0;
        bool reaped = false;
        if (!timed_out && !poll_failed) {
            reaped = detail::reap_before(pid, status, deadline);
            timed_out = !reaped;
        }
        if (!reaped) {
            ::kill(-pid, SIGKILL);
        }

        detail::close_fd(in_pipe.write_end);
        detail::close_fd(out_pipe.read_end);

        while (!reaped && ::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        if (registry != nullptr) {
            registry->remove(pid);
        }

        detail::strip_trailing_newlines(out_buf);

        if (timed_out) {
            return {.exit_code = exit_timeout, .output = std::move(out_buf), .timed_out = true};
        }
        if (poll_failed) {
            return {.exit_code = 1, .output = std::move(out_buf)};
        }
        return {.exit_code = detail::decode_status(status), .output = std::move(out_buf)};
    }

}  // namespace relay::process
