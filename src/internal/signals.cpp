#include "signals.hpp"

#include "relay/utils.hpp"

#include <pthread.h>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <stdexcept>

namespace relay::internal {

    namespace detail {

        // SIGUSR1 only wakes the watcher for a clean stop
        static sigset_t watched_signals() {
            sigset_t set{};
            ::sigemptyset(&set);
            ::sigaddset(&set, SIGINT);
            ::sigaddset(&set, SIGTERM);
            ::sigaddset(&set, SIGHUP);
            ::sigaddset(&set, SIGUSR1);
            return set;
        }

    }  // namespace detail

    signal_watcher::signal_watcher(process::process_registry& registry) : registry_{registry} {
        auto set = detail::watched_signals();
        if (::pthread_sigmask(SIG_BLOCK, &set, nullptr) != 0) {
            throw std::runtime_error("failed to block shutdown signals");
        }
        thread_ = std::thread{[this] { watch(); }};
    }

    signal_watcher::~signal_watcher() {
        if (thread_.joinable()) {
            ::pthread_kill(thread_.native_handle(), SIGUSR1);
            thread_.join();
        }
    }

    void signal_watcher::watch() {
        auto set = detail::watched_signals();
        int sig = 0;
        while (::sigwait(&set, &sig) != 0) {
        }
        if (sig == SIGUSR1) {
            return;
        }

        log_warning("received signal ", sig, ", terminating ", registry_.size(), " child process(es)");
        if (registry_.terminate_all(SIGTERM) > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds{500});
            registry_.terminate_all(SIGKILL);
        }
        std::_Exit(128 + sig);
    }

}  // namespace relay::internal
