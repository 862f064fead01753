#pragma once

#include "relay/process.hpp"

#include <thread>

namespace relay::internal {

    /*
     * Owns shutdown signals (SIGINT, SIGTERM, SIGHUP). The constructor blocks
     * them in the calling thread, so it must run before any other thread is
     * started; every later thread inherits the mask and only the watcher sees
     * them. On delivery all tracked children are terminated and the process
     * exits with 128+signal.
     */
    class signal_watcher {
      public:
        explicit signal_watcher(process::process_registry& registry);
        ~signal_watcher();

        signal_watcher(const signal_watcher&) = delete;
        signal_watcher& operator=(const signal_watcher&) = delete;

      private:
        void watch();

        process::process_registry& registry_;
        std::thread thread_{};
    };

}  // namespace relay::internal
