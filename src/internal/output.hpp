#pragma once

#include <atomic>
#include <mutex>
#include <string_view>

#include <unistd.h>

namespace relay::internal {

    /*
     * The one shared response stream. Each send() holds the lock for exactly
     * one complete line, so concurrently finishing calls never interleave.
     * The channel does not own the fd.
     */
    class output_channel {
      public:
        explicit output_channel(int fd = STDOUT_FILENO) : fd_{fd} {}

        output_channel(const output_channel&) = delete;
        output_channel& operator=(const output_channel&) = delete;

        // Appends '\n'. Returns false if the stream is gone.
        bool send(std::string_view json);

        // Set once a write fails; the client cannot receive anything further.
        bool broken() const { return broken_.load(std::memory_order_acquire); }

      private:
        int fd_;
        std::mutex mutex_{};
        std::atomic<bool> broken_{false};
    };

}  // namespace relay::internal
