#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace relay::internal {

    /*
     * Fixed set of worker threads draining a FIFO queue. submit() never blocks
     * on a running task, so the read loop keeps accepting input while at most
     * `threads` tasks execute. Tasks must not throw; anything that escapes is
     * logged and the worker keeps going.
     */
    class worker_pool {
      public:
        explicit worker_pool(std::size_t threads);
        ~worker_pool();

        worker_pool(const worker_pool&) = delete;
        worker_pool& operator=(const worker_pool&) = delete;

        void submit(std::function<void()> task);

        // Runs every queued task to completion, then joins the workers.
        void drain();

        std::size_t size() const { return workers_.size(); }
        std::size_t pending() const;

      private:
        void work();

        mutable std::mutex mutex_{};
        std::condition_variable cv_{};
        std::deque<std::function<void()>> queue_{};
        std::vector<std::thread> workers_{};
        bool stopping_{false};
    };

}  // namespace relay::internal
