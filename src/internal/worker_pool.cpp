#include "worker_pool.hpp"

#include "relay/utils.hpp"

#include <exception>

namespace relay::internal {

    worker_pool::worker_pool(std::size_t threads) {
        if (threads == 0) {
            threads = 1;
        }
        workers_.reserve(threads);
        for (std::size_t i = 0; i < threads; ++i) {
            workers_.emplace_back([this] { work(); });
        }
    }

    worker_pool::~worker_pool() {
        drain();
    }

    void worker_pool::submit(std::function<void()> task) {
        {
            std::lock_guard lock{mutex_};
            queue_.push_back(std::move(task));
        }
        cv_.notify_one();
    }

    std::size_t worker_pool::pending() const {
        std::lock_guard lock{mutex_};
        return queue_.size();
    }

    void worker_pool::drain() {
        {
            std::lock_guard lock{mutex_};
            stopping_ = true;
        }
        cv_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();
    }

    void worker_pool::work() {
        for (;;) {
            std::function<void()> task{};
            {
                std::unique_lock lock{mutex_};
                cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
                if (queue_.empty()) {
                    return;
                }
                task = std::move(queue_.front());
                queue_.pop_front();
            }

            try {
                task();
            } catch (const std::exception& e) {
                log_error("worker task failed: ", e.what());
            }
        }
    }

}  // namespace relay::internal
