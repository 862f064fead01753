#include "output.hpp"

#include "platform.hpp"

#include "relay/utils.hpp"

#include <cerrno>
#include <string>

namespace relay::internal {

    bool output_channel::send(std::string_view json) {
        std::string line{};
        line.reserve(json.size() + 1);
        line.append(json);
        line.push_back('\n');

        std::lock_guard lock{mutex_};
        if (broken_.load(std::memory_order_relaxed)) {
            return false;
        }

        if (line.size() > platform::atomic_pipe_write) {
            debug_log("response of ", line.size(), " bytes exceeds PIPE_BUF, relying on the lock alone");
        }

        std::size_t written = 0;
        while (written < line.size()) {
            auto n = ::write(fd_, line.data() + written, line.size() - written);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                log_error("failed to write response: errno ", errno);
                broken_.store(true, std::memory_order_release);
                return false;
            }
            written += static_cast<std::size_t>(n);
        }
        return true;
    }

}  // namespace relay::internal
