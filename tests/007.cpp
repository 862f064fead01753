#include "utils.hpp"

#include "internal/output.hpp"
#include "internal/worker_pool.hpp"

#include <mutex>

namespace relay::test {
    using namespace std::chrono_literals;

    namespace detail {
        struct pipe_pair {
            int read_fd{-1};
            int write_fd{-1};

            pipe_pair() {
                int fds[2];
                REQUIRE(::pipe(fds) == 0);
                read_fd = fds[0];
                write_fd = fds[1];
            }

            ~pipe_pair() {
                close_write();
                if (read_fd >= 0) {
                    ::close(read_fd);
                }
            }

            void close_write() {
                if (write_fd >= 0) {
                    ::close(write_fd);
                    write_fd = -1;
                }
            }

            pipe_pair(const pipe_pair&) = delete;
            pipe_pair& operator=(const pipe_pair&) = delete;
        };

        inline std::string drain_fd(int fd) {
            std::string out{};
            std::array<char, 4096> buf{};
            for (;;) {
                auto n = ::read(fd, buf.data(), buf.size());
                if (n < 0 && errno == EINTR) {
                    continue;
                }
                if (n <= 0) {
                    break;
                }
                out.append(buf.data(), static_cast<std::size_t>(n));
            }
            return out;
        }

        inline std::vector<std::string> split_lines(std::string_view text) {
            std::vector<std::string> lines{};
            std::size_t start = 0;
            for (auto pos = text.find('\n'); pos != std::string_view::npos; pos = text.find('\n', start)) {
                lines.emplace_back(text.substr(start, pos - start));
                start = pos + 1;
            }
            if (start < text.size()) {
                lines.emplace_back(text.substr(start));
            }
            return lines;
        }

        struct numbered_line {
            int id{};
            std::string text{};
        };
    }  // namespace detail

    TEST_CASE("007: concurrent sends never interleave lines", "[007][output]") {
        detail::pipe_pair pipe{};
        std::string received{};
        std::thread reader{[&] { received = detail::drain_fd(pipe.read_fd); }};

        constexpr int writers = 8;
        constexpr int per_writer = 25;
        std::atomic<int> failures{0};
        {
            internal::output_channel out{pipe.write_fd};
            std::vector<std::thread> threads{};
            for (int w = 0; w < writers; ++w) {
                threads.emplace_back([&out, &failures, w] {
                    for (int i = 0; i < per_writer; ++i) {
                        // larger than PIPE_BUF so a single write() may be split
                        detail::numbered_line line{
                                .id = w * per_writer + i, .text = std::string(8192 + static_cast<std::size_t>(w), 'a' + w)};
                        std::string json{};
                        if (glz::write_json(line, json) || !out.send(json)) {
                            ++failures;
                        }
                    }
                });
            }
            for (auto& t : threads) {
                t.join();
            }
        }
        pipe.close_write();
        reader.join();
        CHECK(failures == 0);

        auto lines = detail::split_lines(received);
        REQUIRE(lines.size() == static_cast<std::size_t>(writers * per_writer));

        std::set<int> ids{};
        for (const auto& text : lines) {
            detail::numbered_line line{};
            REQUIRE_FALSE(glz::read_json(line, text));
            int writer = line.id / per_writer;
            CHECK(line.text.size() == 8192U + static_cast<std::size_t>(writer));
            CHECK(line.text.find_first_not_of(static_cast<char>('a' + writer)) == std::string::npos);
            ids.insert(line.id);
        }
        CHECK(ids.size() == lines.size());
    }

    TEST_CASE("007: send reports a closed stream", "[007][output]") {
        ::signal(SIGPIPE, SIG_IGN);
        detail::pipe_pair pipe{};
        ::close(pipe.read_fd);
        pipe.read_fd = -1;

        internal::output_channel out{pipe.write_fd};
        CHECK_FALSE(out.send(R"({"jsonrpc":"2.0"})"));
    }

    TEST_CASE("007: worker pool runs every task within its concurrency bound", "[007][pool]") {
        constexpr std::size_t threads = 3;
        std::atomic<int> running{0};
        std::atomic<int> peak{0};
        std::atomic<int> finished{0};

        {
            internal::worker_pool pool{threads};
            CHECK(pool.size() == threads);

            for (int i = 0; i < 12; ++i) {
                pool.submit([&] {
                    int now = ++running;
                    int seen = peak.load();
                    while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
                    std::this_thread::sleep_for(20ms);
                    --running;
                    ++finished;
                });
            }
            pool.drain();
            CHECK(pool.pending() == 0U);
        }

        CHECK(finished == 12);
        CHECK(peak.load() <= static_cast<int>(threads));
        CHECK(peak.load() >= 2);
    }

    TEST_CASE("007: submit returns while earlier tasks are still running", "[007][pool]") {
        internal::worker_pool pool{1};
        std::atomic<bool> release{false};
        std::atomic<int> finished{0};

        pool.submit([&] {
            while (!release) {
                std::this_thread::sleep_for(1ms);
            }
            ++finished;
        });

        auto start = std::chrono::steady_clock::now();
        pool.submit([&] { ++finished; });
        CHECK(test::detail::elapsed_seconds(start) < 0.5);
        CHECK(finished == 0);

        release = true;
        pool.drain();
        CHECK(finished == 2);
    }

    TEST_CASE("007: a throwing task does not take its worker down", "[007][pool]") {
        internal::worker_pool pool{1};
        std::atomic<int> finished{0};

        pool.submit([] { throw std::runtime_error{"boom"}; });
        pool.submit([&] { ++finished; });
        pool.drain();

        CHECK(finished == 1);
    }

    TEST_CASE("007: zero threads still gets one worker", "[007][pool]") {
        internal::worker_pool pool{0};
        CHECK(pool.size() == 1U);
    }
}  // namespace relay::test
