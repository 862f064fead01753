#include "utils.hpp"

#include "relay/process.hpp"

namespace relay::test {
    using namespace std::chrono_literals;

    TEST_CASE("004: resolve_executable searches PATH and checks paths", "[004][process]") {
        auto sh = process::resolve_executable("sh");
        REQUIRE(sh.has_value());
        CHECK(sh->is_absolute());

        CHECK_FALSE(process::resolve_executable("relay-definitely-not-installed").has_value());
        CHECK_FALSE(process::resolve_executable("/nonexistent/claude").has_value());
        CHECK_FALSE(process::resolve_executable("").has_value());

        detail::temp_dir temp{"relay_resolve"};
        auto stub = detail::write_stub(temp.path, "claude", "exit 0");
        auto resolved = process::resolve_executable(stub);
        REQUIRE(resolved.has_value());
        CHECK(*resolved == stub);

        auto plain = temp.path / "not_executable";
        detail::write_file(plain, "data");
        CHECK_FALSE(process::resolve_executable(plain).has_value());
    }

    TEST_CASE("004: prompt is delivered on stdin and output captured", "[004][process]") {
        detail::temp_dir temp{"relay_run_stdin"};
        auto stub = detail::write_stub(temp.path, "echo_stdin", "cat");

        auto result = process::run({stub.string()}, "hello from stdin", 5s);
        CHECK(result.exit_code == 0);
        CHECK_FALSE(result.timed_out);
        CHECK(result.output == "hello from stdin");
    }

    TEST_CASE("004: stdout and stderr are merged, argv passed verbatim", "[004][process]") {
        detail::temp_dir temp{"relay_run_merge"};
        auto stub = detail::write_stub(temp.path, "args", "echo \"out:$1\"\necho \"err:$2\" >&2");

        auto result = process::run({stub.string(), "a b", "$(x)"}, "", 5s);
        CHECK(result.exit_code == 0);
        CHECK(result.output.find("out:a b") != std::string::npos);
        CHECK(result.output.find("err:$(x)") != std::string::npos);
    }

    TEST_CASE("004: non-zero exit codes are reported", "[004][process]") {
        detail::temp_dir temp{"relay_run_exit"};
        auto stub = detail::write_stub(temp.path, "fail", "echo boom\nexit 3");

        auto result = process::run({stub.string()}, "ignored", 5s);
        CHECK(result.exit_code == 3);
        CHECK(result.output == "boom");
    }

    TEST_CASE("004: child that never reads stdin still completes", "[004][process]") {
        detail::temp_dir temp{"relay_run_noread"};
        auto stub = detail::write_stub(temp.path, "noread", "exec 0<&-\necho done");

        std::string big(1U << 20U, 'x');
        auto result = process::run({stub.string()}, big, 5s);
        CHECK(result.exit_code == 0);
        CHECK(result.output == "done");
    }

    TEST_CASE("004: deadline kills the process group and reports the timeout sentinel", "[004][process]") {
        detail::temp_dir temp{"relay_run_timeout"};
        auto stub = detail::write_stub(temp.path, "sleepy", "sleep 30 &\nsleep 30");

        process::process_registry registry{};
        auto start = std::chrono::steady_clock::now();
        auto result = process::run({stub.string()}, "", 300ms, &registry);
        auto elapsed = detail::elapsed_seconds(start);

        CHECK(result.timed_out);
        CHECK(result.exit_code == process::exit_timeout);
        CHECK(elapsed < 5.0);
        CHECK(registry.size() == 0U);
    }

    TEST_CASE("004: death by signal maps to 128 + signal", "[004][process]") {
        detail::temp_dir temp{"relay_run_signal"};
        auto stub = detail::write_stub(temp.path, "selfkill", "kill -9 $$");

        auto result = process::run({stub.string()}, "", 5s);
        CHECK(result.exit_code == process::exit_killed);
    }

    TEST_CASE("004: missing executable reports 127", "[004][process]") {
        auto result = process::run({"/nonexistent/claude"}, "", 5s);
        CHECK(result.exit_code == 127);
    }

    TEST_CASE("004: registry tracks only live children", "[004][process]") {
        detail::temp_dir temp{"relay_registry"};
        auto stub = detail::write_stub(temp.path, "slow", "sleep 1");

        process::process_registry registry{};
        std::atomic<bool> done{false};
        std::thread runner{[&] {
            (void)process::run({stub.string()}, "", 10s, &registry);
            done = true;
        }};

        auto deadline = std::chrono::steady_clock::now() + 5s;
        while (registry.size() == 0U && !done && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(10ms);
        }
        CHECK(registry.size() == 1U);
        CHECK(registry.terminate_all(SIGKILL) == 1U);

        runner.join();
        CHECK(registry.size() == 0U);
    }
    TEST_CASE("004: timeouts beyond the poll range still run normally", "[004][process]") {
        detail::temp_dir temp{"relay_run_long_timeout"};
        auto stub = detail::write_stub(temp.path, "quick", "cat >/dev/null\necho fine");

        auto start = std::chrono::steady_clock::now();
        auto result = process::run({stub.string()}, "x", std::chrono::hours{24 * 60});
        CHECK(result.exit_code == 0);
        CHECK_FALSE(result.timed_out);
        CHECK(result.output == "fine");
        CHECK(detail::elapsed_seconds(start) < 5.0);
    }

    TEST_CASE("004: child that closes its output keeps the deadline", "[004][process]") {
        detail::temp_dir temp{"relay_run_closed_output"};
        auto stub = detail::write_stub(temp.path, "detach", "echo early\nexec >&- 2>&-\nexec sleep 30");

        auto start = std::chrono::steady_clock::now();
        auto result = process::run({stub.string()}, "", 300ms);
        CHECK(result.timed_out);
        CHECK(result.exit_code == process::exit_timeout);
        CHECK(result.output == "early");
        CHECK(detail::elapsed_seconds(start) < 5.0);
    }

    TEST_CASE("004: concurrent runs do not hold each other's pipes open", "[004][process]") {
        detail::temp_dir temp{"relay_run_parallel"};
        auto quick = detail::write_stub(temp.path, "quick", "cat >/dev/null\necho quick");
        auto slow = detail::write_stub(temp.path, "slow", "cat >/dev/null\nsleep 2\necho slow");

        std::atomic<int> quick_ok{0};
        auto start = std::chrono::steady_clock::now();
        std::thread slow_runner{[&] { (void)process::run({slow.string()}, "", 10s); }};
        std::vector<std::thread> quick_runners{};
        for (int i = 0; i < 4; ++i) {
            quick_runners.emplace_back([&] {
                auto result = process::run({quick.string()}, "", 10s);
                if (result.exit_code == 0 && result.output == "quick") {
                    ++quick_ok;
                }
            });
        }
        for (auto& t : quick_runners) {
            t.join();
        }
        auto quick_elapsed = detail::elapsed_seconds(start);
        slow_runner.join();

        CHECK(quick_ok == 4);
        CHECK(quick_elapsed < 1.5);
    }
}  // namespace relay::test
