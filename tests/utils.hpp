#pragma once

#include "relay/relay.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace relay::test::detail {
    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }

        temp_dir(const temp_dir&) = delete;
        temp_dir& operator=(const temp_dir&) = delete;
    };

    inline void write_file(const fs::path& p, std::string_view content) {
        std::ofstream out{p};
        REQUIRE(out.good());
        out << content;
    }

    inline std::string read_file(const fs::path& p) {
        std::ifstream in{p};
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    // Writes an executable /bin/sh script standing in for the AI CLI.
    inline fs::path write_stub(const fs::path& dir, std::string_view name, std::string_view body) {
        auto path = dir / name;
        std::string script{"#!/bin/sh\n"};
        script.append(body);
        script.push_back('\n');
        write_file(path, script);
        fs::permissions(
                path,
                fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec | fs::perms::others_read |
                        fs::perms::others_exec);
        return path;
    }

    // Number of lines a stub appended to its invocation log.
    inline std::size_t count_lines(const fs::path& p) {
        auto text = read_file(p);
        return static_cast<std::size_t>(std::ranges::count(text, '\n'));
    }

    inline double elapsed_seconds(std::chrono::steady_clock::time_point start) {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    }

}  // namespace relay::test::detail
