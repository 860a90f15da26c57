#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace respec {

/// Quote one argument for a POSIX shell. Arguments made only of safe characters pass unchanged.
std::string quote_argument(std::string_view);

template <typename Container>
std::string quote_command(const Container& c) {
    std::string acc;
    for (const auto& arg : c) {
        if (!acc.empty()) {
            acc.push_back(' ');
        }
        acc += quote_argument(arg);
    }
    return acc;
}

struct proc_result {
    int         signal    = 0;
    int         retc      = 0;
    bool        timed_out = false;
    std::string output;

    std::chrono::milliseconds elapsed{0};

    bool okay() const noexcept { return retc == 0 && signal == 0; }
};

struct proc_options {
    std::vector<std::string> command;

    std::optional<std::filesystem::path> cwd = std::nullopt;

    /**
     * Wall-clock limit for the whole run. When it passes the child gets SIGTERM, then SIGKILL
     * if it is still alive after `kill_grace`. Unset means no limit.
     */
    std::optional<std::chrono::milliseconds> timeout    = std::nullopt;
    std::chrono::milliseconds                kill_grace = std::chrono::seconds(10);

    /// Combined stdout/stderr is also written here as it arrives, truncating any old content.
    std::optional<std::filesystem::path> output_file = std::nullopt;
};

proc_result run_proc(const proc_options& opts);

inline proc_result run_proc(std::vector<std::string> args) {
    return run_proc(proc_options{.command = std::move(args)});
}

}  // namespace respec
