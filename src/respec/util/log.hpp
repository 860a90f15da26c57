#pragma once

#include <fmt/core.h>

#include <filesystem>
#include <string_view>

namespace respec::log {

enum class level : int {
    trace,
    debug,
    info,
    warn,
    error,
    critical,
    silent,
};

inline level current_log_level = level::info;

void log_print(level l, std::string_view s) noexcept;

/// Set up the console logger. Must run before the first message.
void init_logger() noexcept;

/**
 * Mirror every message, at every level, into `path` in addition to the console. The file keeps
 * a full trace of a convergence run even when the console shows only info and above.
 */
void mirror_to_file(const std::filesystem::path& path);

/// Parse a level name ("trace", "info", ...). Throws on an unknown name.
level parse_level(std::string_view name);

template <typename T>
concept formattable = requires(const T item) {
    fmt::format("{}", item);
};

template <formattable... Args>
void log(level l, std::string_view s, const Args&... args) noexcept {
    log_print(l, fmt::format(fmt::runtime(s), args...));
}

bool any_sink_wants(level l) noexcept;

#define respec_log(Level, str, ...)                                                                \
    do {                                                                                           \
        if (::respec::log::any_sink_wants(::respec::log::level::Level)) {                          \
            ::respec::log::log(::respec::log::level::Level, str __VA_OPT__(, ) __VA_ARGS__);       \
        }                                                                                          \
    } while (0)

}  // namespace respec::log
