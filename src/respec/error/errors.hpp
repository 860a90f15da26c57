#pragma once

#include <fmt/core.h>

#include <stdexcept>
#include <string>
#include <string_view>

namespace respec {

enum class errc {
    none = 0,
    unknown_build_system,
    missing_source_layout,
    unknown_option,
    invalid_config,
    round_budget_exhausted,
    sandbox_build_failed,
    pgo_marker_missing,
    io_failure,
};

std::string_view explanation_of(errc) noexcept;
std::string_view default_error_string(errc) noexcept;

struct exception_base : std::runtime_error {
    using runtime_error::runtime_error;
};

struct error_base : exception_base {
    using exception_base::exception_base;

    virtual errc     get_errc() const noexcept = 0;
    std::string_view explanation() const noexcept { return explanation_of(get_errc()); }
};

/// An error caused by bad input: a malformed config, an unknown name, a missing file.
struct user_error_base : error_base {
    using error_base::error_base;
};

/// A broken internal contract. These always indicate a defect in synthesis or its inputs'
/// construction and are never retried.
struct precondition_error_base : error_base {
    using error_base::error_base;
};

template <errc ErrorCode>
struct user_error : user_error_base {
    using user_error_base::user_error_base;
    errc get_errc() const noexcept override { return ErrorCode; }
};

template <errc ErrorCode>
struct precondition_error : precondition_error_base {
    using precondition_error_base::precondition_error_base;
    errc get_errc() const noexcept override { return ErrorCode; }
};

template <errc ErrorCode, typename... Args>
[[noreturn]] void throw_user_error(std::string_view fmt_str, Args&&... args) {
    throw user_error<ErrorCode>(fmt::format(fmt::runtime(fmt_str), std::forward<Args>(args)...));
}

template <errc ErrorCode>
[[noreturn]] void throw_user_error() {
    throw user_error<ErrorCode>(std::string(default_error_string(ErrorCode)));
}

template <errc ErrorCode, typename... Args>
[[noreturn]] void throw_precondition_error(std::string_view fmt_str, Args&&... args) {
    throw precondition_error<ErrorCode>(
        fmt::format(fmt::runtime(fmt_str), std::forward<Args>(args)...));
}

}  // namespace respec
