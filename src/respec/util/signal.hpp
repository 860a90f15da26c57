#pragma once

#include <stdexcept>

namespace respec {

/// Thrown at a cancellation point after SIGINT or SIGTERM arrived.
class user_cancelled : public std::exception {
    int _signal;

public:
    explicit user_cancelled(int sig) noexcept
        : _signal(sig) {}

    int signal() const noexcept { return _signal; }
    const char* what() const noexcept override { return "Operation cancelled by signal"; }
};

void install_signal_handlers() noexcept;

/// Request cancellation as if SIGINT had arrived.
void notify_cancel() noexcept;
void reset_cancelled() noexcept;
bool is_cancelled() noexcept;

/// Throw user_cancelled if a cancellation is pending. Called between sandbox commands and
/// between convergence rounds, never inside one.
void cancellation_point();

}  // namespace respec
