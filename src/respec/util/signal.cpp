#include "./signal.hpp"

#include <csignal>

namespace {

volatile std::sig_atomic_t pending_signal = 0;

extern "C" void record_signal(int sig) { pending_signal = sig; }

}  // namespace

using namespace respec;

void respec::install_signal_handlers() noexcept {
    // Only record the signal. run_proc() forwards it to a running child, and the driver stops
    // at the next cancellation point.
    std::signal(SIGINT, record_signal);
    std::signal(SIGTERM, record_signal);
}

void respec::notify_cancel() noexcept { pending_signal = SIGINT; }
void respec::reset_cancelled() noexcept { pending_signal = 0; }
bool respec::is_cancelled() noexcept { return pending_signal != 0; }

void respec::cancellation_point() {
    if (is_cancelled()) {
        throw user_cancelled(static_cast<int>(pending_signal));
    }
}
