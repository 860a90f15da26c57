#include "./time.hpp"

#include <fmt/core.h>

std::string respec::format_duration(std::chrono::milliseconds dur) {
    using namespace std::chrono;
    auto ms = dur.count();
    if (ms < 1000) {
        return fmt::format("{}ms", ms);
    }
    if (ms < 60'000) {
        return fmt::format("{:.1f}s", static_cast<double>(ms) / 1000.0);
    }
    auto secs = duration_cast<seconds>(dur).count();
    if (secs < 3600) {
        return fmt::format("{}m{:02}s", secs / 60, secs % 60);
    }
    return fmt::format("{}h{:02}m", secs / 3600, (secs % 3600) / 60);
}
