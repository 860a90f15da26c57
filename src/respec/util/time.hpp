#pragma once

#include <chrono>
#include <string>

namespace respec {

class stopwatch {
public:
    using clock = std::chrono::steady_clock;

private:
    clock::time_point _start = clock::now();

public:
    void restart() noexcept { _start = clock::now(); }

    std::chrono::milliseconds elapsed() const noexcept {
        return std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - _start);
    }
};

/**
 * Render a duration the way build logs show it: "850ms", "12.4s", "3m05s" or "1h02m".
 * Sub-second precision is dropped above a minute.
 */
std::string format_duration(std::chrono::milliseconds);

}  // namespace respec
