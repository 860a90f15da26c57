#pragma once

#include <array>
#include <filesystem>
#include <string_view>
#include <vector>

namespace respec {

/// The sandbox logs kept for each round.
inline constexpr std::array<std::string_view, 6> sandbox_logs = {
    "build",
    "root",
    "srpm-build",
    "srpm-root",
    "mock_srpm",
    "mock_build",
};

/**
 * @brief Rename each `<name>.log` in the results directory to `round<N>-<name>.log`, so the
 * next round does not overwrite it.
 *
 * Logs the sandbox did not write are skipped. Returns the paths of the archived logs.
 */
std::vector<std::filesystem::path> archive_round_logs(const std::filesystem::path& results_dir,
                                                      int                          round);

}  // namespace respec
