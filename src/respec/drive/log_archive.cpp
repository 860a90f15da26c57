#include "./log_archive.hpp"

#include <respec/util/log.hpp>

#include <boost/leaf/exception.hpp>
#include <fmt/core.h>

using namespace respec;

std::vector<std::filesystem::path>
respec::archive_round_logs(const std::filesystem::path& results_dir, int round) {
    std::vector<std::filesystem::path> ret;
    for (auto name : sandbox_logs) {
        auto src = results_dir / fmt::format("{}.log", name);
        if (!std::filesystem::exists(src)) {
            respec_log(debug, "No {} log to archive for round {}", name, round);
            continue;
        }
        auto dest = results_dir / fmt::format("round{}-{}.log", round, name);
        std::error_code ec;
        std::filesystem::rename(src, dest, ec);
        if (ec) {
            BOOST_LEAF_THROW_EXCEPTION(std::system_error(ec,
                                                         fmt::format("Failed to archive {} as {}",
                                                                     src.string(),
                                                                     dest.string())),
                                       ec);
        }
        ret.push_back(std::move(dest));
    }
    return ret;
}
