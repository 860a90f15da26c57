#include "./mock.hpp"

#include <respec/util/fs/io.hpp>
#include <respec/util/log.hpp>
#include <respec/util/proc.hpp>
#include <respec/util/string.hpp>
#include <respec/util/time.hpp>

#include <fmt/core.h>

#include <algorithm>

using namespace respec;

namespace {

constexpr std::string_view unpackaged_header = "Installed (but unpackaged) file(s) found:";

proc_result run_logged(proc_options opts, const std::filesystem::path& logfile) {
    opts.output_file = logfile;
    auto res         = run_proc(opts);
    respec_log(debug,
               "[{}] exited {} after {} (log: {})",
               opts.command.front(),
               res.retc,
               format_duration(res.elapsed),
               logfile.string());
    return res;
}

std::optional<std::filesystem::path> find_srpm(const std::filesystem::path& results) {
    if (!std::filesystem::is_directory(results)) {
        return std::nullopt;
    }
    for (auto& entry : std::filesystem::directory_iterator{results}) {
        if (ends_with(entry.path().filename().string(), ".src.rpm")) {
            return entry.path();
        }
    }
    return std::nullopt;
}

}  // namespace

std::vector<std::string> respec::parse_unpackaged_files(std::string_view build_log) {
    std::vector<std::string> ret;
    bool                     in_report = false;
    for (auto& line : split_lines(build_log)) {
        auto tl = trim_view(line);
        if (!in_report) {
            in_report = tl.ends_with(unpackaged_header);
            continue;
        }
        if (!tl.starts_with("/")) {
            in_report = false;
            continue;
        }
        if (std::ranges::find(ret, tl) == ret.end()) {
            ret.emplace_back(tl);
        }
    }
    return ret;
}

std::vector<std::string> mock_builder::_base_command() const {
    return {"mock",
            "-r",
            _opts.config,
            fmt::format("--uniqueext={}", _opts.uniqueext),
            fmt::format("--result={}/", results_dir().string()),
            "--no-cleanup-after"};
}

std::filesystem::path mock_builder::build_root() const {
    return std::filesystem::path("/var/lib/mock")
        / fmt::format("{}-{}", _opts.config, _opts.uniqueext) / "root/builddir/build/BUILD";
}

sandbox_result mock_builder::build(const std::filesystem::path& recipe, int round) {
    auto results = results_dir();
    std::filesystem::create_directories(results);
    auto extra = split_words(_opts.extra_opts);

    respec_log(info, "Round {}: building source package from {}", round, recipe.string());
    auto srpm_cmd = _base_command();
    srpm_cmd.push_back("--buildsrpm");
    srpm_cmd.push_back(fmt::format("--sources={}", _opts.target_dir.string()));
    srpm_cmd.push_back(fmt::format("--spec={}", recipe.string()));
    srpm_cmd.insert(srpm_cmd.end(), extra.begin(), extra.end());
    auto srpm_res = run_logged({.command = srpm_cmd,
                                .cwd     = _opts.target_dir,
                                .timeout = _opts.timeout},
                               results / "mock_srpm.log");

    auto srpm = find_srpm(results);
    if (!srpm_res.okay() || !srpm) {
        respec_log(error, "Round {}: source package build failed", round);
        return {};
    }

    respec_log(info, "Round {}: building {}", round, srpm->filename().string());
    auto build_cmd = _base_command();
    build_cmd.push_back(srpm->string());
    build_cmd.push_back("--enable-plugin=ccache");
    build_cmd.insert(build_cmd.end(), extra.begin(), extra.end());
    auto build_res = run_logged({.command = build_cmd,
                                 .cwd     = _opts.target_dir,
                                 .timeout = _opts.timeout},
                                results / "mock_build.log");
    // The source package is rebuilt next round from the updated recipe.
    std::filesystem::remove(*srpm);

    sandbox_result ret;
    ret.success = build_res.okay();
    auto build_log = results / "build.log";
    if (std::filesystem::exists(build_log)) {
        ret.stray_files = parse_unpackaged_files(read_file(build_log));
    }
    respec_log(info,
               "Round {}: build {} ({} unpackaged file(s))",
               round,
               ret.success ? "succeeded" : "failed",
               ret.stray_files.size());
    return ret;
}

bool mock_builder::has_build_file(const std::filesystem::path& relpath) const {
    return std::filesystem::exists(build_root() / relpath);
}
