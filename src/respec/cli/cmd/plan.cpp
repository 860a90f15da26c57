#include "../options.hpp"

#include <respec/config/load.hpp>
#include <respec/synth/plan.hpp>

#include <fmt/core.h>
#include <magic_enum.hpp>

namespace respec::cli::cmd {

namespace {

void print_steps(std::string_view phase, const std::vector<build_step>& steps) {
    fmt::print("{}:\n", phase);
    for (auto& step : steps) {
        fmt::print("  {:<10} {}\n",
                   traits_of(step.var).label,
                   magic_enum::enum_name(step.stage));
    }
}

}  // namespace

int plan(const options& opts) {
    auto pkg = load_package_config(opts.config_path);
    auto bp  = plan_build(pkg.kind, pkg.config);
    fmt::print("{} ({}), PGO mode: {}\n",
               pkg.config.name,
               build_system_name(pkg.kind),
               magic_enum::enum_name(bp.mode));
    print_steps("build", bp.build);
    print_steps("install", bp.install);
    return 0;
}

}  // namespace respec::cli::cmd
