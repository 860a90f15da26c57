#include "../options.hpp"

#include <respec/config/load.hpp>
#include <respec/synth/synthesize.hpp>
#include <respec/util/fs/io.hpp>
#include <respec/util/log.hpp>

#include <fmt/core.h>

namespace respec::cli::cmd {

int synth(const options& opts) {
    auto pkg = load_package_config(opts.config_path);
    if (opts.synth.phase) {
        pkg.config.set_flag("altflags_pgo_ext_phase", *opts.synth.phase == pgo_phase::use);
    }
    auto recipe = synthesize(pkg.kind, pkg.config).render();
    if (!opts.synth.out) {
        fmt::print("{}", recipe);
        return 0;
    }
    write_file(*opts.synth.out, recipe);
    respec_log(info,
               "Wrote {} recipe for {} to [{}]",
               build_system_name(pkg.kind),
               pkg.config.name,
               opts.synth.out->string());
    return 0;
}

}  // namespace respec::cli::cmd
