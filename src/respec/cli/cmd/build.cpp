#include "../options.hpp"

#include <respec/config/load.hpp>
#include <respec/drive/classify.hpp>
#include <respec/drive/converge.hpp>
#include <respec/drive/mock.hpp>
#include <respec/error/errors.hpp>
#include <respec/error/on_error.hpp>
#include <respec/util/log.hpp>

namespace respec::cli::cmd {

int build(const options& opts) {
    auto pkg = load_package_config(opts.config_path);
    RESPEC_E_SCOPE(e_build_target_dir{opts.build.target_dir});
    std::filesystem::create_directories(opts.build.target_dir);

    mock_builder sandbox{mock_options{
        .config     = opts.build.mock_config,
        .extra_opts = opts.build.mock_opts,
        .target_dir = opts.build.target_dir,
        .uniqueext  = pkg.config.name,
    }};
    std::filesystem::create_directories(sandbox.results_dir());
    log::mirror_to_file(sandbox.results_dir() / "respec.log");
    exclude_classifier classifier;
    auto               name = pkg.config.name;
    convergence_driver driver{std::move(pkg),
                              sandbox,
                              classifier,
                              {
                                  .target_dir  = opts.build.target_dir,
                                  .results_dir = sandbox.results_dir(),
                                  .max_rounds  = opts.build.max_rounds,
                              }};
    auto outcome = driver.run([](const convergence_outcome& o) {
        respec_log(debug,
                   "Round {} done: success={}, must_restart={}",
                   o.round,
                   o.success,
                   o.must_restart);
    });

    if (outcome.budget_exhausted) {
        throw_user_error<errc::round_budget_exhausted>(
            "{} was still changing after {} rounds. Giving up.",
            name,
            opts.build.max_rounds);
    }
    if (!outcome.success) {
        throw_user_error<errc::sandbox_build_failed>("Build of {} failed in round {}",
                                                     name,
                                                     outcome.round);
    }
    respec_log(info, "{} built successfully in {} round(s)", name, outcome.round);
    return 0;
}

}  // namespace respec::cli::cmd
