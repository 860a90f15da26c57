#include "./converge.hpp"

#include "./log_archive.hpp"

#include <respec/error/errors.hpp>
#include <respec/recipe/pgo.hpp>
#include <respec/synth/plan.hpp>
#include <respec/synth/synthesize.hpp>
#include <respec/util/fs/io.hpp>
#include <respec/util/log.hpp>
#include <respec/util/signal.hpp>
#include <respec/util/time.hpp>

#include <fmt/core.h>

using namespace respec;

std::filesystem::path convergence_driver::recipe_path() const {
    return _opts.target_dir / fmt::format("{}.spec", _pkg.config.name);
}

void convergence_driver::_write_recipe() const {
    auto stream = synthesize(_pkg.kind, _pkg.config);
    write_file(recipe_path(), stream.render());
    respec_log(debug, "Wrote recipe {}", recipe_path().string());
}

bool convergence_driver::_advance_pgo_phase() {
    auto& cfg  = _pkg.config;
    auto  plan = plan_build(_pkg.kind, cfg);
    if (plan.mode != pgo_mode::externally_phased) {
        return false;
    }
    // Only the trees the recipe actually ran a generate phase in leave a marker behind
    bool generated = false;
    for (auto& step : plan.build) {
        if (step.stage != pgo_stage::generate) {
            continue;
        }
        generated   = true;
        auto marker = pgo_marker_path(_pkg.kind, cfg, step.var);
        if (!_sandbox.has_build_file(marker)) {
            throw_precondition_error<errc::pgo_marker_missing>(
                "The profile generate phase succeeded, but its marker [{}] is not in the build "
                "tree",
                marker.string());
        }
    }
    if (!generated) {
        return false;
    }
    respec_log(info, "Profile data generated. Switching to the profile use phase.");
    cfg.set_flag("altflags_pgo_ext_phase", true);
    return true;
}

convergence_outcome convergence_driver::run(const round_callback& on_round) {
    convergence_outcome state;
    _write_recipe();
    while (true) {
        ++state.round;
        state.must_restart = 0;
        cancellation_point();
        respec_log(info, "Convergence round {} for {}", state.round, _pkg.config.name);
        stopwatch round_time;

        auto result   = _sandbox.build(recipe_path(), state.round);
        state.success = result.success;
        for (auto& file : result.stray_files) {
            if (_classifier.classify(file, _pkg.config)) {
                ++state.must_restart;
            }
        }
        if (result.success && _advance_pgo_phase()) {
            ++state.must_restart;
        }
        _write_recipe();
        respec_log(info,
                   "Round {} took {}, {} change(s) to the configuration",
                   state.round,
                   format_duration(round_time.elapsed()),
                   state.must_restart);

        if (on_round) {
            on_round(state);
        }
        if (state.round > _opts.max_rounds) {
            respec_log(error,
                       "{} did not converge within {} rounds",
                       _pkg.config.name,
                       _opts.max_rounds);
            state.success          = false;
            state.budget_exhausted = true;
            break;
        }
        if (state.must_restart == 0) {
            break;
        }
        archive_round_logs(_opts.results_dir, state.round);
    }
    respec_log(info,
               "{} finished after {} round(s): {}",
               _pkg.config.name,
               state.round,
               state.success ? "success" : "failure");
    return state;
}
