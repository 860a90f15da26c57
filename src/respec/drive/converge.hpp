#pragma once

#include "./classify.hpp"
#include "./sandbox.hpp"

#include <respec/config/load.hpp>

#include <filesystem>
#include <functional>

namespace respec {

struct e_build_target_dir {
    std::filesystem::path value;
};

/// The state of the driver after a round.
struct convergence_outcome {
    bool success      = false;
    int  round        = 0;
    int  must_restart = 0;
    /// Set when the loop stopped because the round budget ran out.
    bool budget_exhausted = false;
};

struct convergence_options {
    std::filesystem::path target_dir;
    /// Where the sandbox leaves its logs. Each round's logs are archived here.
    std::filesystem::path results_dir;
    int                   max_rounds = 20;
};

/**
 * @brief Rebuilds a package until a round needs no restart or the round budget is spent.
 *
 * Each round builds the current recipe in the sandbox, feeds unexpected files to the
 * classifier, advances an externally phased PGO build to its use phase, and rewrites the
 * recipe. A round that changed nothing ends the run with that round's build result. Once the
 * round counter passes `max_rounds` the run ends as a failure.
 *
 * The driver owns the package configuration for the duration of the run. Only the driver
 * mutates it.
 */
class convergence_driver {
public:
    using round_callback = std::function<void(const convergence_outcome&)>;

private:
    package_config      _pkg;
    sandbox_builder&    _sandbox;
    file_classifier&    _classifier;
    convergence_options _opts;

    void _write_recipe() const;
    bool _advance_pgo_phase();

public:
    convergence_driver(package_config       pkg,
                       sandbox_builder&     sandbox,
                       file_classifier&     classifier,
                       convergence_options opts)
        : _pkg(std::move(pkg))
        , _sandbox(sandbox)
        , _classifier(classifier)
        , _opts(std::move(opts)) {}

    convergence_outcome run(const round_callback& on_round = {});

    const package_config& config() const noexcept { return _pkg; }
    std::filesystem::path recipe_path() const;
};

}  // namespace respec
