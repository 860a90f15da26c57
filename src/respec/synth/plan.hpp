#pragma once

#include <respec/recipe/build_system.hpp>
#include <respec/recipe/pgo.hpp>
#include <respec/recipe/variant.hpp>

#include <vector>

namespace respec {

struct build_config;

/// One variant block, and the PGO work it performs.
struct build_step {
    variant   var;
    pgo_stage stage;

    bool operator==(const build_step&) const = default;
};

/**
 * @brief The decision table for one recipe: which variant blocks are written, in which order,
 * and under which PGO stage.
 *
 * Composers iterate this table. They do not consult the variant or PGO options directly.
 */
struct build_plan {
    pgo_mode                mode = pgo_mode::none;
    std::vector<build_step> build;
    std::vector<build_step> install;
};

/// Whether the build system can produce the given variant.
bool supports_variant(build_system_kind kind, variant v) noexcept;

/// Whether the build system can be built with profile-guided optimization.
bool supports_pgo(build_system_kind kind) noexcept;

build_plan plan_build(build_system_kind kind, const build_config& cfg);

}  // namespace respec
