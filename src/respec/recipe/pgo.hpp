#pragma once

#include "./build_system.hpp"
#include "./variant.hpp"

#include <string_view>

namespace respec {

struct build_config;

/**
 * @brief How profile-guided optimization is carried out, if at all.
 *
 * - `in_process_two_phase`: one recipe holds both phases, guarded by a marker file so a single
 *   sandboxed build runs generate then use.
 * - `externally_phased`: each recipe holds one phase, selected by `altflags_pgo_ext_phase`,
 *   and the convergence driver flips the phase between rounds.
 */
enum class pgo_mode {
    none,
    in_process_two_phase,
    externally_phased,
};

/// The PGO work a single variant block performs.
enum class pgo_stage {
    none,
    /// Both phases, selected at build time by the marker file.
    two_phase,
    /// Only the instrumented, profile-generating phase.
    generate,
    /// Only the profile-consuming phase.
    use,
};

/**
 * @brief Marker files written inside the sandbox build tree.
 *
 * A marker's presence means the generate phase for its build tree completed and its profile
 * data is on disk.
 */
namespace pgo_marker {
inline constexpr std::string_view primary = "statuspgo";
inline constexpr std::string_view special = "statuspgo.special";
inline constexpr std::string_view special2 = "statuspgo.special2";
/// Cargo's second marker, written once the use phase has installed.
inline constexpr std::string_view cargo_use = "statuspgo2";
}  // namespace pgo_marker

/**
 * @brief Decide the PGO mode.
 *
 * The in-process precondition (a profile payload, `altflags_pgo`, and no `fsalt1`) is checked
 * first and wins over the externally phased flags.
 */
pgo_mode resolve_pgo_mode(build_system_kind kind, const build_config& cfg);

/// The stage an externally phased recipe is currently written for.
pgo_stage external_stage(const build_config& cfg);

/// The stage a given variant block runs under the given mode.
pgo_stage stage_for(pgo_mode mode, variant v, const build_config& cfg);

std::string_view marker_for(variant v) noexcept;

/// Flag exports selecting the instrumented (`generate`) or profile-consuming (`use`) toolchain
/// flags. Cargo exports its extended Rust set.
std::string_view generate_flag_exports(build_system_kind kind) noexcept;
std::string_view use_flag_exports(build_system_kind kind) noexcept;

}  // namespace respec
