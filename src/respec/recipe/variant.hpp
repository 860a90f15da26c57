#pragma once

#include <array>
#include <string_view>
#include <vector>

namespace respec {

struct build_config;

/// An independently enabled alternate build of the same source.
enum class variant {
    thirty_two_bit,
    avx512,
    avx2,
    openmpi,
    special,
    special2,
    default64,
};

/// The fixed expansion order. Installs follow it; the default build is always last.
inline constexpr std::array<variant, 7> canonical_variant_order = {
    variant::thirty_two_bit,
    variant::avx512,
    variant::avx2,
    variant::openmpi,
    variant::special,
    variant::special2,
    variant::default64,
};

struct variant_traits {
    /// Short name used for block labels, e.g. "avx2"
    std::string_view label;
    /// The boolean option enabling this variant. Empty for the default build.
    std::string_view option;
    /// Suffix for per-variant macro and string names, e.g. "_avx2". Empty for the default build.
    std::string_view suffix;
    /// Suffix for the per-variant extra-flag strings. The default build uses "64".
    std::string_view extra_suffix;
    /// The sibling source tree copied in %prep for copy-tree build systems.
    std::string_view tree_dir;
    /// The out-of-tree build directory for CMake.
    std::string_view cmake_dir;
};

const variant_traits& traits_of(variant) noexcept;

/**
 * @brief Expand the configuration into its enabled variants, in canonical order.
 *
 * `32bit_only` enables the 32-bit build and excludes the default build.
 */
std::vector<variant> expand(const build_config& cfg);

/**
 * @brief The order in which variant blocks are written in %build: the default build first,
 * followed by the other variants in canonical order.
 */
std::vector<variant> build_order(const std::vector<variant>& expanded);

/// Whether a variant is built with profile-guided optimization when PGO is enabled.
constexpr bool is_pgo_capable(variant v) noexcept {
    return v == variant::default64 || v == variant::special || v == variant::special2;
}

}  // namespace respec
