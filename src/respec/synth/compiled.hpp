#pragma once

#include "./context.hpp"
#include "./emit.hpp"

#include <string>
#include <string_view>

namespace respec {

/**
 * @brief The invocations that make up a configure/make/install style build system.
 *
 * Each command function returns the default text for one variant; a user override for the
 * step replaces it. A null command is a step the build system does not have.
 */
struct compiled_family {
    using command_fn = std::string (*)(const synth_context&, variant, bool use_phase);
    using install_fn = std::string (*)(const synth_context&, variant);

    tree_layout layout       = tree_layout::in_tree;
    bool        export_epoch = true;

    /// Override name of the configure step: "configure" or "cmake"
    std::string_view configure_step = "configure";
    command_fn       configure      = nullptr;
    command_fn       make           = nullptr;
    install_fn       install        = nullptr;

    /// Cleanup between the PGO phases when `custom_clean_pgo` is not set
    std::string_view pgo_clean = "make clean || :";

    bool check_in_subdir = false;
};

/**
 * @brief Write a complete recipe body for a build system described by `family`, one block
 * per planned variant in %build and in %install.
 */
void compose_compiled(const synth_context& ctx, const compiled_family& family);

}  // namespace respec
