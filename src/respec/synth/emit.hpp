#pragma once

#include "./context.hpp"

#include <respec/recipe/directive_stream.hpp>

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace respec {

/**
 * @brief Where each variant block runs relative to the main source tree.
 */
enum class tree_layout {
    /// Every variant builds in the main tree (or its subdir).
    in_tree,
    /// Non-default variants build in sibling copies of the tree made during %prep.
    copied_trees,
    /// Every variant builds in its own out-of-tree build directory below the main tree.
    cmake_build_dirs,
};

/// Join the non-empty words with single spaces.
std::string join_words(std::initializer_list<std::string_view> words);

/**
 * @brief The extra arguments for a tool invocation in a variant block.
 *
 * `extra_<tool>` applies to every variant and `extra_<tool><extra-suffix>` to one. In the
 * PGO use phase their `_pgo` forms replace both when either is set.
 */
std::string extra_args(const build_config& cfg, std::string_view tool, variant v, bool use_phase);

/**
 * @brief Find the user-supplied replacement for a default step invocation.
 *
 * Looks up `<step>_macro<suffix>_pgo` (use phase only), then `<step>_macro<suffix>`. Returns
 * the name of the first non-blank list found.
 */
std::optional<std::string>
find_override(const build_config& cfg, std::string_view step, variant v, bool use_phase);

/// Write the override for `step` if there is one, else `default_cmd`.
void write_step(const synth_context& ctx,
                std::string_view     step,
                variant              v,
                bool                 use_phase,
                std::string_view     default_cmd);

/// Write the first of the named line lists that is non-blank, as a content block.
void write_first_block(const synth_context& ctx, std::initializer_list<std::string_view> names);

void write_proxy_exports(const synth_context& ctx);

/// `%build` header and the lines every build section starts with.
void write_build_prologue(const synth_context& ctx, bool export_epoch);

/// Alternate compiler flag blocks for one variant.
void write_variables(const synth_context& ctx, variant v);

/// Toolchain and architecture flag exports for a non-default variant.
void write_arch_exports(const synth_context& ctx, variant v);

/// Lines closing an architecture setup opened by write_arch_exports().
void write_arch_epilogue(const synth_context& ctx, variant v);

/// The `make` (or `ninja`) invocation for a variant. `explicit_flags` passes the flags on the
/// command line, for plain Makefiles that ignore the environment.
std::string make_invocation(const synth_context& ctx,
                            variant              v,
                            bool                 use_phase,
                            bool                 explicit_flags);

/// The make step: static-build and prepend snippets, the invocation (or its override), then the
/// append snippets.
void write_make_step(const synth_context& ctx, variant v, bool use_phase, std::string_view cmd);

/// The profiling workload run between the PGO phases.
void write_profile_payload(const synth_context& ctx, variant v);

/// The cleanup run between the PGO phases: `custom_clean_pgo`, else the given default.
void write_pgo_clean(const synth_context& ctx, std::string_view default_clean);

void write_check(const synth_context& ctx, bool in_subdir);

/// `%install` header, buildroot reset, install_prepend and license files.
void write_install_prologue(const synth_context& ctx, bool export_epoch);

/// The per-variant install_prepend snippet of a non-default variant.
void write_variant_install_prepend(const synth_context& ctx, variant v);

/// Symlink 32-bit pkg-config files into place after a 32-bit install.
void write_pkgconfig_links32(const synth_context& ctx);

/// Installs of loose sources, excludes, install_append, optimized ELF relocation and the
/// language file list.
void write_post_install(const synth_context& ctx);

/**
 * @brief The directories a variant block enters, outermost first.
 *
 * A directory with `create` set is made with `mkdir -p` before entering it.
 */
struct variant_dir {
    std::string path;
    bool        create = false;
};

std::vector<variant_dir>
variant_dirs(const build_config& cfg, tree_layout layout, variant v, bool for_build);

/**
 * @brief Run `fn` with the variant's directories pushed, and pop every one afterward.
 */
template <typename Func>
void in_variant_dir(const synth_context& ctx, tree_layout layout, variant v, bool for_build,
                    Func&& fn) {
    auto dirs = variant_dirs(ctx.cfg, layout, v, for_build);
    for (auto& dir : dirs) {
        if (dir.create) {
            ctx.out.write_strip("mkdir -p " + dir.path);
        }
        ctx.out.write_strip("pushd " + dir.path);
    }
    fn();
    for (std::size_t n = 0; n < dirs.size(); ++n) {
        ctx.out.write_strip("popd");
    }
}

/// Run `fn` with the main source tree's subdir pushed, if there is one.
template <typename Func>
void in_subdir(const synth_context& ctx, Func&& fn) {
    in_variant_dir(ctx, tree_layout::in_tree, variant::default64, false, fn);
}

}  // namespace respec
