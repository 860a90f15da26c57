#pragma once

#include "./context.hpp"
#include "./emit.hpp"

#include <string>

namespace respec {

/**
 * @brief The directory below %{_builddir} that %prep unpacks the main source into.
 *
 * With an explicit prefix whose basename differs from it, the basename is used and the
 * contents are moved up into it.
 */
std::string main_tree_dir(build_system_kind kind, const build_config& cfg);

/**
 * @brief Write the %prep section, recording each extraction directory in the source layout.
 *
 * For `tree_layout::copied_trees`, every planned non-default variant gets its own copy of the
 * prepared tree.
 */
void write_prep(const synth_context& ctx, tree_layout layout);

}  // namespace respec
