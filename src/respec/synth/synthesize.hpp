#pragma once

#include <respec/recipe/build_system.hpp>
#include <respec/recipe/directive_stream.hpp>
#include <respec/recipe/variant.hpp>

#include <filesystem>

namespace respec {

struct build_config;
class source_layout;

/**
 * @brief Synthesize the complete recipe for a package.
 *
 * Synthesis is a pure function of its inputs: the same configuration always produces an
 * identical stream. The layout is filled in with each source's extraction directory as %prep
 * is written.
 */
directive_stream synthesize(build_system_kind kind, const build_config& cfg, source_layout& layout);

/// Convenience overload that uses a fresh source layout.
directive_stream synthesize(build_system_kind kind, const build_config& cfg);

/**
 * @brief The path, relative to the sandbox's %{_builddir}, of the marker written when the
 * PGO generate phase of variant `v` completes.
 */
std::filesystem::path pgo_marker_path(build_system_kind   kind,
                                      const build_config& cfg,
                                      variant             v = variant::default64);

}  // namespace respec
