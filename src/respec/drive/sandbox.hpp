#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace respec {

/// What one sandboxed build of a recipe reported.
struct sandbox_result {
    bool success = false;
    /// Installed files the recipe does not account for.
    std::vector<std::string> stray_files;
};

/**
 * @brief An isolated build environment that builds one recipe per convergence round.
 *
 * A failed build is an ordinary result, never an exception. Implementations throw only when
 * the sandbox itself cannot be run.
 */
class sandbox_builder {
public:
    virtual ~sandbox_builder() = default;

    virtual sandbox_result build(const std::filesystem::path& recipe, int round) = 0;

    /// Whether a file exists in the sandbox's build tree, relative to its %{_builddir}.
    virtual bool has_build_file(const std::filesystem::path& relpath) const = 0;
};

}  // namespace respec
