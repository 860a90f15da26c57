#pragma once

#include "./sandbox.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace respec {

struct mock_options {
    /// Value passed with `mock -r`.
    std::string config = "clear";
    /// Extra whitespace-separated arguments passed to every mock invocation.
    std::string extra_opts;
    /// Directory holding the recipe and its sources. Mock writes its output to `results/` here.
    std::filesystem::path target_dir;
    /// Suffix that gives this package its own chroot.
    std::string uniqueext;

    std::optional<std::chrono::milliseconds> timeout = std::nullopt;
};

/**
 * @brief Extract the paths listed under rpmbuild's "Installed (but unpackaged) file(s) found"
 * report in a build log.
 */
std::vector<std::string> parse_unpackaged_files(std::string_view build_log);

/**
 * @brief Builds recipes in a mock chroot: first the source package, then the binary packages
 * from it.
 */
class mock_builder : public sandbox_builder {
    mock_options _opts;

    std::vector<std::string> _base_command() const;

public:
    explicit mock_builder(mock_options opts)
        : _opts(std::move(opts)) {}

    auto& options() const noexcept { return _opts; }
    std::filesystem::path results_dir() const { return _opts.target_dir / "results"; }
    /// The chroot's %{_builddir}.
    std::filesystem::path build_root() const;

    sandbox_result build(const std::filesystem::path& recipe, int round) override;
    bool           has_build_file(const std::filesystem::path& relpath) const override;
};

}  // namespace respec
