#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace respec {

/// An auxiliary archive unpacked next to the main source tree during %prep.
struct archive_source {
    std::string url;
    /// Directory below the main tree that receives a copy. Empty or ":"-prefixed means none.
    std::string destination;
    /// The archive's top-level directory. Empty when the archive has none.
    std::string prefix;
};

/// An additional upstream version unpacked with `%setup -b N`.
struct version_source {
    std::string url;
    std::string prefix;
};

/// A loose file shipped as a SourceN and installed with the given `install` arguments.
struct extra_source {
    std::string file;
    std::string install_args;
};

struct license_file {
    std::string path;
    std::string hash;
};

/**
 * @brief The complete, read-only input to recipe synthesis.
 *
 * Boolean options are restricted to the names in known_options(). String options and macro
 * line lists are open-ended: per-variant and per-step names are formed by suffixing a base name.
 */
struct build_config {
    std::string name;
    std::string version;
    std::string release = "1";
    std::string url;
    std::string subdir;
    /// Extraction prefix of the main archive. Unset when the archive has no top-level directory.
    std::optional<std::string> prefix;
    std::string                gem_subdir;
    std::string                rawname;
    std::int64_t               source_date_epoch = 0;

    std::vector<archive_source> archives;
    std::vector<version_source> versions;
    std::vector<std::string>    godep_sources;
    std::vector<std::string>    godep_versions;
    std::vector<std::string>    units;
    std::vector<extra_source>   extra_sources;
    /// Python module names whose requirement pins are relaxed after the build.
    std::vector<std::string> pypi_overrides;

    std::vector<std::string> patches;
    /// Patch lists applied inside additional version trees, keyed by the version's URL.
    std::vector<std::pair<std::string, std::vector<std::string>>> version_patches;

    std::string                 tests;
    std::vector<std::string>    excludes;
    std::vector<license_file>   license_files;
    std::vector<std::string>    service_restart;
    std::vector<std::string>    locales;

    [[nodiscard]] bool flag(std::string_view name) const;
    void               set_flag(std::string_view name, bool value);

    /// Get a string option, falling back to its built-in default (or empty).
    [[nodiscard]] std::string str(std::string_view name) const;
    void                      set_str(std::string_view name, std::string value);

    /// Get a macro line list. Absent lists are empty.
    [[nodiscard]] const std::vector<std::string>& lines(std::string_view name) const;
    /// True if the list exists and its first line is not blank.
    [[nodiscard]] bool has_lines(std::string_view name) const;
    void               set_lines(std::string_view name, std::vector<std::string> lines);

private:
    std::map<std::string, bool, std::less<>>                     _flags;
    std::map<std::string, std::string, std::less<>>              _strings;
    std::map<std::string, std::vector<std::string>, std::less<>> _macros;
};

/// The closed set of boolean option names.
std::span<const std::string_view> known_options() noexcept;

bool is_known_option(std::string_view name) noexcept;

struct e_option_name {
    std::string value;
};

}  // namespace respec
