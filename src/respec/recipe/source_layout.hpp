#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace respec {

struct build_config;

struct e_source_url {
    std::string value;
};

/// Where one source URL was extracted to.
struct layout_entry {
    std::string prefix;
    /// True if the archive had no top-level directory and the prefix was made up.
    bool synthesized = false;
};

/**
 * @brief Tracks the directory each source archive is unpacked into, and each source's
 * `SourceN` number.
 *
 * Numbering is fixed at construction. Extraction directories are recorded while %prep is
 * written; every later lookup of an unrecorded URL is a broken precondition.
 */
class source_layout {
public:
    explicit source_layout(const build_config& cfg);

    void record(std::string_view url, std::string prefix, bool synthesized);

    [[nodiscard]] bool                contains(std::string_view url) const noexcept;
    [[nodiscard]] const layout_entry& entry_of(std::string_view url) const;
    [[nodiscard]] const std::string&  dir_of(std::string_view url) const {
        return entry_of(url).prefix;
    }

    /// The directory of the main (Source0) tree.
    [[nodiscard]] const std::string& main_dir() const { return dir_of(_main_url); }
    [[nodiscard]] const std::string& main_url() const noexcept { return _main_url; }

    /// The `N` in `%{SOURCEN}` for the given URL.
    [[nodiscard]] int index_of(std::string_view url) const;

    /// Sources numbered from 1, in `SourceN` order.
    [[nodiscard]] const std::vector<std::string>& numbered_sources() const noexcept {
        return _numbered;
    }

private:
    std::string                                      _main_url;
    std::map<std::string, layout_entry, std::less<>> _entries;
    std::vector<std::string>                         _numbered;
};

/// Make up an extraction directory from an archive's file name, dropping its last extension.
std::string synthesized_prefix(std::string_view url);

/// The final path component of a URL or path.
std::string_view url_basename(std::string_view url) noexcept;

}  // namespace respec
