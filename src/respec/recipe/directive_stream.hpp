#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace respec {

/**
 * @brief An append-only, sectioned sequence of recipe lines.
 *
 * Lines are grouped into sections (`%prep`, `%build`, `%check`, `%install`, or the unnamed
 * preamble), and within a section into labeled blocks. Labels never appear in the rendered
 * text; they name the variant/phase a block was written for so the structure can be inspected.
 */
class directive_stream {
public:
    struct block {
        std::string              label;
        std::vector<std::string> lines;

        bool operator==(const block&) const = default;
    };

    struct section {
        std::string        name;
        std::vector<block> blocks;

        const block* find_block(std::string_view label) const noexcept;
        /// All lines of the section, in order, excluding the section header.
        std::vector<std::string> all_lines() const;

        bool operator==(const section&) const = default;
    };

    directive_stream();

    /// Start a new section. Its header line is the section name.
    void begin_section(std::string_view name);
    /// Start a labeled block in the current section.
    void begin_block(std::string_view label);
    /// Return to an unlabeled block in the current section.
    void end_block();

    /// Append text verbatim, one line per newline-separated piece.
    void write(std::string_view text);
    /// Append text with surrounding whitespace removed. Blank text appends one empty line.
    void write_strip(std::string_view text);
    /// Append `## <name> content`, the lines, then `## <name> end`. Empty lists write nothing.
    void write_content_block(std::string_view name, const std::vector<std::string>& lines);

    const std::vector<section>& sections() const noexcept { return _sections; }
    const section*              find_section(std::string_view name) const noexcept;

    std::string render() const;

    bool operator==(const directive_stream&) const = default;

private:
    std::vector<section> _sections;

    block& _current() noexcept { return _sections.back().blocks.back(); }
};

}  // namespace respec
