#include "./directive_stream.hpp"

#include <respec/util/string.hpp>

#include <algorithm>

using namespace respec;

directive_stream::directive_stream() { _sections.push_back(section{"", {block{}}}); }

const directive_stream::block*
directive_stream::section::find_block(std::string_view label) const noexcept {
    auto it = std::ranges::find(blocks, label, &block::label);
    return it == blocks.end() ? nullptr : &*it;
}

std::vector<std::string> directive_stream::section::all_lines() const {
    std::vector<std::string> ret;
    for (auto& blk : blocks) {
        ret.insert(ret.end(), blk.lines.begin(), blk.lines.end());
    }
    return ret;
}

void directive_stream::begin_section(std::string_view name) {
    _sections.push_back(section{std::string(name), {block{}}});
}

void directive_stream::begin_block(std::string_view label) {
    _sections.back().blocks.push_back(block{std::string(label), {}});
}

void directive_stream::end_block() { _sections.back().blocks.push_back(block{}); }

void directive_stream::write(std::string_view text) {
    for (auto& line : split_lines(text)) {
        _current().lines.push_back(std::move(line));
    }
}

void directive_stream::write_strip(std::string_view text) {
    auto trimmed = trim_view(text);
    if (trimmed.empty()) {
        _current().lines.emplace_back();
        return;
    }
    write(trimmed);
}

void directive_stream::write_content_block(std::string_view               name,
                                           const std::vector<std::string>& lines) {
    if (lines.empty()) {
        return;
    }
    write_strip("## " + std::string(name) + " content");
    for (auto& line : lines) {
        write(line.empty() ? std::string_view("\n") : std::string_view(line));
    }
    write_strip("## " + std::string(name) + " end");
}

const directive_stream::section*
directive_stream::find_section(std::string_view name) const noexcept {
    auto it = std::ranges::find(_sections, name, &section::name);
    return it == _sections.end() ? nullptr : &*it;
}

std::string directive_stream::render() const {
    std::string out;
    for (auto& sec : _sections) {
        if (!sec.name.empty()) {
            out.append(sec.name);
            out.push_back('\n');
        }
        for (auto& blk : sec.blocks) {
            for (auto& line : blk.lines) {
                out.append(line);
                out.push_back('\n');
            }
        }
    }
    return out;
}
