#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace respec {

inline namespace string_utils {

inline std::string_view trim_view(std::string_view s) {
    auto first = s.find_first_not_of(" \t\r\n\f\v");
    if (first == s.npos) {
        return s.substr(0, 0);
    }
    auto last = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(first, last - first + 1);
}

inline std::string trim(std::string_view s) { return std::string(trim_view(s)); }

inline bool ends_with(std::string_view s, std::string_view key) { return s.ends_with(key); }

inline bool starts_with(std::string_view s, std::string_view key) { return s.starts_with(key); }

inline bool contains(std::string_view s, std::string_view key) { return s.find(key) != s.npos; }

inline std::vector<std::string> split(std::string_view str, std::string_view sep) {
    std::vector<std::string>    ret;
    std::string_view::size_type prev_pos = 0;
    auto                        pos      = prev_pos;
    while ((pos = str.find(sep, prev_pos)) != str.npos) {
        ret.emplace_back(str.substr(prev_pos, pos - prev_pos));
        prev_pos = pos + sep.length();
    }
    ret.emplace_back(str.substr(prev_pos));
    return ret;
}

/// Split on newlines, dropping a single trailing empty line.
inline std::vector<std::string> split_lines(std::string_view str) {
    auto lines = split(str, "\n");
    if (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }
    return lines;
}

inline std::string replace(std::string_view str, std::string_view key, std::string_view repl) {
    std::string ret;
    while (!key.empty()) {
        auto pos = str.find(key);
        if (pos == str.npos) {
            break;
        }
        ret.append(str.substr(0, pos));
        ret.append(repl);
        str.remove_prefix(pos + key.size());
    }
    ret.append(str);
    return ret;
}

/// Split on runs of blanks, as a shell splits an unquoted option string.
inline std::vector<std::string> split_words(std::string_view str) {
    std::vector<std::string> ret;
    while (true) {
        auto first = str.find_first_not_of(" \t");
        if (first == str.npos) {
            break;
        }
        str.remove_prefix(first);
        auto end = std::min(str.find_first_of(" \t"), str.size());
        ret.emplace_back(str.substr(0, end));
        str.remove_prefix(end);
    }
    return ret;
}

template <typename Range>
std::string joinstr(std::string_view joiner, Range&& rng) {
    std::string ret;
    bool        first = true;
    for (const auto& item : rng) {
        if (!first) {
            ret.append(joiner);
        }
        first = false;
        ret.append(item);
    }
    return ret;
}

}  // namespace string_utils

}  // namespace respec
