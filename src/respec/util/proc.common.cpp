#include "./proc.hpp"

#include <respec/util/string.hpp>

#include <algorithm>
#include <cctype>

using namespace respec;

namespace {

bool is_shell_safe(char c) {
    constexpr std::string_view safe_punct = "@%-+=:,./_";
    return std::isalnum(static_cast<unsigned char>(c)) || safe_punct.find(c) != safe_punct.npos;
}

}  // namespace

std::string respec::quote_argument(std::string_view s) {
    if (!s.empty() && std::ranges::all_of(s, is_shell_safe)) {
        return std::string(s);
    }
    // Single quotes, so a logged mock command can be pasted back into a shell
    return "'" + replace(s, "'", R"('\'')") + "'";
}
