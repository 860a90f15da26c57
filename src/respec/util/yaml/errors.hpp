#pragma once

#include <filesystem>
#include <string>

namespace respec {

struct e_parse_yaml_file_path {
    std::filesystem::path value;
};

/// The parser's message, without the position prefix yaml-cpp adds to what().
struct e_yaml_parse_error {
    std::string value;
};

/// One-based position of a YAML syntax error.
struct e_yaml_mark {
    int line;
    int column;
};

/// The dotted key path of a YAML node that failed validation, e.g. "options.altflags_pgo".
struct e_yaml_key {
    std::string value;
};

}  // namespace respec
