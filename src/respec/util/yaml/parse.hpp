#pragma once

#include <yaml-cpp/node/node.h>

#include <filesystem>

namespace respec {

/**
 * Load a YAML document from disk. Syntax errors are rethrown with e_yaml_parse_error and
 * e_yaml_mark attached, inside an e_parse_yaml_file_path scope.
 */
YAML::Node parse_yaml_file(const std::filesystem::path&);

}  // namespace respec
