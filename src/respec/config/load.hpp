#pragma once

#include "./build_config.hpp"

#include <respec/recipe/build_system.hpp>

#include <yaml-cpp/node/node.h>

#include <filesystem>

namespace respec {

/// A package description: which build system to write for, and how.
struct package_config {
    build_system_kind kind = build_system_kind::configure;
    build_config      config;
};

package_config load_package_config(const std::filesystem::path& path);
package_config package_config_from_yaml(const YAML::Node& root);

}  // namespace respec
