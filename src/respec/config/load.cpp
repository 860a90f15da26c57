#include "./load.hpp"

#include <respec/error/errors.hpp>
#include <respec/error/on_error.hpp>
#include <respec/util/yaml/errors.hpp>
#include <respec/util/yaml/parse.hpp>

#include <yaml-cpp/exceptions.h>
#include <yaml-cpp/yaml.h>

using namespace respec;

namespace {

template <typename T>
T scalar_as(const YAML::Node& node, std::string_view key) {
    RESPEC_E_SCOPE(e_yaml_key{std::string(key)});
    if (!node.IsScalar()) {
        throw_user_error<errc::invalid_config>("Expected a scalar value for '{}'", key);
    }
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion& exc) {
        throw_user_error<errc::invalid_config>("Invalid value for '{}': {}", key, exc.what());
    }
}

std::vector<std::string> string_list(const YAML::Node& node, std::string_view key) {
    RESPEC_E_SCOPE(e_yaml_key{std::string(key)});
    std::vector<std::string> ret;
    if (!node || node.IsNull()) {
        return ret;
    }
    if (node.IsScalar()) {
        ret.push_back(node.as<std::string>());
        return ret;
    }
    if (!node.IsSequence()) {
        throw_user_error<errc::invalid_config>("Expected a list of strings for '{}'", key);
    }
    for (const auto& item : node) {
        ret.push_back(scalar_as<std::string>(item, key));
    }
    return ret;
}

std::string opt_string(const YAML::Node& map, const char* key, std::string dflt = {}) {
    auto node = map[key];
    if (!node || node.IsNull()) {
        return dflt;
    }
    return scalar_as<std::string>(node, key);
}

void require_map(const YAML::Node& node, std::string_view key) {
    if (node && !node.IsNull() && !node.IsMap()) {
        RESPEC_E_SCOPE(e_yaml_key{std::string(key)});
        throw_user_error<errc::invalid_config>("Expected a mapping for '{}'", key);
    }
}

void require_seq(const YAML::Node& node, std::string_view key) {
    if (node && !node.IsNull() && !node.IsSequence()) {
        RESPEC_E_SCOPE(e_yaml_key{std::string(key)});
        throw_user_error<errc::invalid_config>("Expected a list for '{}'", key);
    }
}

void load_package_section(const YAML::Node& pkg, package_config& out) {
    require_map(pkg, "package");
    if (!pkg || pkg.IsNull()) {
        throw_user_error<errc::invalid_config>("The configuration has no 'package' section");
    }
    auto& cfg   = out.config;
    cfg.name    = opt_string(pkg, "name");
    cfg.version = opt_string(pkg, "version");
    cfg.release = opt_string(pkg, "release", "1");
    cfg.url     = opt_string(pkg, "url");
    if (cfg.name.empty() || cfg.url.empty()) {
        throw_user_error<errc::invalid_config>("'package.name' and 'package.url' are required");
    }
    auto bs = opt_string(pkg, "build_system");
    if (bs.empty()) {
        throw_user_error<errc::invalid_config>("'package.build_system' is required");
    }
    out.kind       = parse_build_system(bs);
    cfg.subdir     = opt_string(pkg, "subdir");
    cfg.gem_subdir = opt_string(pkg, "gem_subdir");
    cfg.rawname    = opt_string(pkg, "rawname", cfg.name);
    if (auto prefix = pkg["prefix"]; prefix && !prefix.IsNull()) {
        auto p = scalar_as<std::string>(prefix, "package.prefix");
        if (!p.empty()) {
            cfg.prefix = std::move(p);
        }
    }
    if (auto epoch = pkg["source_date_epoch"]; epoch && !epoch.IsNull()) {
        cfg.source_date_epoch = scalar_as<std::int64_t>(epoch, "package.source_date_epoch");
    }
}

void load_sources(const YAML::Node& root, build_config& cfg) {
    auto archives = root["archives"];
    require_seq(archives, "archives");
    for (const auto& item : archives) {
        require_map(item, "archives");
        cfg.archives.push_back(archive_source{
            .url         = opt_string(item, "url"),
            .destination = opt_string(item, "destination"),
            .prefix      = opt_string(item, "prefix"),
        });
    }
    auto versions = root["versions"];
    require_seq(versions, "versions");
    for (const auto& item : versions) {
        require_map(item, "versions");
        cfg.versions.push_back(version_source{
            .url    = opt_string(item, "url"),
            .prefix = opt_string(item, "prefix"),
        });
    }
    auto extras = root["extra_sources"];
    require_seq(extras, "extra_sources");
    for (const auto& item : extras) {
        require_map(item, "extra_sources");
        cfg.extra_sources.push_back(extra_source{
            .file         = opt_string(item, "file"),
            .install_args = opt_string(item, "install"),
        });
    }
    cfg.godep_sources  = string_list(root["godep_sources"], "godep_sources");
    cfg.godep_versions = string_list(root["godep_versions"], "godep_versions");
    cfg.units          = string_list(root["units"], "units");
}

void load_options(const YAML::Node& options, build_config& cfg) {
    require_map(options, "options");
    for (const auto& kv : options) {
        auto key = kv.first.as<std::string>();
        RESPEC_E_SCOPE(e_yaml_key{"options." + key});
        cfg.set_flag(key, scalar_as<bool>(kv.second, key));
    }
}

void load_strings(const YAML::Node& strings, build_config& cfg) {
    require_map(strings, "strings");
    for (const auto& kv : strings) {
        auto key = kv.first.as<std::string>();
        cfg.set_str(key, scalar_as<std::string>(kv.second, "strings." + key));
    }
}

void load_macros(const YAML::Node& macros, build_config& cfg) {
    require_map(macros, "macros");
    for (const auto& kv : macros) {
        auto key = kv.first.as<std::string>();
        cfg.set_lines(key, string_list(kv.second, "macros." + key));
    }
}

void load_lists(const YAML::Node& root, build_config& cfg) {
    cfg.patches         = string_list(root["patches"], "patches");
    cfg.excludes        = string_list(root["excludes"], "excludes");
    cfg.service_restart = string_list(root["service_restart"], "service_restart");
    cfg.locales         = string_list(root["locales"], "locales");
    cfg.pypi_overrides  = string_list(root["pypi_overrides"], "pypi_overrides");
    cfg.tests           = opt_string(root, "tests");

    auto verpatches = root["version_patches"];
    require_map(verpatches, "version_patches");
    for (const auto& kv : verpatches) {
        auto key = kv.first.as<std::string>();
        cfg.version_patches.emplace_back(key, string_list(kv.second, "version_patches." + key));
    }

    auto licenses = root["license_files"];
    require_seq(licenses, "license_files");
    for (const auto& item : licenses) {
        if (item.IsScalar()) {
            auto path = item.as<std::string>();
            cfg.license_files.push_back({path, {}});
        } else {
            require_map(item, "license_files");
            cfg.license_files.push_back(license_file{
                .path = opt_string(item, "path"),
                .hash = opt_string(item, "hash"),
            });
        }
    }
}

}  // namespace

package_config respec::package_config_from_yaml(const YAML::Node& root) {
    if (!root.IsMap()) {
        throw_user_error<errc::invalid_config>("The package configuration must be a mapping");
    }
    package_config ret;
    load_package_section(root["package"], ret);
    load_sources(root, ret.config);
    load_options(root["options"], ret.config);
    load_strings(root["strings"], ret.config);
    load_macros(root["macros"], ret.config);
    load_lists(root, ret.config);
    return ret;
}

package_config respec::load_package_config(const std::filesystem::path& path) {
    RESPEC_E_SCOPE(e_parse_yaml_file_path{path});
    auto root = parse_yaml_file(path);
    return package_config_from_yaml(root);
}
