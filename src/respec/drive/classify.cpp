#include "./classify.hpp"

#include <respec/config/build_config.hpp>
#include <respec/util/log.hpp>

#include <algorithm>

using namespace respec;

bool exclude_classifier::classify(std::string_view path, build_config& cfg) {
    if (std::ranges::find(cfg.excludes, path) != cfg.excludes.end()) {
        return false;
    }
    respec_log(info, "Excluding unpackaged file {}", path);
    cfg.excludes.emplace_back(path);
    return true;
}
