#include "./source_layout.hpp"

#include <respec/config/build_config.hpp>
#include <respec/error/errors.hpp>
#include <respec/error/on_error.hpp>

#include <algorithm>

using namespace respec;

std::string_view respec::url_basename(std::string_view url) noexcept {
    auto slash = url.rfind('/');
    return slash == url.npos ? url : url.substr(slash + 1);
}

std::string respec::synthesized_prefix(std::string_view url) {
    auto base = url_basename(url);
    auto dot  = base.rfind('.');
    if (dot == base.npos || dot == 0) {
        return std::string(base);
    }
    return std::string(base.substr(0, dot));
}

source_layout::source_layout(const build_config& cfg)
    : _main_url(cfg.url) {
    std::vector<std::string> sorted;
    for (auto& v : cfg.versions) {
        sorted.push_back(v.url);
    }
    sorted.insert(sorted.end(), cfg.units.begin(), cfg.units.end());
    for (auto& a : cfg.archives) {
        sorted.push_back(a.url);
    }
    sorted.insert(sorted.end(), cfg.godep_sources.begin(), cfg.godep_sources.end());
    std::ranges::sort(sorted);
    _numbered = std::move(sorted);
    for (auto& extra : cfg.extra_sources) {
        _numbered.push_back(extra.file);
    }
}

void source_layout::record(std::string_view url, std::string prefix, bool synthesized) {
    _entries.insert_or_assign(std::string(url), layout_entry{std::move(prefix), synthesized});
}

bool source_layout::contains(std::string_view url) const noexcept {
    return _entries.find(url) != _entries.end();
}

const layout_entry& source_layout::entry_of(std::string_view url) const {
    auto it = _entries.find(url);
    if (it == _entries.end()) {
        RESPEC_E_SCOPE(e_source_url{std::string(url)});
        throw_precondition_error<errc::missing_source_layout>(
            "No extraction directory was recorded for [{}]", url);
    }
    return it->second;
}

int source_layout::index_of(std::string_view url) const {
    if (url == _main_url) {
        return 0;
    }
    auto it = std::ranges::find(_numbered, url);
    if (it == _numbered.end()) {
        RESPEC_E_SCOPE(e_source_url{std::string(url)});
        throw_precondition_error<errc::missing_source_layout>("[{}] is not a numbered source",
                                                              url);
    }
    return static_cast<int>(std::distance(_numbered.begin(), it)) + 1;
}
