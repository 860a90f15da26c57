#include "./synthesize.hpp"

#include "./composers.hpp"
#include "./prep.hpp"

#include <respec/config/build_config.hpp>
#include <respec/recipe/pgo.hpp>
#include <respec/recipe/source_layout.hpp>
#include <respec/util/log.hpp>

#include <fmt/core.h>

#include <algorithm>

using namespace respec;

namespace {

void write_preamble(const synth_context& ctx) {
    auto& cfg = ctx.cfg;
    auto& out = ctx.out;
    out.write_strip("#");
    out.write_strip("# This file is auto-generated. DO NOT EDIT");
    out.write_strip("# Generated by: respec");
    out.write_strip("#");
    if (cfg.flag("keepstatic")) {
        out.write_strip("%define keepstatic 1");
    }
    if (cfg.flag("keepbuildroot")) {
        out.write_strip("%define keepbuildroot 1");
        out.write_strip("%define __spec_install_pre %{___build_pre} %{nil}");
    }
    out.write_strip(fmt::format("Name     : {}", cfg.name));
    out.write_strip(fmt::format("Version  : {}", cfg.version));
    out.write_strip(fmt::format("Release  : {}", cfg.release));
    out.write_strip(fmt::format("URL      : {}", cfg.url));
    if (ctx.kind != build_system_kind::godep) {
        out.write_strip(fmt::format("Source0  : {}", cfg.url));
    }
    auto& sources = ctx.layout.numbered_sources();
    for (std::size_t n = 0; n < sources.size(); ++n) {
        out.write_strip(fmt::format("Source{}  : {}", n + 1, sources[n]));
    }
    int patch_number = 1;
    auto write_patch = [&](const std::string& patch) {
        auto name = patch.substr(0, patch.find_first_of(" \t"));
        out.write_strip(fmt::format("Patch{}   : {}", patch_number++, name));
    };
    std::ranges::for_each(cfg.patches, write_patch);
    for (auto& [url, patches] : cfg.version_patches) {
        std::ranges::for_each(patches, write_patch);
    }
    if (cfg.flag("nodebug")) {
        out.write_strip("%define debug_package %{nil}");
    }
    if (cfg.flag("nostrip")) {
        out.write_strip("%define __strip /bin/true");
    }
    out.write_strip("");
}

}  // namespace

composer_fn respec::composer_for(build_system_kind kind) noexcept {
    using bs = build_system_kind;
    switch (kind) {
    case bs::make:
        return compose_make;
    case bs::configure:
        return compose_configure;
    case bs::configure_ac:
        return compose_configure_ac;
    case bs::autogen:
        return compose_autogen;
    case bs::cmake:
        return compose_cmake;
    case bs::meson:
        return compose_meson;
    case bs::scons:
        return compose_scons;
    case bs::waf:
        return compose_waf;
    case bs::qmake:
        return compose_qmake;
    case bs::cargo:
        return compose_cargo;
    case bs::golang:
        return compose_golang;
    case bs::godep:
        return compose_godep;
    case bs::ruby:
        return compose_ruby;
    case bs::cpan:
        return compose_cpan;
    case bs::distutils3:
        return compose_distutils3;
    case bs::distutils36:
        return compose_distutils36;
    case bs::pyproject:
        return compose_pyproject;
    case bs::R:
        return compose_R;
    case bs::buildtcl_script:
        return compose_buildtcl_script;
    case bs::buildtcl_configure:
        return compose_buildtcl_configure;
    case bs::phpize:
        return compose_phpize;
    case bs::nginx:
        return compose_nginx;
    }
    return compose_make;
}

directive_stream
respec::synthesize(build_system_kind kind, const build_config& cfg, source_layout& layout) {
    directive_stream out;
    synth_context    ctx{kind, cfg, layout, out, plan_build(kind, cfg)};
    respec_log(debug,
               "Synthesizing {} recipe for {} ({} build blocks, {} install blocks)",
               build_system_name(kind),
               cfg.name,
               ctx.plan.build.size(),
               ctx.plan.install.size());
    write_preamble(ctx);
    composer_for(kind)(ctx);
    return out;
}

directive_stream respec::synthesize(build_system_kind kind, const build_config& cfg) {
    source_layout layout{cfg};
    return synthesize(kind, cfg, layout);
}

std::filesystem::path
respec::pgo_marker_path(build_system_kind kind, const build_config& cfg, variant v) {
    std::filesystem::path ret = main_tree_dir(kind, cfg);
    if (kind == build_system_kind::cargo) {
        return ret / pgo_marker::primary;
    }
    if (kind != build_system_kind::cmake && v != variant::default64) {
        // Copy-tree build systems build each variant in a sibling of the main tree
        ret = std::filesystem::path(traits_of(v).tree_dir);
    }
    if (!cfg.subdir.empty()) {
        ret /= cfg.subdir;
    }
    if (kind == build_system_kind::cmake) {
        ret /= traits_of(v).cmake_dir;
    }
    return ret / marker_for(v);
}
