#include "./plan.hpp"

#include <respec/config/build_config.hpp>

#include <algorithm>

using namespace respec;

bool respec::supports_variant(build_system_kind kind, variant v) noexcept {
    using bs = build_system_kind;
    if (v == variant::default64) {
        return true;
    }
    switch (kind) {
    case bs::make:
    case bs::configure:
    case bs::configure_ac:
    case bs::autogen:
    case bs::cmake:
        return true;
    case bs::meson:
    case bs::waf:
        return v == variant::thirty_two_bit || v == variant::avx512 || v == variant::avx2
            || v == variant::special;
    case bs::qmake:
        return v == variant::avx2 || v == variant::special;
    case bs::buildtcl_script:
    case bs::buildtcl_configure:
        return v == variant::thirty_two_bit || v == variant::special || v == variant::special2;
    case bs::distutils3:
    case bs::pyproject:
        return v == variant::avx2;
    case bs::scons:
    case bs::cargo:
    case bs::golang:
    case bs::godep:
    case bs::ruby:
    case bs::cpan:
    case bs::distutils36:
    case bs::R:
    case bs::phpize:
    case bs::nginx:
        return false;
    }
    return false;
}

bool respec::supports_pgo(build_system_kind kind) noexcept {
    using bs = build_system_kind;
    switch (kind) {
    case bs::make:
    case bs::configure:
    case bs::configure_ac:
    case bs::autogen:
    case bs::cmake:
    case bs::meson:
    case bs::waf:
    case bs::cargo:
        return true;
    case bs::scons:
    case bs::qmake:
    case bs::golang:
    case bs::godep:
    case bs::ruby:
    case bs::cpan:
    case bs::distutils3:
    case bs::distutils36:
    case bs::pyproject:
    case bs::R:
    case bs::buildtcl_script:
    case bs::buildtcl_configure:
    case bs::phpize:
    case bs::nginx:
        return false;
    }
    return false;
}

build_plan respec::plan_build(build_system_kind kind, const build_config& cfg) {
    build_plan plan;
    plan.mode = supports_pgo(kind) ? resolve_pgo_mode(kind, cfg) : pgo_mode::none;

    std::vector<variant> enabled;
    std::ranges::copy_if(expand(cfg), std::back_inserter(enabled), [&](variant v) {
        return supports_variant(kind, v);
    });

    auto to_step = [&](variant v) { return build_step{v, stage_for(plan.mode, v, cfg)}; };
    std::ranges::transform(build_order(enabled), std::back_inserter(plan.build), to_step);
    std::ranges::transform(enabled, std::back_inserter(plan.install), to_step);
    return plan;
}
