#include "./pgo.hpp"

#include <respec/config/build_config.hpp>

using namespace respec;

namespace {

constexpr std::string_view c_generate_flags = R"(export CFLAGS="${CFLAGS_GENERATE}"
export CXXFLAGS="${CXXFLAGS_GENERATE}"
export FFLAGS="${FFLAGS_GENERATE}"
export FCFLAGS="${FCFLAGS_GENERATE}"
export LDFLAGS="${LDFLAGS_GENERATE}"
export ASMFLAGS="${ASMFLAGS_GENERATE}"
export LIBS="${LIBS_GENERATE}")";

constexpr std::string_view c_use_flags = R"(export CFLAGS="${CFLAGS_USE}"
export CXXFLAGS="${CXXFLAGS_USE}"
export FFLAGS="${FFLAGS_USE}"
export FCFLAGS="${FCFLAGS_USE}"
export LDFLAGS="${LDFLAGS_USE}"
export ASMFLAGS="${ASMFLAGS_USE}"
export LIBS="${LIBS_USE}")";

constexpr std::string_view cargo_generate_flags = R"(export CFLAGS="${CFLAGS_GENERATE}"
export CXXFLAGS="${CXXFLAGS_GENERATE}"
export LDFLAGS="${LDFLAGS_GENERATE}"
export CFLAGS_x86_64_unknown_linux_gnu="${CFLAGS_x86_64_unknown_linux_gnu_GENERATE}"
export CXXFLAGS_x86_64_unknown_linux_gnu="${CXXFLAGS_x86_64_unknown_linux_gnu_GENERATE}"
export LDFLAGS_x86_64_unknown_linux_gnu="${LDFLAGS_x86_64_unknown_linux_gnu_GENERATE}"
export CARGO_TARGET_X86_64_UNKNOWN_LINUX_GNU_RUSTFLAGS="${CARGO_TARGET_X86_64_UNKNOWN_LINUX_GNU_RUSTFLAGS_GENERATE}"
export RUSTFLAGS="${RUSTFLAGS_GENERATE}"
export CARGO_HOST_RUSTFLAGS="${CARGO_HOST_RUSTFLAGS_GENERATE}")";

constexpr std::string_view cargo_use_flags = R"(export CFLAGS="${CFLAGS_USE}"
export CXXFLAGS="${CXXFLAGS_USE}"
export LDFLAGS="${LDFLAGS_USE}"
export CFLAGS_x86_64_unknown_linux_gnu="${CFLAGS_x86_64_unknown_linux_gnu_USE}"
export CXXFLAGS_x86_64_unknown_linux_gnu="${CXXFLAGS_x86_64_unknown_linux_gnu_USE}"
export LDFLAGS_x86_64_unknown_linux_gnu="${LDFLAGS_x86_64_unknown_linux_gnu_USE}"
export CARGO_TARGET_X86_64_UNKNOWN_LINUX_GNU_RUSTFLAGS="${CARGO_TARGET_X86_64_UNKNOWN_LINUX_GNU_RUSTFLAGS_USE}"
export RUSTFLAGS="${RUSTFLAGS_USE}"
export CARGO_HOST_RUSTFLAGS="${CARGO_HOST_RUSTFLAGS_USE}")";

}  // namespace

pgo_mode respec::resolve_pgo_mode(build_system_kind kind, const build_config& cfg) {
    const bool fsalt1 = cfg.flag("fsalt1");
    if (cfg.has_lines("profile_payload") && cfg.flag("altflags_pgo") && !fsalt1) {
        return pgo_mode::in_process_two_phase;
    }
    if (kind == build_system_kind::cargo && cfg.flag("altcargo_pgo") && !fsalt1) {
        return pgo_mode::in_process_two_phase;
    }
    if (cfg.flag("altflags_pgo_ext") && !cfg.flag("altflags_pgo") && !fsalt1) {
        return pgo_mode::externally_phased;
    }
    return pgo_mode::none;
}

pgo_stage respec::external_stage(const build_config& cfg) {
    return cfg.flag("altflags_pgo_ext_phase") ? pgo_stage::use : pgo_stage::generate;
}

pgo_stage respec::stage_for(pgo_mode mode, variant v, const build_config& cfg) {
    if (!is_pgo_capable(v)) {
        return pgo_stage::none;
    }
    switch (mode) {
    case pgo_mode::none:
        return pgo_stage::none;
    case pgo_mode::in_process_two_phase:
        return pgo_stage::two_phase;
    case pgo_mode::externally_phased:
        return external_stage(cfg);
    }
    return pgo_stage::none;
}

std::string_view respec::marker_for(variant v) noexcept {
    switch (v) {
    case variant::special:
        return pgo_marker::special;
    case variant::special2:
        return pgo_marker::special2;
    case variant::thirty_two_bit:
    case variant::avx512:
    case variant::avx2:
    case variant::openmpi:
    case variant::default64:
        break;
    }
    return pgo_marker::primary;
}

std::string_view respec::generate_flag_exports(build_system_kind kind) noexcept {
    return kind == build_system_kind::cargo ? cargo_generate_flags : c_generate_flags;
}

std::string_view respec::use_flag_exports(build_system_kind kind) noexcept {
    return kind == build_system_kind::cargo ? cargo_use_flags : c_use_flags;
}
