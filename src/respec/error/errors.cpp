#include "./errors.hpp"

using namespace respec;

std::string_view respec::explanation_of(errc ec) noexcept {
    switch (ec) {
    case errc::unknown_build_system:
        return R"(
The 'build_system' named in the package configuration is not one of the build
systems respec knows how to write a recipe for. Valid names are: make, configure,
configure_ac, autogen, cmake, meson, scons, waf, qmake, cargo, golang, godep, ruby,
cpan, distutils3, distutils36, pyproject, R, buildtcl_script, buildtcl_configure,
phpize, and nginx.
)";
    case errc::missing_source_layout:
        return R"(
A source URL was referenced while writing the recipe, but no extraction directory
was recorded for it. Every source that is unpacked in %prep must be given a layout
entry before any later section refers to it. This is a defect in how the source
layout was constructed, not a transient failure.
)";
    case errc::unknown_option:
        return R"(
The package configuration names an option that respec does not recognize. Check
the spelling against the list of supported options. Misspelled options are
rejected rather than ignored so that they cannot silently change the recipe.
)";
    case errc::invalid_config:
        return R"(
The package configuration file is malformed. Check that each key has the expected
type: booleans under 'options', strings under 'strings', and lists of lines under
'macros'.
)";
    case errc::round_budget_exhausted:
        return R"(
The sandboxed build kept requesting another round and did not settle within the
round budget. The logs of every round are kept under 'results/round<N>-*.log' in
the target directory for inspection.
)";
    case errc::sandbox_build_failed:
        return R"(
The sandboxed build of the recipe failed. Inspect 'results/build.log' and the
archived round logs in the target directory.
)";
    case errc::pgo_marker_missing:
        return R"(
A profile-guided build finished its generate phase, but the marker file recording
that phase was not found in the sandbox. The use phase cannot be trusted without
the generate phase's profile data, so the run was stopped instead of falling back
to a build without profiles.
)";
    case errc::io_failure:
        return R"(
A file could not be read or written.
)";
    case errc::none:
        break;
    }
    return "(Unknown error)";
}

std::string_view respec::default_error_string(errc ec) noexcept {
    switch (ec) {
    case errc::unknown_build_system:
        return "The requested build system is not supported";
    case errc::missing_source_layout:
        return "A source URL has no recorded extraction directory";
    case errc::unknown_option:
        return "Unknown configuration option";
    case errc::invalid_config:
        return "The package configuration is invalid";
    case errc::round_budget_exhausted:
        return "The build did not converge within the round budget";
    case errc::sandbox_build_failed:
        return "The sandboxed build failed";
    case errc::pgo_marker_missing:
        return "The PGO generate phase left no marker in the sandbox";
    case errc::io_failure:
        return "A filesystem operation failed";
    case errc::none:
        break;
    }
    return "Unknown error";
}
