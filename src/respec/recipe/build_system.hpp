#pragma once

#include <string_view>

namespace respec {

/**
 * @brief The closed set of upstream build systems a recipe can be written for.
 *
 * The enumerator names are the spellings used in package configuration files.
 */
enum class build_system_kind {
    make,
    configure,
    configure_ac,
    autogen,
    cmake,
    meson,
    scons,
    waf,
    qmake,
    cargo,
    golang,
    godep,
    ruby,
    cpan,
    distutils3,
    distutils36,
    pyproject,
    R,
    buildtcl_script,
    buildtcl_configure,
    phpize,
    nginx,
};

/// Parse a build system name. Throws a user error for unknown names.
build_system_kind parse_build_system(std::string_view name);

std::string_view build_system_name(build_system_kind) noexcept;

}  // namespace respec
