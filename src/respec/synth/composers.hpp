#pragma once

#include "./context.hpp"

namespace respec {

/// Writes the %prep, %build, %check and %install sections for one build system.
using composer_fn = void (*)(const synth_context&);

composer_fn composer_for(build_system_kind kind) noexcept;

void compose_make(const synth_context&);
void compose_configure(const synth_context&);
void compose_configure_ac(const synth_context&);
void compose_autogen(const synth_context&);
void compose_cmake(const synth_context&);
void compose_meson(const synth_context&);
void compose_scons(const synth_context&);
void compose_waf(const synth_context&);
void compose_qmake(const synth_context&);
void compose_golang(const synth_context&);
void compose_ruby(const synth_context&);
void compose_cpan(const synth_context&);
void compose_R(const synth_context&);
void compose_buildtcl_script(const synth_context&);
void compose_buildtcl_configure(const synth_context&);
void compose_phpize(const synth_context&);
void compose_nginx(const synth_context&);

// Build systems with their own section structure
void compose_cargo(const synth_context&);
void compose_godep(const synth_context&);
void compose_distutils3(const synth_context&);
void compose_distutils36(const synth_context&);
void compose_pyproject(const synth_context&);

}  // namespace respec
