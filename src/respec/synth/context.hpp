#pragma once

#include "./plan.hpp"

#include <respec/recipe/build_system.hpp>

namespace respec {

struct build_config;
class directive_stream;
class source_layout;

/// Everything a composer reads from, and the stream it appends to.
struct synth_context {
    build_system_kind   kind;
    const build_config& cfg;
    source_layout&      layout;
    directive_stream&   out;
    build_plan          plan;
};

}  // namespace respec
