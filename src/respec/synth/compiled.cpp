#include "./compiled.hpp"

#include "./prep.hpp"

#include <respec/config/build_config.hpp>

#include <fmt/core.h>

using namespace respec;

namespace {

void write_configure_and_make(const synth_context&   ctx,
                              const compiled_family& family,
                              variant                v,
                              bool                   use_phase) {
    if (family.configure) {
        write_step(ctx, family.configure_step, v, use_phase, family.configure(ctx, v, use_phase));
    }
    if (family.make) {
        write_make_step(ctx, v, use_phase, family.make(ctx, v, use_phase));
    }
}

void write_generate_phase(const synth_context& ctx, const compiled_family& family, variant v) {
    auto marker = marker_for(v);
    ctx.out.write_strip(fmt::format("if [ ! -f {} ]; then", marker));
    ctx.out.write_strip("echo PGO Phase 1");
    ctx.out.write(generate_flag_exports(ctx.kind));
    write_configure_and_make(ctx, family, v, false);
    write_profile_payload(ctx, v);
    write_pgo_clean(ctx, family.pgo_clean);
    ctx.out.write_strip(fmt::format("echo USED > {}", marker));
    ctx.out.write_strip("fi");
}

void write_use_phase(const synth_context& ctx, const compiled_family& family, variant v) {
    ctx.out.write_strip("echo PGO Phase 2");
    ctx.out.write(use_flag_exports(ctx.kind));
    write_configure_and_make(ctx, family, v, true);
}

void write_build_step(const synth_context& ctx, const compiled_family& family, build_step step) {
    switch (step.stage) {
    case pgo_stage::none:
        write_configure_and_make(ctx, family, step.var, false);
        return;
    case pgo_stage::two_phase:
        write_generate_phase(ctx, family, step.var);
        ctx.out.write_strip(fmt::format("if [ -f {} ]; then", marker_for(step.var)));
        write_use_phase(ctx, family, step.var);
        ctx.out.write_strip("fi");
        return;
    case pgo_stage::generate:
        write_generate_phase(ctx, family, step.var);
        return;
    case pgo_stage::use:
        write_use_phase(ctx, family, step.var);
        return;
    }
}

void write_install_flags(const synth_context& ctx, build_step step) {
    switch (step.stage) {
    case pgo_stage::none:
        return;
    case pgo_stage::generate:
        ctx.out.write(generate_flag_exports(ctx.kind));
        return;
    case pgo_stage::two_phase:
    case pgo_stage::use:
        ctx.out.write(use_flag_exports(ctx.kind));
        return;
    }
}

}  // namespace

void respec::compose_compiled(const synth_context& ctx, const compiled_family& family) {
    write_prep(ctx, family.layout);

    write_build_prologue(ctx, family.export_epoch);
    for (auto& step : ctx.plan.build) {
        ctx.out.begin_block(traits_of(step.var).label);
        in_variant_dir(ctx, family.layout, step.var, true, [&] {
            ctx.out.write_content_block("build_prepend", ctx.cfg.lines("build_prepend"));
            if (step.var == variant::thirty_two_bit) {
                ctx.out.write_content_block("build_prepend32", ctx.cfg.lines("build_prepend32"));
            }
            write_variables(ctx, step.var);
            write_arch_exports(ctx, step.var);
            write_build_step(ctx, family, step);
            write_arch_epilogue(ctx, step.var);
        });
        ctx.out.end_block();
        ctx.out.write_strip("");
    }
    ctx.out.write_content_block("build_append", ctx.cfg.lines("build_append"));
    ctx.out.write_strip("");

    write_check(ctx, family.check_in_subdir);

    write_install_prologue(ctx, family.export_epoch);
    for (auto& step : ctx.plan.install) {
        ctx.out.begin_block(traits_of(step.var).label);
        in_variant_dir(ctx, family.layout, step.var, false, [&] {
            write_variables(ctx, step.var);
            write_arch_exports(ctx, step.var);
            write_install_flags(ctx, step);
            write_variant_install_prepend(ctx, step.var);
            write_step(ctx,
                       "install",
                       step.var,
                       false,
                       family.install ? family.install(ctx, step.var) : std::string());
            if (step.var == variant::thirty_two_bit) {
                write_pkgconfig_links32(ctx);
            }
            write_arch_epilogue(ctx, step.var);
        });
        ctx.out.end_block();
    }
    write_post_install(ctx);
    ctx.out.write_strip("");
}
