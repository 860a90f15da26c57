#include "./composers.hpp"
#include "./emit.hpp"
#include "./prep.hpp"

#include <respec/config/build_config.hpp>

#include <fmt/core.h>

using namespace respec;

namespace {

constexpr std::string_view bolt_marker = "statusbolt";

std::string cargo_install_cmd(const synth_context& ctx, bool use_phase) {
    return join_words({"cargo install -Zunstable-options -Zhost-config -Ztarget-applies-to-host "
                       "--jobs 20 -vv --offline --locked --no-track --force --profile release "
                       "--target x86_64-unknown-linux-gnu --path . --root %{buildroot}/usr/",
                       extra_args(ctx.cfg, "configure", variant::default64, use_phase)});
}

void write_cargo_prologue(const synth_context& ctx) {
    write_proxy_exports(ctx);
    ctx.out.write_strip("export LANG=C.UTF-8");
    ctx.out.write_strip(fmt::format("export SOURCE_DATE_EPOCH={}", ctx.cfg.source_date_epoch));
    if (ctx.cfg.flag("asneeded")) {
        ctx.out.write_strip("unset LD_AS_NEEDED");
    }
    write_variables(ctx, variant::default64);
}

void write_generate_phase(const synth_context& ctx) {
    ctx.out.write_strip(fmt::format("if [ ! -f {} ]; then", pgo_marker::primary));
    ctx.out.write_strip("echo PGO Phase 1");
    in_subdir(ctx, [&] {
        ctx.out.write(generate_flag_exports(ctx.kind));
        write_step(ctx,
                   "configure",
                   variant::default64,
                   false,
                   "cargo clean || :\n" + cargo_install_cmd(ctx, false));
        write_profile_payload(ctx, variant::default64);
        write_pgo_clean(ctx, "cargo clean || :");
    });
    ctx.out.write_strip(fmt::format("echo USED > {}", pgo_marker::primary));
    ctx.out.write_strip("fi");
}

void write_use_install(const synth_context& ctx) {
    in_subdir(ctx, [&] {
        ctx.out.write_strip(
            "llvm-profdata merge -o /var/tmp/pgo/rustmerged.profdata /var/tmp/pgo/*.profraw");
        ctx.out.write(use_flag_exports(ctx.kind));
        write_step(ctx, "configure", variant::default64, true, cargo_install_cmd(ctx, true));
    });
}

void write_bolt_phase(const synth_context& ctx) {
    if (!ctx.cfg.flag("altcargo_sample_bolt")) {
        return;
    }
    ctx.out.write_strip(fmt::format("if [ ! -f {} ]; then", bolt_marker));
    ctx.out.write_strip("echo BOLT Phase");
    in_subdir(ctx, [&] {
        ctx.out.write_strip("## profile_payload_bolt start");
        for (auto& line : ctx.cfg.lines("profile_payload_bolt")) {
            ctx.out.write(line);
        }
        ctx.out.write_strip("## profile_payload_bolt end");
    });
    ctx.out.write_strip(fmt::format("echo USED > {}", bolt_marker));
    ctx.out.write_strip("fi");
}

void write_cargo_install(const synth_context& ctx, pgo_stage stage) {
    switch (stage) {
    case pgo_stage::none:
        in_subdir(ctx, [&] {
            write_step(ctx, "install", variant::default64, false, cargo_install_cmd(ctx, false));
        });
        return;
    case pgo_stage::two_phase:
        write_generate_phase(ctx);
        ctx.out.write_strip(fmt::format("if [ -f {} ] && [ ! -f {} ]; then",
                                        pgo_marker::primary,
                                        pgo_marker::cargo_use));
        ctx.out.write_strip("echo PGO Phase 2");
        write_use_install(ctx);
        ctx.out.write_strip(fmt::format("echo USED > {}", pgo_marker::cargo_use));
        ctx.out.write_strip("fi");
        write_bolt_phase(ctx);
        return;
    case pgo_stage::generate:
        write_generate_phase(ctx);
        return;
    case pgo_stage::use:
        ctx.out.write_strip("echo PGO Phase 2");
        write_use_install(ctx);
        return;
    }
}

}  // namespace

/**
 * Cargo builds and installs in one step, so %build only runs a user-supplied make step and
 * every PGO phase lives in %install.
 */
void respec::compose_cargo(const synth_context& ctx) {
    write_prep(ctx, tree_layout::in_tree);

    write_build_prologue(ctx, true);
    write_variables(ctx, variant::default64);
    for (auto& step : ctx.plan.build) {
        ctx.out.begin_block(traits_of(step.var).label);
        ctx.out.write_content_block("build_prepend", ctx.cfg.lines("build_prepend"));
        if (auto name = find_override(ctx.cfg, "make", step.var, false)) {
            ctx.out.write_content_block(*name, ctx.cfg.lines(*name));
        }
        ctx.out.end_block();
    }
    ctx.out.write_content_block("build_append", ctx.cfg.lines("build_append"));
    ctx.out.write_strip("");

    write_check(ctx, true);

    write_install_prologue(ctx, false);
    ctx.out.write_content_block("build_prepend_once", ctx.cfg.lines("build_prepend_once"));
    write_cargo_prologue(ctx);
    for (auto& step : ctx.plan.install) {
        ctx.out.begin_block(traits_of(step.var).label);
        write_cargo_install(ctx, step.stage);
        ctx.out.end_block();
    }
    write_post_install(ctx);
    ctx.out.write_strip("");
}
