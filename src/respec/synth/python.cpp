#include "./composers.hpp"
#include "./emit.hpp"
#include "./prep.hpp"

#include <respec/config/build_config.hpp>

#include <fmt/core.h>

using namespace respec;

namespace {

/// x86-64-v3 builds are installed into a separate root and relocated by elf-move.
constexpr std::string_view v3_exports = R"(export CFLAGS="$CFLAGS -m64 -march=x86-64-v3 -Wl,-z,x86-64-v3 "
export CXXFLAGS="$CXXFLAGS -m64 -march=x86-64-v3 -Wl,-z,x86-64-v3 "
export FFLAGS="$FFLAGS -m64 -march=x86-64-v3 -Wl,-z,x86-64-v3 "
export FCFLAGS="$FCFLAGS -m64 -march=x86-64-v3 "
export LDFLAGS="$LDFLAGS -m64 -march=x86-64-v3 ")";

std::string_view buildroot_of(variant v) {
    return v == variant::avx2 ? "%{buildroot}-v3" : "%{buildroot}";
}

struct python_flavor {
    std::string (*build)(const synth_context&, variant);
    std::string (*install)(const synth_context&, variant);
};

std::string setup_py_build(const synth_context& ctx, variant v) {
    auto line
        = join_words({"python3 setup.py build -j 20", extra_args(ctx.cfg, "configure", v, false)});
    if (v != variant::default64) {
        return line;
    }
    return fmt::format(R"sh(if [ ! -f setup.py ]; then
printf "#!/usr/bin/env python\nfrom setuptools import setup\nsetup()" > setup.py
chmod +x setup.py
{0}
else
{0}
fi)sh",
                       line);
}

std::string setup_py_install(const synth_context&, variant v) {
    if (v == variant::avx2) {
        return "python3 -tt setup.py build install --root=%{buildroot}-v3";
    }
    return "python3 -tt setup.py build -j 20 install --root=%{buildroot}";
}

std::string setup_py36_build(const synth_context& ctx, variant v) {
    return join_words(
        {"python3.6 setup.py build -b py3", extra_args(ctx.cfg, "configure", v, false)});
}

std::string setup_py36_install(const synth_context&, variant) {
    return "python3.6 -tt setup.py build -b py3 install --root=%{buildroot} --force";
}

std::string wheel_build(const synth_context& ctx, variant v) {
    return join_words({"python3 -m build --wheel --skip-dependency-check --no-isolation",
                       extra_args(ctx.cfg, "configure", v, false)});
}

std::string wheel_install(const synth_context&, variant v) {
    return fmt::format("pip install --root={} --no-deps --ignore-installed dist/*.whl",
                       buildroot_of(v));
}

void write_dep_fixes(const synth_context& ctx, std::string_view root) {
    for (auto& module : ctx.cfg.pypi_overrides) {
        ctx.out.write_strip(fmt::format("pypi-dep-fix.py {} {}", root, module));
    }
}

void compose_python(const synth_context& ctx, const python_flavor& flavor) {
    write_prep(ctx, tree_layout::copied_trees);

    write_build_prologue(ctx, true);
    write_variables(ctx, variant::default64);
    ctx.out.write_strip("export MAKEFLAGS=%{?_smp_mflags}");
    for (auto& step : ctx.plan.build) {
        ctx.out.begin_block(traits_of(step.var).label);
        in_variant_dir(ctx, tree_layout::copied_trees, step.var, true, [&] {
            ctx.out.write_content_block("build_prepend", ctx.cfg.lines("build_prepend"));
            if (step.var == variant::avx2) {
                ctx.out.write(v3_exports);
            }
            write_dep_fixes(ctx, ".");
            ctx.out.write_content_block("make_prepend", ctx.cfg.lines("make_prepend"));
            write_step(ctx, "make", step.var, false, flavor.build(ctx, step.var));
        });
        ctx.out.end_block();
        ctx.out.write_strip("");
    }
    ctx.out.write_content_block("build_append", ctx.cfg.lines("build_append"));
    ctx.out.write_strip("");

    write_check(ctx, true);

    write_install_prologue(ctx, true);
    ctx.out.write_strip("export MAKEFLAGS=%{?_smp_mflags}");
    for (auto& step : ctx.plan.install) {
        ctx.out.begin_block(traits_of(step.var).label);
        in_variant_dir(ctx, tree_layout::copied_trees, step.var, false, [&] {
            if (step.var == variant::avx2) {
                ctx.out.write(v3_exports);
            }
            write_variant_install_prepend(ctx, step.var);
            write_step(ctx, "install", step.var, false, flavor.install(ctx, step.var));
        });
        if (step.var == variant::default64) {
            write_dep_fixes(ctx, "%{buildroot}");
            ctx.out.write_strip("echo ----[ mark ]----");
            ctx.out.write_strip("cat %{buildroot}/usr/lib/python3*/site-packages/*/requires.txt || :");
            ctx.out.write_strip("echo ----[ mark ]----");
        }
        ctx.out.end_block();
    }
    write_post_install(ctx);
    ctx.out.write_strip("");
}

}  // namespace

void respec::compose_distutils3(const synth_context& ctx) {
    compose_python(ctx, python_flavor{setup_py_build, setup_py_install});
}

void respec::compose_distutils36(const synth_context& ctx) {
    compose_python(ctx, python_flavor{setup_py36_build, setup_py36_install});
}

void respec::compose_pyproject(const synth_context& ctx) {
    compose_python(ctx, python_flavor{wheel_build, wheel_install});
}
