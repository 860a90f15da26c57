#include "./compiled.hpp"
#include "./composers.hpp"

#include <respec/config/build_config.hpp>

#include <fmt/core.h>

using namespace respec;

namespace {

constexpr std::string_view autotools_fixups
    = R"(sd -r '\s--dirty\s' ' ' .
sd -r 'git describe' 'git describe --abbrev=0' .
sd --flags mi '^AC_INIT\((.*\n.*\)|.*\))' '$0\nAM_MAINTAINER_MODE([disable])' configure.ac)";

constexpr std::string_view configure_32_args
    = "--libdir=/usr/lib32 --build=i686-generic-linux-gnu --host=i686-generic-linux-gnu "
      "--target=i686-clr-linux-gnu";

std::string configure_extras(const synth_context& ctx, variant v, bool use_phase) {
    return extra_args(ctx.cfg, "configure", v, use_phase);
}

/// `%configure`, `%reconfigure` and `%autogen` share their arguments.
std::string autotools_line(const synth_context& ctx,
                           std::string_view     macro,
                           variant              v,
                           bool                 use_phase) {
    auto extras = configure_extras(ctx, v, use_phase);
    switch (v) {
    case variant::thirty_two_bit:
        return join_words({macro, ctx.cfg.str("disable_static"), extras, configure_32_args});
    case variant::openmpi:
        return join_words({"./configure", ctx.cfg.str("conf_args_openmpi"), extras});
    case variant::avx512:
    case variant::avx2:
    case variant::special:
    case variant::special2:
    case variant::default64:
        break;
    }
    return join_words({macro, ctx.cfg.str("disable_static"), extras});
}

std::string configure_cmd(const synth_context& ctx, variant v, bool use_phase) {
    return autotools_line(ctx, "%configure", v, use_phase);
}

std::string reconfigure_cmd(const synth_context& ctx, variant v, bool use_phase) {
    return fmt::format("{}\n{}", autotools_fixups, autotools_line(ctx, "%reconfigure", v, use_phase));
}

std::string autogen_cmd(const synth_context& ctx, variant v, bool use_phase) {
    auto macro = ctx.cfg.flag("autogen_simple") ? "%autogen_simple" : "%autogen";
    return fmt::format("{}\n{}", autotools_fixups, autotools_line(ctx, macro, v, use_phase));
}

std::string make_cmd(const synth_context& ctx, variant v, bool use_phase) {
    return make_invocation(ctx, v, use_phase, false);
}

/// Plain Makefiles get the flags on the command line as well.
std::string plain_make_cmd(const synth_context& ctx, variant v, bool use_phase) {
    bool explicit_flags = v == variant::default64 && ctx.plan.mode == pgo_mode::none;
    return make_invocation(ctx, v, use_phase, explicit_flags);
}

std::string make_install_macro(const synth_context& ctx, variant v) {
    std::string_view base = ctx.cfg.flag("use_ninja") ? "%ninja_install" : "%make_install";
    std::string_view suffix;
    switch (v) {
    case variant::thirty_two_bit:
        suffix = "32";
        break;
    case variant::avx512:
    case variant::avx2:
    case variant::openmpi:
    case variant::special:
    case variant::special2:
        suffix = traits_of(v).suffix;
        break;
    case variant::default64:
        break;
    }
    return fmt::format("{}{}", base, suffix);
}

std::string make_install_cmd(const synth_context& ctx, variant v) {
    return join_words({make_install_macro(ctx, v), extra_args(ctx.cfg, "make_install", v, false)});
}

std::string cmake_cmd(const synth_context& ctx, variant v, bool use_phase) {
    auto srcdir = ctx.cfg.str("cmake_srcdir");
    auto extras = extra_args(ctx.cfg, "cmake", v, use_phase);
    switch (v) {
    case variant::thirty_two_bit:
        return join_words({"%cmake",
                           srcdir,
                           "-DLIB_INSTALL_DIR:PATH=/usr/lib32 -DCMAKE_INSTALL_LIBDIR=/usr/lib32 "
                           "-DLIB_SUFFIX=32",
                           extras});
    case variant::openmpi:
        return join_words({R"(cmake -G "Unix Makefiles" -DCMAKE_INSTALL_PREFIX=$MPI_ROOT )"
                           "-DCMAKE_INSTALL_LIBDIR=$MPI_LIB -DCMAKE_INSTALL_INCLUDEDIR=$MPI_INCLUDE "
                           "-DLIB_INSTALL_DIR=$MPI_LIB -DBUILD_SHARED_LIBS:BOOL=ON "
                           "-DLIB_SUFFIX=64 -DCMAKE_AR=/usr/bin/gcc-ar "
                           "-DCMAKE_BUILD_TYPE=RelWithDebInfo -DCMAKE_RANLIB=/usr/bin/gcc-ranlib",
                           srcdir,
                           extras});
    case variant::avx512:
    case variant::avx2:
    case variant::special:
    case variant::special2:
    case variant::default64:
        break;
    }
    return join_words({"%cmake", srcdir, extras});
}

std::string cmake_install_cmd(const synth_context& ctx, variant v) {
    auto line = make_install_cmd(ctx, v);
    if (v == variant::avx2 || v == variant::avx512 || v == variant::special
        || v == variant::special2) {
        line += " || :";
    }
    return line;
}

std::string_view meson_libdir(variant v) {
    switch (v) {
    case variant::thirty_two_bit:
        return "lib32";
    case variant::avx2:
        return "lib64/haswell";
    case variant::avx512:
        return "lib64/haswell/avx512_1";
    case variant::openmpi:
    case variant::special:
    case variant::special2:
    case variant::default64:
        break;
    }
    return "lib64";
}

std::string meson_cmd(const synth_context& ctx, variant v, bool use_phase) {
    return join_words({R"(CFLAGS="$CFLAGS" CXXFLAGS="$CXXFLAGS" LDFLAGS="$LDFLAGS" LIBS="$LIBS" meson)",
                       fmt::format("--libdir={}", meson_libdir(v)),
                       "--sysconfdir=/usr/share --prefix=/usr --buildtype=plain "
                       "-Ddefault_library=both",
                       configure_extras(ctx, v, use_phase),
                       "builddir"});
}

std::string ninja_builddir_cmd(const synth_context& ctx, variant, bool) {
    return join_words({"ninja --verbose", ctx.cfg.str("parallel_build"), "-C builddir"});
}

std::string meson_install_cmd(const synth_context&, variant) {
    return "DESTDIR=%{buildroot} ninja -C builddir install";
}

std::string waf_cmd(const synth_context& ctx, variant v, bool use_phase) {
    return fmt::format("sd -r 'allow_unknown=False' 'allow_unknown=True' waflib/ || :\n{} || :",
                       join_words({"%waf --out=builddir", configure_extras(ctx, v, use_phase)}));
}

std::string waf_build_cmd(const synth_context&, variant, bool) {
    return "./waf build --verbose --jobs=20 --out=builddir";
}

std::string waf_install_cmd(const synth_context& ctx, variant v) {
    return join_words({"%waf_install -- --verbose", extra_args(ctx.cfg, "make_install", v, false)});
}

std::string qmake_cmd(const synth_context& ctx, variant v, bool use_phase) {
    auto qmake_args = join_words({ctx.cfg.flag("use_clang") ? "-spec linux-clang" : "",
                                  ctx.cfg.flag("use_lto") ? "-config ltcg" : "",
                                  configure_extras(ctx, v, use_phase)});
    std::string line;
    if (v == variant::avx2 || v == variant::special) {
        line = join_words({"%qmake 'QT_CPU_FEATURES.x86_64 += avx avx2 bmi bmi2 f16c fma lzcnt "
                           "popcnt' \\\n    QMAKE_CFLAGS+=-march=native QMAKE_CXXFLAGS+=-march=native "
                           "\\\n    QMAKE_LFLAGS+=-march=native QMAKE_LFLAGS+=-mtune=native",
                           qmake_args});
    } else {
        line = join_words({"%qmake", qmake_args});
    }
    return line + "\ntest -r config.log && cat config.log";
}

std::string scons_cmd(const synth_context& ctx, variant v, bool use_phase) {
    return join_words({"%scons_config O=3 V=1 VERBOSE=1", configure_extras(ctx, v, use_phase)});
}

std::string scons_build_cmd(const synth_context& ctx, variant v, bool use_phase) {
    return join_words({"scons",
                       ctx.cfg.str("parallel_build"),
                       "O=3 V=1 VERBOSE=1",
                       extra_args(ctx.cfg, "make", v, use_phase)});
}

std::string scons_install_cmd(const synth_context& ctx, variant v) {
    return join_words(
        {"%scons_install O=3 V=1 VERBOSE=1", extra_args(ctx.cfg, "make_install", v, false)});
}

std::string go_build_cmd(const synth_context& ctx, variant v, bool use_phase) {
    auto extras = extra_args(ctx.cfg, "make", v, use_phase);
    if (ctx.cfg.flag("set_gopath")) {
        return fmt::format("export GOPATH=\"$PWD\"\n{}", join_words({"go build", extras}));
    }
    return fmt::format("export GOPROXY=file:///usr/share/goproxy\ngo mod vendor\n{}",
                       join_words({"go build -mod=vendor", extras}));
}

std::string gem_build_cmd(const synth_context& ctx, variant, bool) {
    return fmt::format("gem build {0}.gemspec --output {0}.gem", ctx.cfg.name);
}

std::string gem_install_cmd(const synth_context& ctx, variant) {
    return fmt::format(R"(%global gem_dir $(ruby -e'puts Gem.default_dir')
gem install --verbose --local --force \
  --build-root %{{buildroot}} \
  --install-dir %{{gem_dir}} \
  --bindir %{{_bindir}} \
 {}.gem)",
                       ctx.cfg.name);
}

std::string perl_build_cmd(const synth_context& ctx, variant v, bool use_phase) {
    return fmt::format("if test -f Makefile.PL; then\n%{{__perl}} Makefile.PL\n{}\nelse\n"
                       "%{{__perl}} Build.PL\n./Build\nfi",
                       make_invocation(ctx, v, use_phase, false));
}

std::string perl_install_cmd(const synth_context& ctx, variant v) {
    auto extras = extra_args(ctx.cfg, "make_install", v, false);
    return fmt::format(
        R"(if test -f Makefile.PL; then
{}
else
{}
fi
find %{{buildroot}} -type f -name .packlist -exec rm -f {{}} ';'
find %{{buildroot}} -depth -type d -exec rmdir {{}} 2>/dev/null ';'
find %{{buildroot}} -type f -name '*.bs' -empty -exec rm -f {{}} ';'
%{{_fixperms}} %{{buildroot}}/*)",
        join_words({"make pure_install PERL_INSTALL_ROOT=%{buildroot} INSTALLDIRS=vendor", extras}),
        join_words({"./Build install --installdirs=vendor --destdir=%{buildroot}", extras}));
}

std::string r_install_cmd(const synth_context& ctx, variant) {
    auto lib = fmt::format("%{{buildroot}}/usr/lib64/R/library {}", ctx.cfg.rawname);
    return fmt::format(
        R"(export LANG=C.UTF-8
export CFLAGS="$CFLAGS -O3 -flto -fno-semantic-interposition "
export FCFLAGS="$FFLAGS -O3 -flto -fno-semantic-interposition "
export FFLAGS="$FFLAGS -O3 -flto -fno-semantic-interposition "
export CXXFLAGS="$CXXFLAGS -O3 -flto -fno-semantic-interposition "
export AR=gcc-ar
export RANLIB=gcc-ranlib
export LDFLAGS="$LDFLAGS  -Wl,-z -Wl,relro"
mkdir -p %{{buildroot}}/usr/lib64/R/library

mkdir -p ~/.R
mkdir -p ~/.stash
echo "CFLAGS = $CFLAGS -march=native -mtune=native -ftree-vectorize -mno-vzeroupper " > ~/.R/Makevars
echo "FFLAGS = $FFLAGS -march=native -mtune=native -ftree-vectorize -mno-vzeroupper " >> ~/.R/Makevars
echo "CXXFLAGS = $CXXFLAGS -march=native -mtune=native -ftree-vectorize -mno-vzeroupper " >> ~/.R/Makevars
R CMD INSTALL --install-tests --built-timestamp=${{SOURCE_DATE_EPOCH}} --build  -l {0}
for i in `find %{{buildroot}}/usr/lib64/R/ -name "*.so"`; do mv $i $i.avx2 ; mv $i.avx2 ~/.stash/; done
echo "CFLAGS = $CFLAGS -march=native -mtune=native -ftree-vectorize  -mno-vzeroupper " > ~/.R/Makevars
echo "FFLAGS = $FFLAGS -march=native -mtune=native -ftree-vectorize  -mno-vzeroupper " >> ~/.R/Makevars
echo "CXXFLAGS = $CXXFLAGS -march=native -mtune=native -ftree-vectorize -mno-vzeroupper  " >> ~/.R/Makevars
R CMD INSTALL --preclean --install-tests --no-test-load --built-timestamp=${{SOURCE_DATE_EPOCH}} --build  -l {0}
for i in `find %{{buildroot}}/usr/lib64/R/ -name "*.so"`; do mv $i $i.avx512 ; mv $i.avx512 ~/.stash/; done
echo "CFLAGS = $CFLAGS -ftree-vectorize " > ~/.R/Makevars
echo "FFLAGS = $FFLAGS -ftree-vectorize " >> ~/.R/Makevars
echo "CXXFLAGS = $CXXFLAGS -ftree-vectorize " >> ~/.R/Makevars
R CMD INSTALL --preclean --install-tests --built-timestamp=${{SOURCE_DATE_EPOCH}} --build  -l {0}
cp ~/.stash/* %{{buildroot}}/usr/lib64/R/library/*/libs/ || :
%{{__rm}} -rf %{{buildroot}}%{{_datadir}}/R/library/R.css)",
        lib);
}

std::string tcl_script_cmd(const synth_context& ctx, variant v, bool use_phase) {
    return join_words({"tclsh build.tcl", configure_extras(ctx, v, use_phase)});
}

std::string tcl_script_install_cmd(const synth_context& ctx, variant v) {
    return join_words(
        {"%buildtcl_script_install", extra_args(ctx.cfg, "make_install", v, false)});
}

std::string tcl_configure_cmd(const synth_context& ctx, variant v, bool use_phase) {
    return join_words({"%configure_buildtcl", configure_extras(ctx, v, use_phase)});
}

std::string tcl_configure_install_cmd(const synth_context& ctx, variant v) {
    return join_words(
        {"%buildtcl_configure_install", extra_args(ctx.cfg, "make_install", v, false)});
}

std::string phpize_cmd(const synth_context& ctx, variant v, bool use_phase) {
    return "phpize\n"
        + join_words({"%configure", ctx.cfg.str("disable_static"), configure_extras(ctx, v, use_phase)});
}

std::string plain_make_install_cmd(const synth_context&, variant) { return "%make_install"; }

std::string nginx_configure_cmd(const synth_context&, variant, bool) {
    return "nginx-module configure";
}

std::string nginx_build_cmd(const synth_context&, variant, bool) { return "nginx-module build"; }

std::string nginx_install_cmd(const synth_context&, variant) {
    return "nginx-module install %{buildroot}";
}

constexpr std::string_view cmake_pgo_clean
    = "find . -type f,l -not -name '*.gcno' -not -name 'statuspgo*' -delete -print";

const compiled_family configure_family{
    .layout    = tree_layout::copied_trees,
    .configure = configure_cmd,
    .make      = make_cmd,
    .install   = make_install_cmd,
};

const compiled_family configure_ac_family{
    .layout    = tree_layout::copied_trees,
    .configure = reconfigure_cmd,
    .make      = make_cmd,
    .install   = make_install_cmd,
};

const compiled_family autogen_family{
    .layout    = tree_layout::copied_trees,
    .configure = autogen_cmd,
    .make      = make_cmd,
    .install   = make_install_cmd,
};

const compiled_family make_family{
    .layout  = tree_layout::copied_trees,
    .make    = plain_make_cmd,
    .install = make_install_cmd,
};

const compiled_family cmake_family{
    .layout         = tree_layout::cmake_build_dirs,
    .configure_step = "cmake",
    .configure      = cmake_cmd,
    .make           = make_cmd,
    .install        = cmake_install_cmd,
    .pgo_clean      = cmake_pgo_clean,
};

const compiled_family meson_family{
    .layout    = tree_layout::copied_trees,
    .configure = meson_cmd,
    .make      = ninja_builddir_cmd,
    .install   = meson_install_cmd,
    .pgo_clean = "find builddir/ -type f,l -not -name '*.gcno' -not -name 'statuspgo*' -delete "
                 "-print || :",
};

const compiled_family waf_family{
    .layout    = tree_layout::copied_trees,
    .configure = waf_cmd,
    .make      = waf_build_cmd,
    .install   = waf_install_cmd,
    .pgo_clean = "./waf distclean --verbose || :",
};

const compiled_family qmake_family{
    .layout    = tree_layout::copied_trees,
    .configure = qmake_cmd,
    .make      = make_cmd,
    .install   = make_install_cmd,
};

const compiled_family scons_family{
    .export_epoch = false,
    .configure    = scons_cmd,
    .make         = scons_build_cmd,
    .install      = scons_install_cmd,
};

const compiled_family golang_family{
    .export_epoch = false,
    .make         = go_build_cmd,
};

const compiled_family ruby_family{
    .export_epoch = false,
    .make         = gem_build_cmd,
    .install      = gem_install_cmd,
};

const compiled_family cpan_family{
    .export_epoch = false,
    .make         = perl_build_cmd,
    .install      = perl_install_cmd,
};

const compiled_family R_family{
    .install = r_install_cmd,
};

const compiled_family buildtcl_script_family{
    .layout    = tree_layout::copied_trees,
    .configure = tcl_script_cmd,
    .install   = tcl_script_install_cmd,
};

const compiled_family buildtcl_configure_family{
    .layout    = tree_layout::copied_trees,
    .configure = tcl_configure_cmd,
    .make      = make_cmd,
    .install   = tcl_configure_install_cmd,
};

const compiled_family phpize_family{
    .configure = phpize_cmd,
    .make      = make_cmd,
    .install   = plain_make_install_cmd,
};

const compiled_family nginx_family{
    .export_epoch = false,
    .configure    = nginx_configure_cmd,
    .make         = nginx_build_cmd,
    .install      = nginx_install_cmd,
};

}  // namespace

void respec::compose_make(const synth_context& ctx) { compose_compiled(ctx, make_family); }

void respec::compose_configure(const synth_context& ctx) {
    // autoreconf regenerates the build system before configuring
    if (ctx.cfg.flag("autoreconf")) {
        compose_configure_ac(ctx);
        return;
    }
    compose_compiled(ctx, configure_family);
}

void respec::compose_configure_ac(const synth_context& ctx) {
    compose_compiled(ctx, configure_ac_family);
}

void respec::compose_autogen(const synth_context& ctx) { compose_compiled(ctx, autogen_family); }
void respec::compose_cmake(const synth_context& ctx) { compose_compiled(ctx, cmake_family); }
void respec::compose_meson(const synth_context& ctx) { compose_compiled(ctx, meson_family); }
void respec::compose_scons(const synth_context& ctx) { compose_compiled(ctx, scons_family); }
void respec::compose_waf(const synth_context& ctx) { compose_compiled(ctx, waf_family); }
void respec::compose_qmake(const synth_context& ctx) { compose_compiled(ctx, qmake_family); }
void respec::compose_golang(const synth_context& ctx) { compose_compiled(ctx, golang_family); }
void respec::compose_ruby(const synth_context& ctx) { compose_compiled(ctx, ruby_family); }
void respec::compose_cpan(const synth_context& ctx) { compose_compiled(ctx, cpan_family); }
void respec::compose_R(const synth_context& ctx) { compose_compiled(ctx, R_family); }
void respec::compose_phpize(const synth_context& ctx) { compose_compiled(ctx, phpize_family); }
void respec::compose_nginx(const synth_context& ctx) { compose_compiled(ctx, nginx_family); }

void respec::compose_buildtcl_script(const synth_context& ctx) {
    compose_compiled(ctx, buildtcl_script_family);
}

void respec::compose_buildtcl_configure(const synth_context& ctx) {
    compose_compiled(ctx, buildtcl_configure_family);
}
