#include "./emit.hpp"

#include <respec/config/build_config.hpp>
#include <respec/recipe/source_layout.hpp>
#include <respec/util/string.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <filesystem>

using namespace respec;

namespace {

constexpr std::string_view library_search_path
    = "/usr/local/nvidia/lib64:/usr/local/nvidia/lib64/gbm:/usr/local/nvidia/lib64/vdpau:"
      "/usr/local/nvidia/lib64/xorg/modules/drivers:/usr/local/nvidia/lib64/xorg/modules/"
      "extensions:/usr/local/cuda/lib64:/usr/lib64/haswell:/usr/lib64/dri:/usr/lib64:/usr/lib:"
      "/aot/intel/oneapi/compiler/latest/linux/compiler/lib/intel64_lin:/aot/intel/oneapi/"
      "compiler/latest/linux/lib:/aot/intel/oneapi/mkl/latest/lib/intel64:/aot/intel/oneapi/tbb/"
      "latest/lib/intel64/gcc4.8:/usr/share:/usr/lib64/wine:/usr/local/nvidia/lib32:"
      "/usr/local/nvidia/lib32/vdpau:/usr/lib32:/usr/lib32/wine";

constexpr std::string_view unset_flags_32 = R"(unset CFLAGS
unset CXXFLAGS
unset FCFLAGS
unset FFLAGS
unset LDFLAGS
unset LINKFLAGS
unset ASFLAGS
unset LD_LIBRARY_PATH
unset LIBRARY_PATH
export PKG_CONFIG_PATH="/usr/lib32/pkgconfig:/usr/share/pkgconfig")";

constexpr std::string_view clang_exports_32 = R"(export CC=clang
export CXX=clang++
unset LD_LIBRARY_PATH
unset LIBRARY_PATH
unset CPATH
unset ASFLAGS
unset CFLAGS
unset CXXFLAGS
unset FCFLAGS
unset FFLAGS
unset LDFLAGS
unset LINKFLAGS
export PKG_CONFIG_PATH="/usr/lib32/pkgconfig:/usr/share/pkgconfig"
export ASFLAGS="--32"
export CFLAGS="-O2 -pipe -march=native -mtune=native -m32 -mstackrealign"
export ASMFLAGS="-O2 -pipe -march=native -mtune=native -m32 -mstackrealign"
export CXXFLAGS="-O2 -fvisibility-inlines-hidden -pipe -march=native -mtune=native -m32 -mstackrealign"
export FCFLAGS="-O2 -fvisibility-inlines-hidden -pipe -march=native -mtune=native -m32 -mstackrealign"
export FFLAGS="-O2 -fvisibility-inlines-hidden -pipe -march=native -mtune=native -m32 -mstackrealign"
export LDFLAGS="-O2 -pipe -march=native -mtune=native -m32 -mstackrealign")";

constexpr std::string_view gcc_exports_32 = R"(export AR=gcc-ar
export RANLIB=gcc-ranlib
export NM=gcc-nm
unset LD_LIBRARY_PATH
unset LIBRARY_PATH
unset CPATH
unset ASFLAGS
unset CFLAGS
unset CXXFLAGS
unset FCFLAGS
unset FFLAGS
unset LDFLAGS
unset LINKFLAGS
export PKG_CONFIG_PATH="/usr/lib32/pkgconfig:/usr/share/pkgconfig"
export ASFLAGS="--32"
export CFLAGS="-O2 -ffat-lto-objects -fuse-linker-plugin -pipe -march=native -mtune=native -m32 -mstackrealign"
export ASMFLAGS="-O2 -ffat-lto-objects -fuse-linker-plugin -pipe -march=native -mtune=native -m32 -mstackrealign"
export CXXFLAGS="-O2 -ffat-lto-objects -fuse-linker-plugin -fvisibility-inlines-hidden -pipe -march=native -mtune=native -m32 -mstackrealign"
export FCFLAGS="-O2 -ffat-lto-objects -fuse-linker-plugin -fvisibility-inlines-hidden -pipe -march=native -mtune=native -m32 -mstackrealign"
export FFLAGS="-O2 -ffat-lto-objects -fuse-linker-plugin -fvisibility-inlines-hidden -pipe -march=native -mtune=native -m32 -mstackrealign"
export LDFLAGS="-O2 -ffat-lto-objects -fuse-linker-plugin -pipe -march=native -mtune=native -m32 -mstackrealign")";

constexpr std::string_view avx2_exports = R"(export CFLAGS="$CFLAGS -m64 -march=native -mtune=native"
export CXXFLAGS="$CXXFLAGS -m64 -march=native -mtune=native"
export FFLAGS="$FFLAGS -m64 -march=native -mtune=native"
export FCFLAGS="$FCFLAGS -m64 -march=native -mtune=native"
export LDFLAGS="$LDFLAGS -m64 -march=native -mtune=native")";

constexpr std::string_view avx512_exports
    = R"(export CFLAGS="$CFLAGS -m64 -march=skylake-avx512 -mprefer-vector-width=256"
export CXXFLAGS="$CXXFLAGS -m64 -march=skylake-avx512 -mprefer-vector-width=256"
export FFLAGS="$FFLAGS -m64 -march=skylake-avx512 -mprefer-vector-width=256"
export FCFLAGS="$FCFLAGS -m64 -march=skylake-avx512 -mprefer-vector-width=256"
export LDFLAGS="$LDFLAGS -m64 -march=skylake-avx512")";

void write_lines_block(const synth_context& ctx, std::string_view name) {
    ctx.out.write_content_block(name, ctx.cfg.lines(name));
}

}  // namespace

std::string respec::join_words(std::initializer_list<std::string_view> words) {
    std::string ret;
    for (auto word : words) {
        word = trim_view(word);
        if (word.empty()) {
            continue;
        }
        if (!ret.empty()) {
            ret.push_back(' ');
        }
        ret.append(word);
    }
    return ret;
}

std::string
respec::extra_args(const build_config& cfg, std::string_view tool, variant v, bool use_phase) {
    auto shared = fmt::format("extra_{}", tool);
    auto own    = fmt::format("{}{}", shared, traits_of(v).extra_suffix);
    if (use_phase) {
        auto shared_pgo = cfg.str(shared + "_pgo");
        auto own_pgo    = cfg.str(own + "_pgo");
        if (!shared_pgo.empty() || !own_pgo.empty()) {
            return join_words({shared_pgo, own_pgo});
        }
    }
    return join_words({cfg.str(shared), cfg.str(own)});
}

std::optional<std::string>
respec::find_override(const build_config& cfg, std::string_view step, variant v, bool use_phase) {
    auto base = fmt::format("{}_macro{}", step, traits_of(v).suffix);
    if (use_phase && cfg.has_lines(base + "_pgo")) {
        return base + "_pgo";
    }
    if (cfg.has_lines(base)) {
        return base;
    }
    return std::nullopt;
}

void respec::write_step(const synth_context& ctx,
                        std::string_view     step,
                        variant              v,
                        bool                 use_phase,
                        std::string_view     default_cmd) {
    if (auto name = find_override(ctx.cfg, step, v, use_phase)) {
        write_lines_block(ctx, *name);
    } else if (!trim_view(default_cmd).empty()) {
        ctx.out.write_strip(default_cmd);
    }
}

void respec::write_first_block(const synth_context&                    ctx,
                               std::initializer_list<std::string_view> names) {
    for (auto name : names) {
        if (ctx.cfg.has_lines(name)) {
            write_lines_block(ctx, name);
            return;
        }
    }
}

void respec::write_proxy_exports(const synth_context& ctx) {
    ctx.out.write_strip("unset http_proxy");
    ctx.out.write_strip("unset https_proxy");
    ctx.out.write_strip("unset no_proxy");
    ctx.out.write_strip("export SSL_CERT_FILE=/var/cache/ca-certs/anchors/ca-certificates.crt");
}

void respec::write_build_prologue(const synth_context& ctx, bool export_epoch) {
    ctx.out.begin_section("%build");
    write_lines_block(ctx, "build_prepend_once");
    write_proxy_exports(ctx);
    ctx.out.write_strip("export LANG=C.UTF-8");
    if (export_epoch) {
        ctx.out.write_strip(fmt::format("export SOURCE_DATE_EPOCH={}", ctx.cfg.source_date_epoch));
    }
    if (ctx.cfg.flag("asneeded")) {
        ctx.out.write_strip("unset LD_AS_NEEDED");
    }
}

void respec::write_variables(const synth_context& ctx, variant v) {
    auto&      cfg          = ctx.cfg;
    const bool fsalt1       = cfg.flag("fsalt1");
    const bool altflags_pgo = cfg.flag("altflags_pgo");
    switch (v) {
    case variant::default64:
        if (fsalt1 && !altflags_pgo) {
            write_first_block(ctx, {"altflags1f", "altflags1"});
        }
        if (!fsalt1 && (altflags_pgo || cfg.flag("altflags_pgo_ext"))) {
            write_first_block(ctx, {"altflags_pgof", "altflags_pgo"});
        }
        if (cfg.flag("altcargo_pgo") && !cfg.flag("altcargo1") && !cfg.flag("altflags_pgo_ext")
            && !altflags_pgo && !fsalt1) {
            write_first_block(ctx, {"altflagsrust_pgof", "altflagsrust_pgo"});
        }
        return;
    case variant::special:
        if (fsalt1 && !altflags_pgo) {
            write_first_block(ctx, {"altflags1_special", "altflags1"});
        }
        return;
    case variant::special2:
        if (fsalt1 && !altflags_pgo) {
            write_first_block(ctx, {"altflags1_special2", "altflags1"});
        }
        return;
    case variant::thirty_two_bit:
    case variant::avx512:
    case variant::avx2:
    case variant::openmpi:
        return;
    }
}

void respec::write_arch_exports(const synth_context& ctx, variant v) {
    auto& cfg = ctx.cfg;
    switch (v) {
    case variant::thirty_two_bit:
        if (cfg.flag("fsalt1_32") && !cfg.flag("altflags_pgo_32")) {
            for (auto name : {"altflags1_32f", "altflags1_32"}) {
                if (cfg.has_lines(name)) {
                    ctx.out.write_strip(fmt::format("## {} content", name));
                    ctx.out.write(unset_flags_32);
                    for (auto& line : cfg.lines(name)) {
                        ctx.out.write(line);
                    }
                    ctx.out.write_strip(fmt::format("## {} end", name));
                    break;
                }
            }
        } else {
            ctx.out.write(cfg.flag("use_clang") ? clang_exports_32 : gcc_exports_32);
        }
        return;
    case variant::avx512:
        ctx.out.write(avx512_exports);
        return;
    case variant::avx2:
        ctx.out.write(avx2_exports);
        return;
    case variant::openmpi:
        ctx.out.write_strip(". /usr/share/defaults/etc/profile.d/modules.sh");
        ctx.out.write_strip("module load openmpi");
        return;
    case variant::special:
    case variant::special2:
    case variant::default64:
        return;
    }
}

void respec::write_arch_epilogue(const synth_context& ctx, variant v) {
    if (v == variant::openmpi) {
        ctx.out.write_strip("module unload openmpi");
    } else if (v == variant::thirty_two_bit) {
        ctx.out.write_strip("unset PKG_CONFIG_PATH");
    }
}

std::string respec::make_invocation(const synth_context& ctx,
                                    variant              v,
                                    bool                 use_phase,
                                    bool                 explicit_flags) {
    auto parallel = ctx.cfg.str("parallel_build");
    auto extras   = extra_args(ctx.cfg, "make", v, use_phase);
    if (ctx.cfg.flag("use_ninja")) {
        return join_words({"ninja --verbose", parallel, extras});
    }
    std::string flags;
    if (explicit_flags) {
        flags = R"(CFLAGS="$CFLAGS" CXXFLAGS="$CXXFLAGS" LDFLAGS="$LDFLAGS")";
    }
    return join_words({"make", parallel, extras, "V=1 VERBOSE=1", flags});
}

void respec::write_make_step(const synth_context& ctx,
                             variant              v,
                             bool                 use_phase,
                             std::string_view     cmd) {
    write_lines_block(ctx, "trystatic");
    if (v == variant::thirty_two_bit) {
        write_lines_block(ctx, "make_prepend32");
    } else {
        write_lines_block(ctx, "make_prepend");
        write_lines_block(ctx, "make_prepend64");
    }
    write_step(ctx, "make", v, use_phase, cmd);
    write_lines_block(ctx, "make_append");
    if (ctx.cfg.flag("ccstats")) {
        ctx.out.write_strip("## ccache stats");
        ctx.out.write_strip("ccache -s");
    }
}

void respec::write_profile_payload(const synth_context& ctx, variant v) {
    std::string name = "profile_payload";
    if (v == variant::special || v == variant::special2) {
        auto own = name + std::string(traits_of(v).suffix);
        if (ctx.cfg.has_lines(own)) {
            name = own;
        }
    }
    if (!ctx.cfg.has_lines(name)) {
        return;
    }
    ctx.out.write_strip(fmt::format("## {} start", name));
    ctx.out.write_strip("unset LD_LIBRARY_PATH");
    ctx.out.write_strip("unset LIBRARY_PATH");
    for (auto& line : ctx.cfg.lines(name)) {
        ctx.out.write(line.empty() ? std::string_view("\n") : std::string_view(line));
    }
    ctx.out.write_strip(fmt::format(R"(export LD_LIBRARY_PATH="{}")", library_search_path));
    ctx.out.write_strip(fmt::format(R"(export LIBRARY_PATH="{}")", library_search_path));
    ctx.out.write_strip(fmt::format("## {} end", name));
}

void respec::write_pgo_clean(const synth_context& ctx, std::string_view default_clean) {
    auto custom = ctx.cfg.str("custom_clean_pgo");
    ctx.out.write_strip(custom.empty() ? default_clean : custom);
}

void respec::write_check(const synth_context& ctx, bool in_subdir_) {
    if (trim_view(ctx.cfg.tests).empty() || ctx.cfg.flag("skip_tests")) {
        return;
    }
    ctx.out.begin_section("%check");
    ctx.out.write_strip("export LANG=C.UTF-8");
    write_proxy_exports(ctx);
    auto body = [&] {
        auto tests = trim(ctx.cfg.tests);
        if (ctx.cfg.flag("allow_test_failures")) {
            tests += " || :";
        }
        ctx.out.write_strip(tests);
    };
    if (in_subdir_) {
        in_subdir(ctx, body);
    } else {
        body();
    }
    ctx.out.write_strip("");
}

void respec::write_install_prologue(const synth_context& ctx, bool export_epoch) {
    ctx.out.begin_section("%install");
    if (export_epoch) {
        ctx.out.write_strip(fmt::format("export SOURCE_DATE_EPOCH={}", ctx.cfg.source_date_epoch));
    }
    ctx.out.write_strip("rm -rf %{buildroot}");
    write_lines_block(ctx, "install_prepend");
    if (ctx.cfg.license_files.empty()) {
        return;
    }
    auto licdir = fmt::format("%{{buildroot}}/usr/share/package-licenses/{}", ctx.cfg.name);
    ctx.out.write_strip("mkdir -p " + licdir);
    for (auto& lic : ctx.cfg.license_files) {
        auto target = lic.hash.empty() ? std::string(url_basename(lic.path)) : lic.hash;
        ctx.out.write_strip(fmt::format("cp %{{_builddir}}/{} {}/{}", lic.path, licdir, target));
    }
}

void respec::write_variant_install_prepend(const synth_context& ctx, variant v) {
    if (v == variant::default64) {
        return;
    }
    write_lines_block(ctx, fmt::format("install_prepend{}", traits_of(v).suffix));
}

void respec::write_pkgconfig_links32(const synth_context& ctx) {
    for (auto dir : {"%{buildroot}/usr/lib32/pkgconfig", "%{buildroot}/usr/share/pkgconfig"}) {
        ctx.out.write_strip(fmt::format("if [ -d {} ]", dir));
        ctx.out.write_strip("then");
        ctx.out.write(fmt::format("    pushd {}", dir));
        ctx.out.write("    for i in *.pc ; do ln -s $i 32$i ; done");
        ctx.out.write("    popd");
        ctx.out.write_strip("fi");
    }
}

namespace {

void write_source_installs(const synth_context& ctx) {
    auto& cfg = ctx.cfg;
    if (!cfg.units.empty()) {
        ctx.out.write_strip("mkdir -p %{buildroot}/usr/lib/systemd/system");
        for (auto& unit : cfg.units) {
            ctx.out.write_strip(
                fmt::format("install -m 0644 %{{SOURCE{}}} %{{buildroot}}/usr/lib/systemd/system/{}",
                            ctx.layout.index_of(unit),
                            url_basename(unit)));
        }
    }
    for (auto& extra : cfg.extra_sources) {
        // The first absolute path among the install arguments is the destination
        std::string              dest;
        std::vector<std::string> args;
        for (auto& arg : split_words(extra.install_args)) {
            if (dest.empty() && arg.starts_with('/')) {
                dest = arg;
            } else {
                args.push_back(arg);
            }
        }
        if (dest.empty()) {
            continue;
        }
        auto parent = std::filesystem::path(dest).parent_path().string();
        ctx.out.write_strip(fmt::format("mkdir -p %{{buildroot}}{}", parent));
        ctx.out.write_strip(fmt::format("install {} %{{_sourcedir}}/{} %{{buildroot}}{}",
                                        joinstr(" ", args),
                                        extra.file,
                                        dest));
    }
}

void write_service_restart(const synth_context& ctx) {
    if (ctx.cfg.service_restart.empty()) {
        return;
    }
    constexpr std::string_view installdir = "%{buildroot}/usr/share/clr-service-restart";
    ctx.out.write_strip("## service_restart content");
    ctx.out.write_strip(fmt::format("mkdir -p {}", installdir));
    for (auto& unit : ctx.cfg.service_restart) {
        ctx.out.write_strip(fmt::format("ln -s {} {}/{}", unit, installdir, url_basename(unit)));
    }
    ctx.out.write_strip("## service_restart end");
}

bool installs_variant(const synth_context& ctx, variant v) {
    return std::ranges::find(ctx.plan.install, v, &build_step::var) != ctx.plan.install.end();
}

}  // namespace

void respec::write_post_install(const synth_context& ctx) {
    auto& cfg = ctx.cfg;
    write_source_installs(ctx);
    write_service_restart(ctx);
    if (!cfg.excludes.empty()) {
        ctx.out.write_strip("## Remove excluded files");
        for (auto& exclude : cfg.excludes) {
            ctx.out.write_strip(fmt::format("rm -f %{{buildroot}}*{}", exclude));
        }
    }
    write_lines_block(ctx, "install_append");
    if (installs_variant(ctx, variant::special)) {
        write_lines_block(ctx, "install_append_special");
    }
    if (installs_variant(ctx, variant::special2)) {
        write_lines_block(ctx, "install_append_special2");
    }
    if (installs_variant(ctx, variant::avx2)) {
        ctx.out.write_strip(
            "/usr/bin/elf-move.py avx2 %{buildroot}-v3 %{buildroot} "
            "%{buildroot}/usr/share/clear/filemap/filemap-%{name}");
    }
    if (installs_variant(ctx, variant::avx512)) {
        ctx.out.write_strip(
            "/usr/bin/elf-move.py avx512 %{buildroot}-v4 %{buildroot}/usr/share/clear/optimized-elf/ "
            "%{buildroot}/usr/share/clear/filemap/filemap-%{name}");
    }
    if (cfg.flag("findlang") && cfg.has_lines("find_lang")) {
        ctx.out.write_strip("## custom find_lang start");
        for (auto& line : cfg.lines("find_lang")) {
            ctx.out.write(line);
        }
        ctx.out.write_strip("## custom find_lang end");
    } else if (!cfg.locales.empty()) {
        ctx.out.write_strip("## start %find_lang macros");
        for (auto& lang : cfg.locales) {
            ctx.out.write(fmt::format("%find_lang {}", lang));
        }
        ctx.out.write_strip("## end %find_lang macros");
    }
}

std::vector<variant_dir>
respec::variant_dirs(const build_config& cfg, tree_layout layout, variant v, bool for_build) {
    std::vector<variant_dir> ret;
    auto&                    traits = traits_of(v);
    switch (layout) {
    case tree_layout::in_tree:
        if (!cfg.subdir.empty()) {
            ret.push_back({cfg.subdir});
        }
        break;
    case tree_layout::copied_trees:
        if (v == variant::default64) {
            if (!cfg.subdir.empty()) {
                ret.push_back({cfg.subdir});
            }
        } else {
            ret.push_back({fmt::format("../{}/{}", traits.tree_dir, cfg.subdir)});
        }
        break;
    case tree_layout::cmake_build_dirs:
        if (!cfg.subdir.empty()) {
            ret.push_back({cfg.subdir});
        }
        ret.push_back({std::string(traits.cmake_dir), for_build});
        break;
    }
    return ret;
}
