#include "./synthesize.hpp"

#include <respec/config/build_config.hpp>
#include <respec/error/errors.hpp>
#include <respec/recipe/pgo.hpp>
#include <respec/recipe/source_layout.hpp>
#include <respec/recipe/variant.hpp>
#include <respec/util/string.hpp>

#include <catch2/catch.hpp>

#include <algorithm>
#include <array>

using namespace respec;

namespace {

build_config base_config() {
    build_config cfg;
    cfg.name    = "foo";
    cfg.version = "1.0";
    cfg.url     = "https://example.com/foo-1.0.tar.gz";
    cfg.prefix  = "foo-1.0";
    return cfg;
}

bool has_line(const std::vector<std::string>& lines, std::string_view line) {
    return std::ranges::find(lines, line) != lines.end();
}

bool any_contains(const std::vector<std::string>& lines, std::string_view needle) {
    return std::ranges::any_of(lines, [&](auto& l) { return contains(l, needle); });
}

std::ptrdiff_t index_of_line(const std::vector<std::string>& lines, std::string_view line) {
    return std::distance(lines.begin(), std::ranges::find(lines, line));
}

const directive_stream::block& block_of(const directive_stream& out,
                                        std::string_view        section,
                                        std::string_view        label) {
    auto sec = out.find_section(section);
    REQUIRE(sec);
    auto blk = sec->find_block(label);
    REQUIRE(blk);
    return *blk;
}

std::size_t count_lines_starting(const std::vector<std::string>& lines, std::string_view prefix) {
    return static_cast<std::size_t>(
        std::ranges::count_if(lines, [&](auto& l) { return starts_with(trim_view(l), prefix); }));
}

}  // namespace

TEST_CASE("Synthesis is deterministic") {
    auto cfg = base_config();
    cfg.set_flag("use_avx2", true);
    cfg.set_flag("32bit", true);
    cfg.set_lines("make_prepend", {"echo prepared"});
    cfg.patches = {"fix-build.patch", "cve.patch -p0"};
    auto first  = synthesize(build_system_kind::configure, cfg);
    auto second = synthesize(build_system_kind::configure, cfg);
    CHECK(first == second);
    CHECK(first.render() == second.render());
}

TEST_CASE("The preamble names the package and its sources") {
    auto cfg = base_config();
    cfg.units = {"foo.service"};
    cfg.patches = {"fix-build.patch", "skip.nopatch"};
    cfg.set_flag("nostrip", true);
    auto out      = synthesize(build_system_kind::make, cfg);
    auto preamble = out.sections().front().all_lines();
    CHECK(has_line(preamble, "Name     : foo"));
    CHECK(has_line(preamble, "Source0  : https://example.com/foo-1.0.tar.gz"));
    CHECK(has_line(preamble, "Source1  : foo.service"));
    CHECK(has_line(preamble, "Patch1   : fix-build.patch"));
    CHECK(has_line(preamble, "Patch2   : skip.nopatch"));
    CHECK(has_line(preamble, "%define __strip /bin/true"));

    auto prep = out.find_section("%prep")->all_lines();
    CHECK(has_line(prep, "%setup -q -n foo-1.0"));
    CHECK(has_line(prep, "%patch1 -p1"));
    CHECK_FALSE(any_contains(prep, "%patch2"));

    auto install = out.find_section("%install")->all_lines();
    CHECK(has_line(install,
                   "install -m 0644 %{SOURCE1} %{buildroot}/usr/lib/systemd/system/foo.service"));
}

TEST_CASE("Every enabled variant gets exactly one build and one install block") {
    auto cfg = base_config();
    for (auto opt : {"32bit", "use_avx2", "use_avx512", "openmpi", "build_special",
                     "build_special2"}) {
        cfg.set_flag(opt, true);
    }
    auto out = synthesize(build_system_kind::configure, cfg);
    for (auto section : {"%build", "%install"}) {
        auto sec = out.find_section(section);
        REQUIRE(sec);
        for (auto v : canonical_variant_order) {
            auto label = traits_of(v).label;
            CAPTURE(section, label);
            CHECK(std::ranges::count(sec->blocks, label, &directive_stream::block::label) == 1);
        }
    }
}

TEST_CASE("CMake with AVX2 builds and installs in separate build directories") {
    auto cfg = base_config();
    cfg.set_flag("use_avx2", true);
    auto out = synthesize(build_system_kind::cmake, cfg);

    auto& blocks  = out.find_section("%build")->blocks;
    auto  default_it = std::ranges::find(blocks, "default64", &directive_stream::block::label);
    auto  avx2_it    = std::ranges::find(blocks, "avx2", &directive_stream::block::label);
    REQUIRE(default_it != blocks.end());
    REQUIRE(avx2_it != blocks.end());
    CHECK(default_it < avx2_it);

    CHECK(has_line(default_it->lines, "pushd clr-build"));
    CHECK(has_line(default_it->lines, "%cmake .."));
    CHECK_FALSE(any_contains(default_it->lines, "-march=native"));
    CHECK(has_line(avx2_it->lines, "pushd clr-build-avx2"));
    CHECK(any_contains(avx2_it->lines, "-march=native"));

    auto& default_install = block_of(out, "%install", "default64");
    auto& avx2_install    = block_of(out, "%install", "avx2");
    CHECK(has_line(default_install.lines, "pushd clr-build"));
    CHECK(has_line(default_install.lines, "%make_install"));
    CHECK(has_line(avx2_install.lines, "pushd clr-build-avx2"));
    CHECK_FALSE(has_line(avx2_install.lines, "pushd clr-build"));
}

TEST_CASE("In-process PGO guards each phase with the tree's marker") {
    auto cfg = base_config();
    cfg.set_flag("altflags_pgo", true);
    cfg.set_flag("build_special", true);
    cfg.set_lines("profile_payload", {"make check"});
    auto out = synthesize(build_system_kind::configure, cfg);

    auto& dflt = block_of(out, "%build", "default64").lines;
    auto  gen_guard = index_of_line(dflt, "if [ ! -f statuspgo ]; then");
    auto  mark      = index_of_line(dflt, "echo USED > statuspgo");
    auto  use_guard = index_of_line(dflt, "if [ -f statuspgo ]; then");
    REQUIRE(gen_guard < static_cast<std::ptrdiff_t>(dflt.size()));
    CHECK(gen_guard < mark);
    CHECK(mark < use_guard);
    CHECK(use_guard < static_cast<std::ptrdiff_t>(dflt.size()));
    CHECK(any_contains(dflt, "${CFLAGS_GENERATE}"));
    CHECK(any_contains(dflt, "${CFLAGS_USE}"));
    CHECK(has_line(dflt, "make check"));

    auto& special = block_of(out, "%build", "special").lines;
    CHECK(has_line(special, "if [ ! -f statuspgo.special ]; then"));
    CHECK(has_line(special, "echo USED > statuspgo.special"));
}

TEST_CASE("Externally phased PGO writes one phase per recipe") {
    auto cfg = base_config();
    cfg.set_flag("altflags_pgo_ext", true);
    cfg.set_lines("profile_payload", {"./bench"});

    auto gen = block_of(synthesize(build_system_kind::cmake, cfg), "%build", "default64").lines;
    CHECK(has_line(gen, "if [ ! -f statuspgo ]; then"));
    CHECK(has_line(gen, "echo USED > statuspgo"));
    CHECK_FALSE(any_contains(gen, "_USE}"));

    cfg.set_flag("altflags_pgo_ext_phase", true);
    auto use = block_of(synthesize(build_system_kind::cmake, cfg), "%build", "default64").lines;
    CHECK(any_contains(use, "${CFLAGS_USE}"));
    CHECK_FALSE(any_contains(use, "_GENERATE}"));
    CHECK_FALSE(any_contains(use, "echo USED"));
}

TEST_CASE("Cargo in the use phase only installs with the use flags") {
    auto cfg = base_config();
    cfg.set_flag("altflags_pgo_ext", true);
    cfg.set_flag("altflags_pgo_ext_phase", true);
    auto out     = synthesize(build_system_kind::cargo, cfg);
    auto install = block_of(out, "%install", "default64").lines;
    CHECK(any_contains(install, "RUSTFLAGS_USE"));
    CHECK(count_lines_starting(install, "cargo install") == 1);
    CHECK_FALSE(any_contains(install, "_GENERATE"));
    CHECK_FALSE(any_contains(install, "echo USED"));
}

TEST_CASE("Cargo in-process PGO writes both markers") {
    auto cfg = base_config();
    cfg.set_flag("altcargo_pgo", true);
    auto install = block_of(synthesize(build_system_kind::cargo, cfg), "%install", "default64").lines;
    CHECK(has_line(install, "echo USED > statuspgo"));
    CHECK(has_line(install, "if [ -f statuspgo ] && [ ! -f statuspgo2 ]; then"));
    CHECK(has_line(install, "echo USED > statuspgo2"));
}

TEST_CASE("A step override replaces the default invocation") {
    auto cfg = base_config();
    cfg.set_lines("cmake_macro", {"cmake .. -G Ninja -DFOO=ON"});
    auto dflt = block_of(synthesize(build_system_kind::cmake, cfg), "%build", "default64").lines;
    CHECK(has_line(dflt, "cmake .. -G Ninja -DFOO=ON"));
    CHECK(count_lines_starting(dflt, "%cmake") == 0);
}

TEST_CASE("The PGO override is used in the use phase only") {
    auto cfg = base_config();
    cfg.set_flag("altflags_pgo", true);
    cfg.set_lines("profile_payload", {"./bench"});
    cfg.set_lines("make_macro", {"make plain"});
    cfg.set_lines("make_macro_pgo", {"make profiled"});
    auto dflt = block_of(synthesize(build_system_kind::configure, cfg), "%build", "default64").lines;
    auto plain    = index_of_line(dflt, "make plain");
    auto profiled = index_of_line(dflt, "make profiled");
    auto phase2   = index_of_line(dflt, "echo PGO Phase 2");
    CHECK(plain < phase2);
    CHECK(phase2 < profiled);
    CHECK(profiled < static_cast<std::ptrdiff_t>(dflt.size()));
}

TEST_CASE("Per-variant extras are appended to the shared extras") {
    auto cfg = base_config();
    cfg.set_flag("32bit", true);
    cfg.set_str("extra_configure", "--enable-shared");
    cfg.set_str("extra_configure64", "--enable-x86-64");
    cfg.set_str("extra_configure_32", "--disable-asm");
    auto out = synthesize(build_system_kind::configure, cfg);
    CHECK(has_line(block_of(out, "%build", "default64").lines,
                   "%configure --disable-static --enable-shared --enable-x86-64"));
    CHECK(any_contains(block_of(out, "%build", "32bit").lines,
                       "%configure --disable-static --enable-shared --disable-asm --libdir=/usr/lib32"));
}

TEST_CASE("Every directory entered in a subdir build is left again") {
    auto cfg   = base_config();
    cfg.subdir = "src";
    cfg.set_flag("use_avx2", true);
    cfg.set_flag("32bit", true);
    for (auto kind : {build_system_kind::configure, build_system_kind::cmake,
                      build_system_kind::distutils3, build_system_kind::cargo}) {
        auto out = synthesize(kind, cfg);
        for (auto& sec : out.sections()) {
            for (auto& blk : sec.blocks) {
                CAPTURE(build_system_name(kind), sec.name, blk.label);
                CHECK(count_lines_starting(blk.lines, "pushd") == count_lines_starting(blk.lines, "popd"));
            }
        }
    }
    auto out = synthesize(build_system_kind::configure, cfg);
    CHECK(has_line(block_of(out, "%build", "default64").lines, "pushd src"));
    CHECK(has_line(block_of(out, "%build", "avx2").lines, "pushd ../buildavx2/src"));
}

TEST_CASE("Build and install commands run inside the subdir") {
    auto cfg   = base_config();
    cfg.subdir = "src";
    cfg.set_flag("use_avx2", true);
    cfg.set_flag("32bit", true);
    constexpr std::array commands
        = {"make", "%make_install", "%configure", "%cmake", "python3 "};
    for (auto kind :
         {build_system_kind::configure, build_system_kind::cmake, build_system_kind::distutils3}) {
        auto out = synthesize(kind, cfg);
        for (auto section : {"%build", "%install"}) {
            for (auto& blk : out.find_section(section)->blocks) {
                CAPTURE(build_system_name(kind), section, blk.label);
                std::vector<std::string_view> dirs;
                std::size_t                   n_commands = 0;
                for (auto& line : blk.lines) {
                    auto tl = trim_view(line);
                    if (tl.starts_with("pushd ")) {
                        dirs.push_back(tl.substr(6));
                        continue;
                    }
                    if (tl == "popd") {
                        REQUIRE_FALSE(dirs.empty());
                        dirs.pop_back();
                        continue;
                    }
                    bool is_command = std::ranges::any_of(commands, [&](std::string_view c) {
                        return tl.starts_with(c);
                    });
                    if (!is_command) {
                        continue;
                    }
                    ++n_commands;
                    CAPTURE(line);
                    CHECK(std::ranges::any_of(dirs, [](auto d) {
                        return d == "src" || d.ends_with("/src");
                    }));
                }
                CHECK(n_commands > 0);
                CHECK(dirs.empty());
            }
        }
    }
}

TEST_CASE("Copy-tree build systems copy the prepared tree per variant") {
    auto cfg = base_config();
    cfg.set_flag("build_special", true);
    auto prep = synthesize(build_system_kind::meson, cfg).find_section("%prep")->all_lines();
    CHECK(has_line(prep, "cp -a %{_builddir}/foo-1.0 build-special"));
}

TEST_CASE("Tests run in %check unless skipped") {
    auto cfg  = base_config();
    cfg.tests = "make check";
    cfg.set_flag("allow_test_failures", true);
    auto out = synthesize(build_system_kind::configure, cfg);
    REQUIRE(out.find_section("%check"));
    CHECK(has_line(out.find_section("%check")->all_lines(), "make check || :"));

    cfg.set_flag("skip_tests", true);
    CHECK_FALSE(synthesize(build_system_kind::configure, cfg).find_section("%check"));
}

TEST_CASE("godep installs module proxy files without a Source0") {
    auto cfg           = base_config();
    cfg.url            = "https://proxy.golang.org/github.com/pkg/errors/@v/v0.9.1.zip";
    cfg.godep_sources  = {"https://proxy.golang.org/github.com/pkg/errors/@v/v0.9.1.mod"};
    cfg.godep_versions = {"v0.9.1"};
    auto out      = synthesize(build_system_kind::godep, cfg);
    auto preamble = out.sections().front().all_lines();
    CHECK_FALSE(any_contains(preamble, "Source0"));
    auto install = out.find_section("%install")->all_lines();
    CHECK(has_line(install, "mkdir -p %{buildroot}/usr/share/goproxy/github.com/pkg/errors/@v"));
    CHECK(has_line(install,
                   "install -m 0644 %{SOURCE1} "
                   "%{buildroot}/usr/share/goproxy/github.com/pkg/errors/@v/v0.9.1.mod"));
}

TEST_CASE("Every build system produces a recipe") {
    auto cfg = base_config();
    cfg.set_flag("use_avx2", true);
    for (auto kind : {build_system_kind::make,        build_system_kind::configure,
                      build_system_kind::configure_ac, build_system_kind::autogen,
                      build_system_kind::cmake,       build_system_kind::meson,
                      build_system_kind::scons,       build_system_kind::waf,
                      build_system_kind::qmake,       build_system_kind::cargo,
                      build_system_kind::golang,      build_system_kind::ruby,
                      build_system_kind::cpan,        build_system_kind::distutils3,
                      build_system_kind::distutils36, build_system_kind::pyproject,
                      build_system_kind::R,           build_system_kind::buildtcl_script,
                      build_system_kind::buildtcl_configure, build_system_kind::phpize,
                      build_system_kind::nginx}) {
        CAPTURE(build_system_name(kind));
        auto out = synthesize(kind, cfg);
        CHECK(out.find_section("%prep"));
        CHECK(out.find_section("%install"));
    }
}

TEST_CASE("The PGO marker path follows the build tree") {
    auto cfg   = base_config();
    cfg.subdir = "src";
    CHECK(pgo_marker_path(build_system_kind::cmake, cfg) == "foo-1.0/src/clr-build/statuspgo");
    CHECK(pgo_marker_path(build_system_kind::configure, cfg) == "foo-1.0/src/statuspgo");
    CHECK(pgo_marker_path(build_system_kind::cargo, cfg) == "foo-1.0/statuspgo");
}

TEST_CASE("distutils3 writes a minimal setup.py when the source has none") {
    auto cfg  = base_config();
    auto dflt = block_of(synthesize(build_system_kind::distutils3, cfg), "%build", "default64").lines;
    auto guard  = index_of_line(dflt, "if [ ! -f setup.py ]; then");
    auto script = index_of_line(
        dflt,
        R"sh(printf "#!/usr/bin/env python\nfrom setuptools import setup\nsetup()" > setup.py)sh");
    auto chmod = index_of_line(dflt, "chmod +x setup.py");
    auto fi    = index_of_line(dflt, "fi");
    CHECK(guard < script);
    CHECK(script < chmod);
    CHECK(chmod < fi);
    CHECK(fi < static_cast<std::ptrdiff_t>(dflt.size()));
    CHECK(count_lines_starting(dflt, "python3 setup.py build -j 20") == 2);
}

TEST_CASE("A generate-phase recipe is identical on every synthesis") {
    auto cfg = base_config();
    cfg.set_flag("altflags_pgo_ext", true);
    cfg.set_lines("profile_payload", {"./bench"});
    auto first  = synthesize(build_system_kind::configure, cfg);
    auto second = synthesize(build_system_kind::configure, cfg);
    CHECK(first.render() == second.render());

    auto& dflt  = block_of(first, "%build", "default64").lines;
    auto  guard = index_of_line(dflt, "if [ ! -f statuspgo ]; then");
    auto  bench = index_of_line(dflt, "./bench");
    auto  mark  = index_of_line(dflt, "echo USED > statuspgo");
    CHECK(guard < bench);
    CHECK(bench < mark);
    CHECK(mark < static_cast<std::ptrdiff_t>(dflt.size()));
}

TEST_CASE("Externally phased PGO is dropped when nothing can be profiled") {
    auto cfg = base_config();
    cfg.set_flag("altflags_pgo_ext", true);
    cfg.set_lines("profile_payload", {"./bench"});

    auto scons = synthesize(build_system_kind::scons, cfg).render();
    CHECK_FALSE(contains(scons, "statuspgo"));
    CHECK_FALSE(contains(scons, "PGO Phase"));

    cfg.set_flag("32bit_only", true);
    auto only32 = synthesize(build_system_kind::configure, cfg).render();
    CHECK_FALSE(contains(only32, "statuspgo"));
    CHECK_FALSE(contains(only32, "_GENERATE}"));
}
