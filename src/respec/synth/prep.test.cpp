#include "./synthesize.hpp"

#include <respec/config/build_config.hpp>
#include <respec/error/errors.hpp>
#include <respec/recipe/source_layout.hpp>
#include <respec/util/string.hpp>

#include <catch2/catch.hpp>

#include <algorithm>

using namespace respec;

namespace {

build_config base_config() {
    build_config cfg;
    cfg.name    = "foo";
    cfg.version = "1.0";
    cfg.url     = "https://example.com/foo-1.0.tgz";
    return cfg;
}

std::vector<std::string> prep_lines(const directive_stream& out) {
    auto sec = out.find_section("%prep");
    REQUIRE(sec);
    return sec->all_lines();
}

bool has_line(const std::vector<std::string>& lines, std::string_view line) {
    return std::ranges::find(lines, line) != lines.end();
}

}  // namespace

TEST_CASE("A main archive without a top-level directory gets a made-up one") {
    auto          cfg = base_config();
    source_layout layout{cfg};
    auto          prep = prep_lines(synthesize(build_system_kind::configure, cfg, layout));
    CHECK(has_line(prep, "%setup -q -c -n foo-1.0"));
    CHECK(layout.main_dir() == "foo-1.0");
    CHECK(layout.entry_of(cfg.url).synthesized);
}

TEST_CASE("An explicit prefix with a different basename is flattened") {
    auto cfg   = base_config();
    cfg.prefix = "upstream/foo-1.0";
    source_layout layout{cfg};
    auto          prep = prep_lines(synthesize(build_system_kind::configure, cfg, layout));
    CHECK(has_line(prep, "%setup -c -n foo-1.0"));
    CHECK(has_line(prep, R"(find upstream/foo-1.0 -mindepth 1 -name '*' -exec mv -n {} ./ \; || :)"));
    CHECK(layout.main_dir() == "foo-1.0");
}

TEST_CASE("Auxiliary archives are extracted and copied into place") {
    auto cfg   = base_config();
    cfg.prefix = "foo-1.0";
    cfg.archives = {
        {"https://example.com/model.pom", "", ""},
        {"https://example.com/lib.jar", "", ""},
        {"https://example.com/fix.patch", "", ""},
        {"https://example.com/data.zip", "share/data", ""},
        {"https://example.com/vendor-2.0.tar.xz", "vendor", "vendor-2.0"},
    };
    source_layout layout{cfg};
    auto          prep = prep_lines(synthesize(build_system_kind::configure, cfg, layout));

    CHECK_FALSE(std::ranges::any_of(prep, [](auto& l) {
        return contains(l, "model.pom") || contains(l, "lib.jar") || contains(l, "fix.patch");
    }));
    CHECK(has_line(prep, "mkdir -p data"));
    CHECK(has_line(prep, "cd data"));
    CHECK(has_line(prep, "unzip -q %{_sourcedir}/data.zip"));
    CHECK(has_line(prep, "tar xf %{_sourcedir}/vendor-2.0.tar.xz"));
    CHECK(has_line(prep, "mkdir -p share/data"));
    CHECK(has_line(prep, "cp -a %{_builddir}/data/* %{_builddir}/foo-1.0/share/data"));
    CHECK(has_line(prep, "cp -a %{_builddir}/vendor-2.0/* %{_builddir}/foo-1.0/vendor"));

    CHECK(layout.dir_of("https://example.com/data.zip") == "data");
    CHECK(layout.entry_of("https://example.com/data.zip").synthesized);
    CHECK_FALSE(layout.contains("https://example.com/model.pom"));
}

TEST_CASE("A destination of the main tree itself is ignored") {
    auto cfg     = base_config();
    cfg.prefix   = "foo-1.0";
    cfg.archives = {{"https://example.com/foo-extra.tar.gz", "extra", "foo-1.0"}};
    auto prep    = prep_lines(synthesize(build_system_kind::make, cfg));
    CHECK_FALSE(has_line(prep, "mkdir -p extra"));
}

TEST_CASE("Additional versions are unpacked beside the main tree") {
    auto cfg     = base_config();
    cfg.prefix   = "foo-1.0";
    cfg.versions = {{"https://example.com/foo-0.9.tar.gz", "foo-0.9"}};
    cfg.version_patches = {{"https://example.com/foo-0.9.tar.gz", {"old.patch"}}};
    cfg.patches         = {"new.patch"};
    auto prep           = prep_lines(synthesize(build_system_kind::configure, cfg));
    CHECK(has_line(prep, "%setup -q -T -n foo-0.9 -b 1"));
    CHECK(has_line(prep, "%patch1 -p1"));
    CHECK(has_line(prep, "cd ../foo-0.9"));
    CHECK(has_line(prep, "%patch2 -p1"));
}

TEST_CASE("Patches for an unknown version are a broken precondition") {
    auto cfg            = base_config();
    cfg.version_patches = {{"https://example.com/foo-0.8.tar.gz", {"old.patch"}}};
    CHECK_THROWS_AS(synthesize(build_system_kind::configure, cfg), precondition_error_base);
}

TEST_CASE("Cargo sources are vendored during prep") {
    auto cfg = base_config();
    cfg.set_flag("altcargo1", true);
    cfg.set_lines("cargo_update", {"cargo update -p openssl --precise 0.10.55"});
    auto prep = prep_lines(synthesize(build_system_kind::cargo, cfg));
    auto update = std::ranges::find(prep, "cargo update --verbose");
    auto fetch  = std::ranges::find(prep, "cargo fetch --verbose");
    CHECK(update < fetch);
    CHECK(fetch != prep.end());
    CHECK(has_line(prep, "cargo update -p openssl --precise 0.10.55"));
}
