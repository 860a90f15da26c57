#include "./converge.hpp"

#include <respec/error/errors.hpp>
#include <respec/recipe/variant.hpp>
#include <respec/synth/synthesize.hpp>
#include <respec/util/fs/io.hpp>
#include <respec/util/string.hpp>
#include <respec/util/temp.hpp>

#include <catch2/catch.hpp>

#include <fmt/core.h>

#include <functional>
#include <set>

using namespace respec;

namespace {

package_config base_package() {
    package_config pkg;
    pkg.kind           = build_system_kind::configure;
    pkg.config.name    = "foo";
    pkg.config.version = "1.0";
    pkg.config.url     = "https://example.com/foo-1.0.tar.gz";
    pkg.config.prefix  = "foo-1.0";
    return pkg;
}

/// Answers each round from a script, and leaves a build log behind like a real sandbox.
struct scripted_sandbox : sandbox_builder {
    std::filesystem::path                     results;
    std::function<sandbox_result(int)>        script;
    std::set<std::filesystem::path>           build_files;
    std::vector<std::string>                  recipes;
    int                                       builds = 0;

    sandbox_result build(const std::filesystem::path& recipe, int round) override {
        ++builds;
        recipes.push_back(read_file(recipe));
        std::filesystem::create_directories(results);
        write_file(results / "build.log", fmt::format("round {}\n", round));
        return script(round);
    }

    bool has_build_file(const std::filesystem::path& relpath) const override {
        return build_files.contains(relpath);
    }
};

struct fixture {
    temporary_dir      tdir = temporary_dir::create();
    scripted_sandbox   sandbox;
    exclude_classifier classifier;

    fixture() { sandbox.results = tdir.path() / "results"; }

    convergence_options options() const {
        return {.target_dir = tdir.path(), .results_dir = tdir.path() / "results"};
    }
};

}  // namespace

TEST_CASE("A build that always needs a restart stops after the round budget") {
    fixture f;
    f.sandbox.script = [](int round) {
        return sandbox_result{.success     = true,
                              .stray_files = {fmt::format("/usr/share/foo/new-{}", round)}};
    };
    convergence_driver driver{base_package(), f.sandbox, f.classifier, f.options()};
    std::vector<int>   seen_rounds;
    auto outcome
        = driver.run([&](const convergence_outcome& o) { seen_rounds.push_back(o.round); });

    CHECK(outcome.round == 21);
    CHECK(f.sandbox.builds == 21);
    CHECK(seen_rounds.size() == 21);
    CHECK(outcome.budget_exhausted);
    CHECK_FALSE(outcome.success);
    // Logs of every restarted round are archived. The last round's logs stay in place.
    auto results = f.tdir.path() / "results";
    CHECK(std::filesystem::exists(results / "round20-build.log"));
    CHECK_FALSE(std::filesystem::exists(results / "round21-build.log"));
    CHECK(read_file(results / "build.log") == "round 21\n");
}

TEST_CASE("Unpackaged files are excluded and the next round converges") {
    fixture f;
    f.sandbox.script = [](int) {
        return sandbox_result{.success = true, .stray_files = {"/usr/lib64/libfoo.a"}};
    };
    convergence_driver driver{base_package(), f.sandbox, f.classifier, f.options()};
    auto               outcome = driver.run();

    CHECK(outcome.success);
    CHECK(outcome.round == 2);
    CHECK(outcome.must_restart == 0);
    CHECK_FALSE(outcome.budget_exhausted);
    CHECK(driver.config().config.excludes == std::vector<std::string>{"/usr/lib64/libfoo.a"});

    REQUIRE(f.sandbox.recipes.size() == 2);
    CHECK_FALSE(contains(f.sandbox.recipes[0], "rm -f %{buildroot}*/usr/lib64/libfoo.a"));
    CHECK(contains(f.sandbox.recipes[1], "rm -f %{buildroot}*/usr/lib64/libfoo.a"));
    CHECK(read_file(driver.recipe_path()) == f.sandbox.recipes[1]);
    CHECK(std::filesystem::exists(f.tdir.path() / "results/round1-build.log"));
}

TEST_CASE("A failed build with nothing to reclassify ends the run") {
    fixture f;
    f.sandbox.script = [](int) { return sandbox_result{}; };
    convergence_driver driver{base_package(), f.sandbox, f.classifier, f.options()};
    auto               outcome = driver.run();
    CHECK_FALSE(outcome.success);
    CHECK_FALSE(outcome.budget_exhausted);
    CHECK(outcome.round == 1);
}

TEST_CASE("Externally phased PGO moves to the use phase after a successful generate round") {
    fixture f;
    auto    pkg = base_package();
    pkg.config.set_flag("altflags_pgo_ext", true);
    pkg.config.set_lines("profile_payload", {"./bench"});
    f.sandbox.build_files.insert(pgo_marker_path(pkg.kind, pkg.config));
    f.sandbox.script = [](int) { return sandbox_result{.success = true}; };

    convergence_driver driver{pkg, f.sandbox, f.classifier, f.options()};
    auto               outcome = driver.run();

    CHECK(outcome.success);
    CHECK(outcome.round == 2);
    CHECK(driver.config().config.flag("altflags_pgo_ext_phase"));
    REQUIRE(f.sandbox.recipes.size() == 2);
    CHECK(contains(f.sandbox.recipes[0], "PGO Phase 1"));
    CHECK_FALSE(contains(f.sandbox.recipes[0], "PGO Phase 2"));
    CHECK(contains(f.sandbox.recipes[1], "PGO Phase 2"));
    CHECK_FALSE(contains(f.sandbox.recipes[1], "PGO Phase 1"));
}

TEST_CASE("A failed generate round does not advance the PGO phase") {
    fixture f;
    auto    pkg = base_package();
    pkg.config.set_flag("altflags_pgo_ext", true);
    f.sandbox.script = [](int) { return sandbox_result{.success = false}; };

    convergence_driver driver{pkg, f.sandbox, f.classifier, f.options()};
    auto               outcome = driver.run();
    CHECK_FALSE(outcome.success);
    CHECK(outcome.round == 1);
    CHECK_FALSE(driver.config().config.flag("altflags_pgo_ext_phase"));
}

TEST_CASE("A generate round without its marker is an error") {
    fixture f;
    auto    pkg = base_package();
    pkg.config.set_flag("altflags_pgo_ext", true);
    f.sandbox.script = [](int) { return sandbox_result{.success = true}; };

    convergence_driver driver{pkg, f.sandbox, f.classifier, f.options()};
    CHECK_THROWS_AS(driver.run(), precondition_error<errc::pgo_marker_missing>);
}

TEST_CASE("Externally phased PGO flags are inert when the recipe has no generate phase") {
    auto pkg = base_package();
    pkg.config.set_flag("altflags_pgo_ext", true);
    SECTION("A build system without PGO support") { pkg.kind = build_system_kind::scons; }
    SECTION("Only the 32-bit build, which is never profiled") {
        pkg.config.set_flag("32bit_only", true);
    }

    fixture f;
    f.sandbox.script = [](int) { return sandbox_result{.success = true}; };
    convergence_driver driver{pkg, f.sandbox, f.classifier, f.options()};
    auto               outcome = driver.run();

    CHECK(outcome.success);
    CHECK(outcome.round == 1);
    CHECK_FALSE(driver.config().config.flag("altflags_pgo_ext_phase"));
    REQUIRE(f.sandbox.recipes.size() == 1);
    CHECK_FALSE(contains(f.sandbox.recipes[0], "statuspgo"));
}

TEST_CASE("Every profiled variant must leave its own marker") {
    fixture f;
    auto    pkg = base_package();
    pkg.config.set_flag("altflags_pgo_ext", true);
    pkg.config.set_flag("build_special", true);
    pkg.config.set_lines("profile_payload", {"./bench"});
    CHECK(pgo_marker_path(pkg.kind, pkg.config, variant::special)
          == "build-special/statuspgo.special");
    f.sandbox.build_files.insert(pgo_marker_path(pkg.kind, pkg.config));
    f.sandbox.script = [](int) { return sandbox_result{.success = true}; };

    SECTION("The special tree's marker is missing") {
        convergence_driver driver{pkg, f.sandbox, f.classifier, f.options()};
        CHECK_THROWS_AS(driver.run(), precondition_error<errc::pgo_marker_missing>);
    }
    SECTION("Both markers are present") {
        f.sandbox.build_files.insert(pgo_marker_path(pkg.kind, pkg.config, variant::special));
        convergence_driver driver{pkg, f.sandbox, f.classifier, f.options()};
        auto               outcome = driver.run();
        CHECK(outcome.success);
        CHECK(outcome.round == 2);
    }
}
