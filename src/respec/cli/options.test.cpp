#include "./options.hpp"

#include <catch2/catch.hpp>

using namespace respec::cli;

TEST_CASE("Parse each subcommand") {
    auto synth = parse_options({"synth", "pkg.yaml", "-o", "foo.spec", "--phase=use"});
    CHECK(synth.subcommand == subcommand::synth);
    CHECK(synth.config_path == "pkg.yaml");
    CHECK(synth.synth.out == "foo.spec");
    CHECK(synth.synth.phase == pgo_phase::use);
    CHECK_FALSE(synth.log_level);

    auto build = parse_options({"-l", "debug",
                                "build",
                                "--target=/tmp/foo",
                                "pkg.yaml",
                                "-mclear-i",
                                "--mock-opts",
                                "--with lto --without docs",
                                "--max-rounds",
                                "7"});
    CHECK(build.subcommand == subcommand::build);
    CHECK(build.log_level == respec::log::level::debug);
    CHECK(build.build.target_dir == "/tmp/foo");
    CHECK(build.build.mock_config == "clear-i");
    CHECK(build.build.mock_opts == "--with lto --without docs");
    CHECK(build.build.max_rounds == 7);

    auto plan = parse_options({"plan", "pkg.yaml", "--log-level=trace"});
    CHECK(plan.subcommand == subcommand::plan);
    CHECK(plan.log_level == respec::log::level::trace);
}

TEST_CASE("Build options keep their defaults") {
    auto opts = parse_options({"build", "pkg.yaml", "-t", "out"});
    CHECK(opts.build.mock_config == "clear");
    CHECK(opts.build.mock_opts.empty());
    CHECK(opts.build.max_rounds == 20);
}

TEST_CASE("Malformed command lines are usage errors") {
    using argv = std::vector<std::string>;
    auto bad   = GENERATE(argv{},
                        argv{"pkg.yaml"},
                        argv{"frobnicate", "pkg.yaml"},
                        argv{"synth"},
                        argv{"synth", "a.yaml", "b.yaml"},
                        argv{"synth", "pkg.yaml", "--phase=later"},
                        argv{"synth", "pkg.yaml", "-o"},
                        argv{"synth", "pkg.yaml", "-o", "a", "--out=b"},
                        argv{"synth", "pkg.yaml", "--target=x"},
                        argv{"plan", "pkg.yaml", "-o", "x"},
                        argv{"build", "pkg.yaml"},
                        argv{"build", "pkg.yaml", "-t", "x", "--max-rounds=0"},
                        argv{"build", "pkg.yaml", "-t", "x", "--max-rounds=many"},
                        argv{"-l", "chatty", "plan", "pkg.yaml"});
    CAPTURE(bad);
    CHECK_THROWS_AS(parse_options(bad), usage_error);
}

TEST_CASE("Usage errors name the subcommand they belong to") {
    try {
        parse_options({"build", "pkg.yaml"});
        FAIL("Expected a usage error");
    } catch (const usage_error& err) {
        CHECK(err.subcommand() == subcommand::build);
        CHECK(std::string(err.what()).find("--target") != std::string::npos);
    }
}

TEST_CASE("Help is available at every level") {
    CHECK_THROWS_AS(parse_options({"--help"}), help_request);
    try {
        parse_options({"synth", "-h"});
        FAIL("Expected a help request");
    } catch (const help_request& req) {
        CHECK(req.subcommand() == subcommand::synth);
    }
    auto help = help_string("respec", subcommand::build);
    CHECK(help.find("mock-opts") != std::string::npos);
    CHECK(usage_string("respec", subcommand::plan).find("respec [-l <level>] plan <config.yaml>")
          != std::string::npos);
}
