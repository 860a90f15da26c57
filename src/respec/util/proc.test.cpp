#include <respec/util/fs/io.hpp>
#include <respec/util/proc.hpp>
#include <respec/util/temp.hpp>

#include <catch2/catch.hpp>

TEST_CASE("Arguments are quoted only when needed") {
    CHECK(respec::quote_argument("plain-arg") == "plain-arg");
    CHECK(respec::quote_argument("--uniqueext=foo") == "--uniqueext=foo");
    CHECK(respec::quote_argument("two words") == "'two words'");
    CHECK(respec::quote_argument("it's") == R"('it'\''s')");
    CHECK(respec::quote_argument("$HOME") == "'$HOME'");
    CHECK(respec::quote_argument("") == "''");
}

TEST_CASE("Quote a whole command") {
    std::vector<std::string> cmd = {"mock", "-r", "clear", "--result=/tmp/a b/"};
    CHECK(respec::quote_command(cmd) == "mock -r clear '--result=/tmp/a b/'");
}

TEST_CASE("Run a simple subprocess") {
    auto res = respec::run_proc({"sh", "-c", "echo hello; exit 3"});
    CHECK(res.retc == 3);
    CHECK_FALSE(res.okay());
    CHECK(res.output == "hello\n");
}

TEST_CASE("A subprocess that outlives its timeout is stopped") {
    using namespace std::chrono_literals;
    auto res = respec::run_proc({.command = {"sleep", "5"}, .timeout = 100ms});
    CHECK(res.timed_out);
    CHECK_FALSE(res.okay());
}

TEST_CASE("Subprocess output is mirrored into a log file") {
    auto tdir = respec::temporary_dir::create();
    auto log  = tdir.path() / "mock_build.log";
    respec::write_file(log, "stale content from an earlier round\n");
    auto res = respec::run_proc({
        .command     = {"sh", "-c", "echo out; echo err >&2"},
        .output_file = log,
    });
    CHECK(res.okay());
    CHECK(respec::read_file(log) == res.output);
    CHECK(res.output.find("stale") == std::string::npos);
}
