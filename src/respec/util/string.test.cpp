#include <respec/util/string.hpp>

#include <catch2/catch.hpp>

using namespace respec;

TEST_CASE("Trim leading and trailing whitespace") {
    CHECK(trim("  foo \n") == "foo");
    CHECK(trim("\t\t") == "");
    CHECK(trim("") == "");
    CHECK(trim("a b") == "a b");
}

TEST_CASE("Split on a separator") {
    CHECK(split("a,b,c", ",") == std::vector<std::string>{"a", "b", "c"});
    CHECK(split("a", ",") == std::vector<std::string>{"a"});
    CHECK(split("a,,", ",") == std::vector<std::string>{"a", "", ""});
}

TEST_CASE("Split lines drops the trailing newline only") {
    CHECK(split_lines("one\ntwo\n") == std::vector<std::string>{"one", "two"});
    CHECK(split_lines("one\n\n") == std::vector<std::string>{"one", ""});
    CHECK(split_lines("").empty());
}

TEST_CASE("Replace every occurrence") {
    CHECK(replace("a-b-c", "-", "+") == "a+b+c");
    CHECK(replace("nothing", "x", "y") == "nothing");
}

TEST_CASE("Join a range") {
    std::vector<std::string> v = {"x", "y", "z"};
    CHECK(joinstr(" ", v) == "x y z");
    CHECK(joinstr(",", std::vector<std::string>{}) == "");
}

TEST_CASE("Split option strings into words") {
    CHECK(split_words("  --with  foo\t--no-check ")
          == std::vector<std::string>{"--with", "foo", "--no-check"});
    CHECK(split_words("   ").empty());
    CHECK(split_words("").empty());
}
