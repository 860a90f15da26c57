#include <respec/util/time.hpp>

#include <catch2/catch.hpp>

using namespace std::chrono_literals;
using respec::format_duration;

TEST_CASE("Durations are rendered at a readable scale") {
    CHECK(format_duration(0ms) == "0ms");
    CHECK(format_duration(850ms) == "850ms");
    CHECK(format_duration(12'400ms) == "12.4s");
    CHECK(format_duration(185s) == "3m05s");
    CHECK(format_duration(3720s) == "1h02m");
}
