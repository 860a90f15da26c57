#include "./source_layout.hpp"

#include <respec/config/build_config.hpp>
#include <respec/error/errors.hpp>

#include <catch2/catch.hpp>

using namespace respec;

TEST_CASE("Synthesized prefixes drop the last extension") {
    CHECK(synthesized_prefix("https://example.com/dl/foo-1.0.tar.gz") == "foo-1.0.tar");
    CHECK(synthesized_prefix("https://example.com/dl/foo-1.0.zip") == "foo-1");
    CHECK(synthesized_prefix("README") == "README");
    CHECK(url_basename("https://example.com/dl/foo-1.0.zip") == "foo-1.0.zip");
}

TEST_CASE("Sources are numbered in sorted order, with extra sources last") {
    build_config cfg;
    cfg.url           = "https://example.com/foo-1.0.tar.gz";
    cfg.archives      = {{.url = "https://example.com/zlib.tar.gz"},
                         {.url = "https://example.com/bar.tar.gz"}};
    cfg.units         = {"foo.service"};
    cfg.extra_sources = {{.file = "foo.conf", .install_args = "/etc/foo.conf"}};

    source_layout layout{cfg};
    CHECK(layout.index_of(cfg.url) == 0);
    CHECK(layout.numbered_sources()
          == std::vector<std::string>{"foo.service",
                                      "https://example.com/bar.tar.gz",
                                      "https://example.com/zlib.tar.gz",
                                      "foo.conf"});
    CHECK(layout.index_of("https://example.com/zlib.tar.gz") == 3);
    CHECK(layout.index_of("foo.conf") == 4);
    CHECK_THROWS_AS(layout.index_of("https://example.com/nope.tar.gz"), precondition_error_base);
}

TEST_CASE("Extraction directories must be recorded before they are used") {
    build_config cfg;
    cfg.url = "https://example.com/foo-1.0.tar.gz";
    source_layout layout{cfg};
    CHECK_FALSE(layout.contains(cfg.url));
    CHECK_THROWS_AS(layout.main_dir(), precondition_error<errc::missing_source_layout>);

    layout.record(cfg.url, "foo-1.0", false);
    CHECK(layout.main_dir() == "foo-1.0");
    layout.record("https://example.com/bar.zip", "bar", true);
    CHECK(layout.entry_of("https://example.com/bar.zip").synthesized);
}
