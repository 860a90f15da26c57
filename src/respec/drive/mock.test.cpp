#include "./mock.hpp"

#include <catch2/catch.hpp>

using namespace respec;

TEST_CASE("Unpackaged files are read from the build log") {
    auto log = R"(Processing files: foo-bin-1.0-1.x86_64
Checking for unpackaged file(s): /usr/lib/rpm/check-files /builddir/build/BUILDROOT/foo
error: Installed (but unpackaged) file(s) found:
   /usr/bin/foo-helper
   /usr/share/foo/data.txt
   /usr/bin/foo-helper

RPM build errors:
    Installed (but unpackaged) file(s) found:
   /usr/lib64/libfoo.a
)";
    auto files = parse_unpackaged_files(log);
    CHECK(files
          == std::vector<std::string>{
              "/usr/bin/foo-helper",
              "/usr/share/foo/data.txt",
              "/usr/lib64/libfoo.a",
          });
}

TEST_CASE("A clean build log has no unpackaged files") {
    CHECK(parse_unpackaged_files("Wrote: /builddir/build/RPMS/foo-1.0-1.x86_64.rpm\n").empty());
}

TEST_CASE("The mock build root is per package") {
    mock_builder mock{mock_options{.config = "clear", .target_dir = "/tmp/foo", .uniqueext = "foo"}};
    CHECK(mock.build_root() == "/var/lib/mock/clear-foo/root/builddir/build/BUILD");
    CHECK(mock.results_dir() == "/tmp/foo/results");
}
