#include "./directive_stream.hpp"

#include <catch2/catch.hpp>

using namespace respec;

TEST_CASE("Sections render their header before their lines") {
    directive_stream out;
    out.write("Name     : foo");
    out.begin_section("%build");
    out.write("make\nmake check\n");
    CHECK(out.render() == "Name     : foo\n%build\nmake\nmake check\n");
}

TEST_CASE("Labeled blocks do not appear in the rendered text") {
    directive_stream out;
    out.begin_section("%install");
    out.begin_block("avx2");
    out.write("pushd ../buildavx2/");
    out.write("popd");
    out.end_block();
    out.write("%make_install");

    auto sec = out.find_section("%install");
    REQUIRE(sec);
    auto blk = sec->find_block("avx2");
    REQUIRE(blk);
    CHECK(blk->lines == std::vector<std::string>{"pushd ../buildavx2/", "popd"});
    CHECK(sec->all_lines()
          == std::vector<std::string>{"pushd ../buildavx2/", "popd", "%make_install"});
    CHECK(out.render() == "%install\npushd ../buildavx2/\npopd\n%make_install\n");
    CHECK(sec->find_block("avx512") == nullptr);
    CHECK(out.find_section("%check") == nullptr);
}

TEST_CASE("Stripped writes trim the text, and blank text is one empty line") {
    directive_stream out;
    out.write_strip("   export LANG=C.UTF-8  \n");
    out.write_strip("  \n ");
    CHECK(out.render() == "export LANG=C.UTF-8\n\n");
}

TEST_CASE("Content blocks are bracketed with their name") {
    directive_stream out;
    out.write_content_block("make_prepend", {"sed -i s/a/b/ Makefile", "", "echo done"});
    out.write_content_block("make_append", {});
    CHECK(out.render()
          == "## make_prepend content\nsed -i s/a/b/ Makefile\n\necho done\n## make_prepend end\n");
}
