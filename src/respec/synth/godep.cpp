#include "./composers.hpp"
#include "./emit.hpp"
#include "./prep.hpp"

#include <respec/config/build_config.hpp>
#include <respec/recipe/source_layout.hpp>
#include <respec/util/string.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <filesystem>

using namespace respec;

namespace {

constexpr std::string_view module_proxy = "https://proxy.golang.org/";

}  // namespace

/**
 * Go module dependencies are installed as-is into the local module proxy, together with the
 * `list` of versions it serves.
 */
void respec::compose_godep(const synth_context& ctx) {
    auto& cfg = ctx.cfg;
    write_prep(ctx, tree_layout::in_tree);

    ctx.out.begin_section("%install");
    ctx.out.write_content_block("install_prepend", cfg.lines("install_prepend"));
    ctx.out.write_strip("rm -fr %{buildroot}");

    std::string_view module_path = cfg.url;
    if (starts_with(module_path, module_proxy)) {
        module_path.remove_prefix(module_proxy.size());
    }
    auto proxy_dir = (std::filesystem::path("%{buildroot}/usr/share/goproxy")
                      / std::filesystem::path(module_path).parent_path())
                         .string();
    ctx.out.write_strip("mkdir -p " + proxy_dir);
    ctx.out.write_strip("# Create list file using packaged versions");
    for (auto& ver : cfg.godep_versions) {
        ctx.out.write_strip(fmt::format("echo {} >> {}/list", ver, proxy_dir));
    }
    auto sources = cfg.godep_sources;
    std::ranges::sort(sources);
    for (auto& source : sources) {
        ctx.out.write_strip(fmt::format("install -m 0644 %{{SOURCE{}}} {}/{}",
                                        ctx.layout.index_of(source),
                                        proxy_dir,
                                        url_basename(source)));
    }
    ctx.out.write_strip("");
}
