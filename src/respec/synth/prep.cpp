#include "./prep.hpp"

#include <respec/config/build_config.hpp>
#include <respec/recipe/source_layout.hpp>
#include <respec/util/log.hpp>
#include <respec/util/string.hpp>

#include <fmt/core.h>

using namespace respec;

namespace {

bool is_metadata_only(std::string_view url) {
    return ends_with(url, ".pom") || ends_with(url, ".jar") || ends_with(url, ".patch");
}

std::string explicit_prefix_dir(const std::string& prefix) {
    auto base = std::string(url_basename(prefix));
    if (!trim_view(base).empty() && base != prefix) {
        return base;
    }
    return prefix;
}

void write_main_setup(const synth_context& ctx) {
    auto& cfg = ctx.cfg;
    if (ctx.kind == build_system_kind::ruby && cfg.flag("ruby_pattern_from_gemspec")) {
        ctx.layout.record(cfg.url, cfg.gem_subdir, false);
        ctx.out.write_strip("gem unpack %{SOURCE0}");
        ctx.out.write_strip("%setup -q -D -T -n " + cfg.gem_subdir);
        ctx.out.write_strip(fmt::format("gem spec %{{SOURCE0}} -l --ruby > {}.gemspec", cfg.name));
        return;
    }
    auto dir = main_tree_dir(ctx.kind, cfg);
    if (ctx.kind == build_system_kind::R || !cfg.prefix) {
        ctx.out.write_strip("%setup -q -c -n " + dir);
    } else if (dir != *cfg.prefix) {
        ctx.out.write_strip("%setup -c -n " + dir);
        ctx.out.write_strip(
            fmt::format(R"(find {} -mindepth 1 -name '*' -exec mv -n {{}} ./ \; || :)", *cfg.prefix));
    } else {
        ctx.out.write_strip("%setup -q -n " + dir);
    }
    ctx.layout.record(cfg.url, dir, !cfg.prefix.has_value());
}

void write_archives(const synth_context& ctx) {
    for (auto& archive : ctx.cfg.archives) {
        if (is_metadata_only(archive.url)) {
            continue;
        }
        auto file    = url_basename(archive.url);
        auto extract = ends_with(file, ".zip") ? fmt::format("unzip -q %{{_sourcedir}}/{}", file)
                                               : fmt::format("tar xf %{{_sourcedir}}/{}", file);
        ctx.out.write_strip("cd %{_builddir}");
        if (!archive.prefix.empty()) {
            ctx.out.write_strip(extract);
            ctx.layout.record(archive.url, archive.prefix, false);
        } else {
            // No top-level directory inside, so extract below a made-up one
            auto fake = synthesized_prefix(archive.url);
            ctx.out.write_strip("mkdir -p " + fake);
            ctx.out.write_strip("cd " + fake);
            ctx.out.write_strip(extract);
            ctx.layout.record(archive.url, fake, true);
        }
    }
}

void write_versions(const synth_context& ctx) {
    for (auto& ver : ctx.cfg.versions) {
        auto index = ctx.layout.index_of(ver.url);
        ctx.out.write_strip("cd ..");
        if (!ver.prefix.empty()) {
            ctx.out.write_strip(fmt::format("%setup -q -T -n {} -b {}", ver.prefix, index));
            ctx.layout.record(ver.url, ver.prefix, false);
        } else {
            auto fake = synthesized_prefix(ver.url);
            ctx.out.write_strip(fmt::format("%setup -q -T -c -n {} -b {}", fake, index));
            ctx.layout.record(ver.url, fake, true);
        }
    }
    if (!ctx.cfg.versions.empty()) {
        ctx.out.write_strip("cd %{_builddir}/" + ctx.layout.main_dir());
    }
}

void write_destinations(const synth_context& ctx) {
    auto& main = ctx.layout.main_dir();
    for (auto& archive : ctx.cfg.archives) {
        if (archive.destination.empty() || archive.destination.starts_with(':')
            || is_metadata_only(archive.url)) {
            continue;
        }
        auto& dir = ctx.layout.dir_of(archive.url);
        if (dir == main) {
            respec_log(debug,
                       "Archive {} is already unpacked in {}; ignoring its destination",
                       archive.url,
                       main);
            continue;
        }
        ctx.out.write_strip("mkdir -p " + archive.destination);
        ctx.out.write_strip(fmt::format("cp -a %{{_builddir}}/{}/* %{{_builddir}}/{}/{}",
                                        dir,
                                        main,
                                        archive.destination));
    }
}

void write_cargo_vendoring(const synth_context& ctx) {
    if (!ctx.cfg.flag("altcargo1") && !ctx.cfg.flag("altcargo_pgo")) {
        return;
    }
    ctx.out.write_strip("export CARGO_NET_GIT_FETCH_WITH_CLI=true");
    ctx.out.write_strip("export SSL_CERT_FILE=/var/cache/ca-certs/anchors/ca-certificates.crt");
    ctx.out.write_strip("export CARGO_HTTP_CAINFO=/var/cache/ca-certs/anchors/ca-certificates.crt");
    ctx.out.write_strip("cargo update --verbose");
    if (ctx.cfg.has_lines("cargo_update")) {
        ctx.out.write_content_block("cargo_update", ctx.cfg.lines("cargo_update"));
    }
    ctx.out.write_strip("cargo fetch --verbose");
}

/// Write `%patchN` lines, numbering from `counter`. Returns the next number.
int write_patch_list(const synth_context& ctx, const std::vector<std::string>& patches, int counter) {
    for (auto& patch : patches) {
        auto spec    = trim_view(patch);
        auto space   = spec.find_first_of(" \t");
        auto name    = spec.substr(0, space);
        auto options = space == spec.npos ? std::string_view("-p1") : trim_view(spec.substr(space));
        if (!ends_with(name, ".nopatch")) {
            ctx.out.write_strip(fmt::format("%patch{} {}", counter, options));
        }
        ++counter;
    }
    return counter;
}

void write_patches(const synth_context& ctx) {
    auto counter = write_patch_list(ctx, ctx.cfg.patches, 1);
    for (auto& [url, patches] : ctx.cfg.version_patches) {
        if (patches.empty()) {
            continue;
        }
        ctx.out.write_strip("cd ../" + ctx.layout.dir_of(url));
        counter = write_patch_list(ctx, patches, counter);
    }
}

void write_tree_copies(const synth_context& ctx) {
    auto& main = ctx.layout.main_dir();
    for (auto& step : ctx.plan.install) {
        if (step.var == variant::default64) {
            continue;
        }
        ctx.out.write_strip("pushd %{_builddir}");
        ctx.out.write_strip(
            fmt::format("cp -a %{{_builddir}}/{} {}", main, traits_of(step.var).tree_dir));
        ctx.out.write_strip("popd");
    }
}

}  // namespace

std::string respec::main_tree_dir(build_system_kind kind, const build_config& cfg) {
    if (kind == build_system_kind::ruby && cfg.flag("ruby_pattern_from_gemspec")) {
        return cfg.gem_subdir;
    }
    if (!cfg.prefix) {
        return synthesized_prefix(cfg.url);
    }
    if (kind == build_system_kind::R) {
        return *cfg.prefix;
    }
    return explicit_prefix_dir(*cfg.prefix);
}

void respec::write_prep(const synth_context& ctx, tree_layout layout) {
    ctx.out.begin_section("%prep");
    ctx.out.write_content_block("prep_prepend", ctx.cfg.lines("prep_prepend"));
    if (ctx.kind == build_system_kind::godep) {
        // Each module proxy file is installed as is
        ctx.out.write_strip("");
        return;
    }
    write_main_setup(ctx);
    write_archives(ctx);
    ctx.out.write_strip("cd %{_builddir}/" + ctx.layout.main_dir());
    write_versions(ctx);
    write_destinations(ctx);
    write_cargo_vendoring(ctx);
    write_patches(ctx);
    if (layout == tree_layout::copied_trees) {
        write_tree_copies(ctx);
    }
    ctx.out.write_strip("");
}
