#include "./build_config.hpp"

#include <respec/error/errors.hpp>
#include <respec/error/on_error.hpp>
#include <respec/util/string.hpp>

#include <algorithm>
#include <array>

using namespace respec;

namespace {

constexpr std::array<std::string_view, 32> option_names = {
    "32bit",
    "32bit_only",
    "use_avx2",
    "use_avx512",
    "openmpi",
    "build_special",
    "build_special2",
    "altflags_pgo",
    "altflags_pgo_32",
    "altflags_pgo_ext",
    "altflags_pgo_ext_phase",
    "fsalt1",
    "fsalt1_32",
    "altcargo1",
    "altcargo_pgo",
    "altcargo_sample_bolt",
    "asneeded",
    "use_ninja",
    "use_clang",
    "use_lto",
    "ccstats",
    "skip_tests",
    "autogen_simple",
    "autoreconf",
    "set_gopath",
    "keepstatic",
    "keepbuildroot",
    "nostrip",
    "nodebug",
    "findlang",
    "ruby_pattern_from_gemspec",
    "allow_test_failures",
};

struct string_default {
    std::string_view name;
    std::string_view value;
};

constexpr std::array<string_default, 4> string_defaults = {{
    {"cmake_srcdir", ".."},
    {"parallel_build", "%{?_smp_mflags}"},
    {"disable_static", "--disable-static"},
    {"conf_args_openmpi",
     "--program-prefix= --exec-prefix=$MPI_ROOT --libdir=$MPI_LIB --bindir=$MPI_BIN "
     "--sbindir=$MPI_ROOT/sbin --includedir=$MPI_INCLUDE --datarootdir=$MPI_ROOT/share "
     "--mandir=$MPI_MAN -disable-static"},
}};

const std::vector<std::string> no_lines;

void check_option_name(std::string_view name) {
    if (!is_known_option(name)) {
        RESPEC_E_SCOPE(e_option_name{std::string(name)});
        throw_user_error<errc::unknown_option>("Unknown option '{}'", name);
    }
}

}  // namespace

std::span<const std::string_view> respec::known_options() noexcept { return option_names; }

bool respec::is_known_option(std::string_view name) noexcept {
    return std::ranges::find(option_names, name) != option_names.end();
}

bool build_config::flag(std::string_view name) const {
    check_option_name(name);
    auto it = _flags.find(name);
    return it != _flags.end() && it->second;
}

void build_config::set_flag(std::string_view name, bool value) {
    check_option_name(name);
    _flags.insert_or_assign(std::string(name), value);
}

std::string build_config::str(std::string_view name) const {
    auto it = _strings.find(name);
    if (it != _strings.end()) {
        return it->second;
    }
    auto dflt = std::ranges::find(string_defaults, name, &string_default::name);
    if (dflt != string_defaults.end()) {
        return std::string(dflt->value);
    }
    return {};
}

void build_config::set_str(std::string_view name, std::string value) {
    _strings.insert_or_assign(std::string(name), std::move(value));
}

const std::vector<std::string>& build_config::lines(std::string_view name) const {
    auto it = _macros.find(name);
    if (it == _macros.end()) {
        return no_lines;
    }
    return it->second;
}

bool build_config::has_lines(std::string_view name) const {
    auto& ls = lines(name);
    return !ls.empty() && !trim_view(ls.front()).empty();
}

void build_config::set_lines(std::string_view name, std::vector<std::string> ls) {
    _macros.insert_or_assign(std::string(name), std::move(ls));
}
