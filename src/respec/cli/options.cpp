#include "./options.hpp"

#include <boost/leaf/exception.hpp>
#include <fmt/color.h>
#include <fmt/core.h>
#include <fmt/format.h>
#include <magic_enum.hpp>

#include <algorithm>
#include <charconv>
#include <functional>
#include <span>

using namespace respec;
using namespace respec::cli;

namespace {

/// How one option stores its value into the options aggregate.
using option_setter = std::function<void(options&, std::string_view value)>;

struct option_spec {
    std::string_view long_name;
    char             short_name = 0;
    std::string_view valname;
    std::string_view help;
    option_setter    apply;
};

[[noreturn]] void fail(subcommand sub, std::string msg) {
    BOOST_LEAF_THROW_EXCEPTION(usage_error(sub, msg));
}

template <typename Enum>
Enum parse_enum(subcommand sub, std::string_view option, std::string_view value) {
    auto e = magic_enum::enum_cast<Enum>(value);
    if (!e) {
        auto names = magic_enum::enum_names<Enum>();
        fail(sub,
             fmt::format("'{}' is not a valid value for '--{}'. Expected one of: {}",
                         value,
                         option,
                         fmt::join(names, ", ")));
    }
    return *e;
}

const option_spec log_level_option{
    "log-level",
    'l',
    "<level>",
    "Console logging level: trace, debug, info, warn, error, critical or silent",
    [](options& o, std::string_view v) {
        o.log_level = parse_enum<log::level>(o.subcommand, "log-level", v);
    },
};

const option_spec synth_options[] = {
    {"out",
     'o',
     "<path>",
     "Write the recipe to this file instead of stdout",
     [](options& o, std::string_view v) { o.synth.out = std::filesystem::path(v); }},
    {"phase",
     0,
     "{generate,use}",
     "Write the given phase of an externally phased PGO build",
     [](options& o, std::string_view v) {
         o.synth.phase = parse_enum<pgo_phase>(o.subcommand, "phase", v);
     }},
};

const option_spec build_options[] = {
    {"target",
     't',
     "<dir>",
     "Directory holding the package sources. The recipe and sandbox results go here. Required.",
     [](options& o, std::string_view v) { o.build.target_dir = std::filesystem::path(v); }},
    {"mock-config",
     'm',
     "<config>",
     "Value for mock's -r option. Default is 'clear'",
     [](options& o, std::string_view v) { o.build.mock_config = std::string(v); }},
    {"mock-opts",
     0,
     "<opts>",
     "Additional options for every mock invocation",
     [](options& o, std::string_view v) { o.build.mock_opts = std::string(v); }},
    {"max-rounds",
     0,
     "<count>",
     "Abandon the build after this many rounds. Default is 20",
     [](options& o, std::string_view v) {
         int  n   = 0;
         auto res = std::from_chars(v.data(), v.data() + v.size(), n);
         if (res.ec != std::errc{} || res.ptr != v.data() + v.size() || n < 1) {
             fail(o.subcommand,
                  fmt::format("'--max-rounds' needs a positive number, not '{}'", v));
         }
         o.build.max_rounds = n;
     }},
};

std::span<const option_spec> options_of(subcommand sub) {
    switch (sub) {
    case subcommand::synth:
        return synth_options;
    case subcommand::build:
        return build_options;
    case subcommand::plan:
    case subcommand::_none_:
        break;
    }
    return {};
}

std::string_view description_of(subcommand sub) {
    switch (sub) {
    case subcommand::synth:
        return "Write the recipe for a package";
    case subcommand::build:
        return "Build a package in the sandbox until its recipe converges";
    case subcommand::plan:
        return "Print the variant blocks and PGO stages a recipe would contain";
    case subcommand::_none_:
        break;
    }
    return "Synthesize RPM recipes and converge them in a mock sandbox";
}

/// Walks the argument list, holding the state the option lookups need.
struct parser {
    std::span<const std::string> args;
    options                      opts;
    std::vector<std::string>     seen;

    const option_spec* find_long(std::string_view name) const {
        if (name == log_level_option.long_name) {
            return &log_level_option;
        }
        auto specs = options_of(opts.subcommand);
        auto it    = std::ranges::find(specs, name, &option_spec::long_name);
        return it == specs.end() ? nullptr : &*it;
    }

    const option_spec* find_short(char c) const {
        if (c == log_level_option.short_name) {
            return &log_level_option;
        }
        auto specs = options_of(opts.subcommand);
        auto it    = std::ranges::find(specs, c, &option_spec::short_name);
        return it == specs.end() ? nullptr : &*it;
    }

    /// Take the value of an option given without an attached one. The value may itself start
    /// with a dash, as `--mock-opts` values do.
    std::string_view next_value(std::string_view spelling) {
        if (args.empty()) {
            fail(opts.subcommand, fmt::format("'{}' requires a value", spelling));
        }
        std::string_view ret = args.front();
        args                 = args.subspan(1);
        return ret;
    }

    void apply(const option_spec& spec, std::string_view spelling, std::string_view value) {
        if (std::ranges::find(seen, spec.long_name) != seen.end()) {
            fail(opts.subcommand, fmt::format("'{}' was given twice", spelling));
        }
        seen.emplace_back(spec.long_name);
        spec.apply(opts, value);
    }

    void long_option(std::string_view arg) {
        auto body = arg.substr(2);
        auto eq   = body.find('=');
        auto name = body.substr(0, eq);
        if (name == "help") {
            BOOST_LEAF_THROW_EXCEPTION(help_request(opts.subcommand));
        }
        auto spec = find_long(name);
        if (!spec) {
            fail(opts.subcommand, fmt::format("unknown option '--{}'", name));
        }
        auto value = eq == body.npos ? next_value(arg) : body.substr(eq + 1);
        apply(*spec, fmt::format("--{}", name), value);
    }

    void short_option(std::string_view arg) {
        char c = arg[1];
        if (c == 'h') {
            BOOST_LEAF_THROW_EXCEPTION(help_request(opts.subcommand));
        }
        auto spec = find_short(c);
        if (!spec) {
            fail(opts.subcommand, fmt::format("unknown option '-{}'", c));
        }
        auto value = arg.size() > 2 ? arg.substr(2) : next_value(arg);
        apply(*spec, arg.substr(0, 2), value);
    }

    void positional(std::string_view arg) {
        if (opts.subcommand == subcommand::_none_) {
            auto sub = magic_enum::enum_cast<subcommand>(arg);
            if (!sub || *sub == subcommand::_none_) {
                fail(subcommand::_none_, fmt::format("unknown subcommand '{}'", arg));
            }
            opts.subcommand = *sub;
            return;
        }
        if (!opts.config_path.empty()) {
            fail(opts.subcommand, fmt::format("unexpected argument '{}'", arg));
        }
        opts.config_path = std::filesystem::path(arg);
    }

    options run() {
        while (!args.empty()) {
            std::string_view arg = args.front();
            args                 = args.subspan(1);
            if (arg.starts_with("--")) {
                long_option(arg);
            } else if (arg.size() > 1 && arg.starts_with('-')) {
                short_option(arg);
            } else {
                positional(arg);
            }
        }
        if (opts.subcommand == subcommand::_none_) {
            fail(subcommand::_none_, "a subcommand is required");
        }
        if (opts.config_path.empty()) {
            fail(opts.subcommand, "the package configuration <config.yaml> is required");
        }
        if (opts.subcommand == subcommand::build && opts.build.target_dir.empty()) {
            fail(opts.subcommand, "'--target' is required");
        }
        return std::move(opts);
    }
};

std::string option_synopsis(const option_spec& spec) {
    if (spec.short_name) {
        return fmt::format("[-{} {}]", spec.short_name, spec.valname);
    }
    return fmt::format("[--{} {}]", spec.long_name, spec.valname);
}

void append_option_help(std::string& out, const option_spec& spec) {
    out += "  ";
    if (spec.short_name) {
        out += fmt::format(fmt::emphasis::bold, "-{}", spec.short_name);
        out += ", ";
    }
    out += fmt::format(fmt::emphasis::bold, "--{}", spec.long_name);
    out += fmt::format(fmt::emphasis::italic, " {}", spec.valname);
    out += fmt::format("\n      {}\n", spec.help);
}

}  // namespace

options cli::parse_options(const std::vector<std::string>& argv) {
    return parser{.args = argv}.run();
}

std::string cli::usage_string(std::string_view program, subcommand sub) {
    auto ret = fmt::format("Usage: {} {}", program, option_synopsis(log_level_option));
    if (sub == subcommand::_none_) {
        return ret + " {synth,build,plan} <config.yaml> ...";
    }
    ret += fmt::format(" {} <config.yaml>", magic_enum::enum_name(sub));
    for (auto& spec : options_of(sub)) {
        ret += " " + option_synopsis(spec);
    }
    return ret;
}

std::string cli::help_string(std::string_view program, subcommand sub) {
    auto ret = usage_string(program, sub) + "\n\n" + std::string(description_of(sub)) + "\n\n";
    if (sub == subcommand::_none_) {
        ret += "Subcommands:\n";
        for (auto s : {subcommand::synth, subcommand::build, subcommand::plan}) {
            ret += fmt::format(fmt::emphasis::bold, "  {:<7}", magic_enum::enum_name(s));
            ret += fmt::format("{}\n", description_of(s));
        }
        ret += "\n";
    } else {
        ret += "  <config.yaml>\n      The package configuration file\n";
    }
    ret += "Options:\n";
    append_option_help(ret, log_level_option);
    for (auto& spec : options_of(sub)) {
        append_option_help(ret, spec);
    }
    return ret;
}
