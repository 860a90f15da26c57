#include "./dispatch_main.hpp"

#include "./error_handler.hpp"
#include "./options.hpp"

#include <respec/error/errors.hpp>
#include <respec/error/on_error.hpp>
#include <respec/util/env.hpp>

using namespace respec;

namespace respec::cli {

namespace cmd {
using command = int(const options&);

command synth;
command build;
command plan;

}  // namespace cmd

int dispatch_main(const options& opts) noexcept {
    return respec::handle_cli_errors([&] {
        if (opts.log_level) {
            log::current_log_level = *opts.log_level;
        } else if (auto env_level = respec::getenv("RESPEC_LOG_LEVEL")) {
            log::current_log_level = log::parse_level(*env_level);
        }
        RESPEC_E_SCOPE(opts.subcommand);
        switch (opts.subcommand) {
        case subcommand::synth:
            return cmd::synth(opts);
        case subcommand::build:
            return cmd::build(opts);
        case subcommand::plan:
            return cmd::plan(opts);
        case subcommand::_none_:;
        }
        throw_precondition_error<errc::invalid_config>("No subcommand was selected");
    });
}

}  // namespace respec::cli
