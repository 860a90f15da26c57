#include "./parse_cli.hpp"

#include "./options.hpp"

#include <boost/leaf/handle_errors.hpp>
#include <fmt/core.h>

#include <cstdio>

using namespace respec::cli;

std::optional<int> respec::cli::parse_command_line(options&                        opts,
                                                   std::string_view                prog,
                                                   const std::vector<std::string>& argv) {
    return boost::leaf::try_catch(
        [&]() -> std::optional<int> {
            opts = parse_options(argv);
            return std::nullopt;
        },
        [&](const help_request& req) -> std::optional<int> {
            fmt::print("{}", help_string(prog, req.subcommand()));
            return 0;
        },
        [&](const usage_error& err) -> std::optional<int> {
            // Usage line first, so the message is the last thing on screen
            fmt::print(stderr,
                       "{}\nrespec: {}\n",
                       usage_string(prog, err.subcommand()),
                       err.what());
            return 2;
        });
}
