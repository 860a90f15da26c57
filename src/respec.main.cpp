#include <respec/cli/dispatch_main.hpp>
#include <respec/cli/options.hpp>
#include <respec/cli/parse_cli.hpp>
#include <respec/util/log.hpp>
#include <respec/util/signal.hpp>

#include <string>
#include <vector>

int main(int argc, char** argv) {
    respec::log::init_logger();

    respec::cli::options opts;
    auto early_exit = respec::cli::parse_command_line(opts, argv[0], {argv + 1, argv + argc});
    if (early_exit) {
        return *early_exit;
    }
    respec::install_signal_handlers();
    return respec::cli::dispatch_main(opts);
}
