#include "./error_handler.hpp"

#include <respec/error/errors.hpp>
#include <respec/error/marker.hpp>
#include <respec/util/fs/io.hpp>
#include <respec/util/log.hpp>
#include <respec/util/signal.hpp>
#include <respec/util/yaml/errors.hpp>

#include <boost/leaf/common.hpp>
#include <boost/leaf/handle_errors.hpp>
#include <boost/leaf/pred.hpp>
#include <fmt/ostream.h>

#include <system_error>

using namespace respec;

namespace {

void log_explained(const error_base& exc) {
    respec_log(error, "{}", exc.what());
    respec_log(error, "{}", exc.explanation());
}

auto handlers = std::tuple(  //
    [](e_yaml_parse_error error, e_parse_yaml_file_path fpath, e_yaml_mark const* mark) {
        if (mark && mark->line > 0) {
            respec_log(error,
                       "Invalid YAML in [{}:{}:{}]: {}",
                       fpath.value.string(),
                       mark->line,
                       mark->column,
                       error.value);
        } else {
            respec_log(error, "Invalid YAML in [{}]: {}", fpath.value.string(), error.value);
        }
        write_error_marker("config-yaml-parse-error");
        return 1;
    },
    [](const user_cancelled& exc) {
        respec_log(critical, "Operation cancelled by the user (signal {})", exc.signal());
        write_error_marker("cancelled");
        return 2;
    },
    [](const user_error<errc::round_budget_exhausted>& exc) {
        log_explained(exc);
        write_error_marker("round-budget-exhausted");
        return 3;
    },
    [](const precondition_error_base&              exc,
       boost::leaf::verbose_diagnostic_info const& diag) {
        log_explained(exc);
        respec_log(debug, "Additional diagnostic details:\n{}", fmt::streamed(diag));
        write_error_marker("precondition-violated");
        return 4;
    },
    [](const user_error_base&                      exc,
       e_parse_yaml_file_path const*               fpath,
       e_yaml_key const*                           key,
       boost::leaf::verbose_diagnostic_info const& diag) {
        log_explained(exc);
        if (key) {
            respec_log(error, "  (At configuration key '{}')", key->value);
        }
        if (fpath) {
            respec_log(error,
                       "  (While reading package configuration [{}])",
                       fpath->value.string());
        }
        respec_log(debug, "Additional diagnostic details:\n{}", fmt::streamed(diag));
        return 1;
    },
    [](const std::system_error& exc, e_open_file_path fpath) {
        respec_log(error, "{}", exc.what());
        respec_log(debug, "  (I/O failure on [{}])", fpath.value.string());
        write_error_marker("io-failure");
        return 1;
    },
    [](const std::system_error& exc, boost::leaf::verbose_diagnostic_info const& diag) {
        respec_log(critical,
                   "An unhandled std::system_error arose. THIS IS A RESPEC BUG! Info: {}",
                   fmt::streamed(diag));
        respec_log(critical, "Exception message from std::system_error: {}", exc.code().message());
        return 42;
    },
    [](boost::leaf::verbose_diagnostic_info const& diag) {
        respec_log(critical,
                   "An unhandled error arose. THIS IS A RESPEC BUG! Info: {}",
                   fmt::streamed(diag));
        return 42;
    });

}  // namespace

int respec::handle_cli_errors(std::function<int()> fn) noexcept {
    return boost::leaf::try_catch(fn, handlers);
}
