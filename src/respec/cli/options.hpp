#pragma once

#include <respec/util/log.hpp>

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace respec::cli {

/**
 * @brief Top-level respec subcommands
 */
enum class subcommand {
    _none_,
    synth,
    build,
    plan,
};

/// The `--phase` argument of 'respec synth'
enum class pgo_phase {
    generate,
    use,
};

/**
 * @brief Complete aggregate of all respec command-line options
 */
struct options {
    using path     = std::filesystem::path;
    using opt_path = std::optional<path>;

    // The `--log-level` argument. Unset means $RESPEC_LOG_LEVEL, or 'info'.
    std::optional<log::level> log_level;

    // The selected subcommand
    enum subcommand subcommand = subcommand::_none_;

    // The package configuration every subcommand reads
    path config_path;

    /**
     * @brief Parameters specific to 'respec synth'
     */
    struct {
        /// Where to write the recipe. Unset means stdout.
        opt_path out;
        /// Force the externally phased PGO phase
        std::optional<pgo_phase> phase;
    } synth;

    /**
     * @brief Parameters specific to 'respec build'
     */
    struct {
        path        target_dir;
        std::string mock_config = "clear";
        std::string mock_opts;
        int         max_rounds = 20;
    } build;
};

/// A malformed command line. `what()` names the offending argument.
class usage_error : public std::runtime_error {
    enum subcommand _sub;

public:
    usage_error(enum subcommand sub, const std::string& msg)
        : runtime_error(msg)
        , _sub(sub) {}

    /// The subcommand whose usage should be shown. `_none_` for the top level.
    enum subcommand subcommand() const noexcept { return _sub; }
};

/// `-h` or `--help` was given.
class help_request : public std::exception {
    enum subcommand _sub;

public:
    explicit help_request(enum subcommand sub) noexcept
        : _sub(sub) {}

    enum subcommand subcommand() const noexcept { return _sub; }
    const char*     what() const noexcept override { return "Help was requested"; }
};

/**
 * @brief Parse the arguments following the program name.
 *
 * Global options (`-l`) may appear before or after the subcommand. Long options accept
 * `--name=value` and `--name value`, short ones `-xvalue` and `-x value`.
 *
 * @throws usage_error for anything respec cannot run.
 * @throws help_request when help was asked for.
 */
options parse_options(const std::vector<std::string>& argv);

/// One-line synopsis of the given subcommand, or of respec itself for `_none_`.
std::string usage_string(std::string_view program, enum subcommand sub);

/// The synopsis followed by a description of every accepted option.
std::string help_string(std::string_view program, enum subcommand sub);

}  // namespace respec::cli
