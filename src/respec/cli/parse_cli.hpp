#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace respec::cli {

struct options;

/**
 * Parse the command line into `opts`. A help request or a malformed command line is reported
 * on the console, and the process exit code is returned. nullopt means "run the command".
 */
std::optional<int> parse_command_line(options&                        opts,
                                       std::string_view                program_name,
                                       const std::vector<std::string>& argv);

}  // namespace respec::cli
