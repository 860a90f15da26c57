#pragma once

#include <functional>

namespace respec {

/**
 * @brief Run `fn`, translating any error that escapes it into a logged message and a process
 * exit code.
 */
int handle_cli_errors(std::function<int()> fn) noexcept;

}  // namespace respec
