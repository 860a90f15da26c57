#pragma once

#include <optional>
#include <string>

namespace respec {

/// Read an environment variable. An unset or empty variable yields nullopt.
std::optional<std::string> getenv(const std::string& name) noexcept;

}  // namespace respec
