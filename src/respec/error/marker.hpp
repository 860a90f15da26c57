#pragma once

#include <string>
#include <string_view>

namespace respec {

/// Write a short machine-readable error tag to $RESPEC_WRITE_ERROR_MARKER, if set.
void write_error_marker(std::string_view) noexcept;

struct e_error_marker {
    std::string value;
};

}  // namespace respec
