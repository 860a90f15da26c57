#include "./env.hpp"

#include <cstdlib>

std::optional<std::string> respec::getenv(const std::string& name) noexcept {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}
