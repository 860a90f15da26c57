#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace respec {

/// Attached to any I/O failure on a recipe, configuration or log file.
struct e_open_file_path {
    std::filesystem::path value;
};

/// Replace the content of `path`, creating it if needed.
void write_file(const std::filesystem::path& path, std::string_view content);

[[nodiscard]] std::string read_file(const std::filesystem::path& path);

}  // namespace respec
