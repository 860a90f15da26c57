#include "./marker.hpp"

#include <respec/util/env.hpp>
#include <respec/util/fs/io.hpp>
#include <respec/util/log.hpp>

#include <system_error>

void respec::write_error_marker(std::string_view error) noexcept {
    respec_log(trace, "[error marker {}]", error);
    auto efile_path = respec::getenv("RESPEC_WRITE_ERROR_MARKER");
    if (!efile_path) {
        return;
    }
    try {
        respec::write_file(*efile_path, error);
        respec_log(trace, "[error marker written to [{}]]", *efile_path);
    } catch (const std::system_error& err) {
        respec_log(warn, "Failed to write error marker [{}]: {}", *efile_path, err.what());
    }
}
