#include "./io.hpp"

#include <respec/error/on_error.hpp>

#include <boost/leaf/common.hpp>
#include <boost/leaf/exception.hpp>
#include <fmt/core.h>

#include <cerrno>
#include <fstream>
#include <iterator>
#include <system_error>

using namespace respec;

namespace {

[[noreturn]] void throw_io_failure(int err, std::string_view verb, const std::filesystem::path& p) {
    auto ec = std::error_code{err ? err : EIO, std::system_category()};
    BOOST_LEAF_THROW_EXCEPTION(
        std::system_error(ec, fmt::format("Failed to {} [{}]", verb, p.string())),
        boost::leaf::e_errno{ec.value()},
        ec);
}

}  // namespace

void respec::write_file(const std::filesystem::path& dest, std::string_view content) {
    RESPEC_E_SCOPE(e_open_file_path{dest});
    errno = 0;
    std::ofstream out{dest, std::ios::binary | std::ios::trunc};
    if (!out) {
        throw_io_failure(errno, "open for writing", dest);
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) {
        throw_io_failure(errno, "write", dest);
    }
}

std::string respec::read_file(const std::filesystem::path& path) {
    RESPEC_E_SCOPE(e_open_file_path{path});
    errno = 0;
    std::ifstream in{path, std::ios::binary};
    if (!in) {
        throw_io_failure(errno, "open", path);
    }
    std::string content{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    if (in.bad()) {
        throw_io_failure(errno, "read", path);
    }
    return content;
}
