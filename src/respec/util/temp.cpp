#include "./temp.hpp"

#include <respec/util/log.hpp>

#include <boost/leaf/exception.hpp>

#include <stdlib.h>

#include <cerrno>
#include <system_error>

using namespace respec;

temporary_dir temporary_dir::create() {
    auto tmpl = (std::filesystem::temp_directory_path() / "respec-tmp-XXXXXX").string();
    if (::mkdtemp(tmpl.data()) == nullptr) {
        BOOST_LEAF_THROW_EXCEPTION(
            std::system_error(std::error_code(errno, std::system_category()),
                              "Failed to create a temporary directory"));
    }
    return temporary_dir{tmpl};
}

temporary_dir::~temporary_dir() {
    if (_path.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(_path, ec);
    if (ec) {
        respec_log(warn,
                   "Failed to remove temporary directory [{}]: {}",
                   _path.string(),
                   ec.message());
    }
}
