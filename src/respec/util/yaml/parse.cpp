#include "./parse.hpp"

#include "./errors.hpp"

#include <respec/error/on_error.hpp>
#include <respec/util/fs/io.hpp>

#include <boost/leaf/exception.hpp>
#include <yaml-cpp/exceptions.h>
#include <yaml-cpp/node/parse.h>

using namespace respec;

YAML::Node respec::parse_yaml_file(const std::filesystem::path& fpath) {
    RESPEC_E_SCOPE(e_parse_yaml_file_path{fpath});
    auto content = respec::read_file(fpath);
    try {
        return YAML::Load(content);
    } catch (const YAML::Exception& exc) {
        // yaml-cpp marks are zero-based, and null_mark() is all -1
        e_yaml_mark mark{exc.mark.line + 1, exc.mark.column + 1};
        BOOST_LEAF_THROW_EXCEPTION(exc, e_yaml_parse_error{exc.msg}, mark);
    }
}
