#include "./build_system.hpp"

#include <respec/error/errors.hpp>

#include <magic_enum.hpp>

using namespace respec;

build_system_kind respec::parse_build_system(std::string_view name) {
    auto kind = magic_enum::enum_cast<build_system_kind>(name);
    if (!kind) {
        throw_user_error<errc::unknown_build_system>("Unknown build system '{}'", name);
    }
    return *kind;
}

std::string_view respec::build_system_name(build_system_kind kind) noexcept {
    return magic_enum::enum_name(kind);
}
