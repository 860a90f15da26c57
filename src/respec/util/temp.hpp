#pragma once

#include <filesystem>
#include <utility>

namespace respec {

/// A scratch directory under the system temp dir, removed with its contents on destruction.
class temporary_dir {
    std::filesystem::path _path;

    explicit temporary_dir(std::filesystem::path p) noexcept
        : _path(std::move(p)) {}

public:
    static temporary_dir create();

    temporary_dir(temporary_dir&& o) noexcept
        : _path(std::exchange(o._path, {})) {}
    temporary_dir& operator=(temporary_dir&&) = delete;
    ~temporary_dir();

    const std::filesystem::path& path() const noexcept { return _path; }
};

}  // namespace respec
