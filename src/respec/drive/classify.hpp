#pragma once

#include <string_view>

namespace respec {

struct build_config;

/**
 * @brief Decides what to do with an installed file the recipe did not expect.
 */
class file_classifier {
public:
    virtual ~file_classifier() = default;

    /// Update the configuration to account for `path`. Returns true if anything changed, which
    /// requires another round.
    virtual bool classify(std::string_view path, build_config& cfg) = 0;
};

/// Drops unexpected files from the package by adding them to the excludes.
class exclude_classifier : public file_classifier {
public:
    bool classify(std::string_view path, build_config& cfg) override;
};

}  // namespace respec
