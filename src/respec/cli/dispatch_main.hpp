#pragma once

namespace respec::cli {

struct options;

int dispatch_main(const options&) noexcept;

}  // namespace respec::cli
