#include "./variant.hpp"

#include <respec/config/build_config.hpp>

#include <algorithm>

using namespace respec;

namespace {

constexpr variant_traits traits_32{"32bit", "32bit", "_32", "_32", "build32", "clr-build32"};
constexpr variant_traits traits_avx512{"avx512",
                                       "use_avx512",
                                       "_avx512",
                                       "_avx512",
                                       "buildavx512",
                                       "clr-build-avx512"};
constexpr variant_traits traits_avx2{"avx2",
                                     "use_avx2",
                                     "_avx2",
                                     "_avx2",
                                     "buildavx2",
                                     "clr-build-avx2"};
constexpr variant_traits traits_openmpi{"openmpi",
                                        "openmpi",
                                        "_openmpi",
                                        "_openmpi",
                                        "build-openmpi",
                                        "clr-build-openmpi"};
constexpr variant_traits traits_special{"special",
                                        "build_special",
                                        "_special",
                                        "_special",
                                        "build-special",
                                        "clr-build-special"};
constexpr variant_traits traits_special2{"special2",
                                         "build_special2",
                                         "_special2",
                                         "_special2",
                                         "build-special2",
                                         "clr-build-special2"};
constexpr variant_traits traits_default{"default64", "", "", "64", "", "clr-build"};

bool is_enabled(variant v, const build_config& cfg) {
    switch (v) {
    case variant::thirty_two_bit:
        return cfg.flag("32bit") || cfg.flag("32bit_only");
    case variant::default64:
        return !cfg.flag("32bit_only");
    case variant::avx512:
    case variant::avx2:
    case variant::openmpi:
    case variant::special:
    case variant::special2:
        return cfg.flag(traits_of(v).option);
    }
    return false;
}

}  // namespace

const variant_traits& respec::traits_of(variant v) noexcept {
    switch (v) {
    case variant::thirty_two_bit:
        return traits_32;
    case variant::avx512:
        return traits_avx512;
    case variant::avx2:
        return traits_avx2;
    case variant::openmpi:
        return traits_openmpi;
    case variant::special:
        return traits_special;
    case variant::special2:
        return traits_special2;
    case variant::default64:
        break;
    }
    return traits_default;
}

std::vector<variant> respec::expand(const build_config& cfg) {
    std::vector<variant> ret;
    std::ranges::copy_if(canonical_variant_order, std::back_inserter(ret), [&](variant v) {
        return is_enabled(v, cfg);
    });
    return ret;
}

std::vector<variant> respec::build_order(const std::vector<variant>& expanded) {
    std::vector<variant> ret;
    if (std::ranges::find(expanded, variant::default64) != expanded.end()) {
        ret.push_back(variant::default64);
    }
    std::ranges::copy_if(expanded, std::back_inserter(ret), [](variant v) {
        return v != variant::default64;
    });
    return ret;
}
