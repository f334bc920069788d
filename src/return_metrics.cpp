#include "return_metrics.hpp"

#include <map>

namespace {

// clang-format off
const std::array<const char*, kIndicatorCount> kCanonicalNames = {
    "return_1d",  "roi_1d",
    "return_2d",  "roi_2d",
    "return_7d",  "roi_7d",
    "return_14d", "roi_14d",
    "return_30d", "roi_30d",
    "return_all", "roi_all",
};

const std::array<const char*, kIndicatorCount> kLegacyNames = {
    "1d_return",  "1d_ROI",
    "2d_return",  "2d_ROI",
    "7d_return",  "7d_ROI",
    "14d_return", "14d_ROI",
    "30d_return", "30d_ROI",
    "all_return", "all_ROI",
};
// clang-format on

const std::map<std::string, Indicator>& nameTable() {
    static const std::map<std::string, Indicator> table = [] {
        std::map<std::string, Indicator> t;
        for (std::size_t i = 0; i < kIndicatorCount; ++i) {
            t.emplace(kCanonicalNames[i], static_cast<Indicator>(i));
            t.emplace(kLegacyNames[i], static_cast<Indicator>(i));
        }
        return t;
    }();
    return table;
}

}  // namespace

std::optional<Indicator> indicatorFromName(const std::string& name) {
    const auto& table = nameTable();
    const auto  it    = table.find(name);
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string indicatorName(Indicator indicator) {
    return kCanonicalNames[static_cast<std::size_t>(indicator)];
}
