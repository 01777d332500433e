#include "zone_types.hpp"

#include <set>

namespace zones {

// ============================================================================
// OhlcvTimeSeries
// ============================================================================

void OhlcvTimeSeries::push_back(const Candle& c) {
    open.push_back(c.open);
    high.push_back(c.high);
    low.push_back(c.low);
    close.push_back(c.close);
    base_volume.push_back(c.base_volume);
    quote_volume.push_back(c.quote_volume);
}

// ============================================================================
// TimeSeriesCollection
// ============================================================================

std::vector<std::string> TimeSeriesCollection::unique_pair_names() const {
    std::set<std::string> names;
    for (const auto& s : series) {
        names.insert(s.pair_interval.name);
    }
    return std::vector<std::string>(names.begin(), names.end());
}

const OhlcvTimeSeries* TimeSeriesCollection::find(const std::string& pair,
                                                  int64_t interval_ms) const {
    for (const auto& s : series) {
        if (s.pair_interval.name == pair &&
            s.pair_interval.interval_ms == interval_ms) {
            return &s;
        }
    }
    return nullptr;
}

std::size_t total_candles(const std::vector<SliceRange>& ranges) {
    std::size_t total = 0;
    for (const auto& range : ranges) {
        if (range.second > range.first) {
            total += range.second - range.first;
        }
    }
    return total;
}

} // namespace zones
