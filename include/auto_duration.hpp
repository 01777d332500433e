#pragma once

#include "analysis_config.hpp"
#include "zone_types.hpp"

#include <cstdint>
#include <utility>
#include <vector>

namespace zones {

/// Ranges to analyse plus the (min, max) price band they were chosen for
struct RangeSelection {
  std::vector<SliceRange> ranges;
  std::pair<double, double> price_range{0.0, 0.0};
};

/// [price / (1 + t), price * (1 + t)]
std::pair<double, double> calculate_price_range(double current_price,
                                                double threshold);

/// Maximal runs of candles whose [low, high] overlaps [price_min, price_max].
/// End indices are exclusive.
std::vector<SliceRange> find_relevant_ranges(const OhlcvTimeSeries &series,
                                             double price_min,
                                             double price_max);

/// Minimum lookback expressed in candles of this series' interval
std::size_t min_lookback_candles(const OhlcvTimeSeries &series,
                                 std::size_t min_lookback_days);

/// When fewer than the minimum lookback candles are relevant, move the
/// earliest range's start backward by the deficit (saturating at 0). Later
/// ranges are never touched.
std::vector<SliceRange>
apply_min_lookback_constraint(std::vector<SliceRange> ranges,
                              const OhlcvTimeSeries &series,
                              std::size_t min_lookback_days);

/// Price-relevant, possibly discontinuous ranges for the live price.
/// An empty series yields no ranges and a (0, 0) band.
RangeSelection auto_select_ranges(const OhlcvTimeSeries &series,
                                  double current_price,
                                  const AutoDurationConfig &config);

/// Timestamp where the selected window begins (first_timestamp_ms if none)
int64_t calculate_relevant_start_timestamp(const OhlcvTimeSeries &series,
                                           double current_price,
                                           const AutoDurationConfig &config);

} // namespace zones
