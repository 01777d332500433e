#include "auto_duration.hpp"

#include <iostream>
#include <utility>

namespace zones {

std::pair<double, double> calculate_price_range(double current_price,
                                                double threshold) {
  double multiplier = 1.0 + threshold;
  return {current_price / multiplier, current_price * multiplier};
}

std::vector<SliceRange> find_relevant_ranges(const OhlcvTimeSeries &series,
                                             double price_min,
                                             double price_max) {
  std::vector<SliceRange> ranges;
  const std::size_t total = series.size();

  bool in_range = false;
  std::size_t range_start = 0;
  for (std::size_t i = 0; i < total; ++i) {
    bool relevant = series.low[i] <= price_max && series.high[i] >= price_min;
    if (relevant && !in_range) {
      range_start = i;
      in_range = true;
    } else if (!relevant && in_range) {
      ranges.emplace_back(range_start, i);
      in_range = false;
    }
  }
  if (in_range) {
    ranges.emplace_back(range_start, total);
  }
  return ranges;
}

std::size_t min_lookback_candles(const OhlcvTimeSeries &series,
                                 std::size_t min_lookback_days) {
  const int64_t interval_ms = series.pair_interval.interval_ms;
  if (interval_ms <= 0) {
    return 0;
  }
  uint64_t ms_needed = static_cast<uint64_t>(min_lookback_days) *
                       static_cast<uint64_t>(MS_IN_DAY);
  return static_cast<std::size_t>(ms_needed /
                                  static_cast<uint64_t>(interval_ms));
}

std::vector<SliceRange>
apply_min_lookback_constraint(std::vector<SliceRange> ranges,
                              const OhlcvTimeSeries &series,
                              std::size_t min_lookback_days) {
  if (ranges.empty()) {
    return ranges;
  }

  std::size_t have = total_candles(ranges);
  std::size_t need = min_lookback_candles(series, min_lookback_days);
  if (have >= need) {
    return ranges;
  }

  std::size_t deficit = need - have;
  SliceRange &earliest = ranges.front();
  earliest.first = earliest.first > deficit ? earliest.first - deficit : 0;
  return ranges;
}

RangeSelection auto_select_ranges(const OhlcvTimeSeries &series,
                                  double current_price,
                                  const AutoDurationConfig &config) {
  RangeSelection selection;
  if (series.empty()) {
    std::cerr << "[AUTO-DURATION] pair=" << series.pair_interval.name
              << " no candles loaded, nothing to select\n";
    return selection;
  }

  selection.price_range =
      calculate_price_range(current_price, config.relevancy_threshold);
  selection.ranges = find_relevant_ranges(series, selection.price_range.first,
                                          selection.price_range.second);
  selection.ranges = apply_min_lookback_constraint(
      std::move(selection.ranges), series, config.min_lookback_days);
  return selection;
}

int64_t calculate_relevant_start_timestamp(const OhlcvTimeSeries &series,
                                           double current_price,
                                           const AutoDurationConfig &config) {
  RangeSelection selection = auto_select_ranges(series, current_price, config);
  if (selection.ranges.empty()) {
    return series.first_timestamp_ms;
  }
  return series.timestamp_at(selection.ranges.front().first);
}

} // namespace zones
