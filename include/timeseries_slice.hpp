#pragma once

#include "cva.hpp"
#include "zone_types.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace zones {

/// Window-uniform decay: max(1, time_decay_factor ^ years), where years is
/// the span from the first range start to the last range end. Returns 1.0
/// for an empty or zero-length window.
double compute_decay_multiplier(const std::vector<SliceRange> &ranges,
                                int64_t interval_ms, double time_decay_factor);

/// Possibly discontinuous view into one OhlcvTimeSeries
struct TimeSeriesSlice {
  const OhlcvTimeSeries &series;
  std::vector<SliceRange> ranges; // [start, end) index pairs, ascending

  TimeSeriesSlice(const OhlcvTimeSeries &s, std::vector<SliceRange> r)
      : series(s), ranges(std::move(r)) {}

  std::size_t candle_count() const { return total_candles(ranges); }

  /// Fold every candle of every range into a fresh CVACore.
  ///
  /// @param zone_count Number of price buckets
  /// @param time_decay_factor Per-year decay factor (see
  ///        compute_decay_multiplier)
  /// @param price_range (min, max) analysed prices
  /// @param min_candles Minimum total candle count
  /// @throws InsufficientDataError if fewer than min_candles candles
  /// @throws std::out_of_range if a range exceeds the series
  /// @throws std::invalid_argument for an empty price range or zero zones
  CVACore generate_cva_results(std::size_t zone_count,
                               double time_decay_factor,
                               std::pair<double, double> price_range,
                               std::size_t min_candles) const;

private:
  void process_candle_scores(CVACore &cva, const Candle &candle,
                             double weight) const;
};

} // namespace zones
