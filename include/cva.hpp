#pragma once

#include "price_range.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace zones {

/// Score kinds accumulated per price bucket
enum class ScoreType : uint8_t {
  CandleBodyVW = 0, // Body range weighted by base volume (sticky/slippy)
  LowWickVW = 1,    // Low wick weighted by base volume (rejection at low)
  HighWickVW = 2,   // High wick weighted by base volume (rejection at high)
  QuoteVolume = 3   // Full candle range weighted by quote volume
};

constexpr std::size_t SCORE_TYPE_COUNT = 4;

constexpr std::array<ScoreType, SCORE_TYPE_COUNT> ALL_SCORE_TYPES = {
    ScoreType::CandleBodyVW, ScoreType::LowWickVW, ScoreType::HighWickVW,
    ScoreType::QuoteVolume};

std::string to_string(ScoreType st);

/// Cumulative Volume Analysis results for one pair.
///
/// Built once per recompute by the candle folding step, then shared
/// read-only as std::shared_ptr<const CVACore>.
class CVACore {
public:
  CVACore(double start_price, double end_price, std::size_t n_chunks,
          std::string pair_name, double time_decay_factor);

  const std::vector<double> &scores(ScoreType st) const {
    return scores_[static_cast<std::size_t>(st)];
  }

  /// Add weight to the single bucket containing price
  void increase_score_one_zone(ScoreType st, double price, double weight);

  /// Spread score evenly across every bucket intersected by [start, end].
  /// A zero-width interval is a no-op; so is an interval that lies entirely
  /// outside the partition (logged).
  void increase_score_multi_zones_spread(ScoreType st, double start, double end,
                                         double score_to_spread);

  const PriceRangePartition &price_range() const { return price_range_; }

  std::string pair_name;
  std::size_t zone_count;
  double time_decay_factor; // Configured per-year factor
  double decay_multiplier;  // max(1, factor^years) applied to this window
  int64_t start_timestamp_ms;
  int64_t end_timestamp_ms;
  std::size_t total_candles;

private:
  std::vector<double> &mutable_scores(ScoreType st) {
    return scores_[static_cast<std::size_t>(st)];
  }

  PriceRangePartition price_range_;
  std::array<std::vector<double>, SCORE_TYPE_COUNT> scores_;
};

} // namespace zones
