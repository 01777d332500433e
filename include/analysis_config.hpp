#pragma once

#include "zone_types.hpp"

#include <cstddef>
#include <cstdint>

namespace zones {

/// Price-relevancy window used to pick historical candles
struct AutoDurationConfig {
  double relevancy_threshold{0.15}; // +/-15% around the live price
  std::size_t min_lookback_days{7};
};

/// Tuning for TradingModel zone classification. Categories get deliberately
/// different thresholds.
struct ClassifierParams {
  // Sticky: smoothed, squared body scores clustered with islands
  double sticky_smoothing_pct{0.02}; // smoothing window as fraction of zones
  double sticky_gap_pct{0.02};       // bridgeable gap as fraction of zones
  double sticky_threshold{0.16};     // on squared data (~0.4 original)

  // Wicks: top quartile, contiguous only
  double wick_top_percentile{0.75};
  std::size_t wick_max_gap{0};

  // Slippy: bottom fifth with a flat neighbourhood
  double slippy_bottom_percentile{0.20};
  double slippy_gradient_percentile{0.70};
};

/// Opt-in diagnostics. Lifecycle and error lines are always printed.
struct DebugFlags {
  bool print_cva_cache_events{false};
  bool print_trigger_updates{false};
  bool print_monitor_progress{false};
  bool print_publish_events{false};
};

/// Engine-wide analysis settings, passed explicitly at construction
struct AnalysisConfig {
  int64_t interval_width_ms{MS_IN_30_MIN};
  std::size_t zone_count{100};
  double time_decay_factor{1.5};
  std::size_t min_candles_for_analysis{100};

  /// Fractional move from the last computed price that queues a recompute
  /// (0.01 = 1%)
  double price_recalc_threshold_pct{0.01};

  /// CVA cache entries kept (least recently used evicted); 0 = unbounded
  std::size_t cache_capacity{256};

  std::size_t worker_threads{1};

  AutoDurationConfig auto_duration;
  ClassifierParams classifier;
  DebugFlags debug;

  /// @throws std::invalid_argument describing the first bad field
  void validate() const;
};

} // namespace zones
