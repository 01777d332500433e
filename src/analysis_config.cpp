#include "analysis_config.hpp"

#include <stdexcept>

namespace zones {

void AnalysisConfig::validate() const {
  if (interval_width_ms <= 0) {
    throw std::invalid_argument("interval_width_ms must be > 0");
  }
  if (zone_count == 0) {
    throw std::invalid_argument("zone_count must be > 0");
  }
  if (!(time_decay_factor > 0.0)) {
    throw std::invalid_argument("time_decay_factor must be > 0");
  }
  if (price_recalc_threshold_pct < 0.0) {
    throw std::invalid_argument("price_recalc_threshold_pct must be >= 0");
  }
  if (worker_threads == 0) {
    throw std::invalid_argument("worker_threads must be > 0");
  }
  if (auto_duration.relevancy_threshold < 0.0) {
    throw std::invalid_argument("relevancy_threshold must be >= 0");
  }
  if (classifier.wick_top_percentile < 0.0 ||
      classifier.wick_top_percentile > 1.0) {
    throw std::invalid_argument("wick_top_percentile must be in [0, 1]");
  }
  if (classifier.slippy_bottom_percentile < 0.0 ||
      classifier.slippy_bottom_percentile > 1.0) {
    throw std::invalid_argument("slippy_bottom_percentile must be in [0, 1]");
  }
}

} // namespace zones
