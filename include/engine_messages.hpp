#pragma once

#include "analysis_config.hpp"
#include "trading_model.hpp"
#include "zone_types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace zones {

/// Request to build a fresh model for one pair
struct JobRequest {
  std::string pair_name;
  double current_price{0.0};
  AnalysisConfig config;
  std::shared_ptr<const TimeSeriesCollection> timeseries;
};

/// Worker output. Exactly one of model / error is set.
struct JobResult {
  std::string pair_name;
  uint64_t duration_ms{0};
  std::shared_ptr<const TradingModel> model; // New front buffer on success
  std::optional<std::string> error;

  bool ok() const { return model != nullptr && !error; }
};

} // namespace zones
