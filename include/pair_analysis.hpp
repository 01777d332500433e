#pragma once

#include "analysis_config.hpp"
#include "cva_cache.hpp"
#include "engine_messages.hpp"
#include "trading_model.hpp"
#include "zone_types.hpp"

#include <memory>
#include <string>

namespace zones {

/// CVA for one pair at the given live price: finds the series, selects the
/// price-relevant ranges and folds them through the cache.
///
/// @throws InvalidPairError if the pair is not in the collection
/// @throws InsufficientDataError if the selected ranges are too short
std::shared_ptr<const CVACore> analyze_pair(const std::string &pair,
                                            const TimeSeriesCollection &data,
                                            double current_price,
                                            const AnalysisConfig &config,
                                            CvaCache &cache);

/// Turns a job into a model. Runs on worker threads.
class PairAnalyzer {
public:
  virtual ~PairAnalyzer() = default;

  /// @throws std::exception on failure; the worker records what()
  virtual std::shared_ptr<const TradingModel>
  analyze(const JobRequest &request) = 0;
};

/// Default analyzer: analyze_pair + TradingModel::from_cva
class CvaPairAnalyzer : public PairAnalyzer {
public:
  explicit CvaPairAnalyzer(std::shared_ptr<CvaCache> cache);

  std::shared_ptr<const TradingModel>
  analyze(const JobRequest &request) override;

  const std::shared_ptr<CvaCache> &cache() const { return cache_; }

private:
  std::shared_ptr<CvaCache> cache_;
};

} // namespace zones
