#include "pair_analysis.hpp"
#include "auto_duration.hpp"
#include "errors.hpp"

#include <stdexcept>
#include <utility>

namespace zones {

std::shared_ptr<const CVACore> analyze_pair(const std::string& pair,
                                            const TimeSeriesCollection& data,
                                            double current_price,
                                            const AnalysisConfig& config,
                                            CvaCache& cache) {
    const OhlcvTimeSeries* series = data.find(pair, config.interval_width_ms);
    if (series == nullptr) {
        throw InvalidPairError(pair);
    }

    // Ranges are selected fresh every time; only the fold is cached
    RangeSelection selection =
        auto_select_ranges(*series, current_price, config.auto_duration);

    std::size_t candle_count = total_candles(selection.ranges);
    if (candle_count < config.min_candles_for_analysis) {
        throw InsufficientDataError(pair, candle_count,
                                    config.min_candles_for_analysis);
    }

    return cache.get_cva_results(pair, config.zone_count,
                                 config.time_decay_factor, *series,
                                 selection.ranges, selection.price_range);
}

CvaPairAnalyzer::CvaPairAnalyzer(std::shared_ptr<CvaCache> cache)
    : cache_(std::move(cache)) {
    if (!cache_) {
        throw std::invalid_argument("CvaPairAnalyzer requires a cache");
    }
}

std::shared_ptr<const TradingModel>
CvaPairAnalyzer::analyze(const JobRequest& request) {
    if (!request.timeseries) {
        throw std::invalid_argument("job for " + request.pair_name +
                                    " carries no timeseries");
    }
    auto cva = analyze_pair(request.pair_name, *request.timeseries,
                            request.current_price, request.config, *cache_);
    return std::make_shared<const TradingModel>(TradingModel::from_cva(
        cva, request.current_price, request.config.classifier));
}

} // namespace zones
