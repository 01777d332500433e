#include "timeseries_slice.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace zones {

double compute_decay_multiplier(const std::vector<SliceRange>& ranges,
                                int64_t interval_ms, double time_decay_factor) {
    if (ranges.empty()) {
        return 1.0;
    }

    std::size_t start_idx = ranges.front().first;
    std::size_t end_idx = ranges.back().second;
    if (end_idx <= start_idx || interval_ms <= 0) {
        return 1.0;
    }

    double duration_ms = static_cast<double>(end_idx - start_idx) *
                         static_cast<double>(interval_ms);
    double duration_years = duration_ms / MS_IN_YEAR;

    return std::max(1.0, std::pow(time_decay_factor, duration_years));
}

CVACore TimeSeriesSlice::generate_cva_results(
    std::size_t zone_count, double time_decay_factor,
    std::pair<double, double> price_range, std::size_t min_candles) const {
    const std::string& pair_name = series.pair_interval.name;

    std::size_t total = candle_count();
    if (ranges.empty() || total < min_candles) {
        throw InsufficientDataError(pair_name, total, min_candles);
    }

    for (const auto& range : ranges) {
        if (range.first > range.second || range.second > series.size()) {
            throw std::out_of_range(
                "slice range [" + std::to_string(range.first) + ", " +
                std::to_string(range.second) + ") exceeds " + pair_name +
                " series of " + std::to_string(series.size()) + " candles");
        }
    }

    CVACore cva(price_range.first, price_range.second, zone_count, pair_name,
                time_decay_factor);
    cva.decay_multiplier = compute_decay_multiplier(
        ranges, series.pair_interval.interval_ms, time_decay_factor);
    cva.total_candles = total;

    // Window-uniform weighting: every candle in this window is discounted by
    // the same multiplier, regardless of its own age.
    const double weight = 1.0 / cva.decay_multiplier;

    for (const auto& range : ranges) {
        for (std::size_t idx = range.first; idx < range.second; ++idx) {
            process_candle_scores(cva, series.candle(idx), weight);
        }
    }

    const int64_t interval = series.pair_interval.interval_ms;
    cva.start_timestamp_ms = series.first_timestamp_ms +
                             static_cast<int64_t>(ranges.front().first) * interval;
    cva.end_timestamp_ms = series.first_timestamp_ms +
                           static_cast<int64_t>(ranges.back().second) * interval;

    return cva;
}

void TimeSeriesSlice::process_candle_scores(CVACore& cva, const Candle& candle,
                                            double weight) const {
    const auto bounds = cva.price_range().min_max();
    const double price_min = bounds.first;
    const double price_max = bounds.second;

    // Candles that never traded inside the analysed range add nothing
    if (candle.high < price_min || candle.low > price_max) {
        return;
    }

    auto clamp = [price_min, price_max](double price) {
        return std::min(std::max(price, price_min), price_max);
    };

    const double volume_weight = candle.base_volume * weight;

    // 1. Body, spread as a density across every bucket it covers. A body
    // wholly outside the range adds nothing even when a wick reaches in.
    const double body_low = candle.body_low();
    const double body_high = candle.body_high();
    const bool body_in_range = body_high >= price_min && body_low <= price_max;
    if (body_in_range && body_low == body_high) {
        cva.increase_score_one_zone(ScoreType::CandleBodyVW, body_low,
                                    volume_weight);
    } else if (body_in_range) {
        cva.increase_score_multi_zones_spread(ScoreType::CandleBodyVW,
                                              clamp(body_low),
                                              clamp(body_high), volume_weight);
    }

    // 2. Low wick (rejection at low). No wick, no score.
    cva.increase_score_multi_zones_spread(ScoreType::LowWickVW,
                                          clamp(candle.low_wick_low()),
                                          clamp(candle.low_wick_high()),
                                          volume_weight);

    // 3. High wick (rejection at high)
    cva.increase_score_multi_zones_spread(ScoreType::HighWickVW,
                                          clamp(candle.high_wick_low()),
                                          clamp(candle.high_wick_high()),
                                          volume_weight);

    // 4. Quote volume across the full candle range
    double full_low = clamp(candle.low);
    double full_high = clamp(candle.high);
    double quote_weight = candle.quote_volume * weight;
    if (full_low == full_high) {
        cva.increase_score_one_zone(ScoreType::QuoteVolume, full_low,
                                    quote_weight);
    } else {
        cva.increase_score_multi_zones_spread(ScoreType::QuoteVolume, full_low,
                                              full_high, quote_weight);
    }
}

} // namespace zones
