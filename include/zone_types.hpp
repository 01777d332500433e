#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace zones {

/// Half-open candle index range [first, second) into an OhlcvTimeSeries
using SliceRange = std::pair<std::size_t, std::size_t>;

constexpr int64_t MS_IN_MIN = 60 * 1000;
constexpr int64_t MS_IN_30_MIN = 30 * MS_IN_MIN;
constexpr int64_t MS_IN_H = 60 * MS_IN_MIN;
constexpr int64_t MS_IN_DAY = 24 * MS_IN_H;
constexpr double MS_IN_YEAR = 31536000000.0;

/// Identity of one instrument + timeframe
struct PairInterval {
  std::string name;    // Exchange symbol, e.g. "BTCUSDT"
  int64_t interval_ms; // Candle width

  PairInterval() : interval_ms(0) {}
  PairInterval(std::string n, int64_t interval)
      : name(std::move(n)), interval_ms(interval) {}

  bool operator==(const PairInterval &other) const {
    return name == other.name && interval_ms == other.interval_ms;
  }
  bool operator!=(const PairInterval &other) const { return !(*this == other); }
};

/// One OHLCV bar
struct Candle {
  double open;
  double high;
  double low;
  double close;
  double base_volume;
  double quote_volume;

  Candle()
      : open(0), high(0), low(0), close(0), base_volume(0), quote_volume(0) {}
  Candle(double o, double h, double l, double c, double base_vol,
         double quote_vol)
      : open(o), high(h), low(l), close(c), base_volume(base_vol),
        quote_volume(quote_vol) {}

  bool is_bullish() const { return close >= open; }
  double body_low() const { return is_bullish() ? open : close; }
  double body_high() const { return is_bullish() ? close : open; }

  double low_wick_low() const { return low; }
  double low_wick_high() const { return body_low(); }
  double high_wick_low() const { return body_high(); }
  double high_wick_high() const { return high; }
};

/// Dense candle history for one pair. Gaps are pre-filled by the data layer,
/// so index i always sits at first_timestamp_ms + i * interval_ms.
struct OhlcvTimeSeries {
  PairInterval pair_interval;
  int64_t first_timestamp_ms{0};

  std::vector<double> open;
  std::vector<double> high;
  std::vector<double> low;
  std::vector<double> close;
  std::vector<double> base_volume;
  std::vector<double> quote_volume;

  std::size_t size() const { return open.size(); }
  bool empty() const { return open.empty(); }

  Candle candle(std::size_t idx) const {
    return Candle(open[idx], high[idx], low[idx], close[idx], base_volume[idx],
                  quote_volume[idx]);
  }

  /// Append one bar (used by loaders and tests)
  void push_back(const Candle &c);

  int64_t timestamp_at(std::size_t idx) const {
    return first_timestamp_ms +
           static_cast<int64_t>(idx) * pair_interval.interval_ms;
  }
};

/// All series loaded for a session
struct TimeSeriesCollection {
  std::string name;
  std::vector<OhlcvTimeSeries> series;

  /// Sorted, de-duplicated pair names
  std::vector<std::string> unique_pair_names() const;

  /// Series for pair + interval, or nullptr if not loaded
  const OhlcvTimeSeries *find(const std::string &pair,
                              int64_t interval_ms) const;
};

/// Total number of candles covered by a list of ranges
std::size_t total_candles(const std::vector<SliceRange> &ranges);

} // namespace zones
