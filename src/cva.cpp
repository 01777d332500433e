#include "cva.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace zones {

std::string to_string(ScoreType st) {
  switch (st) {
  case ScoreType::CandleBodyVW:
    return "Candle Bodies Volume Weighted";
  case ScoreType::LowWickVW:
    return "Low Wick Volume Weighted (reject @ low)";
  case ScoreType::HighWickVW:
    return "High Wick Volume Weighted (reject @ high)";
  case ScoreType::QuoteVolume:
    return "Quote Volume (transitions)";
  default:
    return "unknown";
  }
}

CVACore::CVACore(double start_price, double end_price, std::size_t n_chunks,
                 std::string pair, double decay_factor)
    : pair_name(std::move(pair)), zone_count(n_chunks),
      time_decay_factor(decay_factor), decay_multiplier(1.0),
      start_timestamp_ms(0), end_timestamp_ms(0), total_candles(0),
      price_range_(start_price, end_price, n_chunks) {
  for (auto &vec : scores_) {
    vec.assign(n_chunks, 0.0);
  }
}

void CVACore::increase_score_one_zone(ScoreType st, double price,
                                      double weight) {
  std::size_t index = price_range_.chunk_index(price);
  auto &scores = mutable_scores(st);
  if (index >= scores.size()) {
    throw std::logic_error("chunk index out of range for " + pair_name);
  }
  scores[index] += weight;
}

void CVACore::increase_score_multi_zones_spread(ScoreType st, double start,
                                                double end,
                                                double score_to_spread) {
  if (start == end) {
    return;
  }

  std::size_t num_chunks = price_range_.count_intersecting_chunks(start, end);
  if (num_chunks == 0) {
    std::cerr << "[CVA] pair=" << pair_name << " range=[" << start << ", "
              << end << "] outside analysed prices, skipping\n";
    return;
  }

  std::size_t first_chunk = price_range_.chunk_index(start < end ? start : end);
  auto &scores = mutable_scores(st);
  if (first_chunk + num_chunks > scores.size()) {
    throw std::logic_error("spread exceeds bucket count for " + pair_name);
  }

  double quantity_per_zone = score_to_spread / static_cast<double>(num_chunks);
  for (std::size_t i = first_chunk; i < first_chunk + num_chunks; ++i) {
    scores[i] += quantity_per_zone;
  }
}

} // namespace zones
