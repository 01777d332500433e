#pragma once

#include <cstddef>
#include <utility>

namespace zones {

/// Splits [start, end] into n_chunks equal-width price buckets.
///
/// Invariant: n_chunks > 0 and end > start (enforced by the constructor).
///
/// Example:
///   PriceRangePartition p(100.0, 200.0, 10);  // 10 buckets of width 10
///   p.chunk_index(155.0) == 5
///   p.chunk_index(200.0) == 9                 // upper edge maps to last
class PriceRangePartition {
public:
  /// @throws std::invalid_argument if n_chunks == 0 or end <= start
  PriceRangePartition(double start, double end, std::size_t n_chunks);

  double start() const { return start_; }
  double end() const { return end_; }
  std::size_t n_chunks() const { return n_chunks_; }

  double range_length() const { return end_ - start_; }
  double chunk_size() const { return range_length() / n_chunks_; }

  /// Bucket containing price. Prices outside [start, end] clamp to the edge
  /// buckets; NaN maps to bucket 0.
  std::size_t chunk_index(double price) const;

  /// Number of buckets touched by [low, high] (inclusive, order-independent).
  /// Returns 0 only when the interval lies entirely outside [start, end].
  std::size_t count_intersecting_chunks(double low, double high) const;

  /// [bottom, top) price bounds of a bucket
  /// @throws std::out_of_range if index >= n_chunks
  std::pair<double, double> chunk_bounds(std::size_t index) const;

  std::pair<double, double> min_max() const { return {start_, end_}; }

private:
  double start_;
  double end_;
  std::size_t n_chunks_;
};

} // namespace zones
