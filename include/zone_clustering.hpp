#pragma once

#include <cstddef>
#include <vector>

namespace zones {

/// One cluster found by find_target_zones
struct TargetZone {
  std::size_t start_idx; // First index of the cluster (inclusive)
  std::size_t end_idx;   // Last index of the cluster (inclusive)
  double strength_mass;  // Sum of original scores over [start_idx, end_idx]
  double peak_score;     // Max score over [start_idx, end_idx]
  double center_of_mass; // Score-weighted mean index

  std::size_t width() const { return end_idx - start_idx + 1; }
};

/// "Islands" clustering.
///
/// Indices with score >= threshold are land. Consecutive land indices belong
/// to the same island while next - prev <= max_gap + 1, so up to max_gap
/// sub-threshold buckets can be bridged. Mass and peak are computed over the
/// whole inclusive island, bridged water included.
///
/// Example:
///   find_target_zones({0.1, 0.6, 0.7, 0.05, 0.65}, 0.5, 1)
///   -> one island [1, 4], peak_score 0.7, strength_mass 2.0
std::vector<TargetZone> find_target_zones(const std::vector<double> &scores,
                                          double threshold,
                                          std::size_t max_gap);

/// Every index covered by the given islands, ascending
std::vector<std::size_t>
expand_target_zones(const std::vector<TargetZone> &targets);

/// Max normalization to [0, 1]. Non-positive maxima return the input as-is.
std::vector<double> normalize_max(const std::vector<double> &values);

/// Centered moving average; window_size should be odd
std::vector<double> smooth_data(const std::vector<double> &values,
                                std::size_t window_size);

/// |v[i+1] - v[i]| for each adjacent pair (size n - 1)
std::vector<double> calculate_zone_gradient(const std::vector<double> &values);

/// Value at the given fraction of the ascending sort, e.g. 0.75 = the value
/// that 75% of entries lie below. Index is clamped into range.
/// @throws std::invalid_argument on empty input
double percentile_threshold(const std::vector<double> &values,
                            double percentile);

/// Indices whose score is in the top (1 - top_percentile) of the
/// distribution. No gradient filtering: rejection wicks are often single
/// sharp candles.
std::vector<std::size_t> find_high_activity_zones(
    const std::vector<double> &scores, double top_percentile);

/// High score and low gradient on both sides (sustained, not spiky)
std::vector<std::size_t> find_high_activity_zones_low_gradient(
    const std::vector<double> &scores, double top_percentile,
    double gradient_percentile);

/// Low score and low gradient on both sides (price passes through)
std::vector<std::size_t> find_low_activity_zones_low_gradient(
    const std::vector<double> &scores, double bottom_percentile,
    double gradient_percentile);

} // namespace zones
