#include "zone_clustering.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace zones {

namespace {

TargetZone summarize_island(const std::vector<double>& scores,
                            std::size_t start, std::size_t end) {
    TargetZone zone{start, end, 0.0, 0.0, 0.0};
    double peak = -std::numeric_limits<double>::infinity();
    double weighted_index_sum = 0.0;

    for (std::size_t i = start; i <= end; ++i) {
        zone.strength_mass += scores[i];
        peak = std::max(peak, scores[i]);
        weighted_index_sum += scores[i] * static_cast<double>(i);
    }

    zone.peak_score = peak;
    if (zone.strength_mass != 0.0) {
        zone.center_of_mass = weighted_index_sum / zone.strength_mass;
    } else {
        zone.center_of_mass =
            (static_cast<double>(start) + static_cast<double>(end)) / 2.0;
    }
    return zone;
}

double max_gradient_at(const std::vector<double>& gradients,
                       double gradient_percentile) {
    if (gradients.empty()) {
        return std::numeric_limits<double>::infinity();
    }
    return percentile_threshold(gradients, gradient_percentile);
}

// Gradient both before and after index i is within the limit
bool is_flat(const std::vector<double>& gradients, std::size_t i,
             double max_gradient) {
    bool before_ok = i == 0 || i - 1 >= gradients.size() ||
                     gradients[i - 1] <= max_gradient;
    bool after_ok = i >= gradients.size() || gradients[i] <= max_gradient;
    return before_ok && after_ok;
}

} // namespace

// ============================================================================
// Islands
// ============================================================================

std::vector<TargetZone> find_target_zones(const std::vector<double>& scores,
                                          double threshold,
                                          std::size_t max_gap) {
    std::vector<TargetZone> targets;

    // 1. Land
    std::vector<std::size_t> land;
    for (std::size_t i = 0; i < scores.size(); ++i) {
        if (scores[i] >= threshold) {
            land.push_back(i);
        }
    }
    if (land.empty()) {
        return targets;
    }

    // 2. Bridge land into islands
    std::size_t island_start = land.front();
    std::size_t prev = land.front();
    for (std::size_t k = 1; k < land.size(); ++k) {
        std::size_t curr = land[k];
        if (curr - prev > max_gap + 1) {
            targets.push_back(summarize_island(scores, island_start, prev));
            island_start = curr;
        }
        prev = curr;
    }

    // 3. Last island
    targets.push_back(summarize_island(scores, island_start, prev));
    return targets;
}

std::vector<std::size_t>
expand_target_zones(const std::vector<TargetZone>& targets) {
    std::vector<std::size_t> indices;
    for (const auto& target : targets) {
        for (std::size_t i = target.start_idx; i <= target.end_idx; ++i) {
            indices.push_back(i);
        }
    }
    std::sort(indices.begin(), indices.end());
    indices.erase(std::unique(indices.begin(), indices.end()), indices.end());
    return indices;
}

// ============================================================================
// Normalization and smoothing
// ============================================================================

std::vector<double> normalize_max(const std::vector<double>& values) {
    if (values.empty()) {
        return values;
    }
    double max_value = *std::max_element(values.begin(), values.end());
    if (!(max_value > 0.0)) {
        return values;
    }

    std::vector<double> normalized;
    normalized.reserve(values.size());
    for (double v : values) {
        normalized.push_back(v / max_value);
    }
    return normalized;
}

std::vector<double> smooth_data(const std::vector<double>& values,
                                std::size_t window_size) {
    if (values.empty() || window_size <= 1) {
        return values;
    }

    const std::size_t half_window = window_size / 2;
    const std::size_t len = values.size();
    std::vector<double> smoothed(len, 0.0);

    for (std::size_t i = 0; i < len; ++i) {
        std::size_t start = i >= half_window ? i - half_window : 0;
        std::size_t end = std::min(i + half_window + 1, len);

        double sum = 0.0;
        for (std::size_t j = start; j < end; ++j) {
            sum += values[j];
        }
        smoothed[i] = sum / static_cast<double>(end - start);
    }
    return smoothed;
}

std::vector<double> calculate_zone_gradient(const std::vector<double>& values) {
    std::vector<double> gradients;
    if (values.size() < 2) {
        return gradients;
    }
    gradients.reserve(values.size() - 1);
    for (std::size_t i = 1; i < values.size(); ++i) {
        double diff = values[i] - values[i - 1];
        gradients.push_back(diff < 0 ? -diff : diff);
    }
    return gradients;
}

double percentile_threshold(const std::vector<double>& values,
                            double percentile) {
    if (values.empty()) {
        throw std::invalid_argument("percentile of empty input");
    }
    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    double scaled = static_cast<double>(sorted.size()) * percentile;
    std::size_t idx = scaled <= 0.0 ? 0 : static_cast<std::size_t>(scaled);
    idx = std::min(idx, sorted.size() - 1);
    return sorted[idx];
}

// ============================================================================
// Percentile-based selectors
// ============================================================================

std::vector<std::size_t> find_high_activity_zones(
    const std::vector<double>& scores, double top_percentile) {
    std::vector<std::size_t> indices;
    if (scores.empty()) {
        return indices;
    }

    double threshold = percentile_threshold(scores, top_percentile);
    for (std::size_t i = 0; i < scores.size(); ++i) {
        if (scores[i] >= threshold) {
            indices.push_back(i);
        }
    }
    return indices;
}

std::vector<std::size_t> find_high_activity_zones_low_gradient(
    const std::vector<double>& scores, double top_percentile,
    double gradient_percentile) {
    std::vector<std::size_t> indices;
    if (scores.empty()) {
        return indices;
    }

    double threshold = percentile_threshold(scores, top_percentile);
    auto gradients = calculate_zone_gradient(scores);
    double max_gradient = max_gradient_at(gradients, gradient_percentile);

    for (std::size_t i = 0; i < scores.size(); ++i) {
        if (scores[i] >= threshold && is_flat(gradients, i, max_gradient)) {
            indices.push_back(i);
        }
    }
    return indices;
}

std::vector<std::size_t> find_low_activity_zones_low_gradient(
    const std::vector<double>& scores, double bottom_percentile,
    double gradient_percentile) {
    std::vector<std::size_t> indices;
    if (scores.empty()) {
        return indices;
    }

    double threshold = percentile_threshold(scores, bottom_percentile);
    auto gradients = calculate_zone_gradient(scores);
    double max_gradient = max_gradient_at(gradients, gradient_percentile);

    for (std::size_t i = 0; i < scores.size(); ++i) {
        if (scores[i] <= threshold && is_flat(gradients, i, max_gradient)) {
            indices.push_back(i);
        }
    }
    return indices;
}

} // namespace zones
