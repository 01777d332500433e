#include "trading_model.hpp"
#include "zone_clustering.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace zones {

namespace {

std::vector<Zone> to_zones(const PriceRangePartition& range,
                           const std::vector<std::size_t>& indices) {
    std::vector<Zone> out;
    out.reserve(indices.size());
    for (std::size_t idx : indices) {
        out.push_back(Zone::from_partition(range, idx));
    }
    return out;
}

std::size_t fraction_of(std::size_t zone_count, double pct) {
    return static_cast<std::size_t>(
        std::ceil(static_cast<double>(zone_count) * pct));
}

const SuperZone* nearest_sticky(const std::vector<SuperZone>& sticky,
                                double price, bool below) {
    const SuperZone* best = nullptr;
    double best_distance = 0.0;
    for (const auto& sz : sticky) {
        bool on_side = below ? sz.price_center < price : sz.price_center > price;
        if (!on_side) {
            continue;
        }
        double distance = sz.distance_to(price);
        if (best == nullptr || distance < best_distance) {
            best = &sz;
            best_distance = distance;
        }
    }
    return best;
}

} // namespace

// ============================================================================
// Zone / SuperZone
// ============================================================================

Zone Zone::from_partition(const PriceRangePartition& range, std::size_t index) {
    auto bounds = range.chunk_bounds(index);
    return Zone{index, bounds.first, bounds.second,
                bounds.first + range.chunk_size() / 2.0};
}

double Zone::distance_to(double price) const {
    return std::fabs(price_center - price);
}

SuperZone SuperZone::from_zones(std::vector<Zone> zones) {
    if (zones.empty()) {
        throw std::invalid_argument("cannot build SuperZone from no zones");
    }
    const Zone& first = zones.front();
    const Zone& last = zones.back();

    SuperZone sz;
    sz.id = first.index;
    sz.index_range = {first.index, last.index};
    sz.price_bottom = first.price_bottom;
    sz.price_top = last.price_top;
    sz.price_center = (sz.price_bottom + sz.price_top) / 2.0;
    sz.constituent_zones = std::move(zones);
    return sz;
}

double SuperZone::distance_to(double price) const {
    return std::fabs(price_center - price);
}

std::vector<SuperZone> aggregate_zones(const std::vector<Zone>& zones) {
    std::vector<SuperZone> superzones;
    if (zones.empty()) {
        return superzones;
    }

    std::vector<Zone> group{zones.front()};
    for (std::size_t i = 1; i < zones.size(); ++i) {
        if (zones[i].index == zones[i - 1].index + 1) {
            group.push_back(zones[i]);
        } else {
            superzones.push_back(SuperZone::from_zones(std::move(group)));
            group = {zones[i]};
        }
    }
    superzones.push_back(SuperZone::from_zones(std::move(group)));
    return superzones;
}

const char* to_string(ZoneType type) {
    switch (type) {
    case ZoneType::Sticky:
        return "Sticky";
    case ZoneType::Slippy:
        return "Slippy";
    case ZoneType::Support:
        return "Support";
    case ZoneType::Resistance:
        return "Resistance";
    case ZoneType::LowWicks:
        return "LowWicks";
    case ZoneType::HighWicks:
        return "HighWicks";
    case ZoneType::Neutral:
        return "Neutral";
    }
    return "Unknown";
}

// ============================================================================
// Classification
// ============================================================================

ClassifiedZones classify_zones(const CVACore& cva,
                               const ClassifierParams& params) {
    const PriceRangePartition& range = cva.price_range();
    const std::size_t zone_count = cva.zone_count;

    // Sticky: smooth over ~2% of the map so single-bucket noise does not
    // split a consolidation, then square for contrast before clustering.
    auto raw_body = normalize_max(cva.scores(ScoreType::CandleBodyVW));
    std::size_t window = fraction_of(zone_count, params.sticky_smoothing_pct);
    if (window < 1) {
        window = 1;
    }
    window |= 1;
    auto smoothed = normalize_max(smooth_data(raw_body, window));
    std::vector<double> sharpened;
    sharpened.reserve(smoothed.size());
    for (double s : smoothed) {
        sharpened.push_back(s * s);
    }
    std::size_t sticky_gap = fraction_of(zone_count, params.sticky_gap_pct);
    auto sticky_indices = expand_target_zones(
        find_target_zones(sharpened, params.sticky_threshold, sticky_gap));

    // Slippy: low, flat activity on the un-smoothed body scores
    auto slippy_indices = find_low_activity_zones_low_gradient(
        raw_body, params.slippy_bottom_percentile,
        params.slippy_gradient_percentile);

    // Wicks: anything in the top quartile, no bridging
    std::vector<std::size_t> wick_indices[2];
    const ScoreType wick_types[2] = {ScoreType::LowWickVW, ScoreType::HighWickVW};
    for (int w = 0; w < 2; ++w) {
        auto normalized = normalize_max(cva.scores(wick_types[w]));
        // No wick volume at all means no wick zones, not a full-range one
        if (normalized.empty() ||
            *std::max_element(normalized.begin(), normalized.end()) <= 0.0) {
            continue;
        }
        double threshold =
            percentile_threshold(normalized, params.wick_top_percentile);
        wick_indices[w] = expand_target_zones(
            find_target_zones(normalized, threshold, params.wick_max_gap));
    }

    ClassifiedZones classified;
    classified.sticky = to_zones(range, sticky_indices);
    classified.slippy = to_zones(range, slippy_indices);
    classified.low_wicks = to_zones(range, wick_indices[0]);
    classified.high_wicks = to_zones(range, wick_indices[1]);

    classified.sticky_superzones = aggregate_zones(classified.sticky);
    classified.slippy_superzones = aggregate_zones(classified.slippy);
    classified.low_wicks_superzones = aggregate_zones(classified.low_wicks);
    classified.high_wicks_superzones = aggregate_zones(classified.high_wicks);
    return classified;
}

// ============================================================================
// TradingModel
// ============================================================================

TradingModel::TradingModel(std::string pair, std::shared_ptr<const CVACore> cva,
                           ClassifiedZones zones,
                           std::optional<double> current_price)
    : pair_name_(std::move(pair)), cva_(std::move(cva)),
      zones_(std::move(zones)), current_price_(current_price) {}

TradingModel TradingModel::from_cva(std::shared_ptr<const CVACore> cva,
                                    std::optional<double> current_price,
                                    const ClassifierParams& params) {
    if (!cva) {
        throw std::invalid_argument("TradingModel requires CVA results");
    }
    ClassifiedZones classified = classify_zones(*cva, params);
    std::string pair = cva->pair_name;
    return TradingModel(std::move(pair), std::move(cva), std::move(classified),
                        current_price);
}

const SuperZone* TradingModel::nearest_support_superzone(double price) const {
    return nearest_sticky(zones_.sticky_superzones, price, true);
}

const SuperZone* TradingModel::nearest_resistance_superzone(double price) const {
    return nearest_sticky(zones_.sticky_superzones, price, false);
}

const SuperZone* TradingModel::nearest_support_superzone() const {
    return current_price_ ? nearest_support_superzone(*current_price_) : nullptr;
}

const SuperZone* TradingModel::nearest_resistance_superzone() const {
    return current_price_ ? nearest_resistance_superzone(*current_price_)
                          : nullptr;
}

std::vector<std::pair<std::size_t, ZoneType>>
TradingModel::find_superzones_at_price(double price) const {
    std::vector<std::pair<std::size_t, ZoneType>> found;

    const SuperZone* support = nearest_support_superzone(price);
    const SuperZone* resistance = nearest_resistance_superzone(price);

    for (const auto& sz : zones_.sticky_superzones) {
        if (!sz.contains(price)) {
            continue;
        }
        ZoneType type = ZoneType::Sticky;
        if (support != nullptr && support->id == sz.id) {
            type = ZoneType::Support;
        } else if (resistance != nullptr && resistance->id == sz.id) {
            type = ZoneType::Resistance;
        }
        found.emplace_back(sz.id, type);
    }

    for (const auto& sz : zones_.slippy_superzones) {
        if (sz.contains(price)) {
            found.emplace_back(sz.id, ZoneType::Slippy);
        }
    }
    for (const auto& sz : zones_.low_wicks_superzones) {
        if (sz.contains(price)) {
            found.emplace_back(sz.id, ZoneType::LowWicks);
        }
    }
    for (const auto& sz : zones_.high_wicks_superzones) {
        if (sz.contains(price)) {
            found.emplace_back(sz.id, ZoneType::HighWicks);
        }
    }
    return found;
}

} // namespace zones
