#pragma once

#include "analysis_config.hpp"
#include "cva.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace zones {

/// One fixed-width price bucket
struct Zone {
  std::size_t index;
  double price_bottom;
  double price_top;
  double price_center;

  /// Zone for bucket `index` of the partition
  static Zone from_partition(const PriceRangePartition &range,
                             std::size_t index);

  bool contains(double price) const {
    return price >= price_bottom && price <= price_top;
  }
  double distance_to(double price) const;
};

/// Maximal run of index-contiguous zones of one category
struct SuperZone {
  std::size_t id; // Index of the first constituent zone; stable across frames
  std::pair<std::size_t, std::size_t> index_range; // inclusive
  double price_bottom;
  double price_top;
  double price_center;
  std::vector<Zone> constituent_zones;

  /// @throws std::invalid_argument on an empty zone list
  static SuperZone from_zones(std::vector<Zone> zones);

  bool contains(double price) const {
    return price >= price_bottom && price <= price_top;
  }
  double distance_to(double price) const;
  std::size_t zone_count() const { return constituent_zones.size(); }
};

/// Merge index-adjacent zones into SuperZones in one linear pass.
/// Input must be sorted by index.
std::vector<SuperZone> aggregate_zones(const std::vector<Zone> &zones);

/// Classification of a price level
enum class ZoneType {
  Sticky,     // High consolidation, price tends to stick here
  Slippy,     // Low activity, price passes through
  Support,    // Nearest sticky zone below price
  Resistance, // Nearest sticky zone above price
  LowWicks,   // Rejection activity at lows
  HighWicks,  // Rejection activity at highs
  Neutral
};

const char *to_string(ZoneType type);

/// Zone categories derived from one CVACore, in raw and aggregated form
struct ClassifiedZones {
  std::vector<Zone> sticky;
  std::vector<Zone> slippy;
  std::vector<Zone> low_wicks;
  std::vector<Zone> high_wicks;

  std::vector<SuperZone> sticky_superzones;
  std::vector<SuperZone> slippy_superzones;
  std::vector<SuperZone> low_wicks_superzones;
  std::vector<SuperZone> high_wicks_superzones;
};

/// Classify the score vectors of a CVACore into typed zones
ClassifiedZones classify_zones(const CVACore &cva,
                               const ClassifierParams &params);

/// Everything known about one pair at one point in time. Support and
/// resistance are derived from sticky superzones on demand.
class TradingModel {
public:
  TradingModel(std::string pair, std::shared_ptr<const CVACore> cva,
               ClassifiedZones zones, std::optional<double> current_price);

  /// Run classification over cva and wrap the result
  static TradingModel from_cva(std::shared_ptr<const CVACore> cva,
                               std::optional<double> current_price,
                               const ClassifierParams &params = {});

  const std::string &pair_name() const { return pair_name_; }
  const std::shared_ptr<const CVACore> &cva() const { return cva_; }
  const ClassifiedZones &zones() const { return zones_; }
  std::optional<double> current_price() const { return current_price_; }

  /// Re-targets support/resistance; CVA is not rerun
  void update_price(double new_price) { current_price_ = new_price; }

  /// Nearest sticky superzone centred below / above price
  const SuperZone *nearest_support_superzone(double price) const;
  const SuperZone *nearest_resistance_superzone(double price) const;

  /// Same, relative to current_price (nullptr when no price is set)
  const SuperZone *nearest_support_superzone() const;
  const SuperZone *nearest_resistance_superzone() const;

  /// (superzone id, type) for every superzone containing price
  std::vector<std::pair<std::size_t, ZoneType>>
  find_superzones_at_price(double price) const;

private:
  std::string pair_name_;
  std::shared_ptr<const CVACore> cva_;
  ClassifiedZones zones_;
  std::optional<double> current_price_;
};

} // namespace zones
