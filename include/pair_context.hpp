#pragma once

#include "trading_model.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace zones {

/// Superzone id plus the category it was found in
using ZoneOccupancy = std::pair<std::size_t, ZoneType>;

/// Event derived from a change in the set of superzones holding price
struct TradingSignal {
  enum class Kind {
    ZoneEntered,  // Price moved into a superzone
    ZoneExited,   // Price left a superzone
    InStickyZone  // Price currently sits in a sticky superzone
  };

  Kind kind;
  std::size_t superzone_id;
  ZoneType zone_type;

  std::string description() const;

  /// Actionable signals; enter/exit are bookkeeping
  bool is_signal() const { return kind == Kind::InStickyZone; }
};

const char *to_string(TradingSignal::Kind kind);

/// Monitor state for one pair: which superzones contain the current price
/// and the signals produced by the last transition.
struct PairContext {
  std::string pair_name;
  double current_price;
  std::vector<ZoneOccupancy> current_zones;
  TradingModel trading_model;
  std::chrono::system_clock::time_point last_updated;
  std::vector<TradingSignal> signals;

  PairContext(TradingModel model, double initial_price);

  /// Signals for the starting state (sticky occupancy only)
  void initialize_signals();

  /// True when new_price falls in a different set of superzones
  bool needs_update(double new_price) const;

  /// Move to new_price and rebuild signals from the occupancy change
  void update(double new_price);

  /// Swap in a freshly computed model, keeping the price. Occupancy is
  /// re-derived; signals are rebuilt only when it changed.
  /// @return true if the set of superzones holding price changed
  bool replace_model(TradingModel model);

  bool has_signals() const;

private:
  void rebuild_signals(const std::vector<ZoneOccupancy> &previous);
};

} // namespace zones
