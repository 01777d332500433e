#pragma once

#include "pair_context.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace zones {

/// Zone occupancy tracking across every analysed pair.
///
/// Contexts are rebuilt only when price crosses a superzone boundary or a
/// new model arrives, so signals change only on real transitions. Owned and
/// driven by the engine thread; not thread-safe.
class MultiPairMonitor {
public:
  explicit MultiPairMonitor(bool log_progress = false);

  /// Start (or restart) tracking a pair; the starting signals are computed
  void add_pair(PairContext context);

  /// Install a new model for a tracked pair, or start tracking it.
  /// @return true if the pair is new or its occupancy changed
  bool update_model(const TradingModel &model, double price);

  /// @return true if price crossed into a different superzone set
  bool process_price_update(const std::string &pair, double new_price);

  /// Pairs whose last transition produced an actionable signal
  std::vector<const PairContext *> get_signals() const;

  const PairContext *get_context(const std::string &pair) const;
  std::vector<const PairContext *> get_all_contexts() const;
  std::size_t pair_count() const { return contexts_.size(); }
  void set_log_progress(bool enabled) { log_progress_ = enabled; }

  /// Non-empty signal lists keyed by pair
  std::map<std::string, std::vector<TradingSignal>> get_all_signals() const;

  /// Pair names grouped by the type of every superzone they occupy
  std::map<std::string, std::vector<std::string>> pairs_by_zone_type() const;

private:
  std::map<std::string, PairContext> contexts_;
  bool log_progress_;
};

} // namespace zones
