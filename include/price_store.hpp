#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace zones {

/// Latest traded price per symbol, written by the feed and read by the engine.
///
/// Symbols are stored lowercase so "BTCUSDT" and "btcusdt" are the same key.
class LivePriceStore {
public:
  /// Record a price (ignored while suspended)
  void set_price(const std::string &symbol, double price);

  std::optional<double> get_price(const std::string &symbol) const;

  /// Copy of every known price, keyed by lowercase symbol
  std::map<std::string, double> snapshot() const;

  /// Freeze the store; used when prices are driven by a simulation
  void suspend();
  void resume();
  bool is_suspended() const;

private:
  static std::string normalize(const std::string &symbol);

  mutable std::mutex mutex_;
  std::map<std::string, double> prices_;
  bool suspended_{false};
};

} // namespace zones
