#pragma once

#include "cva.hpp"
#include "zone_types.hpp"

#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace zones {

/// IEEE-754 bit pattern of a double. Used wherever floats take part in
/// equality or hashing so that NaN and -0.0 behave deterministically.
uint64_t double_bits(double value);

/// Identity of one CVA computation
struct CacheKey {
  std::string pair;
  std::size_t zone_count;
  uint64_t time_decay_factor_bits;
  std::vector<SliceRange> slice_ranges;
  uint64_t price_min_bits;
  uint64_t price_max_bits;

  static CacheKey make(const std::string &pair, std::size_t zone_count,
                       double time_decay_factor,
                       const std::vector<SliceRange> &slice_ranges,
                       std::pair<double, double> price_range);

  bool operator==(const CacheKey &other) const;
  bool operator!=(const CacheKey &other) const { return !(*this == other); }
};

struct CacheKeyHash {
  std::size_t operator()(const CacheKey &key) const;
};

/// Memoizes CVA results by computation parameters.
///
/// The mutex only guards map lookup and insert; the fold itself runs with
/// no lock held. Two threads missing on the same key both compute and the
/// later insert wins. Entries beyond `capacity` are evicted least recently
/// used first (capacity 0 keeps everything).
class CvaCache {
public:
  explicit CvaCache(std::size_t min_candles_for_analysis,
                    std::size_t capacity = 256, bool log_events = false);

  /// Cached CVA for these parameters, computing it on a miss.
  ///
  /// @throws InsufficientDataError if the ranges hold too few candles
  /// @throws std::out_of_range if a range exceeds the series
  std::shared_ptr<const CVACore>
  get_cva_results(const std::string &pair, std::size_t zone_count,
                  double time_decay_factor, const OhlcvTimeSeries &series,
                  const std::vector<SliceRange> &slice_ranges,
                  std::pair<double, double> price_range);

  /// Re-apply settings from a new AnalysisConfig. Shrinking the capacity
  /// evicts immediately; a new minimum applies to the next miss.
  void configure(std::size_t min_candles_for_analysis, std::size_t capacity,
                 bool log_events);

  std::size_t size() const;
  std::size_t capacity() const;
  std::size_t min_candles() const;
  uint64_t hits() const;
  uint64_t misses() const;
  void clear();

private:
  using LruList = std::list<CacheKey>;

  struct Entry {
    std::shared_ptr<const CVACore> value;
    LruList::iterator lru_pos;
  };

  /// Caller holds mutex_
  void insert_locked(const CacheKey &key, std::shared_ptr<const CVACore> value);
  void evict_locked();

  mutable std::mutex mutex_;
  std::size_t min_candles_;
  std::size_t capacity_;
  bool log_events_;

  std::unordered_map<CacheKey, Entry, CacheKeyHash> entries_;
  LruList lru_; // front = most recently used
  uint64_t hits_{0};
  uint64_t misses_{0};
};

} // namespace zones
