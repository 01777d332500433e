#include "cva_cache.hpp"
#include "timeseries_slice.hpp"

#include <chrono>
#include <cstring>
#include <iostream>

namespace zones {

namespace {

// 64-bit FNV-1a
constexpr uint64_t kFnvOffset = 1469598103934665603ull;
constexpr uint64_t kFnvPrime = 1099511628211ull;

void hash_bytes(uint64_t& hash, const void* data, std::size_t len) {
    const unsigned char* bytes = static_cast<const unsigned char*>(data);
    for (std::size_t i = 0; i < len; ++i) {
        hash ^= bytes[i];
        hash *= kFnvPrime;
    }
}

void hash_u64(uint64_t& hash, uint64_t value) {
    hash_bytes(hash, &value, sizeof(value));
}

} // namespace

uint64_t double_bits(double value) {
    static_assert(sizeof(double) == sizeof(uint64_t), "double must be 64-bit");
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    return bits;
}

// ============================================================================
// CacheKey
// ============================================================================

CacheKey CacheKey::make(const std::string& pair, std::size_t zone_count,
                        double time_decay_factor,
                        const std::vector<SliceRange>& slice_ranges,
                        std::pair<double, double> price_range) {
    return CacheKey{pair,
                    zone_count,
                    double_bits(time_decay_factor),
                    slice_ranges,
                    double_bits(price_range.first),
                    double_bits(price_range.second)};
}

bool CacheKey::operator==(const CacheKey& other) const {
    return pair == other.pair && zone_count == other.zone_count &&
           time_decay_factor_bits == other.time_decay_factor_bits &&
           slice_ranges == other.slice_ranges &&
           price_min_bits == other.price_min_bits &&
           price_max_bits == other.price_max_bits;
}

std::size_t CacheKeyHash::operator()(const CacheKey& key) const {
    uint64_t hash = kFnvOffset;
    hash_bytes(hash, key.pair.data(), key.pair.size());
    hash_u64(hash, key.zone_count);
    hash_u64(hash, key.time_decay_factor_bits);
    hash_u64(hash, key.slice_ranges.size());
    for (const auto& range : key.slice_ranges) {
        hash_u64(hash, range.first);
        hash_u64(hash, range.second);
    }
    hash_u64(hash, key.price_min_bits);
    hash_u64(hash, key.price_max_bits);
    return static_cast<std::size_t>(hash);
}

// ============================================================================
// CvaCache
// ============================================================================

CvaCache::CvaCache(std::size_t min_candles_for_analysis, std::size_t capacity,
                   bool log_events)
    : min_candles_(min_candles_for_analysis), capacity_(capacity),
      log_events_(log_events) {}

std::shared_ptr<const CVACore>
CvaCache::get_cva_results(const std::string& pair, std::size_t zone_count,
                          double time_decay_factor,
                          const OhlcvTimeSeries& series,
                          const std::vector<SliceRange>& slice_ranges,
                          std::pair<double, double> price_range) {
    CacheKey key = CacheKey::make(pair, zone_count, time_decay_factor,
                                  slice_ranges, price_range);

    std::size_t min_candles = 0;
    bool log_events = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        min_candles = min_candles_;
        log_events = log_events_;
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            ++hits_;
            lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
            if (log_events) {
                std::cout << "[CACHE] hit pair=" << pair
                          << " zones=" << zone_count << "\n";
            }
            return it->second.value;
        }
        ++misses_;
    }

    // Heavy work, no lock held
    auto start = std::chrono::steady_clock::now();
    TimeSeriesSlice slice(series, slice_ranges);
    auto computed = std::make_shared<const CVACore>(slice.generate_cva_results(
        zone_count, time_decay_factor, price_range, min_candles));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now() - start)
                       .count();

    if (log_events) {
        std::cout << "[CACHE] miss pair=" << pair << " zones=" << zone_count
                  << " ranges=" << slice_ranges.size()
                  << " candles=" << computed->total_candles
                  << " elapsed_ms=" << elapsed << "\n";
    }

    std::lock_guard<std::mutex> lock(mutex_);
    insert_locked(key, computed);
    return computed;
}

void CvaCache::insert_locked(const CacheKey& key,
                             std::shared_ptr<const CVACore> value) {
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        // Raced with another miss on the same key; last insert wins
        it->second.value = std::move(value);
        lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
        return;
    }

    lru_.push_front(key);
    entries_.emplace(key, Entry{std::move(value), lru_.begin()});
    evict_locked();
}

void CvaCache::evict_locked() {
    while (capacity_ > 0 && entries_.size() > capacity_) {
        const CacheKey& oldest = lru_.back();
        if (log_events_) {
            std::cout << "[CACHE] evict pair=" << oldest.pair << "\n";
        }
        entries_.erase(oldest);
        lru_.pop_back();
    }
}

void CvaCache::configure(std::size_t min_candles_for_analysis,
                         std::size_t capacity, bool log_events) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_candles_ = min_candles_for_analysis;
    capacity_ = capacity;
    log_events_ = log_events;
    evict_locked();
}

std::size_t CvaCache::capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_;
}

std::size_t CvaCache::min_candles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_candles_;
}

std::size_t CvaCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

uint64_t CvaCache::hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

uint64_t CvaCache::misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

void CvaCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    lru_.clear();
}

} // namespace zones
