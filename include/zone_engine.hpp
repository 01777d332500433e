#pragma once

#include "analysis_config.hpp"
#include "cva_cache.hpp"
#include "engine_messages.hpp"
#include "multi_pair_monitor.hpp"
#include "pair_analysis.hpp"
#include "price_store.hpp"
#include "publisher.hpp"
#include "zone_worker.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace zones {

/// Engine-side state of one pair. Created at startup for every pair in the
/// collection and never removed.
struct PairState {
  /// Front buffer. Written with std::atomic_store by the engine thread,
  /// read with std::atomic_load from anywhere.
  std::shared_ptr<const TradingModel> model;

  double last_update_price{0.0}; // 0 until the first dispatch
  std::chrono::steady_clock::time_point last_update_time{
      std::chrono::steady_clock::now()};

  bool is_calculating{false};
  std::optional<std::string> last_error;

  /// Promote a finished model to the front buffer and go idle
  void update_buffer(std::shared_ptr<const TradingModel> new_model);
};

struct PairStatus {
  bool is_calculating{false};
  std::optional<std::string> last_error;
};

/// Decides when each pair's zones are recomputed and publishes the results.
///
/// Driven by update(), called once per frame from a single thread. That
/// thread owns every PairState; only get_model() may be called from other
/// threads.
class ZoneEngine {
public:
  /// @param timeseries Loaded candles; one PairState per unique pair name
  /// @param prices Live price feed
  /// @param config Validated and copied
  /// @param analyzer Job computation; defaults to CvaPairAnalyzer over a
  ///        CvaCache built from config
  /// @throws std::invalid_argument on null inputs or an invalid config
  ZoneEngine(std::shared_ptr<const TimeSeriesCollection> timeseries,
             std::shared_ptr<LivePriceStore> prices, AnalysisConfig config,
             std::shared_ptr<PairAnalyzer> analyzer = nullptr);

  ~ZoneEngine();

  ZoneEngine(const ZoneEngine &) = delete;
  ZoneEngine &operator=(const ZoneEngine &) = delete;

  /// One frame: apply finished results, check price triggers, dispatch,
  /// then move monitor occupancy to the live prices.
  /// @return true while work is queued or in flight
  bool update();

  // --- Readers ---

  std::shared_ptr<const TradingModel> get_model(const std::string &pair) const;
  std::optional<double> get_price(const std::string &pair) const;
  std::vector<const PairContext *> get_signals() const;
  const MultiPairMonitor &monitor() const { return monitor_; }
  PairStatus get_pair_status(const std::string &pair) const;

  // --- Commands ---

  /// Queue pair at the front unless already queued or calculating
  /// @return true if queued
  /// @throws InvalidPairError for a pair not in the collection
  bool force_recalc(const std::string &pair);

  /// Drop the queue and requeue every pair, priority first
  /// @throws InvalidPairError for an unknown priority pair
  void trigger_global_recalc(
      const std::optional<std::string> &priority_pair = std::nullopt);

  /// Applies to jobs dispatched from now on
  void update_config(AnalysisConfig config);
  const AnalysisConfig &config() const { return config_; }

  void set_publisher(std::shared_ptr<ZonePublisher> publisher);
  void set_stream_suspended(bool suspended);

  // --- Telemetry ---

  std::size_t queue_len() const { return queue_.size(); }
  /// "Processing X" / "Queued: N" / nothing when idle
  std::optional<std::string> worker_status_msg() const;
  std::size_t active_pair_count() const { return pairs_.size(); }
  std::vector<std::string> pair_names() const;
  uint64_t jobs_dispatched() const { return jobs_dispatched_; }

  /// Null when a custom analyzer was supplied
  const std::shared_ptr<CvaCache> &cache() const { return cache_; }

private:
  void handle_job_result(JobResult result);
  void check_automatic_triggers();
  void process_queue();
  void dispatch_job(const std::string &pair);
  void update_monitor_prices();
  bool has_active_jobs() const;
  bool is_queued(const std::string &pair) const;

  void publish_model(const TradingModel &model);
  void publish_signals(const PairContext &context);

  std::shared_ptr<const TimeSeriesCollection> timeseries_;
  std::shared_ptr<LivePriceStore> prices_;
  AnalysisConfig config_;

  std::map<std::string, PairState> pairs_;
  std::deque<std::string> queue_;
  MultiPairMonitor monitor_;
  std::shared_ptr<ZonePublisher> publisher_;

  std::shared_ptr<CvaCache> cache_;
  std::unique_ptr<AnalysisWorker> worker_;
  uint64_t jobs_dispatched_{0};
};

} // namespace zones
