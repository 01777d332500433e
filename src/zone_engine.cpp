#include "zone_engine.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace zones {

// ============================================================================
// PairState Implementation
// ============================================================================

void PairState::update_buffer(std::shared_ptr<const TradingModel> new_model) {
    // Readers holding the old pointer keep it alive until they let go
    std::atomic_store(&model, std::move(new_model));
    is_calculating = false;
    last_update_time = std::chrono::steady_clock::now();
    last_error.reset();
}

// ============================================================================
// ZoneEngine Implementation
// ============================================================================

ZoneEngine::ZoneEngine(std::shared_ptr<const TimeSeriesCollection> timeseries,
                       std::shared_ptr<LivePriceStore> prices,
                       AnalysisConfig config,
                       std::shared_ptr<PairAnalyzer> analyzer)
    : timeseries_(std::move(timeseries)), prices_(std::move(prices)),
      config_(std::move(config)),
      monitor_(config_.debug.print_monitor_progress) {
    if (!timeseries_) {
        throw std::invalid_argument("ZoneEngine requires a timeseries collection");
    }
    if (!prices_) {
        throw std::invalid_argument("ZoneEngine requires a price store");
    }
    config_.validate();

    if (!analyzer) {
        cache_ = std::make_shared<CvaCache>(config_.min_candles_for_analysis,
                                            config_.cache_capacity,
                                            config_.debug.print_cva_cache_events);
        analyzer = std::make_shared<CvaPairAnalyzer>(cache_);
    }

    for (const auto& pair : timeseries_->unique_pair_names()) {
        pairs_.emplace(pair, PairState{});
    }

    worker_ = std::make_unique<AnalysisWorker>(
        std::move(analyzer), static_cast<uint32_t>(config_.worker_threads));
    worker_->start();

    std::cout << "ZoneEngine started with " << pairs_.size() << " pairs\n";
}

ZoneEngine::~ZoneEngine() {
    if (worker_) {
        worker_->stop();
    }
}

bool ZoneEngine::update() {
    // 1. Apply finished results (front-buffer swaps)
    while (auto result = worker_->poll_result()) {
        handle_job_result(std::move(*result));
    }

    // 2. Queue pairs whose price moved enough
    check_automatic_triggers();

    // 3. Hand the next pair to the worker
    process_queue();

    // 4. Zone transitions at the live price
    update_monitor_prices();

    return !queue_.empty() || has_active_jobs();
}

std::shared_ptr<const TradingModel>
ZoneEngine::get_model(const std::string& pair) const {
    auto it = pairs_.find(pair);
    if (it == pairs_.end()) {
        return nullptr;
    }
    return std::atomic_load(&it->second.model);
}

std::optional<double> ZoneEngine::get_price(const std::string& pair) const {
    return prices_->get_price(pair);
}

std::vector<const PairContext*> ZoneEngine::get_signals() const {
    return monitor_.get_signals();
}

PairStatus ZoneEngine::get_pair_status(const std::string& pair) const {
    auto it = pairs_.find(pair);
    if (it == pairs_.end()) {
        return PairStatus{};
    }
    return PairStatus{it->second.is_calculating, it->second.last_error};
}

bool ZoneEngine::force_recalc(const std::string& pair) {
    auto it = pairs_.find(pair);
    if (it == pairs_.end()) {
        throw InvalidPairError(pair);
    }
    if (it->second.is_calculating || is_queued(pair)) {
        return false;
    }
    queue_.push_front(pair);
    return true;
}

void ZoneEngine::trigger_global_recalc(
    const std::optional<std::string>& priority_pair) {
    if (priority_pair && pairs_.find(*priority_pair) == pairs_.end()) {
        throw InvalidPairError(*priority_pair);
    }

    // Stale jobs are not worth finishing
    queue_.clear();

    if (priority_pair) {
        queue_.push_back(*priority_pair);
    }
    for (const auto& [pair, state] : pairs_) {
        if (priority_pair && pair == *priority_pair) {
            continue;
        }
        queue_.push_back(pair);
    }

    std::cout << "[RECALC] global queue_len=" << queue_.size()
              << " head=" << (queue_.empty() ? "-" : queue_.front()) << "\n";
}

void ZoneEngine::update_config(AnalysisConfig config) {
    config.validate();
    config_ = std::move(config);

    // The default analyzer's cache enforces its own minimum; keep it in step
    if (cache_) {
        cache_->configure(config_.min_candles_for_analysis, config_.cache_capacity,
                          config_.debug.print_cva_cache_events);
    }
    monitor_.set_log_progress(config_.debug.print_monitor_progress);
}

void ZoneEngine::set_publisher(std::shared_ptr<ZonePublisher> publisher) {
    publisher_ = std::move(publisher);
}

void ZoneEngine::set_stream_suspended(bool suspended) {
    if (suspended) {
        prices_->suspend();
    } else {
        prices_->resume();
    }
}

std::optional<std::string> ZoneEngine::worker_status_msg() const {
    for (const auto& [pair, state] : pairs_) {
        if (state.is_calculating) {
            return "Processing " + pair;
        }
    }
    if (!queue_.empty()) {
        return "Queued: " + std::to_string(queue_.size());
    }
    return std::nullopt;
}

std::vector<std::string> ZoneEngine::pair_names() const {
    return timeseries_->unique_pair_names();
}

void ZoneEngine::handle_job_result(JobResult result) {
    auto it = pairs_.find(result.pair_name);
    if (it == pairs_.end()) {
        // Pair no longer tracked; nothing to update
        return;
    }
    PairState& state = it->second;

    if (!result.ok()) {
        std::string error = result.error.value_or("unknown error");
        std::cerr << "[WORKER] pair=" << result.pair_name
                  << " duration_ms=" << result.duration_ms
                  << " error=" << error << "\n";
        state.last_error = std::move(error);
        state.is_calculating = false;
        return;
    }

    if (config_.debug.print_trigger_updates) {
        std::cout << "[RESULT] pair=" << result.pair_name
                  << " duration_ms=" << result.duration_ms << "\n";
    }

    state.update_buffer(result.model);
    publish_model(*result.model);

    if (monitor_.update_model(*result.model, state.last_update_price)) {
        publish_signals(*monitor_.get_context(result.pair_name));
    }
}

void ZoneEngine::check_automatic_triggers() {
    for (const auto& [pair, state] : pairs_) {
        auto current_price = prices_->get_price(pair);
        if (!current_price) {
            continue;
        }
        if (state.is_calculating || is_queued(pair)) {
            continue;
        }

        // Never computed
        if (state.last_update_price == 0.0) {
            queue_.push_back(pair);
            continue;
        }

        double moved = std::abs(*current_price - state.last_update_price) /
                       state.last_update_price;
        if (moved >= config_.price_recalc_threshold_pct) {
            if (config_.debug.print_trigger_updates) {
                std::cout << "[TRIGGER] pair=" << pair
                          << " moved_pct=" << moved * 100.0 << "\n";
            }
            queue_.push_back(pair);
        }
    }
}

void ZoneEngine::process_queue() {
    if (queue_.empty()) {
        return;
    }

    // Head still in flight: wait for its result rather than double dispatch
    auto it = pairs_.find(queue_.front());
    if (it != pairs_.end() && it->second.is_calculating) {
        return;
    }

    std::string pair = std::move(queue_.front());
    queue_.pop_front();
    dispatch_job(pair);
}

void ZoneEngine::dispatch_job(const std::string& pair) {
    auto it = pairs_.find(pair);
    if (it == pairs_.end()) {
        return;
    }
    PairState& state = it->second;

    // No price yet: the trigger check requeues the pair once one arrives
    auto price = prices_->get_price(pair);
    if (!price) {
        return;
    }

    state.is_calculating = true;
    state.last_update_price = *price;

    JobRequest request;
    request.pair_name = pair;
    request.current_price = *price;
    request.config = config_;
    request.timeseries = timeseries_;

    if (!worker_->submit(std::move(request))) {
        state.is_calculating = false;
        state.last_error = "analysis worker is not running";
        std::cerr << "[DISPATCH] pair=" << pair
                  << " error=analysis worker is not running\n";
        return;
    }
    ++jobs_dispatched_;
}

void ZoneEngine::update_monitor_prices() {
    for (const auto& [pair, state] : pairs_) {
        if (monitor_.get_context(pair) == nullptr) {
            continue;
        }
        auto price = prices_->get_price(pair);
        if (!price) {
            continue;
        }
        if (monitor_.process_price_update(pair, *price)) {
            publish_signals(*monitor_.get_context(pair));
        }
    }
}

bool ZoneEngine::has_active_jobs() const {
    return std::any_of(pairs_.begin(), pairs_.end(), [](const auto& entry) {
        return entry.second.is_calculating;
    });
}

bool ZoneEngine::is_queued(const std::string& pair) const {
    return std::find(queue_.begin(), queue_.end(), pair) != queue_.end();
}

void ZoneEngine::publish_model(const TradingModel& model) {
    if (!publisher_) {
        return;
    }
    try {
        publisher_->publish_model(model);
        if (config_.debug.print_publish_events) {
            std::cout << "[PUBLISH] kind=zones pair=" << model.pair_name()
                      << "\n";
        }
    } catch (const std::exception& ex) {
        std::cerr << "[PUBLISH] kind=zones pair=" << model.pair_name()
                  << " error=" << ex.what() << "\n";
    }
}

void ZoneEngine::publish_signals(const PairContext& context) {
    if (!publisher_) {
        return;
    }
    try {
        publisher_->publish_signals(context);
        if (config_.debug.print_publish_events) {
            std::cout << "[PUBLISH] kind=signals pair=" << context.pair_name
                      << " signals=" << context.signals.size() << "\n";
        }
    } catch (const std::exception& ex) {
        std::cerr << "[PUBLISH] kind=signals pair=" << context.pair_name
                  << " error=" << ex.what() << "\n";
    }
}

} // namespace zones
