#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include "errors.hpp"
#include "zone_engine.hpp"

using namespace zones;

namespace {

/// Candles oscillating around 100 on the default 30-minute interval
OhlcvTimeSeries make_series(const std::string& pair, std::size_t count,
                            double centre = 100.0) {
    OhlcvTimeSeries series;
    series.pair_interval = PairInterval(pair, MS_IN_30_MIN);
    series.first_timestamp_ms = 1700000000000;
    for (std::size_t i = 0; i < count; ++i) {
        double base = centre + static_cast<double>(i % 5) - 2.0;
        double close = (i % 2 == 0) ? base + 1.0 : base - 1.0;
        series.push_back(Candle(base, base + 2.0, base - 2.0, close, 10.0,
                                10.0 * base));
    }
    return series;
}

std::shared_ptr<const TimeSeriesCollection>
make_collection(const std::vector<std::string>& pairs, std::size_t count = 300) {
    auto collection = std::make_shared<TimeSeriesCollection>();
    collection->name = "engine-test";
    for (const auto& pair : pairs) {
        collection->series.push_back(make_series(pair, count));
    }
    return collection;
}

/// Sticky superzones 10-11, 30-32 and 60-61 over [0, 100)
std::shared_ptr<const TradingModel> make_model(const std::string& pair,
                                               double price) {
    PriceRangePartition range(0.0, 100.0, 100);
    ClassifiedZones classified;
    for (std::size_t idx : {10, 11, 30, 31, 32, 60, 61}) {
        classified.sticky.push_back(Zone::from_partition(range, idx));
    }
    classified.sticky_superzones = aggregate_zones(classified.sticky);
    auto cva = std::make_shared<const CVACore>(0.0, 100.0, 100, pair, 1.5);
    return std::make_shared<const TradingModel>(pair, cva, classified, price);
}

/// Analyzer whose jobs block until opened. Records call order and the
/// number of simultaneous jobs per pair.
class GatedAnalyzer : public PairAnalyzer {
public:
    explicit GatedAnalyzer(bool open = true) : open_(open) {}

    std::shared_ptr<const TradingModel> analyze(const JobRequest& request) override {
        std::unique_lock<std::mutex> lock(mutex_);
        calls_.push_back(request.pair_name);
        int active = ++in_flight_[request.pair_name];
        max_in_flight_ = std::max(max_in_flight_, active);
        cv_.notify_all();

        cv_.wait(lock, [this] { return open_; });
        --in_flight_[request.pair_name];

        if (failing_.count(request.pair_name) > 0) {
            throw AnalysisError("scripted failure for " + request.pair_name);
        }
        return make_model(request.pair_name, request.current_price);
    }

    void open() {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = true;
        cv_.notify_all();
    }

    void fail(const std::string& pair) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_.insert(pair);
    }

    /// Block until `count` jobs have started
    bool wait_for_calls(std::size_t count) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::seconds(5),
                            [&] { return calls_.size() >= count; });
    }

    std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    int max_in_flight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return max_in_flight_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool open_;
    std::vector<std::string> calls_;
    std::map<std::string, int> in_flight_;
    int max_in_flight_{0};
    std::set<std::string> failing_;
};

/// Run engine frames until done() or the deadline
bool pump(ZoneEngine& engine, const std::function<bool()>& done,
          std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        engine.update();
        if (done()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return false;
}

class ZoneEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        prices = std::make_shared<LivePriceStore>();
        analyzer = std::make_shared<GatedAnalyzer>(false);
    }

    void TearDown() override {
        // Blocked jobs must finish before the engine joins its worker
        analyzer->open();
        engine.reset();
    }

    void build(const std::vector<std::string>& pairs, AnalysisConfig config = {}) {
        engine = std::make_unique<ZoneEngine>(make_collection(pairs), prices,
                                              config, analyzer);
    }

    std::shared_ptr<LivePriceStore> prices;
    std::shared_ptr<GatedAnalyzer> analyzer;
    std::unique_ptr<ZoneEngine> engine;
};

} // namespace

// ============================================================================
// Construction
// ============================================================================

TEST(ZoneEngineConstructionTest, RejectsMissingInputs) {
    auto prices = std::make_shared<LivePriceStore>();
    auto collection = make_collection({"BTCUSDT"});

    EXPECT_THROW(ZoneEngine(nullptr, prices, AnalysisConfig{}), std::invalid_argument);
    EXPECT_THROW(ZoneEngine(collection, nullptr, AnalysisConfig{}), std::invalid_argument);

    AnalysisConfig bad;
    bad.zone_count = 0;
    EXPECT_THROW(ZoneEngine(collection, prices, bad), std::invalid_argument);
}

TEST(ZoneEngineConstructionTest, OneStatePerUniquePair) {
    auto collection = std::make_shared<TimeSeriesCollection>();
    collection->series.push_back(make_series("ETHUSDT", 10));
    collection->series.push_back(make_series("BTCUSDT", 10));
    collection->series.push_back(make_series("ETHUSDT", 10));

    ZoneEngine engine(collection, std::make_shared<LivePriceStore>(), AnalysisConfig{});

    EXPECT_EQ(engine.active_pair_count(), 2u);
    std::vector<std::string> expected = {"BTCUSDT", "ETHUSDT"};
    EXPECT_EQ(engine.pair_names(), expected);
    EXPECT_NE(engine.cache(), nullptr);
    EXPECT_FALSE(engine.worker_status_msg().has_value());
}

// ============================================================================
// Full pipeline with the default analyzer
// ============================================================================

TEST(ZoneEnginePipelineTest, FirstPriceProducesModel) {
    auto prices = std::make_shared<LivePriceStore>();
    ZoneEngine engine(make_collection({"BTCUSDT"}), prices, AnalysisConfig{});

    // No price yet: nothing to do
    EXPECT_FALSE(engine.update());
    EXPECT_EQ(engine.jobs_dispatched(), 0u);

    prices->set_price("btcusdt", 100.0);
    ASSERT_TRUE(pump(engine, [&] { return engine.get_model("BTCUSDT") != nullptr; }));

    auto model = engine.get_model("BTCUSDT");
    EXPECT_EQ(model->pair_name(), "BTCUSDT");
    ASSERT_TRUE(model->current_price().has_value());
    EXPECT_DOUBLE_EQ(*model->current_price(), 100.0);
    ASSERT_NE(model->cva(), nullptr);
    EXPECT_EQ(model->cva()->total_candles, 300u);

    EXPECT_EQ(engine.jobs_dispatched(), 1u);
    EXPECT_EQ(engine.cache()->misses(), 1u);
    EXPECT_FALSE(engine.get_pair_status("BTCUSDT").last_error.has_value());
    EXPECT_NE(engine.monitor().get_context("BTCUSDT"), nullptr);

    // Idle once the result is applied and the price has not moved
    EXPECT_TRUE(pump(engine, [&] { return !engine.update(); }));
    EXPECT_EQ(engine.jobs_dispatched(), 1u);
}

TEST(ZoneEnginePipelineTest, ShortSeriesRecordsError) {
    auto prices = std::make_shared<LivePriceStore>();
    ZoneEngine engine(make_collection({"BTCUSDT"}, 40), prices, AnalysisConfig{});
    prices->set_price("BTCUSDT", 100.0);

    ASSERT_TRUE(pump(engine, [&] {
        return engine.get_pair_status("BTCUSDT").last_error.has_value();
    }));

    PairStatus status = engine.get_pair_status("BTCUSDT");
    EXPECT_FALSE(status.is_calculating);
    EXPECT_NE(status.last_error->find("Insufficient data"), std::string::npos);
    EXPECT_EQ(engine.get_model("BTCUSDT"), nullptr);
}

TEST(ZoneEnginePipelineTest, LoweredMinimumReachesCache) {
    auto prices = std::make_shared<LivePriceStore>();
    ZoneEngine engine(make_collection({"BTCUSDT"}, 50), prices, AnalysisConfig{});

    AnalysisConfig lowered;
    lowered.min_candles_for_analysis = 20;
    lowered.cache_capacity = 8;
    engine.update_config(lowered);
    EXPECT_EQ(engine.cache()->min_candles(), 20u);
    EXPECT_EQ(engine.cache()->capacity(), 8u);

    prices->set_price("BTCUSDT", 100.0);
    ASSERT_TRUE(pump(engine, [&] {
        return engine.get_model("BTCUSDT") != nullptr ||
               engine.get_pair_status("BTCUSDT").last_error.has_value();
    }));

    EXPECT_FALSE(engine.get_pair_status("BTCUSDT").last_error.has_value());
    auto model = engine.get_model("BTCUSDT");
    ASSERT_NE(model, nullptr);
    EXPECT_GE(model->cva()->total_candles, 20u);
    EXPECT_LE(model->cva()->total_candles, 50u);
}

// ============================================================================
// Dispatch rules
// ============================================================================

TEST_F(ZoneEngineTest, NeverDispatchesPairTwice) {
    build({"BTCUSDT"});
    prices->set_price("BTCUSDT", 100.0);

    EXPECT_TRUE(engine->update());
    ASSERT_TRUE(analyzer->wait_for_calls(1));
    EXPECT_TRUE(engine->get_pair_status("BTCUSDT").is_calculating);
    EXPECT_EQ(engine->worker_status_msg(), std::optional<std::string>("Processing BTCUSDT"));

    // Big move and explicit request while in flight
    prices->set_price("BTCUSDT", 150.0);
    EXPECT_FALSE(engine->force_recalc("BTCUSDT"));
    for (int i = 0; i < 20; ++i) {
        engine->update();
    }
    EXPECT_EQ(engine->jobs_dispatched(), 1u);
    EXPECT_EQ(engine->queue_len(), 0u);

    // Once the result lands, the move triggers exactly one new job
    analyzer->open();
    ASSERT_TRUE(pump(*engine, [&] { return engine->jobs_dispatched() == 2u; }));
    ASSERT_TRUE(pump(*engine, [&] { return !engine->update(); }));

    EXPECT_EQ(analyzer->max_in_flight(), 1);
    EXPECT_EQ(engine->jobs_dispatched(), 2u);
    EXPECT_DOUBLE_EQ(*engine->get_model("BTCUSDT")->current_price(), 150.0);
}

TEST_F(ZoneEngineTest, SmallMovesDoNotRecompute) {
    AnalysisConfig config;
    config.price_recalc_threshold_pct = 0.05;
    build({"BTCUSDT"}, config);
    analyzer->open();

    prices->set_price("BTCUSDT", 100.0);
    ASSERT_TRUE(pump(*engine, [&] { return engine->get_model("BTCUSDT") != nullptr; }));

    prices->set_price("BTCUSDT", 104.0);
    EXPECT_TRUE(pump(*engine, [&] { return !engine->update(); }));
    EXPECT_EQ(engine->jobs_dispatched(), 1u);

    prices->set_price("BTCUSDT", 105.5);
    ASSERT_TRUE(pump(*engine, [&] { return engine->jobs_dispatched() == 2u; }));
}

TEST_F(ZoneEngineTest, UnknownPairsAreRejected) {
    build({"BTCUSDT"});
    EXPECT_THROW(engine->force_recalc("DOGEUSDT"), InvalidPairError);
    EXPECT_THROW(engine->trigger_global_recalc(std::string("DOGEUSDT")), InvalidPairError);
    EXPECT_EQ(engine->queue_len(), 0u);
    EXPECT_EQ(engine->get_model("DOGEUSDT"), nullptr);
}

TEST_F(ZoneEngineTest, GlobalRecalcPutsPriorityFirst) {
    build({"BTCUSDT", "ETHUSDT", "SOLUSDT"});

    engine->trigger_global_recalc(std::string("SOLUSDT"));
    EXPECT_EQ(engine->queue_len(), 3u);
    EXPECT_EQ(engine->worker_status_msg(), std::optional<std::string>("Queued: 3"));

    prices->set_price("BTCUSDT", 100.0);
    prices->set_price("ETHUSDT", 100.0);
    prices->set_price("SOLUSDT", 100.0);
    analyzer->open();

    ASSERT_TRUE(pump(*engine, [&] {
        return engine->get_model("BTCUSDT") && engine->get_model("ETHUSDT") &&
               engine->get_model("SOLUSDT");
    }));

    std::vector<std::string> expected = {"SOLUSDT", "BTCUSDT", "ETHUSDT"};
    EXPECT_EQ(analyzer->calls(), expected);
}

TEST_F(ZoneEngineTest, GlobalRecalcReplacesQueue) {
    build({"BTCUSDT", "ETHUSDT"});
    engine->trigger_global_recalc();
    engine->trigger_global_recalc(std::string("ETHUSDT"));
    EXPECT_EQ(engine->queue_len(), 2u);
}

TEST_F(ZoneEngineTest, ForceRecalcJumpsQueue) {
    build({"BTCUSDT", "ETHUSDT", "SOLUSDT"});
    prices->set_price("BTCUSDT", 100.0);
    prices->set_price("ETHUSDT", 100.0);
    prices->set_price("SOLUSDT", 100.0);
    analyzer->open();
    ASSERT_TRUE(pump(*engine, [&] { return engine->jobs_dispatched() == 3u; }));
    ASSERT_TRUE(pump(*engine, [&] { return !engine->update(); }));

    EXPECT_TRUE(engine->force_recalc("ETHUSDT"));
    EXPECT_FALSE(engine->force_recalc("ETHUSDT"));
    EXPECT_TRUE(engine->force_recalc("SOLUSDT"));
    EXPECT_EQ(engine->queue_len(), 2u);

    ASSERT_TRUE(pump(*engine, [&] { return engine->jobs_dispatched() == 5u; }));
    ASSERT_TRUE(analyzer->wait_for_calls(5));
    auto calls = analyzer->calls();
    ASSERT_EQ(calls.size(), 5u);
    EXPECT_EQ(calls[3], "SOLUSDT");
    EXPECT_EQ(calls[4], "ETHUSDT");
}

TEST_F(ZoneEngineTest, FailureKeepsPreviousModel) {
    build({"BTCUSDT"});
    analyzer->open();
    prices->set_price("BTCUSDT", 40.0);
    ASSERT_TRUE(pump(*engine, [&] { return engine->get_model("BTCUSDT") != nullptr; }));
    auto first = engine->get_model("BTCUSDT");

    analyzer->fail("BTCUSDT");
    EXPECT_TRUE(engine->force_recalc("BTCUSDT"));
    ASSERT_TRUE(pump(*engine, [&] {
        return engine->get_pair_status("BTCUSDT").last_error.has_value();
    }));

    EXPECT_EQ(engine->get_model("BTCUSDT"), first);
    EXPECT_EQ(*engine->get_pair_status("BTCUSDT").last_error,
              "scripted failure for BTCUSDT");
    EXPECT_FALSE(engine->get_pair_status("BTCUSDT").is_calculating);
}

TEST_F(ZoneEngineTest, ModelReadableFromOtherThreads) {
    build({"BTCUSDT"});
    analyzer->open();
    prices->set_price("BTCUSDT", 40.0);

    std::atomic<bool> stop{false};
    std::atomic<int> observed{0};
    std::thread reader([&]() {
        while (!stop) {
            auto model = engine->get_model("BTCUSDT");
            if (model) {
                EXPECT_EQ(model->pair_name(), "BTCUSDT");
                ++observed;
            }
        }
    });

    ASSERT_TRUE(pump(*engine, [&] { return observed > 0; }));
    for (int i = 0; i < 5; ++i) {
        prices->set_price("BTCUSDT", 40.0 + 5.0 * (i + 1));
        pump(*engine, [&] { return !engine->update(); });
    }
    stop = true;
    reader.join();
    EXPECT_GT(observed.load(), 0);
}

TEST_F(ZoneEngineTest, UpdateConfigValidates) {
    build({"BTCUSDT"});
    AnalysisConfig bad;
    bad.worker_threads = 0;
    EXPECT_THROW(engine->update_config(bad), std::invalid_argument);
    EXPECT_EQ(engine->config().worker_threads, 1u);

    AnalysisConfig good;
    good.zone_count = 250;
    engine->update_config(good);
    EXPECT_EQ(engine->config().zone_count, 250u);
}

// ============================================================================
// Monitor and publishing
// ============================================================================

TEST_F(ZoneEngineTest, PublishesModelsAndTransitions) {
    AnalysisConfig config;
    config.price_recalc_threshold_pct = 100.0; // recompute only on request
    build({"BTCUSDT"}, config);
    auto publisher = std::make_shared<InMemoryPublisher>();
    engine->set_publisher(publisher);
    analyzer->open();

    prices->set_price("BTCUSDT", 50.0);
    ASSERT_TRUE(pump(*engine, [&] { return engine->get_model("BTCUSDT") != nullptr; }));
    EXPECT_EQ(publisher->snapshots().size(), 1u);
    EXPECT_EQ(publisher->signals().size(), 1u);
    EXPECT_TRUE(engine->get_signals().empty());

    // Into the sticky superzone at 30-32
    prices->set_price("BTCUSDT", 30.5);
    engine->update();
    EXPECT_EQ(publisher->signals().size(), 2u);
    auto with_signals = engine->get_signals();
    ASSERT_EQ(with_signals.size(), 1u);
    EXPECT_EQ(with_signals[0]->pair_name, "BTCUSDT");

    // Same occupancy: nothing new
    prices->set_price("BTCUSDT", 30.6);
    engine->update();
    EXPECT_EQ(publisher->signals().size(), 2u);
    EXPECT_EQ(publisher->snapshots().size(), 1u);
}

TEST_F(ZoneEngineTest, RecomputeWithSameOccupancyPublishesNoSignals) {
    AnalysisConfig config;
    config.price_recalc_threshold_pct = 100.0;
    build({"BTCUSDT"}, config);
    auto publisher = std::make_shared<InMemoryPublisher>();
    engine->set_publisher(publisher);
    analyzer->open();

    // Inside the sticky superzone at 30-32 from the start
    prices->set_price("BTCUSDT", 30.5);
    ASSERT_TRUE(pump(*engine, [&] { return engine->get_model("BTCUSDT") != nullptr; }));
    ASSERT_EQ(publisher->signals().size(), 1u);
    ASSERT_EQ(publisher->snapshots().size(), 1u);

    // Same price, same zones: a new snapshot but no new signals
    EXPECT_TRUE(engine->force_recalc("BTCUSDT"));
    ASSERT_TRUE(pump(*engine, [&] { return publisher->snapshots().size() == 2u; }));
    ASSERT_TRUE(pump(*engine, [&] { return !engine->update(); }));
    EXPECT_EQ(publisher->signals().size(), 1u);
    EXPECT_TRUE(engine->monitor().get_context("BTCUSDT")->has_signals());

    // Leaving the zone is still reported
    prices->set_price("BTCUSDT", 50.0);
    engine->update();
    EXPECT_EQ(publisher->signals().size(), 2u);
}

TEST_F(ZoneEngineTest, StreamSuspensionFreezesPrices) {
    build({"BTCUSDT"});
    prices->set_price("BTCUSDT", 100.0);

    engine->set_stream_suspended(true);
    prices->set_price("BTCUSDT", 120.0);
    EXPECT_DOUBLE_EQ(*engine->get_price("BTCUSDT"), 100.0);

    engine->set_stream_suspended(false);
    prices->set_price("BTCUSDT", 120.0);
    EXPECT_DOUBLE_EQ(*engine->get_price("BTCUSDT"), 120.0);
}

// ============================================================================
// AnalysisWorker
// ============================================================================

TEST(AnalysisWorkerTest, RejectsBadArguments) {
    EXPECT_THROW(AnalysisWorker(nullptr, 1), std::invalid_argument);
    EXPECT_THROW(AnalysisWorker(std::make_shared<GatedAnalyzer>(), 0),
                 std::invalid_argument);
}

TEST(AnalysisWorkerTest, ReturnsResultForEveryJob) {
    auto analyzer = std::make_shared<GatedAnalyzer>();
    analyzer->fail("ETHUSDT");
    AnalysisWorker worker(analyzer, 1);
    worker.start();

    JobRequest ok;
    ok.pair_name = "BTCUSDT";
    ok.current_price = 42.0;
    JobRequest bad;
    bad.pair_name = "ETHUSDT";
    ASSERT_TRUE(worker.submit(ok));
    ASSERT_TRUE(worker.submit(bad));

    auto first = worker.wait_result();
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(first->ok());
    EXPECT_EQ(first->pair_name, "BTCUSDT");
    EXPECT_DOUBLE_EQ(*first->model->current_price(), 42.0);

    auto second = worker.wait_result();
    ASSERT_TRUE(second.has_value());
    EXPECT_FALSE(second->ok());
    EXPECT_EQ(second->model, nullptr);
    EXPECT_EQ(*second->error, "scripted failure for ETHUSDT");

    worker.stop();
    EXPECT_EQ(worker.jobs_completed(), 2u);
}

TEST(AnalysisWorkerTest, StoppedWorkerRefusesJobs) {
    AnalysisWorker worker(std::make_shared<GatedAnalyzer>(), 1);
    worker.start();
    EXPECT_TRUE(worker.running());
    worker.stop();
    EXPECT_FALSE(worker.running());

    JobRequest request;
    request.pair_name = "BTCUSDT";
    EXPECT_FALSE(worker.submit(request));
    EXPECT_FALSE(worker.wait_result().has_value());
    EXPECT_THROW(worker.start(), std::logic_error);
}

// ============================================================================
// LivePriceStore
// ============================================================================

TEST(LivePriceStoreTest, SymbolsAreCaseInsensitive) {
    LivePriceStore store;
    store.set_price("BTCUSDT", 100.0);
    ASSERT_TRUE(store.get_price("btcusdt").has_value());
    EXPECT_DOUBLE_EQ(*store.get_price("BtcUsdt"), 100.0);
    EXPECT_FALSE(store.get_price("ETHUSDT").has_value());

    auto snapshot = store.snapshot();
    ASSERT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(snapshot.begin()->first, "btcusdt");
}

TEST(LivePriceStoreTest, SuspendIgnoresWrites) {
    LivePriceStore store;
    store.set_price("BTCUSDT", 100.0);
    store.suspend();
    EXPECT_TRUE(store.is_suspended());
    store.set_price("BTCUSDT", 200.0);
    EXPECT_DOUBLE_EQ(*store.get_price("BTCUSDT"), 100.0);
    store.resume();
    store.set_price("BTCUSDT", 200.0);
    EXPECT_DOUBLE_EQ(*store.get_price("BTCUSDT"), 200.0);
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
