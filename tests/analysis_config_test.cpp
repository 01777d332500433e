#include <gtest/gtest.h>
#include "analysis_config.hpp"

#include <stdexcept>
#include <string>

using namespace zones;

TEST(AnalysisConfigTest, DefaultsAreValid) {
    AnalysisConfig config;
    EXPECT_NO_THROW(config.validate());

    EXPECT_EQ(config.interval_width_ms, MS_IN_30_MIN);
    EXPECT_EQ(config.zone_count, 100u);
    EXPECT_DOUBLE_EQ(config.time_decay_factor, 1.5);
    EXPECT_EQ(config.min_candles_for_analysis, 100u);
    EXPECT_DOUBLE_EQ(config.price_recalc_threshold_pct, 0.01);
    EXPECT_EQ(config.cache_capacity, 256u);
    EXPECT_EQ(config.worker_threads, 1u);
    EXPECT_DOUBLE_EQ(config.auto_duration.relevancy_threshold, 0.15);
    EXPECT_EQ(config.auto_duration.min_lookback_days, 7u);
    EXPECT_FALSE(config.debug.print_trigger_updates);
}

TEST(AnalysisConfigTest, RejectsBadFields) {
    {
        AnalysisConfig config;
        config.zone_count = 0;
        EXPECT_THROW(config.validate(), std::invalid_argument);
    }
    {
        AnalysisConfig config;
        config.interval_width_ms = 0;
        EXPECT_THROW(config.validate(), std::invalid_argument);
    }
    {
        AnalysisConfig config;
        config.time_decay_factor = 0.0;
        EXPECT_THROW(config.validate(), std::invalid_argument);
    }
    {
        AnalysisConfig config;
        config.price_recalc_threshold_pct = -0.5;
        EXPECT_THROW(config.validate(), std::invalid_argument);
    }
    {
        AnalysisConfig config;
        config.worker_threads = 0;
        EXPECT_THROW(config.validate(), std::invalid_argument);
    }
    {
        AnalysisConfig config;
        config.classifier.wick_top_percentile = 1.5;
        EXPECT_THROW(config.validate(), std::invalid_argument);
    }
}

TEST(AnalysisConfigTest, NonPositiveIntervalNamesTheField) {
    for (int64_t interval : {int64_t{0}, int64_t{-1}, -MS_IN_30_MIN}) {
        AnalysisConfig config;
        config.interval_width_ms = interval;
        try {
            config.validate();
            FAIL() << "interval " << interval << " accepted";
        } catch (const std::invalid_argument& e) {
            EXPECT_NE(std::string(e.what()).find("interval_width_ms"), std::string::npos);
        }
    }
}

TEST(AnalysisConfigTest, ZeroThresholdAndUnboundedCacheAllowed) {
    AnalysisConfig config;
    config.price_recalc_threshold_pct = 0.0;
    config.cache_capacity = 0;
    config.auto_duration.min_lookback_days = 0;
    EXPECT_NO_THROW(config.validate());
}
