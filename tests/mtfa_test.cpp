#include <gtest/gtest.h>
#include "indicators/mtfa.hpp"
#include "test_helpers.hpp"

using core::Horizon;
using core::Trend;

TEST(ClassifyTrend, EmaRelationAndPricePosition) {
    ind::IndicatorSet s;
    s.ema_fast = 11; s.ema_slow = 10; s.sma = 10;
    EXPECT_EQ(ind::classify_trend(s, 10.5), Trend::Up);
    EXPECT_EQ(ind::classify_trend(s, 9.5), Trend::Flat);   // EMA up, ár az SMA alatt

    s.ema_fast = 9;
    EXPECT_EQ(ind::classify_trend(s, 9.5), Trend::Down);
    EXPECT_EQ(ind::classify_trend(s, 10.5), Trend::Flat);

    s.ema_fast = 10;
    EXPECT_EQ(ind::classify_trend(s, 10.5), Trend::Flat);  // egyenlő EMA-k
}

TEST(Resample, AggregatesCompleteGroupsOnly) {
    const auto low = testutil::bars_from_closes({1, 2, 3, 4, 5, 6, 7, 8, 9, 10}, 0.5, 10.0);
    const auto hi = ind::resample(low, 4);
    ASSERT_EQ(hi.size(), 2u);
    EXPECT_EQ(hi[0].timestamp_ms, low[0].timestamp_ms);
    EXPECT_DOUBLE_EQ(hi[0].open, low[0].open);
    EXPECT_DOUBLE_EQ(hi[0].close, 4.0);
    EXPECT_DOUBLE_EQ(hi[0].high, 4.5);
    EXPECT_DOUBLE_EQ(hi[0].low, 0.5);
    EXPECT_DOUBLE_EQ(hi[0].volume, 40.0);
    EXPECT_DOUBLE_EQ(hi[1].close, 8.0);
    EXPECT_TRUE(ind::resample(low, 0).empty());
}

TEST(TimeframeAligner, NotReadyWhenAnyHorizonIsShort) {
    ind::TimeframeAligner al(core::IndicatorConfig{});
    auto inst = testutil::trending_instrument("BTCUSDT", 0.004);
    inst.horizons[core::index_of(Horizon::Long)].resize(30);
    const auto r = al.align(inst);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error(), core::ScanError::InsufficientData);
}

TEST(TimeframeAligner, ViewIsAbsentForInsufficientHorizon) {
    ind::TimeframeAligner al(core::IndicatorConfig{});
    const auto bars = testutil::trending_bars(20, 100.0, 0.004, 0.006);
    const auto series = al.engine().compute(bars);
    EXPECT_FALSE(al.view(Horizon::Short, bars, series));
}

TEST(TimeframeAligner, UptrendOnAllHorizons) {
    ind::TimeframeAligner al(core::IndicatorConfig{});
    const auto inst = testutil::trending_instrument("BTCUSDT", 0.004);
    const auto r = al.align(inst);
    ASSERT_TRUE(r.ok());
    for (auto h : core::kHorizons) {
        const auto& v = r.value().view(h);
        EXPECT_EQ(v.horizon, h);
        EXPECT_EQ(v.trend, Trend::Up) << core::to_string(h);
        EXPECT_DOUBLE_EQ(v.close, inst.at(h).back().close);
        EXPECT_GT(v.persistence, 0u);
        EXPECT_LE(v.persistence, inst.at(h).size() - al.engine().warmup_bars() + 1);
        EXPECT_EQ(r.value().series_of(h).size(), inst.at(h).size());
    }
}

TEST(TimeframeAligner, DowntrendLabels) {
    ind::TimeframeAligner al(core::IndicatorConfig{});
    const auto r = al.align(testutil::trending_instrument("ETHUSDT", -0.004));
    ASSERT_TRUE(r.ok());
    for (auto h : core::kHorizons) EXPECT_EQ(r.value().view(h).trend, Trend::Down);
}

TEST(TimeframeAligner, PersistenceCountsStableTail) {
    ind::TimeframeAligner al(core::IndicatorConfig{});
    // 60 bar emelkedés, utána 8 bar erős esés
    std::vector<double> closes;
    for (int i = 0; i < 60; ++i) closes.push_back(100.0 + i);
    for (int i = 0; i < 8; ++i) closes.push_back(closes.back() - 12.0);
    const auto bars = testutil::bars_from_closes(closes);
    const auto v = al.view(Horizon::Medium, bars, al.engine().compute(bars));
    ASSERT_TRUE(v);
    EXPECT_NE(v->trend, Trend::Up);
    EXPECT_LT(v->persistence, 8u);
}
