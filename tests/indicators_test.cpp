#include <gtest/gtest.h>
#include <cmath>
#include <random>
#include "indicators/atr.hpp"
#include "indicators/bollinger.hpp"
#include "indicators/indicator_engine.hpp"
#include "indicators/macd.hpp"
#include "indicators/rsi.hpp"
#include "indicators/sma_ema.hpp"
#include "test_helpers.hpp"

using namespace ind;

TEST(SmaSeries, WindowAverageAfterWarmup) {
    const auto s = sma_series({1, 2, 3, 4, 5}, 3);
    ASSERT_EQ(s.size(), 5u);
    EXPECT_FALSE(s[0]);
    EXPECT_FALSE(s[1]);
    EXPECT_DOUBLE_EQ(*s[2], 2.0);
    EXPECT_DOUBLE_EQ(*s[3], 3.0);
    EXPECT_DOUBLE_EQ(*s[4], 4.0);
}

TEST(EmaSeries, SeededWithSmaThenSmoothed) {
    const auto e = ema_series(std::vector<double>{1, 2, 3, 4, 5}, 3);
    EXPECT_FALSE(e[0]);
    EXPECT_FALSE(e[1]);
    EXPECT_DOUBLE_EQ(*e[2], 2.0);
    EXPECT_DOUBLE_EQ(*e[3], 3.0); // 2 + (4-2)*0.5
    EXPECT_DOUBLE_EQ(*e[4], 4.0);
}

TEST(EmaSeries, ShorterThanWindowIsAbsent) {
    const auto e = ema_series(std::vector<double>{1, 2}, 3);
    EXPECT_FALSE(e[0]);
    EXPECT_FALSE(e[1]);
}

TEST(EmaSeries, ConstantSeriesConvergesImmediately) {
    const std::vector<double> v(60, 42.0);
    for (std::size_t p : {9u, 21u}) {
        const auto e = ema_series(v, p);
        for (std::size_t i = p - 1; i < v.size(); ++i) {
            ASSERT_TRUE(e[i]);
            EXPECT_NEAR(*e[i], 42.0, 1e-12);
        }
    }
}

TEST(EmaSeries, ConvergesToNewLevelWithinBoundedBars) {
    std::vector<double> v(50, 100.0);
    v.insert(v.end(), 300, 200.0);
    const auto fast = ema_series(v, 9);
    const auto slow = ema_series(v, 21);
    EXPECT_NEAR(*fast.back(), 200.0, 1e-6);
    EXPECT_NEAR(*slow.back(), 200.0, 1e-6);
}

TEST(RsiSeries, WilderSmoothing) {
    const auto r = rsi_series({1, 2, 1, 2, 3}, 2);
    EXPECT_FALSE(r[1]);
    EXPECT_DOUBLE_EQ(*r[2], 50.0);
    EXPECT_DOUBLE_EQ(*r[3], 75.0);
    EXPECT_DOUBLE_EQ(*r[4], 87.5);
}

TEST(RsiSeries, FlatAndMonotoneExtremes) {
    const auto flat = rsi_series(std::vector<double>(30, 10.0), 14);
    EXPECT_DOUBLE_EQ(*flat.back(), 50.0);

    std::vector<double> up(30);
    for (std::size_t i = 0; i < up.size(); ++i) up[i] = 10.0 + i;
    EXPECT_DOUBLE_EQ(*rsi_series(up, 14).back(), 100.0);
}

TEST(RsiSeries, AlwaysWithinBounds) {
    std::mt19937 rng(7);
    std::normal_distribution<double> step(0.0, 5.0);
    for (int run = 0; run < 50; ++run) {
        std::vector<double> v{1000.0};
        for (int i = 0; i < 300; ++i) v.push_back(v.back() + step(rng) * (run % 5 + 1));
        for (const auto& x : rsi_series(v, 14)) {
            if (!x) continue;
            EXPECT_GE(*x, 0.0);
            EXPECT_LE(*x, 100.0);
        }
    }
}

TEST(AtrSeries, ConstantRange) {
    const auto bars = testutil::bars_from_closes(std::vector<double>(30, 50.0), 1.0);
    const auto a = atr_series(bars, 14);
    EXPECT_FALSE(a[13]);
    ASSERT_TRUE(a[14]);
    EXPECT_DOUBLE_EQ(*a[14], 2.0);
    EXPECT_DOUBLE_EQ(*a.back(), 2.0);
}

TEST(AtrSeries, TrueRangeUsesPreviousClose) {
    core::Bar prev{0, 10, 10, 10, 10, 1};
    core::Bar gap_up{1, 14, 15, 13, 14, 1};
    EXPECT_DOUBLE_EQ(true_range(gap_up, prev), 5.0);
}

TEST(BollingerSeries, ConstantCollapsesBands) {
    const auto bb = bb_series(std::vector<double>(25, 3.0), 20, 2.0);
    EXPECT_FALSE(bb[18]);
    ASSERT_TRUE(bb[19]);
    EXPECT_DOUBLE_EQ(bb[24]->upper, 3.0);
    EXPECT_DOUBLE_EQ(bb[24]->lower, 3.0);
    EXPECT_DOUBLE_EQ(band_width(*bb[24]), 0.0);
}

TEST(BollingerSeries, PopulationDeviation) {
    // 2,4,4,4,5,5,7,9 -> átlag 5, szórás 2
    const auto bb = bb_series({2, 4, 4, 4, 5, 5, 7, 9}, 8, 2.0);
    EXPECT_DOUBLE_EQ(bb[7]->mid, 5.0);
    EXPECT_DOUBLE_EQ(bb[7]->upper, 9.0);
    EXPECT_DOUBLE_EQ(bb[7]->lower, 1.0);
}

TEST(MacdSeries, SignalStartsAfterSlowPlusSignalWarmup) {
    std::vector<double> v(60);
    for (std::size_t i = 0; i < v.size(); ++i) v[i] = 100.0 + std::sin(i * 0.3) * 5.0;
    const auto m = macd_series(v, 12, 26, 9);
    EXPECT_FALSE(m.line[24]);
    EXPECT_TRUE(m.line[25]);
    EXPECT_FALSE(m.signal[32]);
    EXPECT_TRUE(m.signal[33]);
}

TEST(IndicatorEngine, WarmupMatchesLargestRequirement) {
    IndicatorEngine eng(core::IndicatorConfig{});
    EXPECT_EQ(eng.warmup_bars(), 34u);
}

TEST(IndicatorEngine, ShortSeriesIsEntirelyInsufficient) {
    IndicatorEngine eng(core::IndicatorConfig{});
    for (std::size_t n : {0u, 1u, 10u, 26u, 33u}) {
        const auto out = eng.compute(testutil::trending_bars(n, 100.0, 0.001, 0.001));
        ASSERT_EQ(out.size(), n);
        for (const auto& e : out) EXPECT_FALSE(e);
    }
}

TEST(IndicatorEngine, WarmupEntriesAbsentThenComplete) {
    IndicatorEngine eng(core::IndicatorConfig{});
    const auto bars = testutil::trending_bars(100, 100.0, 0.002, 0.003);
    const auto out = eng.compute(bars);
    ASSERT_EQ(out.size(), bars.size());
    for (std::size_t i = 0; i < 33; ++i) EXPECT_FALSE(out[i]) << i;
    for (std::size_t i = 33; i < out.size(); ++i) {
        ASSERT_TRUE(out[i]) << i;
        EXPECT_GE(out[i]->rsi, 0.0);
        EXPECT_LE(out[i]->rsi, 100.0);
        EXPECT_GT(out[i]->atr, 0.0);
        EXPECT_LE(out[i]->bb_lower, out[i]->bb_mid);
        EXPECT_GE(out[i]->bb_upper, out[i]->bb_mid);
    }
}

TEST(IndicatorEngine, ExactlyWarmupBarsYieldsOneEntry) {
    IndicatorEngine eng(core::IndicatorConfig{});
    const auto out = eng.compute(testutil::trending_bars(34, 100.0, 0.002, 0.003));
    for (std::size_t i = 0; i < 33; ++i) EXPECT_FALSE(out[i]);
    EXPECT_TRUE(out[33]);
}
