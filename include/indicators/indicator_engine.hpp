#pragma once
#include <optional>
#include <vector>
#include "core/config.hpp"
#include "core/types.hpp"

namespace ind {

// Egy bar-hoz tartozó teljes indikátorkészlet
struct IndicatorSet {
    double ema_fast{};
    double ema_slow{};
    double sma{};
    double rsi{};
    double macd_line{};
    double macd_signal{};
    double atr{};
    double bb_upper{};
    double bb_mid{};
    double bb_lower{};
};

// 1:1 a bar sorral; warm-up alatt std::nullopt ("insufficient data")
using IndicatorSeries = std::vector<std::optional<IndicatorSet>>;

// Fix indikátorkészlet egy bar soron. Állapotmentes, tisztán funkcionális.
class IndicatorEngine {
public:
    explicit IndicatorEngine(core::IndicatorConfig cfg);

    IndicatorSeries compute(const core::BarSeries& bars) const;

    // Az első warmup_bars()-1 elem mindig hiányzik
    std::size_t warmup_bars() const { return cfg_.warmup_bars(); }
    const core::IndicatorConfig& config() const { return cfg_; }

private:
    core::IndicatorConfig cfg_;
};

} // namespace ind
