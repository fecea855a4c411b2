#include "strategy/regime.hpp"
#include <algorithm>
#include <cmath>
#include "indicators/bollinger.hpp"

namespace strategy {

core::Style RegimeClassifier::classify_style(std::size_t persistence) const {
    if (persistence <= cfg_.persistence_scalp_max) return core::Style::Scalp;
    if (persistence >= cfg_.persistence_trend_min) return core::Style::Trend;
    return core::Style::Swing;
}

Classification RegimeClassifier::classify(const core::BarSeries& bars,
                                          const ind::IndicatorSeries& series,
                                          const ind::HorizonView& medium) const {
    Classification c;
    c.style = classify_style(medium.persistence);

    const std::size_t n = std::min(bars.size(), series.size());
    if (n==0 || !series[n-1]) return c;

    const auto& last = *series[n-1];
    c.volatility_ratio = (std::abs(last.sma) > 1e-12 ? last.atr/last.sma : 0.0);
    c.band_width = ind::band_width({last.bb_mid, last.bb_upper, last.bb_lower});

    // sávszélesség tágul-e a lookback-hez képest
    const std::size_t lb = cfg_.breakout_lookback;
    if (n > lb && series[n-1-lb]){
        const auto& prev = *series[n-1-lb];
        const double w_prev = ind::band_width({prev.bb_mid, prev.bb_upper, prev.bb_lower});
        c.expanding = c.band_width > cfg_.expansion_ratio * w_prev;
    }

    // zárt-e sávon kívül az utolsó lookback baron belül
    const std::size_t from = (n > lb ? n-lb : 0);
    for (std::size_t i=from;i<n;++i){
        if (!series[i]) continue;
        const double cl = bars[i].close;
        if (cl > series[i]->bb_upper || cl < series[i]->bb_lower){ c.penetrated = true; break; }
    }

    c.regime = (c.expanding && c.penetrated) ? core::Regime::Breakout : core::Regime::Mean;
    return c;
}

} // namespace strategy
