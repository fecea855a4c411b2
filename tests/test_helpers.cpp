#include "test_helpers.hpp"
#include <algorithm>
#include <cmath>

namespace testutil {

core::BarSeries trending_bars(std::size_t n, double p0, double growth, double wiggle,
                              double volume){
    core::BarSeries out;
    out.reserve(n);
    double prev = p0;
    for (std::size_t i=0;i<n;++i){
        const double base = p0*std::exp(growth*static_cast<double>(i));
        const double close = base*(1.0 + (i%2==0 ? wiggle : -wiggle));
        core::Bar b;
        b.timestamp_ms = 1700000000000LL + static_cast<std::int64_t>(i)*60000;
        b.open   = (i==0 ? close : prev);
        b.close  = close;
        b.high   = std::max(b.open, b.close)*1.002;
        b.low    = std::min(b.open, b.close)*0.998;
        b.volume = volume;
        out.push_back(b);
        prev = close;
    }
    return out;
}

core::InstrumentBars trending_instrument(const std::string& symbol, double growth, std::size_t n){
    core::InstrumentBars inst;
    inst.symbol = symbol;
    // |growth| * 1.5 wiggle: RSI ~ 67 (long) / ~ 33 (short)
    const double wiggle = std::abs(growth)*1.5;
    for (auto h : core::kHorizons)
        inst.horizons[core::index_of(h)] = trending_bars(n, 100.0, growth, wiggle);
    return inst;
}

core::BarSeries bars_from_closes(const std::vector<double>& closes, double spread, double volume){
    core::BarSeries out;
    for (std::size_t i=0;i<closes.size();++i){
        core::Bar b;
        b.timestamp_ms = 1700000000000LL + static_cast<std::int64_t>(i)*60000;
        b.open   = (i==0 ? closes[i] : closes[i-1]);
        b.close  = closes[i];
        b.high   = std::max(b.open, b.close) + spread;
        b.low    = std::min(b.open, b.close) - spread;
        b.volume = volume;
        out.push_back(b);
    }
    return out;
}

ind::HorizonView make_view(core::Horizon h, core::Trend t, double rsi, double macd_line,
                           double macd_signal, double atr, double close){
    ind::HorizonView v;
    v.horizon = h;
    v.trend = t;
    v.close = close;
    v.volume = 5000.0;
    v.persistence = 5;
    v.latest.rsi = rsi;
    v.latest.macd_line = macd_line;
    v.latest.macd_signal = macd_signal;
    v.latest.atr = atr;
    v.latest.sma = close;
    v.latest.bb_mid = close;
    v.latest.bb_upper = close + 2*atr;
    v.latest.bb_lower = close - 2*atr;
    const double spread = (t==core::Trend::Up ? atr : t==core::Trend::Down ? -atr : 0.0);
    v.latest.ema_slow = close;
    v.latest.ema_fast = close + spread;
    return v;
}

strategy::Signal make_signal(const std::string& symbol, core::Side side, double score,
                             double confidence, double ref, double atr){
    strategy::Signal s;
    s.symbol = symbol;
    s.side = side;
    s.base_score = score;
    s.confidence = confidence;
    s.reference_price = ref;
    s.atr_at_signal = atr;
    s.horizons_agree = true;
    s.trends.fill(core::trend_of(side));
    return s;
}

} // namespace testutil
