#include "indicators/mtfa.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace ind {

core::Trend classify_trend(const IndicatorSet& s, double close){
    if (s.ema_fast > s.ema_slow && close > s.sma) return core::Trend::Up;
    if (s.ema_fast < s.ema_slow && close < s.sma) return core::Trend::Down;
    return core::Trend::Flat;
}

core::BarSeries resample(const core::BarSeries& bars, std::size_t factor){
    core::BarSeries out;
    if (factor==0) return out;
    out.reserve(bars.size()/factor);
    for (std::size_t i=0;i+factor<=bars.size();i+=factor){
        core::Bar hb = bars[i];
        for (std::size_t k=i+1;k<i+factor;++k){
            hb.high = std::max(hb.high, bars[k].high);
            hb.low  = std::min(hb.low, bars[k].low);
            hb.volume += bars[k].volume;
        }
        hb.close = bars[i+factor-1].close;
        out.push_back(hb);
    }
    return out;
}

std::optional<HorizonView> TimeframeAligner::view(core::Horizon h, const core::BarSeries& bars,
                                                  const IndicatorSeries& series) const {
    if (bars.empty() || series.size()!=bars.size() || !series.back()) return std::nullopt;

    HorizonView v;
    v.horizon = h;
    v.latest  = *series.back();
    v.close   = bars.back().close;
    v.volume  = bars.back().volume;
    v.trend   = classify_trend(v.latest, v.close);

    // visszafelé számoljuk, meddig ugyanaz a címke
    for (std::size_t i=bars.size(); i-- > 0;){
        if (!series[i] || classify_trend(*series[i], bars[i].close)!=v.trend) break;
        ++v.persistence;
    }
    return v;
}

core::Result<AlignedHorizons> TimeframeAligner::align(const core::InstrumentBars& inst) const {
    AlignedHorizons out;
    bool ready = true;
    for (auto h : core::kHorizons){
        const auto& bars = inst.at(h);
        out.series[core::index_of(h)] = engine_.compute(bars);
        auto v = view(h, bars, out.series[core::index_of(h)]);
        if (!v){
            spdlog::debug("{}: {} horizon insufficient ({} bars, need {})",
                          inst.symbol, core::to_string(h), bars.size(), engine_.warmup_bars());
            ready = false;
            continue;
        }
        out.views[core::index_of(h)] = *v;
    }
    if (!ready) return core::ScanError::InsufficientData;
    return out;
}

} // namespace ind
