#include "indicators/indicator_engine.hpp"
#include "indicators/atr.hpp"
#include "indicators/bollinger.hpp"
#include "indicators/macd.hpp"
#include "indicators/rsi.hpp"
#include "indicators/sma_ema.hpp"

namespace ind {

IndicatorEngine::IndicatorEngine(core::IndicatorConfig cfg) : cfg_(cfg) {}

IndicatorSeries IndicatorEngine::compute(const core::BarSeries& bars) const {
    const std::size_t n = bars.size();
    IndicatorSeries out(n);
    const std::size_t warm = warmup_bars();
    if (n < warm) return out;

    std::vector<double> closes;
    closes.reserve(n);
    for (const auto& b : bars) closes.push_back(b.close);

    const Series ema_f = ema_series(closes, cfg_.ema_fast);
    const Series ema_s = ema_series(closes, cfg_.ema_slow);
    const Series sma   = sma_series(closes, cfg_.sma);
    const Series rsi   = rsi_series(closes, cfg_.rsi);
    const MacdSeries macd = macd_series(closes, cfg_.macd_fast, cfg_.macd_slow, cfg_.macd_signal);
    const Series atr   = atr_series(bars, cfg_.atr);
    const auto bb      = bb_series(closes, cfg_.bb_period, cfg_.bb_k);

    for (std::size_t i=warm-1;i<n;++i){
        if (!(ema_f[i] && ema_s[i] && sma[i] && rsi[i] && macd.line[i] && macd.signal[i] &&
              atr[i] && bb[i]))
            continue;
        IndicatorSet s;
        s.ema_fast    = *ema_f[i];
        s.ema_slow    = *ema_s[i];
        s.sma         = *sma[i];
        s.rsi         = *rsi[i];
        s.macd_line   = *macd.line[i];
        s.macd_signal = *macd.signal[i];
        s.atr         = *atr[i];
        s.bb_upper    = bb[i]->upper;
        s.bb_mid      = bb[i]->mid;
        s.bb_lower    = bb[i]->lower;
        out[i] = s;
    }
    return out;
}

} // namespace ind
