#include "strategy/decision.hpp"
#include <algorithm>
#include <cmath>

namespace strategy {

std::optional<core::Side> dominant_side(const HorizonViews& views){
    int up=0, down=0;
    for (const auto& v : views){
        if (v.trend==core::Trend::Up) ++up;
        else if (v.trend==core::Trend::Down) ++down;
    }
    if (up>down) return core::Side::Long;
    if (down>up) return core::Side::Short;
    return std::nullopt;
}

ScoreBreakdown ScoreModel::score(const HorizonViews& views, const Classification& cls,
                                 core::Side side) const {
    ScoreBreakdown b;
    const double sgn = core::side_sign(side);
    const core::Trend want = core::trend_of(side);
    const double n = static_cast<double>(views.size());

    int agree=0, macd_ok=0;
    double rsi_acc=0.0, mom_acc=0.0;
    for (const auto& v : views){
        const auto& s = v.latest;
        rsi_acc += core::clamp01(sgn*(s.rsi-50.0)/cfg_.rsi_span);
        if (sgn*(s.macd_line - s.macd_signal) > 0.0) ++macd_ok;
        if (v.trend!=want) continue;
        ++agree;
        if (s.atr > 0.0)
            mom_acc += core::clamp01(std::abs(s.ema_fast - s.ema_slow)/(cfg_.spread_atr*s.atr));
    }

    b.unanimous      = (agree==static_cast<int>(views.size()));
    b.agreement      = agree/n;
    b.rsi_strength   = rsi_acc/n;
    b.macd_alignment = macd_ok/n;
    b.momentum       = (agree>0 ? mom_acc/agree : 0.0);
    switch (cls.regime){
        case core::Regime::Breakout: b.regime_fit = 1.0; break;
        case core::Regime::Mean:     b.regime_fit = 0.5; break;
    }

    double sc = cfg_.w_trend*b.agreement + cfg_.w_rsi*b.rsi_strength + cfg_.w_macd*b.macd_alignment
              + cfg_.w_momentum*b.momentum + cfg_.w_regime*b.regime_fit;
    // részleges egyezésnél plafon a küszöb alatt
    if (!b.unanimous) sc = std::min(sc, cfg_.partial_agreement_cap);
    b.base_score = core::clamp100(sc);

    // confidence: a közép horizont volatilitása és RSI zónája
    const auto& mid = views[core::index_of(core::Horizon::Medium)];
    const double vol = (mid.close > 0.0 ? mid.latest.atr/mid.close : 0.0);
    b.vol_quality = (vol >= cfg_.vol_low && vol <= cfg_.vol_high) ? 1.0 : -1.0;
    b.rsi_extreme = (mid.latest.rsi < cfg_.rsi_zone_low || mid.latest.rsi > cfg_.rsi_zone_high);

    double conf = cfg_.conf_base + cfg_.conf_agreement*b.agreement + cfg_.conf_macd*b.macd_alignment
                + cfg_.conf_volatility*b.vol_quality;
    if (b.rsi_extreme) conf -= cfg_.rsi_extreme_penalty;
    b.confidence = core::clamp100(conf);
    return b;
}

core::Result<Signal> ScoreModel::evaluate(const std::string& symbol, const HorizonViews& views,
                                          const Classification& cls) const {
    const auto side = dominant_side(views);
    if (!side) return core::ScanError::HorizonDisagreement;

    const ScoreBreakdown b = score(views, cls, *side);
    const auto& mid = views[core::index_of(core::Horizon::Medium)];

    Signal s;
    s.symbol          = symbol;
    s.side            = *side;
    s.base_score      = b.base_score;
    s.confidence      = b.confidence;
    s.regime          = cls.regime;
    s.style           = cls.style;
    s.reference_price = mid.close;
    s.atr_at_signal   = mid.latest.atr;
    s.horizons_agree  = b.unanimous;
    for (std::size_t i=0;i<views.size();++i) s.trends[i] = views[i].trend;
    return s;
}

bool ScoreModel::is_valid(const Signal& s) const {
    return s.horizons_agree && s.base_score >= thr_.score && s.confidence >= thr_.confidence;
}

} // namespace strategy
