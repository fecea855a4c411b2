#include "exec/risk.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>
#include "exec/filters.hpp"

namespace exec {

bool levels_ordered(core::Side side, const TradeStructure& t){
    if (!(t.stop_loss > 0.0 && t.take_profit > 0.0)) return false;
    if (side==core::Side::Long) return t.stop_loss < t.entry && t.entry < t.take_profit;
    return t.take_profit < t.entry && t.entry < t.stop_loss;
}

double TradeStructurer::liquidation_price(core::Side side, double entry, double leverage) const {
    const double mmr = cfg_.maintenance_margin_rate;
    if (side==core::Side::Long) return entry*(1.0 - 1.0/leverage + mmr);
    return entry*(1.0 + 1.0/leverage - mmr);
}

double TradeStructurer::pick_entry(const strategy::Signal& s, const ind::IndicatorSet* medium,
                                   double max_offset) const {
    const double ref = s.reference_price;
    switch (cfg_.entry_mode){
        case core::EntryMode::Market:
            return ref;
        case core::EntryMode::NearestAverage: {
            if (!medium) return ref;
            // a piaci árhoz legközelebbi átlag a visszahúzódás oldalán (long: alatta, short: fölötte)
            const double sgn = core::side_sign(s.side);
            double best = ref, best_d = -1.0;
            for (double c : {medium->sma, medium->ema_fast, medium->ema_slow}){
                if (!(c > 0.0) || sgn*(ref - c) < 0.0) continue;
                const double d = std::abs(c - ref);
                if (best_d < 0.0 || d < best_d){ best = c; best_d = d; }
            }
            return (best_d >= 0.0 && best_d < max_offset) ? best : ref;
        }
    }
    return ref;
}

core::Result<TradeStructure> TradeStructurer::structure(const strategy::Signal& s,
                                                        const core::Account& acct,
                                                        const ind::IndicatorSet* medium) const {
    if (!(acct.equity > 0.0) || !(acct.leverage > 0.0) || !std::isfinite(acct.equity) ||
        !std::isfinite(acct.leverage))
        return core::ScanError::InvalidAccountState;

    const double ref = s.reference_price;
    const double atr = s.atr_at_signal;
    if (!(ref > 0.0) || !(atr > 0.0) || !std::isfinite(ref) || !std::isfinite(atr))
        return core::ScanError::InvalidSignal;

    const double sgn = core::side_sign(s.side);
    TradeStructure t;
    t.leverage = acct.leverage;
    t.entry = pick_entry(s, medium, cfg_.sl_atr_mult*atr);

    // távolságok plafonja, hogy az SL / TP pozitív maradjon
    const double cap = cfg_.max_stop_fraction*t.entry;
    const double sl_dist    = std::min(cfg_.sl_atr_mult*atr, cap);
    const double tp_dist    = std::min(cfg_.tp_atr_mult*atr, cap);
    const double trail_dist = std::min(cfg_.trail_atr_mult*atr, sl_dist);

    t.stop_loss           = t.entry - sgn*sl_dist;
    t.take_profit         = t.entry + sgn*tp_dist;
    t.trailing_activation = t.entry + sgn*cfg_.trail_activation*tp_dist;
    t.trailing_distance   = trail_dist;
    t.trailing_stop       = t.trailing_activation - sgn*trail_dist;

    if (cfg_.price_tick > 0.0){
        const double tick = cfg_.price_tick;
        t.entry               = round_step(t.entry, tick);
        t.stop_loss           = round_step(t.stop_loss, tick);
        t.take_profit         = round_step(t.take_profit, tick);
        t.trailing_activation = round_step(t.trailing_activation, tick);
        t.trailing_stop       = round_step(t.trailing_stop, tick);
    }

    t.position_size   = acct.equity*cfg_.risk_fraction/ref;
    t.margin_required = t.position_size*ref/acct.leverage;
    t.estimated_liquidation_price = liquidation_price(s.side, t.entry, acct.leverage);

    if (!levels_ordered(s.side, t)){
        spdlog::debug("{}: level ordering broken (entry {} sl {} tp {})", s.symbol, t.entry,
                      t.stop_loss, t.take_profit);
        return core::ScanError::InvalidSignal;
    }
    return t;
}

} // namespace exec
