#pragma once
#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "indicators/indicator_engine.hpp"
#include "strategy/signal.hpp"

namespace exec {

// Konkrét kötés-struktúra egy elfogadott jelhez. A hívó kapja érték szerint.
struct TradeStructure {
    double entry{0.0};
    double take_profit{0.0};
    double stop_loss{0.0};
    double trailing_stop{0.0};        // a trailing stop szintje aktiváláskor
    double trailing_activation{0.0};  // ezen az áron lesz aktív a trailing stop
    double trailing_distance{0.0};
    double position_size{0.0};        // base mennyiség
    double margin_required{0.0};
    double estimated_liquidation_price{0.0};
    double leverage{1.0};
};

// long: sl < entry < tp, short: tp < entry < sl, és sl, tp > 0
bool levels_ordered(core::Side side, const TradeStructure& t);

// Elfogadott jel + számla -> entry / TP / SL / trailing / méret.
class TradeStructurer {
public:
    explicit TradeStructurer(core::RiskConfig cfg) : cfg_(cfg) {}

    // InvalidAccountState: equity <= 0 vagy leverage <= 0
    // InvalidSignal: nem pozitív ár / ATR, vagy a kerekítés után sérül a sorrend
    // medium: a közép horizont indikátorai (csak nearest_average entry módhoz kell)
    core::Result<TradeStructure> structure(const strategy::Signal& s, const core::Account& acct,
                                           const ind::IndicatorSet* medium = nullptr) const;

    // long: entry*(1 - 1/lev + mmr), short: entry*(1 + 1/lev - mmr)
    double liquidation_price(core::Side side, double entry, double leverage) const;

    const core::RiskConfig& config() const { return cfg_; }

private:
    double pick_entry(const strategy::Signal& s, const ind::IndicatorSet* medium,
                      double max_offset) const;

    core::RiskConfig cfg_;
};

} // namespace exec
