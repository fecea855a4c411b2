#include "data/report.hpp"
#include <fstream>
#include <stdexcept>
#include <fmt/format.h>

using json = nlohmann::json;

namespace data {

json signal_json(const strategy::Signal& s){
    json trends = json::object();
    for (auto h : core::kHorizons) trends[core::to_string(h)] = core::to_string(s.trends[core::index_of(h)]);
    return {
        {"symbol", s.symbol},
        {"side", core::to_string(s.side)},
        {"base_score", s.base_score},
        {"confidence", s.confidence},
        {"regime", core::to_string(s.regime)},
        {"style", core::to_string(s.style)},
        {"reference_price", s.reference_price},
        {"atr_at_signal", s.atr_at_signal},
        {"horizons_agree", s.horizons_agree},
        {"trends", trends},
    };
}

json trade_json(const exec::TradeStructure& t){
    return {
        {"entry", t.entry},
        {"take_profit", t.take_profit},
        {"stop_loss", t.stop_loss},
        {"trailing_stop", t.trailing_stop},
        {"trailing_activation", t.trailing_activation},
        {"trailing_distance", t.trailing_distance},
        {"position_size", t.position_size},
        {"margin_required", t.margin_required},
        {"estimated_liquidation_price", t.estimated_liquidation_price},
        {"leverage", t.leverage},
    };
}

json report_json(const strategy::ScanReport& rep){
    json skipped = json::object();
    for (std::size_t i=0;i<core::kScanErrorCount;++i)
        skipped[core::to_string(static_cast<core::ScanError>(i))] = rep.skipped[i];
    json signals = json::array();
    for (const auto& r : rep.ranked)
        signals.push_back({{"signal", signal_json(r.signal)}, {"trade", trade_json(r.trade)}});
    return {
        {"scanned", rep.scanned},
        {"filter_degraded", rep.degraded},
        {"skipped", skipped},
        {"signals", signals},
    };
}

std::string format_top(const std::vector<strategy::RankedSignal>& ranked, std::size_t k){
    std::string out;
    std::size_t i = 0;
    for (const auto& r : ranked){
        if (i++ >= k) break;
        const auto& s = r.signal;
        const auto& t = r.trade;
        out += fmt::format("==================== {} ====================\n", s.symbol);
        out += fmt::format("TYPE: {:<8} REGIME: {:<9} SIDE: {:<6} SCORE: {:.1f}  CONF: {:.1f}\n",
                           core::to_string(s.style), core::to_string(s.regime),
                           core::to_string(s.side), s.base_score, s.confidence);
        out += fmt::format("ENTRY: {:.6f}  TP: {:.6f}  SL: {:.6f}  TRAIL: {:.6f} (from {:.6f})\n",
                           t.entry, t.take_profit, t.stop_loss, t.trailing_stop,
                           t.trailing_activation);
        out += fmt::format("SIZE: {:.6f}  MARGIN: {:.2f}  LIQ: {:.6f}  MARKET: {:.6f}\n",
                           t.position_size, t.margin_required, t.estimated_liquidation_price,
                           s.reference_price);
    }
    return out;
}

void write_report(const std::string& path, const json& j){
    std::ofstream f(path);
    if (!f.good()) throw std::runtime_error("cannot write " + path);
    f << j.dump(2) << '\n';
}

} // namespace data
