#pragma once
#include <array>
#include <memory>
#include <vector>
#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "exec/risk.hpp"
#include "indicators/mtfa.hpp"
#include "strategy/decision.hpp"
#include "strategy/ranker.hpp"
#include "strategy/regime.hpp"
#include "strategy/signal_filter.hpp"
#include "strategy/win_rate.hpp"

namespace strategy {

struct ScanReport {
    std::vector<RankedSignal> ranked;
    std::array<std::size_t, core::kScanErrorCount> skipped{}; // ScanError szerint
    std::size_t scanned{0};
    std::size_t degraded{0}; // ennyiszer ment pass-through-ként a szűrő

    std::size_t skipped_for(core::ScanError e) const { return skipped[static_cast<std::size_t>(e)]; }
};

// Egy instrumentum teljes pipeline-ja és a párhuzamos scan ciklus.
// Nincs megosztott, módosuló állapot; egy példány több szálról is hívható.
class Scanner {
public:
    explicit Scanner(core::EngineConfig cfg,
                     std::shared_ptr<const ISignalFilter> filter = nullptr,
                     std::shared_ptr<const WinRateBook> history = nullptr);

    // degraded: true, ha a szűrő modell nem volt elérhető
    core::Result<RankedSignal> scan_instrument(const core::InstrumentBars& inst,
                                               const core::Account& acct,
                                               bool* degraded = nullptr) const;

    ScanReport scan(const std::vector<core::InstrumentBars>& universe,
                    const core::Account& acct) const;

    const core::EngineConfig& config() const { return cfg_; }

private:
    core::EngineConfig cfg_;
    ind::TimeframeAligner aligner_;
    RegimeClassifier regime_;
    ScoreModel score_;
    SignalFilterStage filter_;
    exec::TradeStructurer structurer_;
};

} // namespace strategy
