#include "strategy/scanner.hpp"
#include <algorithm>
#include <optional>
#include <thread>
#include <spdlog/spdlog.h>

namespace strategy {

namespace {

struct Slot {
    std::optional<core::Result<RankedSignal>> result;
    bool degraded{false};
};

std::shared_ptr<const ISignalFilter> or_default(std::shared_ptr<const ISignalFilter> f,
                                                const core::FilterConfig& cfg){
    return f ? std::move(f) : make_signal_filter(cfg);
}

} // namespace

Scanner::Scanner(core::EngineConfig cfg, std::shared_ptr<const ISignalFilter> filter,
                 std::shared_ptr<const WinRateBook> history)
    : cfg_(std::move(cfg)),
      aligner_(cfg_.indicators),
      regime_(cfg_.regime),
      score_(cfg_.score, cfg_.thresholds),
      filter_(cfg_.filter, or_default(std::move(filter), cfg_.filter), std::move(history)),
      structurer_(cfg_.risk) {}

core::Result<RankedSignal> Scanner::scan_instrument(const core::InstrumentBars& inst,
                                                    const core::Account& acct,
                                                    bool* degraded) const {
    if (degraded) *degraded = false;

    auto aligned = aligner_.align(inst);
    if (!aligned) return aligned.error();
    const auto& h = aligned.value();
    const auto& mid = h.view(core::Horizon::Medium);

    // forgalom és minimális volatilitás a közép horizonton
    if (mid.volume < cfg_.scan.min_volume ||
        !(mid.close > 0.0) || mid.latest.atr/mid.close < cfg_.scan.min_atr_pct)
        return core::ScanError::QualityGate;

    const auto cls = regime_.classify(inst.at(core::Horizon::Long),
                                      h.series_of(core::Horizon::Long), mid);

    auto cand = score_.evaluate(inst.symbol, h.views, cls);
    if (!cand) return cand.error();
    if (!cand->horizons_agree) return core::ScanError::HorizonDisagreement;
    // a szűrő csak élesíthet: küszöb alatti jelöltet nem emelhet át
    if (!score_.is_valid(cand.value())) return core::ScanError::BelowThreshold;

    const FilterOutcome fo = filter_.apply(cand.value(), h);
    if (degraded) *degraded = fo.degraded;
    if (!fo.signal) return core::ScanError::FilterVeto;

    // küszöbök a szűrő után is: fail-closed
    const Signal& sig = *fo.signal;
    if (!score_.is_valid(sig)) return core::ScanError::BelowThreshold;

    auto trade = structurer_.structure(sig, acct, &mid.latest);
    if (!trade) return trade.error();
    return RankedSignal{sig, trade.value()};
}

ScanReport Scanner::scan(const std::vector<core::InstrumentBars>& universe,
                         const core::Account& acct) const {
    std::vector<Slot> slots(universe.size());
    const std::size_t n_threads = std::max<std::size_t>(1,
        std::min(cfg_.scan.worker_threads, universe.size()));

    // minden szál a saját indexeire ír, zárolás nem kell
    auto work = [&](std::size_t t){
        for (std::size_t i=t;i<universe.size();i+=n_threads){
            bool deg = false;
            slots[i].result = scan_instrument(universe[i], acct, &deg);
            slots[i].degraded = deg;
        }
    };
    if (n_threads==1) {
        work(0);
    } else {
        std::vector<std::thread> pool;
        pool.reserve(n_threads);
        for (std::size_t t=0;t<n_threads;++t) pool.emplace_back(work, t);
        for (auto& th : pool) th.join();
    }

    ScanReport rep;
    rep.scanned = universe.size();
    std::vector<RankedSignal> accepted;
    for (std::size_t i=0;i<slots.size();++i){
        const auto& sym = universe[i].symbol;
        if (slots[i].degraded){
            ++rep.degraded;
            spdlog::warn("{}: signal filter unavailable, passing candidate through", sym);
        }
        const auto& r = *slots[i].result;
        if (r.ok()){
            spdlog::debug("{}: {} score {:.1f} conf {:.1f}", sym, core::to_string(r->signal.side),
                          r->signal.base_score, r->signal.confidence);
            accepted.push_back(r.value());
            continue;
        }
        ++rep.skipped[static_cast<std::size_t>(r.error())];
        if (r.error()==core::ScanError::InvalidAccountState)
            spdlog::error("{}: invalid account state (equity {}, leverage {})", sym, acct.equity,
                          acct.leverage);
        else
            spdlog::debug("{}: skipped ({})", sym, core::to_string(r.error()));
    }
    rep.ranked = rank(std::move(accepted));
    spdlog::info("scan: {} instruments, {} signals, {} insufficient, {} disagreement, {} below threshold",
                 rep.scanned, rep.ranked.size(),
                 rep.skipped_for(core::ScanError::InsufficientData),
                 rep.skipped_for(core::ScanError::HorizonDisagreement),
                 rep.skipped_for(core::ScanError::BelowThreshold));
    return rep;
}

} // namespace strategy
