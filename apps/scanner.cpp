#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "core/config.hpp"
#include "core/types.hpp"
#include "data/csv_bars.hpp"
#include "data/report.hpp"
#include "data/universe.hpp"
#include "strategy/scanner.hpp"
#include "strategy/signal_filter.hpp"
#include "strategy/win_rate.hpp"

namespace {

// sigscan train <config.json> <history.json> <model.json>
int run_train(const std::string& cfg_path, const std::string& history_path,
              const std::string& model_path) {
    const core::EngineConfig cfg = core::load_config(cfg_path);
    spdlog::set_level(spdlog::level::from_str(cfg.log_level));

    const auto samples = strategy::load_training_samples(history_path);
    const auto model = strategy::LogisticFilter::fit(samples, cfg.filter);
    if (!model) {
        spdlog::error("not enough training samples in {} ({} < {})", history_path, samples.size(),
                      cfg.filter.train_min_samples);
        return 3;
    }
    model->save(model_path);
    spdlog::info("filter model written to {}", model_path);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    if (argc >= 2 && std::string(argv[1]) == "train") {
        if (argc < 5) {
            std::cout << "Hasznalat: sigscan train <config.json> <history.json> <model.json>\n";
            return 1;
        }
        try {
            return run_train(argv[2], argv[3], argv[4]);
        } catch (const nlohmann::json::exception& e) {
            spdlog::error("json error: {}", e.what());
        } catch (const std::exception& e) {
            spdlog::error("{}", e.what());
        }
        return 2;
    }
    if (argc < 3) {
        std::cout << "Hasznalat: sigscan <config.json> <data_dir> [out.json]\n"
                     "           sigscan train <config.json> <history.json> <model.json>\n";
        return 1;
    }
    const std::string cfg_path = argv[1];
    const std::string dir      = argv[2];
    const std::string out_path = (argc >= 4 ? argv[3] : "");

    try {
        const core::EngineConfig cfg = core::load_config(cfg_path);
        spdlog::set_level(spdlog::level::from_str(cfg.log_level));

        const auto tickers = data::load_tickers(dir + "/tickers.json");
        const auto symbols = data::select_top_by_volume(tickers, cfg.scan.max_symbols,
                                                        cfg.scan.quote_suffix);
        const core::Account acct = data::load_account(dir + "/account.json");
        spdlog::info("universe: {} of {} tickers, equity {} leverage {}", symbols.size(),
                     tickers.size(), acct.equity, acct.leverage);

        std::vector<core::InstrumentBars> universe;
        universe.reserve(symbols.size());
        for (const auto& s : symbols) universe.push_back(data::load_instrument(dir, s));

        // korábbi kötések: hiányuk nem végzetes, a szűrő 0.5-ös nyerési aránnyal számol
        std::shared_ptr<const strategy::WinRateBook> history;
        if (cfg.filter.enabled && !cfg.filter.win_rate_path.empty()) {
            try {
                history = std::make_shared<strategy::WinRateBook>(
                    strategy::WinRateBook::load(cfg.filter.win_rate_path));
            } catch (const std::exception& e) {
                spdlog::warn("trade history unavailable: {}", e.what());
            }
        }

        const strategy::Scanner scanner(cfg, strategy::make_signal_filter(cfg.filter), history);
        const auto report = scanner.scan(universe, acct);

        if (report.ranked.empty()) {
            std::cout << "No valid signals.\n";
        } else {
            std::cout << data::format_top(report.ranked, cfg.scan.top_k);
        }
        if (!out_path.empty()) {
            data::write_report(out_path, data::report_json(report));
            spdlog::info("report written to {}", out_path);
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("json error: {}", e.what());
        return 2;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 2;
    }
    return 0;
}
