#include "core/config.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace core {

std::size_t IndicatorConfig::warmup_bars() const {
    // MACD signal: a lassú EMA első értékétől még macd_signal-1 bar kell
    const std::size_t macd = macd_slow + macd_signal - 1;
    return std::max({ema_fast, ema_slow, sma, rsi + 1, macd, atr + 1, bb_period});
}

namespace {

void require(bool cond, const std::string& what) {
    if (!cond) throw std::invalid_argument("invalid config: " + what);
}

// az spdlog::level::from_str által ismert nevek; minden más csendben "off" lenne
bool known_log_level(const std::string& s) {
    static const char* const names[] = {"trace", "debug", "info", "warn", "warning",
                                        "err", "error", "critical", "off"};
    return std::find(std::begin(names), std::end(names), s) != std::end(names);
}

EntryMode parse_entry_mode(const std::string& s) {
    if (s == "market") return EntryMode::Market;
    if (s == "nearest_average") return EntryMode::NearestAverage;
    throw std::invalid_argument(fmt::format("invalid config: unknown entry_mode '{}'", s));
}

} // namespace

void from_json(const json& j, IndicatorConfig& c) {
    c.ema_fast    = j.value("ema_fast", c.ema_fast);
    c.ema_slow    = j.value("ema_slow", c.ema_slow);
    c.sma         = j.value("sma", c.sma);
    c.rsi         = j.value("rsi", c.rsi);
    c.macd_fast   = j.value("macd_fast", c.macd_fast);
    c.macd_slow   = j.value("macd_slow", c.macd_slow);
    c.macd_signal = j.value("macd_signal", c.macd_signal);
    c.atr         = j.value("atr", c.atr);
    c.bb_period   = j.value("bb_period", c.bb_period);
    c.bb_k        = j.value("bb_k", c.bb_k);
}

void from_json(const json& j, Thresholds& c) {
    c.score      = j.value("score", c.score);
    c.confidence = j.value("confidence", c.confidence);
}

void from_json(const json& j, RegimeConfig& c) {
    c.breakout_lookback     = j.value("breakout_lookback", c.breakout_lookback);
    c.expansion_ratio       = j.value("expansion_ratio", c.expansion_ratio);
    c.persistence_scalp_max = j.value("persistence_scalp_max", c.persistence_scalp_max);
    c.persistence_trend_min = j.value("persistence_trend_min", c.persistence_trend_min);
}

void from_json(const json& j, ScoreConfig& c) {
    c.w_trend               = j.value("w_trend", c.w_trend);
    c.w_rsi                 = j.value("w_rsi", c.w_rsi);
    c.w_macd                = j.value("w_macd", c.w_macd);
    c.w_momentum            = j.value("w_momentum", c.w_momentum);
    c.w_regime              = j.value("w_regime", c.w_regime);
    c.rsi_span              = j.value("rsi_span", c.rsi_span);
    c.spread_atr            = j.value("spread_atr", c.spread_atr);
    c.partial_agreement_cap = j.value("partial_agreement_cap", c.partial_agreement_cap);
    c.conf_base             = j.value("conf_base", c.conf_base);
    c.conf_agreement        = j.value("conf_agreement", c.conf_agreement);
    c.conf_macd             = j.value("conf_macd", c.conf_macd);
    c.conf_volatility       = j.value("conf_volatility", c.conf_volatility);
    c.vol_low               = j.value("vol_low", c.vol_low);
    c.vol_high              = j.value("vol_high", c.vol_high);
    c.rsi_zone_low          = j.value("rsi_zone_low", c.rsi_zone_low);
    c.rsi_zone_high         = j.value("rsi_zone_high", c.rsi_zone_high);
    c.rsi_extreme_penalty   = j.value("rsi_extreme_penalty", c.rsi_extreme_penalty);
}

void from_json(const json& j, FilterConfig& c) {
    c.enabled        = j.value("enabled", c.enabled);
    c.model_path     = j.value("model_path", c.model_path);
    c.win_rate_path  = j.value("win_rate_path", c.win_rate_path);
    c.adjustment_cap = j.value("adjustment_cap", c.adjustment_cap);
    c.veto_below     = j.value("veto_below", c.veto_below);
    c.zscore_window  = j.value("zscore_window", c.zscore_window);
    c.train_min_samples   = j.value("train_min_samples", c.train_min_samples);
    c.train_epochs        = j.value("train_epochs", c.train_epochs);
    c.train_learning_rate = j.value("train_learning_rate", c.train_learning_rate);
    c.train_l2            = j.value("train_l2", c.train_l2);
}

void from_json(const json& j, RiskConfig& c) {
    c.risk_fraction           = j.value("risk_fraction", c.risk_fraction);
    c.sl_atr_mult             = j.value("sl_atr_mult", c.sl_atr_mult);
    c.tp_atr_mult             = j.value("tp_atr_mult", c.tp_atr_mult);
    c.trail_atr_mult          = j.value("trail_atr_mult", c.trail_atr_mult);
    c.trail_activation        = j.value("trail_activation", c.trail_activation);
    c.maintenance_margin_rate = j.value("maintenance_margin_rate", c.maintenance_margin_rate);
    c.max_stop_fraction       = j.value("max_stop_fraction", c.max_stop_fraction);
    c.price_tick              = j.value("price_tick", c.price_tick);
    if (j.contains("entry_mode"))
        c.entry_mode = parse_entry_mode(j.at("entry_mode").get<std::string>());
}

void from_json(const json& j, ScanConfig& c) {
    c.max_symbols    = j.value("max_symbols", c.max_symbols);
    c.quote_suffix   = j.value("quote_suffix", c.quote_suffix);
    c.top_k          = j.value("top_k", c.top_k);
    c.min_volume     = j.value("min_volume", c.min_volume);
    c.min_atr_pct    = j.value("min_atr_pct", c.min_atr_pct);
    c.worker_threads = j.value("worker_threads", c.worker_threads);
}

void from_json(const json& j, EngineConfig& c) {
    if (j.contains("indicators")) c.indicators = j.at("indicators").get<IndicatorConfig>();
    if (j.contains("thresholds")) c.thresholds = j.at("thresholds").get<Thresholds>();
    if (j.contains("regime"))     c.regime     = j.at("regime").get<RegimeConfig>();
    if (j.contains("score"))      c.score      = j.at("score").get<ScoreConfig>();
    if (j.contains("filter"))     c.filter     = j.at("filter").get<FilterConfig>();
    if (j.contains("risk"))       c.risk       = j.at("risk").get<RiskConfig>();
    if (j.contains("scan"))       c.scan       = j.at("scan").get<ScanConfig>();
    c.log_level = j.value("log_level", c.log_level);
}

void EngineConfig::validate() const {
    const auto& ic = indicators;
    require(ic.ema_fast > 0 && ic.ema_slow > 0 && ic.sma > 0 && ic.rsi > 0 && ic.atr > 0,
            "indicator windows must be positive");
    require(ic.ema_fast < ic.ema_slow, "ema_fast must be shorter than ema_slow");
    require(ic.macd_fast > 0 && ic.macd_fast < ic.macd_slow && ic.macd_signal > 0,
            "macd windows");
    require(ic.bb_period > 0 && ic.bb_k > 0.0, "bollinger period / k");

    require(thresholds.score >= 0.0 && thresholds.score <= 100.0, "score threshold in [0,100]");
    require(thresholds.confidence >= 0.0 && thresholds.confidence <= 100.0,
            "confidence threshold in [0,100]");

    require(regime.breakout_lookback > 0, "breakout_lookback must be positive");
    require(regime.expansion_ratio > 0.0, "expansion_ratio must be positive");
    require(regime.persistence_scalp_max < regime.persistence_trend_min,
            "persistence_scalp_max must be below persistence_trend_min");

    // nem egyhangú horizontokkal a score szerkezetileg nem érheti el a küszöböt
    require(score.partial_agreement_cap < thresholds.score,
            "partial_agreement_cap must be below the score threshold");
    require(score.w_trend >= 0 && score.w_rsi >= 0 && score.w_macd >= 0 &&
            score.w_momentum >= 0 && score.w_regime >= 0, "score weights must be non-negative");
    require(score.rsi_span > 0.0 && score.spread_atr > 0.0, "rsi_span / spread_atr");
    require(score.vol_low < score.vol_high, "vol_low must be below vol_high");
    require(score.rsi_zone_low < score.rsi_zone_high, "rsi zone");

    require(filter.adjustment_cap >= 0.0 && filter.adjustment_cap <= 100.0, "adjustment_cap");
    require(filter.veto_below >= 0.0 && filter.veto_below <= 1.0, "veto_below in [0,1]");
    require(filter.zscore_window >= 2, "zscore_window must be at least 2");
    require(filter.train_epochs > 0 && filter.train_learning_rate > 0.0 && filter.train_l2 >= 0.0,
            "filter training parameters");

    require(risk.risk_fraction > 0.0 && risk.risk_fraction <= 1.0, "risk_fraction in (0,1]");
    require(risk.sl_atr_mult > 0.0 && risk.tp_atr_mult > 0.0 && risk.trail_atr_mult > 0.0,
            "atr multipliers must be positive");
    require(risk.trail_atr_mult < risk.sl_atr_mult, "trailing stop must be tighter than stop-loss");
    require(risk.trail_activation > 0.0 && risk.trail_activation < 1.0, "trail_activation in (0,1)");
    require(risk.maintenance_margin_rate >= 0.0 && risk.maintenance_margin_rate < 1.0,
            "maintenance_margin_rate in [0,1)");
    require(risk.max_stop_fraction > 0.0 && risk.max_stop_fraction < 1.0,
            "max_stop_fraction in (0,1)");
    require(risk.price_tick >= 0.0, "price_tick must be non-negative");

    require(scan.worker_threads > 0, "worker_threads must be positive");
    require(known_log_level(log_level), "unknown log_level '" + log_level + "'");
}

EngineConfig load_config(const std::string& path) {
    std::ifstream f(path);
    if (!f.good()) throw std::runtime_error("cannot open config: " + path);
    const json j = json::parse(f);
    EngineConfig cfg = j.get<EngineConfig>();
    cfg.validate();
    spdlog::debug("config loaded from {} (warmup {} bars)", path, cfg.indicators.warmup_bars());
    return cfg;
}

} // namespace core
