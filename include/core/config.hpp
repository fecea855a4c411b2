#pragma once
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace core {

// Indikátor ablakok
struct IndicatorConfig {
    std::size_t ema_fast{9};
    std::size_t ema_slow{21};
    std::size_t sma{20};
    std::size_t rsi{14};
    std::size_t macd_fast{12};
    std::size_t macd_slow{26};
    std::size_t macd_signal{9};
    std::size_t atr{14};
    std::size_t bb_period{20};
    double bb_k{2.0};

    // Ennyi bar kell, mire minden indikátor értelmezett (alapértékekkel 34)
    std::size_t warmup_bars() const;
};

struct Thresholds {
    double score{60.0};
    double confidence{70.0};
};

struct RegimeConfig {
    std::size_t breakout_lookback{5};     // ennyi bart nézünk sávátlépésre
    double expansion_ratio{1.0};          // sávszélesség növekedés aránya
    std::size_t persistence_scalp_max{3};
    std::size_t persistence_trend_min{12};
};

struct ScoreConfig {
    // base score súlyok (összesen 100)
    double w_trend{40.0};
    double w_rsi{20.0};
    double w_macd{20.0};
    double w_momentum{10.0};
    double w_regime{10.0};
    double rsi_span{20.0};              // |rsi-50| ekkora eltérésnél telített
    double spread_atr{1.0};             // EMA spread / ATR telítési pont
    double partial_agreement_cap{45.0}; // nem egyhangú horizontoknál plafon

    // confidence
    double conf_base{30.0};
    double conf_agreement{30.0};
    double conf_macd{15.0};
    double conf_volatility{25.0};
    double vol_low{0.002};              // atr/price alsó határ
    double vol_high{0.05};              // atr/price felső határ
    double rsi_zone_low{20.0};
    double rsi_zone_high{80.0};
    double rsi_extreme_penalty{15.0};
};

struct FilterConfig {
    bool enabled{false};
    std::string model_path;
    std::string win_rate_path;
    double adjustment_cap{10.0};
    double veto_below{0.35};
    std::size_t zscore_window{50};      // z-score feature-ök ablaka (közép horizont)

    // betanítás a kötés-történetből
    std::size_t train_min_samples{30};
    std::size_t train_epochs{500};
    double train_learning_rate{0.1};
    double train_l2{0.0};
};

enum class EntryMode { Market, NearestAverage };

struct RiskConfig {
    double risk_fraction{0.75};
    double sl_atr_mult{1.5};
    double tp_atr_mult{3.0};
    double trail_atr_mult{1.0};
    double trail_activation{0.5};       // TP távolság ekkora része után aktív
    double maintenance_margin_rate{0.005};
    double max_stop_fraction{0.9};      // SL/TP távolság max. az entry arányában
    EntryMode entry_mode{EntryMode::Market};
    double price_tick{0.0};             // 0 = nincs kerekítés
};

struct ScanConfig {
    std::size_t max_symbols{100};
    std::string quote_suffix{"USDT"};
    std::size_t top_k{5};
    double min_volume{1000.0};
    double min_atr_pct{0.001};
    std::size_t worker_threads{4};
};

// Immutábilis motor-konfiguráció; minden komponens konstrukciókor kapja meg.
struct EngineConfig {
    IndicatorConfig indicators{};
    Thresholds thresholds{};
    RegimeConfig regime{};
    ScoreConfig score{};
    FilterConfig filter{};
    RiskConfig risk{};
    ScanConfig scan{};
    std::string log_level{"info"};

    // std::invalid_argument hibás értékeknél
    void validate() const;
};

void from_json(const nlohmann::json& j, IndicatorConfig& c);
void from_json(const nlohmann::json& j, Thresholds& c);
void from_json(const nlohmann::json& j, RegimeConfig& c);
void from_json(const nlohmann::json& j, ScoreConfig& c);
void from_json(const nlohmann::json& j, FilterConfig& c);
void from_json(const nlohmann::json& j, RiskConfig& c);
void from_json(const nlohmann::json& j, ScanConfig& c);
void from_json(const nlohmann::json& j, EngineConfig& c);

// JSON fájl -> validált konfiguráció. Hibánál kivételt dob.
EngineConfig load_config(const std::string& path);

} // namespace core
