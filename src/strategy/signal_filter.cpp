#include "strategy/signal_filter.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <functional>
#include <stdexcept>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "core/result.hpp"

using json = nlohmann::json;

namespace strategy {

namespace {

const char* const kFeatureNames[kFeatureCount] = {
    "rsi_z", "macd_hist_z", "ema_spread_z", "atr_ratio_z", "side", "breakout", "style", "win_rate"};

// a sor utolsó eleme z-score-ja az utolsó `window` jelen lévő elemhez képest
double zscore_latest(const ind::IndicatorSeries& series, std::size_t window,
                     const std::function<double(const ind::IndicatorSet&)>& get){
    std::vector<double> xs;
    for (auto it = series.rbegin(); it != series.rend() && xs.size() < window; ++it){
        if (!*it) break;
        xs.push_back(get(**it));
    }
    if (xs.size() < 2) return 0.0;
    double mean=0.0;
    for (double x : xs) mean += x;
    mean /= xs.size();
    double var=0.0;
    for (double x : xs) var += (x-mean)*(x-mean);
    const double sd = std::sqrt(var/xs.size());
    if (sd < 1e-12) return 0.0;
    return (xs.front()-mean)/sd;
}

double style_ordinal(core::Style s){
    switch (s){
        case core::Style::Scalp: return 0.0;
        case core::Style::Swing: return 1.0;
        case core::Style::Trend: return 2.0;
    }
    return 1.0;
}

} // namespace

const char* feature_name(std::size_t i){
    return i < kFeatureCount ? kFeatureNames[i] : "?";
}

LogisticFilter::LogisticFilter(std::array<double, kFeatureCount> weights, double bias, double cap,
                               double veto_below)
    : w_(weights), bias_(bias), cap_(cap), veto_below_(veto_below), loaded_(true) {}

LogisticFilter LogisticFilter::from_file(const std::string& path, const core::FilterConfig& cfg){
    LogisticFilter m;
    m.cap_ = cfg.adjustment_cap;
    m.veto_below_ = cfg.veto_below;
    std::ifstream f(path);
    if (!f.good()){
        spdlog::warn("filter model {} not found", path);
        return m;
    }
    try {
        const json j = json::parse(f);
        m.bias_ = j.value("bias", 0.0);
        const auto& w = j.at("weights");
        for (std::size_t i=0;i<kFeatureCount;++i)
            m.w_[i] = w.value(kFeatureNames[i], 0.0);
        m.loaded_ = true;
        spdlog::info("filter model {} loaded", path);
    } catch (const json::exception& e){
        spdlog::warn("filter model {} unreadable: {}", path, e.what());
    }
    return m;
}

double LogisticFilter::probability(const FeatureVector& f) const {
    double z = bias_;
    for (std::size_t i=0;i<kFeatureCount;++i) z += w_[i]*f[i];
    return 1.0/(1.0+std::exp(-z));
}

FilterVerdict LogisticFilter::score(const FeatureVector& f) const {
    FilterVerdict v;
    if (!loaded_) return v;
    const double p = probability(f);
    v.score_adjustment      = (p-0.5)*2.0*cap_;
    v.confidence_adjustment = (p-0.5)*2.0*cap_;
    v.veto = p < veto_below_;
    return v;
}

std::optional<LogisticFilter> LogisticFilter::fit(const std::vector<TrainingSample>& samples,
                                                  const core::FilterConfig& cfg){
    if (samples.size() < cfg.train_min_samples || samples.empty()){
        spdlog::warn("filter training: {} samples, need {}", samples.size(), cfg.train_min_samples);
        return std::nullopt;
    }
    LogisticFilter m;
    m.cap_ = cfg.adjustment_cap;
    m.veto_below_ = cfg.veto_below;
    m.loaded_ = true;

    const double n = static_cast<double>(samples.size());
    const double lr = cfg.train_learning_rate;
    for (std::size_t ep=0;ep<cfg.train_epochs;++ep){
        std::array<double, kFeatureCount> gw{};
        double gb = 0.0;
        for (const auto& s : samples){
            const double err = m.probability(s.x) - (s.win ? 1.0 : 0.0);
            for (std::size_t i=0;i<kFeatureCount;++i) gw[i] += err*s.x[i];
            gb += err;
        }
        for (std::size_t i=0;i<kFeatureCount;++i)
            m.w_[i] -= lr*(gw[i]/n + cfg.train_l2*m.w_[i]);
        m.bias_ -= lr*gb/n;
    }

    std::size_t hits = 0;
    for (const auto& s : samples)
        if ((m.probability(s.x) >= 0.5) == s.win) ++hits;
    spdlog::info("filter trained on {} samples, in-sample accuracy {:.1f}%", samples.size(),
                 100.0*hits/n);
    return m;
}

json LogisticFilter::to_json() const {
    json w = json::object();
    for (std::size_t i=0;i<kFeatureCount;++i) w[kFeatureNames[i]] = w_[i];
    return {{"bias", bias_}, {"weights", w}};
}

void LogisticFilter::save(const std::string& path) const {
    std::ofstream f(path);
    if (!f.good()) throw std::runtime_error("cannot write filter model: " + path);
    f << to_json().dump(2) << '\n';
}

std::vector<TrainingSample> load_training_samples(const std::string& path){
    std::ifstream f(path);
    if (!f.good()) throw std::runtime_error("cannot open trade history: " + path);
    const json j = json::parse(f);
    if (!j.is_array()) throw std::runtime_error("trade history is not a JSON array: " + path);

    std::vector<TrainingSample> out;
    std::size_t skipped = 0;
    for (const auto& t : j){
        if (!t.is_object() || !t.contains("features") || !t.at("features").is_object() ||
            !t.contains("profit")){ ++skipped; continue; }
        const auto& p = t.at("profit");
        if (!p.is_boolean() && !p.is_number()){ ++skipped; continue; }
        TrainingSample s;
        const auto& fj = t.at("features");
        for (std::size_t i=0;i<kFeatureCount;++i){
            const auto it = fj.find(kFeatureNames[i]);
            if (it != fj.end() && it->is_number()) s.x.values[i] = it->get<double>();
        }
        s.win = p.is_boolean() ? p.get<bool>() : p.get<double>() > 0.0;
        out.push_back(s);
    }
    if (skipped) spdlog::debug("trade history {}: {} records without features", path, skipped);
    return out;
}

json trade_record(const Signal& s, const FeatureVector& f, double profit){
    json fj = json::object();
    for (std::size_t i=0;i<kFeatureCount;++i) fj[kFeatureNames[i]] = f[i];
    return {
        {"symbol", s.symbol},
        {"side", core::to_string(s.side)},
        {"regime", core::to_string(s.regime)},
        {"style", core::to_string(s.style)},
        {"features", fj},
        {"profit", profit},
    };
}

void append_trade_record(const std::string& path, const json& record){
    json data = json::array();
    {
        std::ifstream in(path);
        if (in.good()){
            data = json::parse(in, nullptr, false);
            if (data.is_discarded() || !data.is_array()){
                spdlog::warn("trade history {} unreadable, starting a new one", path);
                data = json::array();
            }
        }
    }
    data.push_back(record);
    std::ofstream out(path);
    if (!out.good()) throw std::runtime_error("cannot write trade history: " + path);
    out << data.dump(2) << '\n';
}

std::shared_ptr<const ISignalFilter> make_signal_filter(const core::FilterConfig& cfg){
    if (!cfg.enabled) return std::make_shared<PassThroughFilter>();
    return std::make_shared<LogisticFilter>(LogisticFilter::from_file(cfg.model_path, cfg));
}

SignalFilterStage::SignalFilterStage(core::FilterConfig cfg,
                                     std::shared_ptr<const ISignalFilter> model,
                                     std::shared_ptr<const WinRateBook> history)
    : cfg_(std::move(cfg)), model_(std::move(model)), history_(std::move(history)) {
    if (!model_) model_ = std::make_shared<PassThroughFilter>();
}

FeatureVector SignalFilterStage::features(const Signal& s, const ind::AlignedHorizons& h) const {
    const auto& mid = h.series_of(core::Horizon::Medium);
    FeatureVector f;
    const std::size_t win = cfg_.zscore_window;
    f.values[kRsiZ]      = zscore_latest(mid, win, [](const ind::IndicatorSet& x){ return x.rsi; });
    f.values[kMacdHistZ] = zscore_latest(mid, win, [](const ind::IndicatorSet& x){
        return x.macd_line - x.macd_signal; });
    f.values[kEmaSpreadZ] = zscore_latest(mid, win, [](const ind::IndicatorSet& x){
        return x.atr > 0.0 ? (x.ema_fast - x.ema_slow)/x.atr : 0.0; });
    f.values[kAtrRatioZ] = zscore_latest(mid, win, [](const ind::IndicatorSet& x){
        return x.sma > 0.0 ? x.atr/x.sma : 0.0; });
    f.values[kSideSign]  = core::side_sign(s.side);
    f.values[kBreakout]  = (s.regime==core::Regime::Breakout ? 1.0 : 0.0);
    f.values[kStyle]     = style_ordinal(s.style);
    f.values[kWinRate]   = 0.5;
    if (history_)
        f.values[kWinRate] = history_->win_rate(s.symbol, s.regime, s.style).value_or(0.5);
    return f;
}

FilterOutcome SignalFilterStage::apply(const Signal& s, const ind::AlignedHorizons& h) const {
    FilterOutcome out;
    if (!cfg_.enabled){ out.signal = s; return out; }
    if (!model_->available()){
        out.degraded = true;
        out.signal = s;
        return out;
    }

    const FilterVerdict v = model_->score(features(s, h));
    if (v.veto){
        spdlog::debug("{}: vetoed by {}", s.symbol, model_->id());
        return out;
    }
    const double cap = cfg_.adjustment_cap;
    Signal adj = s;
    adj.base_score = core::clamp100(s.base_score + std::clamp(v.score_adjustment, -cap, cap));
    adj.confidence = core::clamp100(s.confidence + std::clamp(v.confidence_adjustment, -cap, cap));
    out.signal = adj;
    return out;
}

} // namespace strategy
