#pragma once
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config.hpp"
#include "indicators/mtfa.hpp"
#include "strategy/signal.hpp"
#include "strategy/win_rate.hpp"

namespace strategy {

enum Feature : std::size_t {
    kRsiZ = 0,      // (rsi - átlag) / szórás a közép horizont történetén
    kMacdHistZ,     // MACD hisztogram z-score
    kEmaSpreadZ,    // (ema_fast - ema_slow)/atr z-score
    kAtrRatioZ,     // atr/sma z-score
    kSideSign,      // +1 long, -1 short
    kBreakout,      // 1 breakout, 0 mean
    kStyle,         // 0 scalp, 1 swing, 2 trend
    kWinRate,       // korábbi nyerési arány, ismeretlennél 0.5
    kFeatureCount
};

const char* feature_name(std::size_t i);

struct FeatureVector {
    std::array<double, kFeatureCount> values{};
    double operator[](std::size_t i) const { return values[i]; }
};

// Egy lezárt kötés: a belépéskori feature-ök és az eredmény
struct TrainingSample {
    FeatureVector x;
    bool win{false};
};

struct FilterVerdict {
    double score_adjustment{0.0};
    double confidence_adjustment{0.0};
    bool veto{false};
};

// Szűrő modell képesség: features -> (score, confidence korrekció, vétó)
class ISignalFilter {
public:
    virtual ~ISignalFilter() = default;
    virtual std::string id() const = 0;
    // false: a modell nem futtatható, a jel változatlanul megy tovább
    virtual bool available() const = 0;
    virtual FilterVerdict score(const FeatureVector& f) const = 0;
};

// Kikapcsolt állapot: nincs korrekció, nincs vétó
class PassThroughFilter final : public ISignalFilter {
public:
    std::string id() const override { return "PASS"; }
    bool available() const override { return true; }
    FilterVerdict score(const FeatureVector&) const override { return {}; }
};

// Betanított logisztikus modell: p = sigmoid(bias + w·x)
class LogisticFilter final : public ISignalFilter {
public:
    LogisticFilter(std::array<double, kFeatureCount> weights, double bias, double cap,
                   double veto_below);

    // JSON: {"bias": b, "weights": {"rsi_z": w, ...}}. Olvashatatlan fájl -> nem elérhető modell.
    static LogisticFilter from_file(const std::string& path, const core::FilterConfig& cfg);

    std::string id() const override { return "LOGIT"; }
    bool available() const override { return loaded_; }
    FilterVerdict score(const FeatureVector& f) const override;

    double probability(const FeatureVector& f) const;

    // Batch gradiens módszer log-loss-ra. nullopt, ha kevesebb mint train_min_samples minta van.
    static std::optional<LogisticFilter> fit(const std::vector<TrainingSample>& samples,
                                             const core::FilterConfig& cfg);

    // a from_file által olvasott formátum
    nlohmann::json to_json() const;
    void save(const std::string& path) const;

    double bias() const { return bias_; }
    double weight(std::size_t i) const { return w_[i]; }

private:
    LogisticFilter() = default;

    std::array<double, kFeatureCount> w_{};
    double bias_{0.0};
    double cap_{0.0};
    double veto_below_{0.0};
    bool loaded_{false};
};

// Kötés-történet (JSON tömb) rekordjai, amelyeknek van "features" objektuma és "profit" mezője.
// A többit kihagyja. Hiányzó / hibás fájlnál kivétel.
std::vector<TrainingSample> load_training_samples(const std::string& path);

// {"symbol","regime","style","features","profit"}; a WinRateBook és a betanítás is ezt olvassa
nlohmann::json trade_record(const Signal& s, const FeatureVector& f, double profit);

// Rekord hozzáfűzése a kötés-történethez; nem létező vagy sérült fájl helyett új tömb
void append_trade_record(const std::string& path, const nlohmann::json& record);

// A konfiguráció szerinti szűrő; kikapcsolva PassThroughFilter
std::shared_ptr<const ISignalFilter> make_signal_filter(const core::FilterConfig& cfg);

struct FilterOutcome {
    std::optional<Signal> signal; // nullopt = vétó
    bool degraded{false};         // a modell nem volt elérhető, pass-through
};

// A jelölt jel szűrése korlátos korrekcióval.
class SignalFilterStage {
public:
    SignalFilterStage(core::FilterConfig cfg, std::shared_ptr<const ISignalFilter> model,
                      std::shared_ptr<const WinRateBook> history = nullptr);

    FeatureVector features(const Signal& s, const ind::AlignedHorizons& h) const;
    FilterOutcome apply(const Signal& s, const ind::AlignedHorizons& h) const;

    bool enabled() const { return cfg_.enabled; }

private:
    core::FilterConfig cfg_;
    std::shared_ptr<const ISignalFilter> model_;
    std::shared_ptr<const WinRateBook> history_;
};

} // namespace strategy
