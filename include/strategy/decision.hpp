#pragma once
#include <array>
#include <optional>
#include <string>
#include "core/config.hpp"
#include "core/result.hpp"
#include "indicators/mtfa.hpp"
#include "strategy/regime.hpp"
#include "strategy/signal.hpp"

namespace strategy {

using HorizonViews = std::array<ind::HorizonView, core::kHorizonCount>;

// A score / confidence összetevői (0..1 faktorok), naplózáshoz és tesztekhez
struct ScoreBreakdown {
    double agreement{0.0};
    double rsi_strength{0.0};
    double macd_alignment{0.0};
    double momentum{0.0};
    double regime_fit{0.0};
    double vol_quality{0.0};
    bool rsi_extreme{false};
    bool unanimous{false};
    double base_score{0.0};
    double confidence{0.0};
};

// Többségi irány; döntetlen vagy csupa flat -> nullopt
std::optional<core::Side> dominant_side(const HorizonViews& views);

// Trend egyezés + indikátor erő + rezsim -> base score és confidence (0..100).
// Determinisztikus, tiszta függvény.
class ScoreModel {
public:
    ScoreModel(core::ScoreConfig cfg, core::Thresholds thr) : cfg_(cfg), thr_(thr) {}

    ScoreBreakdown score(const HorizonViews& views, const Classification& cls,
                         core::Side side) const;

    // HorizonDisagreement, ha nincs domináns irány
    core::Result<Signal> evaluate(const std::string& symbol, const HorizonViews& views,
                                  const Classification& cls) const;

    // score >= küszöb, confidence >= küszöb (inkluzív), és mindhárom horizont egyezik
    bool is_valid(const Signal& s) const;

    const core::Thresholds& thresholds() const { return thr_; }

private:
    core::ScoreConfig cfg_;
    core::Thresholds thr_;
};

} // namespace strategy
