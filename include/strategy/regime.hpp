#pragma once
#include "core/config.hpp"
#include "core/types.hpp"
#include "indicators/mtfa.hpp"

namespace strategy {

struct Classification {
    core::Regime regime{core::Regime::Mean};
    core::Style style{core::Style::Swing};
    double volatility_ratio{0.0}; // atr / sma a hosszú horizonton
    double band_width{0.0};       // legutolsó (upper-lower)/mid
    bool expanding{false};
    bool penetrated{false};
};

// Piaci rezsim (mean / breakout) és tartási stílus (scalp / swing / trend).
class RegimeClassifier {
public:
    explicit RegimeClassifier(core::RegimeConfig cfg) : cfg_(cfg) {}

    // long_*: hosszú horizont bar + indikátor sor; medium: a stílushoz
    Classification classify(const core::BarSeries& long_bars,
                            const ind::IndicatorSeries& long_series,
                            const ind::HorizonView& medium) const;

    core::Style classify_style(std::size_t persistence) const;

private:
    core::RegimeConfig cfg_;
};

} // namespace strategy
