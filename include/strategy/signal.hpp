#pragma once
#include <array>
#include <string>
#include "core/types.hpp"

namespace strategy {

// Jelölt jel. Létrehozás után nem módosul; a szűrő módosított másolatot ad tovább.
struct Signal {
    std::string symbol;
    core::Side side{core::Side::Long};
    double base_score{0.0};  // 0..100
    double confidence{0.0};  // 0..100
    core::Regime regime{core::Regime::Mean};
    core::Style style{core::Style::Swing};
    double reference_price{0.0};
    double atr_at_signal{0.0};
    bool horizons_agree{false};
    std::array<core::Trend, core::kHorizonCount> trends{core::Trend::Flat, core::Trend::Flat,
                                                        core::Trend::Flat};
};

} // namespace strategy
