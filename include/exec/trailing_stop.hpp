#pragma once
#include <optional>
#include "core/types.hpp"
#include "exec/risk.hpp"

namespace exec {

// Aktiválás előtt nincs stop szint; utána csak kedvező irányba mozdul.
class TrailingStop {
public:
    TrailingStop(core::Side side, double activation, double distance)
        : side_(side), activation_(activation), distance_(distance) {}

    static TrailingStop from(core::Side side, const TradeStructure& t) {
        return TrailingStop(side, t.trailing_activation, t.trailing_distance);
    }

    // új ár; true, ha a stop szint megváltozott
    bool update(double price);

    // az ár elérte-e a stop szintet
    bool triggered(double price) const;

    bool active() const { return level_.has_value(); }
    std::optional<double> level() const { return level_; }

private:
    core::Side side_;
    double activation_;
    double distance_;
    std::optional<double> level_;
};

} // namespace exec
