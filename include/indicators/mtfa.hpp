#pragma once
#include <array>
#include <optional>
#include "core/result.hpp"
#include "core/types.hpp"
#include "indicators/indicator_engine.hpp"

namespace ind {

// Egy horizont pillanatképe a legutolsó bar-on
struct HorizonView {
    core::Horizon horizon{core::Horizon::Short};
    core::Trend trend{core::Trend::Flat};
    IndicatorSet latest{};
    double close{0.0};
    double volume{0.0};
    std::size_t persistence{0}; // ennyi bar óta változatlan a trend címke
};

struct AlignedHorizons {
    std::array<HorizonView, core::kHorizonCount> views;
    std::array<IndicatorSeries, core::kHorizonCount> series;

    const HorizonView& view(core::Horizon h) const { return views[core::index_of(h)]; }
    const IndicatorSeries& series_of(core::Horizon h) const { return series[core::index_of(h)]; }
};

// up: gyors EMA > lassú EMA és close > SMA; down: fordítva; egyébként flat
core::Trend classify_trend(const IndicatorSet& s, double close);

// Alacsonyabb horizont -> factor-szoros horizont. A csonka utolsó csoport elmarad.
core::BarSeries resample(const core::BarSeries& bars, std::size_t factor);

// Horizontonként független IndicatorEngine futás + trend címke.
class TimeframeAligner {
public:
    explicit TimeframeAligner(core::IndicatorConfig cfg) : engine_(cfg) {}

    // nullopt, ha a horizonton nincs elég bar (insufficient)
    std::optional<HorizonView> view(core::Horizon h, const core::BarSeries& bars,
                                    const IndicatorSeries& series) const;

    // InsufficientData, ha bármelyik horizont nem kész
    core::Result<AlignedHorizons> align(const core::InstrumentBars& inst) const;

    const IndicatorEngine& engine() const { return engine_; }

private:
    IndicatorEngine engine_;
};

} // namespace ind
