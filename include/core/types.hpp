#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace core {

// OHLCV bar
struct Bar {
    std::int64_t timestamp_ms{}; // bar nyitási ideje (ms)
    double open{};
    double high{};
    double low{};
    double close{};
    double volume{};
};

using BarSeries = std::vector<Bar>;

// Időhorizont: rövid / közép / hosszú (pl. 15m / 1h / 4h)
enum class Horizon { Short, Medium, Long };
constexpr std::size_t kHorizonCount = 3;

inline std::size_t index_of(Horizon h) { return static_cast<std::size_t>(h); }

constexpr std::array<Horizon, kHorizonCount> kHorizons{Horizon::Short, Horizon::Medium, Horizon::Long};

enum class Trend { Up, Down, Flat };
enum class Side { Long, Short };
enum class Regime { Mean, Breakout };
enum class Style { Scalp, Swing, Trend };

inline const char* to_string(Horizon h) {
    switch (h) {
        case Horizon::Short:  return "short";
        case Horizon::Medium: return "medium";
        case Horizon::Long:   return "long";
    }
    return "?";
}

inline const char* to_string(Trend t) {
    switch (t) {
        case Trend::Up:   return "up";
        case Trend::Down: return "down";
        case Trend::Flat: return "flat";
    }
    return "?";
}

inline const char* to_string(Side s) {
    switch (s) {
        case Side::Long:  return "LONG";
        case Side::Short: return "SHORT";
    }
    return "?";
}

inline const char* to_string(Regime r) {
    switch (r) {
        case Regime::Mean:     return "mean";
        case Regime::Breakout: return "breakout";
    }
    return "?";
}

inline const char* to_string(Style s) {
    switch (s) {
        case Style::Scalp: return "scalp";
        case Style::Swing: return "swing";
        case Style::Trend: return "trend";
    }
    return "?";
}

// +1 long, -1 short
inline double side_sign(Side s) { return s == Side::Long ? 1.0 : -1.0; }

inline Trend trend_of(Side s) { return s == Side::Long ? Trend::Up : Trend::Down; }

// Egy instrumentum három horizontjának bar sorai
struct InstrumentBars {
    std::string symbol;
    std::array<BarSeries, kHorizonCount> horizons;

    const BarSeries& at(Horizon h) const { return horizons[index_of(h)]; }
};

// Külső számla-adatok (equity, tőkeáttétel)
struct Account {
    double equity{0.0};
    double leverage{1.0};
};

} // namespace core
