#pragma once
#include <cmath>

namespace exec {
// Ár kerekítése a tőzsdei tick méretre; step<=0 esetén változatlan
inline double round_step(double v, double step){
    if (step<=0) return v;
    return std::round(v/step)*step;
}
} // namespace exec
