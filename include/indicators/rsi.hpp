#pragma once
#include <cstddef>
#include <vector>
#include "indicators/sma_ema.hpp"

namespace ind {

// RSI két Wilder-átlagból; mindkettő 0 -> 50, csak veszteség 0 -> 100
double rsi_value(double avg_gain, double avg_loss);

// Wilder-féle RSI, első érték a p. indexen. Mindig 0..100 között.
Series rsi_series(const std::vector<double>& closes, std::size_t p);

} // namespace ind
