#pragma once
#include <cstddef>
#include "core/types.hpp"
#include "indicators/sma_ema.hpp"

namespace ind {

// max(h-l, |h-prev_c|, |l-prev_c|)
double true_range(const core::Bar& b, const core::Bar& prev);

// Wilder ATR a 2. bartól számolt true range-ekből; első érték a p. indexen
Series atr_series(const core::BarSeries& bars, std::size_t p);

} // namespace ind
