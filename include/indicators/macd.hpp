#pragma once
#include <cstddef>
#include <vector>
#include "indicators/sma_ema.hpp"

namespace ind {

struct MacdSeries {
    Series line;    // ema(fast) - ema(slow)
    Series signal;  // ema(signal) a line-on
};

MacdSeries macd_series(const std::vector<double>& closes, std::size_t fast, std::size_t slow,
                       std::size_t signal);

} // namespace ind
