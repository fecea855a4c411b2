#include "indicators/atr.hpp"
#include <algorithm>
#include <cmath>

namespace ind {

double true_range(const core::Bar& b, const core::Bar& prev){
    return std::max({b.high - b.low, std::abs(b.high - prev.close), std::abs(b.low - prev.close)});
}

Series atr_series(const core::BarSeries& bars, std::size_t p){
    Series out(bars.size());
    if (p==0 || bars.size()<=p) return out;
    double a=0.0;
    for (std::size_t i=1;i<=p;++i) a += true_range(bars[i], bars[i-1]);
    a /= static_cast<double>(p);
    out[p] = a;
    for (std::size_t i=p+1;i<bars.size();++i){
        a = (a*(p-1) + true_range(bars[i], bars[i-1]))/static_cast<double>(p);
        out[i] = a;
    }
    return out;
}

} // namespace ind
