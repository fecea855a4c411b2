#include "indicators/macd.hpp"

namespace ind {

MacdSeries macd_series(const std::vector<double>& closes, std::size_t fast, std::size_t slow,
                       std::size_t signal){
    const Series ef = ema_series(closes, fast);
    const Series es = ema_series(closes, slow);
    MacdSeries m;
    m.line.resize(closes.size());
    for (std::size_t i=0;i<closes.size();++i)
        if (ef[i] && es[i]) m.line[i] = *ef[i] - *es[i];
    m.signal = ema_series(m.line, signal);
    return m;
}

} // namespace ind
