#include "strategy/ranker.hpp"
#include <algorithm>

namespace strategy {

bool ranks_before(const RankedSignal& a, const RankedSignal& b){
    const auto& x = a.signal;
    const auto& y = b.signal;
    if (x.base_score != y.base_score) return x.base_score > y.base_score;
    if (x.confidence != y.confidence) return x.confidence > y.confidence;
    return x.symbol < y.symbol;
}

std::vector<RankedSignal> rank(std::vector<RankedSignal> signals){
    std::stable_sort(signals.begin(), signals.end(), ranks_before);
    return signals;
}

std::vector<RankedSignal> top(const std::vector<RankedSignal>& ranked, std::size_t k){
    const auto n = std::min(k, ranked.size());
    return std::vector<RankedSignal>(ranked.begin(), ranked.begin() + static_cast<std::ptrdiff_t>(n));
}

} // namespace strategy
