#pragma once
#include <vector>
#include "exec/risk.hpp"
#include "strategy/signal.hpp"

namespace strategy {

struct RankedSignal {
    Signal signal;
    exec::TradeStructure trade;
};

// (base_score, confidence) szerint csökkenő, egyezésnél szimbólum szerint növekvő
bool ranks_before(const RankedSignal& a, const RankedSignal& b);

std::vector<RankedSignal> rank(std::vector<RankedSignal> signals);

// az első k elem (k > size esetén mind)
std::vector<RankedSignal> top(const std::vector<RankedSignal>& ranked, std::size_t k);

} // namespace strategy
