#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "strategy/scanner.hpp"

namespace data {

nlohmann::json signal_json(const strategy::Signal& s);
nlohmann::json trade_json(const exec::TradeStructure& t);

// {"scanned", "skipped": {...}, "signals": [{"signal", "trade"}]}
nlohmann::json report_json(const strategy::ScanReport& rep);

// Szöveges tábla az első k jelről (konzol kimenet)
std::string format_top(const std::vector<strategy::RankedSignal>& ranked, std::size_t k);

void write_report(const std::string& path, const nlohmann::json& j);

} // namespace data
