#pragma once
#include <string>
#include <vector>
#include "core/types.hpp"

namespace data {

struct Ticker {
    std::string symbol;
    double turnover_24h{0.0};
};

// quote_suffix-re végződő szimbólumok, 24h forgalom szerint csökkenő sorrendben, max n darab
std::vector<std::string> select_top_by_volume(std::vector<Ticker> tickers, std::size_t n,
                                              const std::string& quote_suffix);

// [{"symbol": "...", "turnover24h": n}]; hibánál kivétel
std::vector<Ticker> load_tickers(const std::string& path);

// {"equity": n, "leverage": n}; hibánál kivétel
core::Account load_account(const std::string& path);

} // namespace data
