#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include "core/types.hpp"

namespace strategy {

struct WinRecord {
    std::size_t wins{0};
    std::size_t losses{0};
    std::size_t total() const { return wins + losses; }
    double rate() const { return total()==0 ? 0.0 : static_cast<double>(wins)/total(); }
};

// Korábbi kötések nyerési aránya szimbólum / rezsim / stílus kombinációnként.
class WinRateBook {
public:
    void record(const std::string& symbol, core::Regime r, core::Style s, bool win);

    // nullopt, ha kevesebb mint min_samples kötés van
    std::optional<double> win_rate(const std::string& symbol, core::Regime r, core::Style s,
                                   std::size_t min_samples = 1) const;

    WinRecord get(const std::string& symbol, core::Regime r, core::Style s) const;
    std::size_t size() const { return map_.size(); }

    // JSON tömb: [{"symbol","regime","style","profit"}]; hibánál kivétel
    static WinRateBook load(const std::string& path);

private:
    static std::string key(const std::string& symbol, core::Regime r, core::Style s);
    std::unordered_map<std::string, WinRecord> map_;
};

} // namespace strategy
