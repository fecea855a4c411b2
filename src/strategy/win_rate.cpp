#include "strategy/win_rate.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace strategy {

namespace {

std::string lower(std::string s){
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::optional<core::Regime> parse_regime(const std::string& s){
    const auto l = lower(s);
    if (l=="mean") return core::Regime::Mean;
    if (l=="breakout") return core::Regime::Breakout;
    return std::nullopt;
}

std::optional<core::Style> parse_style(const std::string& s){
    const auto l = lower(s);
    if (l=="scalp") return core::Style::Scalp;
    if (l=="swing") return core::Style::Swing;
    if (l=="trend") return core::Style::Trend;
    return std::nullopt;
}

} // namespace

std::string WinRateBook::key(const std::string& symbol, core::Regime r, core::Style s){
    return symbol + "|" + core::to_string(r) + "|" + core::to_string(s);
}

void WinRateBook::record(const std::string& symbol, core::Regime r, core::Style s, bool win){
    auto& rec = map_[key(symbol, r, s)];
    if (win) ++rec.wins; else ++rec.losses;
}

WinRecord WinRateBook::get(const std::string& symbol, core::Regime r, core::Style s) const {
    auto it = map_.find(key(symbol, r, s));
    if (it==map_.end()) return {};
    return it->second;
}

std::optional<double> WinRateBook::win_rate(const std::string& symbol, core::Regime r,
                                            core::Style s, std::size_t min_samples) const {
    const auto rec = get(symbol, r, s);
    if (rec.total()==0 || rec.total() < min_samples) return std::nullopt;
    return rec.rate();
}

WinRateBook WinRateBook::load(const std::string& path){
    std::ifstream f(path);
    if (!f.good()) throw std::runtime_error("cannot open trade history: " + path);
    const json j = json::parse(f);
    if (!j.is_array()) throw std::runtime_error("trade history is not a JSON array: " + path);

    WinRateBook book;
    std::size_t skipped = 0;
    for (const auto& t : j){
        const auto r = parse_regime(t.value("regime", std::string{}));
        const auto s = parse_style(t.value("style", std::string{}));
        const auto sym = t.value("symbol", std::string{});
        if (!r || !s || sym.empty() || !t.contains("profit")){ ++skipped; continue; }
        const auto& p = t.at("profit");
        const bool win = p.is_boolean() ? p.get<bool>() : (p.is_number() && p.get<double>() > 0.0);
        book.record(sym, *r, *s, win);
    }
    if (skipped) spdlog::warn("trade history {}: {} malformed records skipped", path, skipped);
    spdlog::info("trade history {}: {} symbol/regime/style buckets", path, book.size());
    return book;
}

} // namespace strategy
