#include "data/universe.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace data {

namespace {

bool ends_with(const std::string& s, const std::string& suffix){
    return s.size() >= suffix.size() && s.compare(s.size()-suffix.size(), suffix.size(), suffix)==0;
}

json read_json(const std::string& path){
    std::ifstream f(path);
    if (!f.good()) throw std::runtime_error("cannot open " + path);
    return json::parse(f);
}

// a forgalom stringként is érkezhet
double to_d(const json& j, const char* k){
    if (!j.contains(k)) return 0.0;
    if (j[k].is_string()) return std::strtod(j[k].get_ref<const std::string&>().c_str(), nullptr);
    if (j[k].is_number()) return j[k].get<double>();
    return 0.0;
}

} // namespace

std::vector<std::string> select_top_by_volume(std::vector<Ticker> tickers, std::size_t n,
                                              const std::string& quote_suffix){
    tickers.erase(std::remove_if(tickers.begin(), tickers.end(), [&](const Ticker& t){
        return !ends_with(t.symbol, quote_suffix); }), tickers.end());
    std::sort(tickers.begin(), tickers.end(), [](const Ticker& a, const Ticker& b){
        if (a.turnover_24h != b.turnover_24h) return a.turnover_24h > b.turnover_24h;
        return a.symbol < b.symbol;
    });
    std::vector<std::string> out;
    for (const auto& t : tickers){
        if (out.size() >= n) break;
        out.push_back(t.symbol);
    }
    return out;
}

std::vector<Ticker> load_tickers(const std::string& path){
    const json j = read_json(path);
    if (!j.is_array()) throw std::runtime_error("tickers file is not a JSON array: " + path);
    std::vector<Ticker> out;
    out.reserve(j.size());
    for (const auto& t : j){
        if (!t.contains("symbol")) continue;
        out.push_back({t.at("symbol").get<std::string>(), to_d(t, "turnover24h")});
    }
    spdlog::debug("{}: {} tickers", path, out.size());
    return out;
}

core::Account load_account(const std::string& path){
    const json j = read_json(path);
    core::Account a;
    a.equity   = to_d(j, "equity");
    a.leverage = j.contains("leverage") ? to_d(j, "leverage") : 1.0;
    return a;
}

} // namespace data
