#include "data/csv_bars.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace data {

namespace {

bool parse_row(const std::string& line, core::Bar& b){
    std::stringstream ss(line);
    std::string x;
    try {
        if (!std::getline(ss,x,',')) return false; b.timestamp_ms = std::stoll(x);
        if (!std::getline(ss,x,',')) return false; b.open   = std::stod(x);
        if (!std::getline(ss,x,',')) return false; b.high   = std::stod(x);
        if (!std::getline(ss,x,',')) return false; b.low    = std::stod(x);
        if (!std::getline(ss,x,',')) return false; b.close  = std::stod(x);
        if (!std::getline(ss,x,',')) return false; b.volume = std::stod(x);
    } catch (const std::logic_error&) { // invalid_argument / out_of_range
        return false;
    }
    return true;
}

} // namespace

core::BarSeries parse_csv(std::istream& in, const std::string& source){
    core::BarSeries out;
    std::string line;
    std::size_t lineno = 0, bad = 0;
    while (std::getline(in, line)){
        ++lineno;
        if (!line.empty() && line.back()=='\r') line.pop_back();
        if (line.empty()) continue;
        core::Bar b{};
        if (!parse_row(line, b)){
            if (lineno > 1) ++bad; // az első sor lehet fejléc
            continue;
        }
        if (!out.empty() && b.timestamp_ms <= out.back().timestamp_ms)
            throw std::runtime_error(source + ": timestamps not strictly increasing at line " +
                                     std::to_string(lineno));
        out.push_back(b);
    }
    if (bad) spdlog::warn("{}: {} malformed rows skipped", source, bad);
    return out;
}

core::BarSeries load_csv(const std::string& path){
    std::ifstream f(path);
    if (!f.good()) throw std::runtime_error("cannot open " + path);
    return parse_csv(f, path);
}

core::InstrumentBars load_instrument(const std::string& dir, const std::string& symbol){
    core::InstrumentBars inst;
    inst.symbol = symbol;
    for (auto h : core::kHorizons){
        const std::string path = dir + "/" + symbol + "_" + core::to_string(h) + ".csv";
        std::ifstream probe(path);
        if (!probe.good()){
            spdlog::warn("{}: no {} bars ({})", symbol, core::to_string(h), path);
            continue;
        }
        // egy hibás fájl csak ezt a horizontot üríti ki (insufficient data), a scant nem állítja le
        try {
            inst.horizons[core::index_of(h)] = parse_csv(probe, path);
        } catch (const std::runtime_error& e) {
            spdlog::warn("{}: {} bars dropped: {}", symbol, core::to_string(h), e.what());
        }
    }
    return inst;
}

} // namespace data
