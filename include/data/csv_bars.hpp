#pragma once
#include <istream>
#include <string>
#include "core/types.hpp"

namespace data {

// timestamp,open,high,low,close,volume; opcionális fejléc sor.
// Hibás sorokat kihagy; nem szigorúan növekvő időbélyegnél std::runtime_error.
core::BarSeries parse_csv(std::istream& in, const std::string& source = "<stream>");

core::BarSeries load_csv(const std::string& path);

// <dir>/<SYMBOL>_short.csv, _medium.csv, _long.csv; hiányzó vagy hibás fájl -> üres sor
core::InstrumentBars load_instrument(const std::string& dir, const std::string& symbol);

} // namespace data
