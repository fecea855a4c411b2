#pragma once
#include <cstddef>
#include <optional>
#include <vector>

namespace ind {

struct BB { double mid, upper, lower; };

// (upper-lower)/mid; mid==0 -> 0
double band_width(const BB& bb);

// mid = SMA(p), sávok mid ± k*szórás (populációs szórás)
std::vector<std::optional<BB>> bb_series(const std::vector<double>& v, std::size_t p=20, double k=2.0);

} // namespace ind
