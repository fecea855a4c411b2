#pragma once
#include <cstddef>
#include <optional>
#include <vector>

namespace ind {

// Bar-onként egy érték; warm-up alatt std::nullopt
using Series = std::vector<std::optional<double>>;

// Egyszerű mozgóátlag, első érték a p-1. indexen
Series sma_series(const std::vector<double>& v, std::size_t p);

// EMA: az első p érték SMA-jával indul, utána e += (x-e) * 2/(p+1)
Series ema_series(const std::vector<double>& v, std::size_t p);

// EMA egy részben hiányzó sorra (pl. MACD signal); az első jelen lévő értéktől számol
Series ema_series(const Series& v, std::size_t p);

} // namespace ind
