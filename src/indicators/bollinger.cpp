#include "indicators/bollinger.hpp"
#include <algorithm>
#include <cmath>

namespace ind {

double band_width(const BB& bb){
    if (std::abs(bb.mid) < 1e-12) return 0.0;
    return (bb.upper - bb.lower)/bb.mid;
}

std::vector<std::optional<BB>> bb_series(const std::vector<double>& v, std::size_t p, double k){
    std::vector<std::optional<BB>> out(v.size());
    if (p==0 || v.size()<p) return out;
    for (std::size_t i=p-1;i<v.size();++i){
        double mid=0.0;
        for (std::size_t j=i+1-p;j<=i;++j) mid += v[j];
        mid/=static_cast<double>(p);
        double var=0.0;
        for (std::size_t j=i+1-p;j<=i;++j){ const double d=v[j]-mid; var+=d*d; }
        const double sd = std::sqrt(std::max(0.0, var/static_cast<double>(p)));
        out[i] = BB{mid, mid + k*sd, mid - k*sd};
    }
    return out;
}

} // namespace ind
