#include "indicators/sma_ema.hpp"

namespace ind {

Series sma_series(const std::vector<double>& v, std::size_t p){
    Series out(v.size());
    if (p==0 || v.size()<p) return out;
    for (std::size_t i=p-1;i<v.size();++i){
        double s=0.0;
        for (std::size_t k=i+1-p;k<=i;++k) s+=v[k];
        out[i] = s/static_cast<double>(p);
    }
    return out;
}

Series ema_series(const Series& v, std::size_t p){
    Series out(v.size());
    if (p==0) return out;
    std::size_t first=0;
    while (first<v.size() && !v[first]) ++first;
    if (v.size()-first < p) return out;

    // seed: az első p jelen lévő érték átlaga
    double e=0.0;
    for (std::size_t i=first;i<first+p;++i){
        if (!v[i]) return out; // lyukas bemenetre nem számolunk
        e += *v[i];
    }
    e /= static_cast<double>(p);
    const double k = 2.0/(p+1.0);
    out[first+p-1] = e;
    for (std::size_t i=first+p;i<v.size();++i){
        if (!v[i]) break;
        e = e + (*v[i]-e)*k;
        out[i] = e;
    }
    return out;
}

Series ema_series(const std::vector<double>& v, std::size_t p){
    return ema_series(Series(v.begin(), v.end()), p);
}

} // namespace ind
