#include "exec/trailing_stop.hpp"
#include <algorithm>

namespace exec {

bool TrailingStop::update(double price){
    const bool is_long = (side_==core::Side::Long);
    if (!level_){
        const bool reached = is_long ? price >= activation_ : price <= activation_;
        if (!reached) return false;
        level_ = is_long ? price - distance_ : price + distance_;
        return true;
    }
    const double cand = is_long ? price - distance_ : price + distance_;
    const double next = is_long ? std::max(*level_, cand) : std::min(*level_, cand);
    if (next == *level_) return false;
    level_ = next;
    return true;
}

bool TrailingStop::triggered(double price) const {
    if (!level_) return false;
    return side_==core::Side::Long ? price <= *level_ : price >= *level_;
}

} // namespace exec
