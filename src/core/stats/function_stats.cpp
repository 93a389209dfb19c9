#include <funcclock/core/stats/function_stats.hpp>
#include <algorithm>
#include <cmath>

namespace FuncClock {

void RunningStats::merge(const RunningStats& other) {
    if (other.count_ == 0) return;
    if (count_ == 0) {
        *this = other;
        return;
    }

    const double na = static_cast<double>(count_);
    const double nb = static_cast<double>(other.count_);
    const double n = na + nb;
    const double delta = other.mean_ - mean_;

    mean_ += delta * nb / n;
    m2_ += other.m2_ + delta * delta * na * nb / n;
    min_ = std::min(min_, other.min_);
    max_ = std::max(max_, other.max_);
    count_ += other.count_;
}

double RunningStats::sampleStdDev() const {
    return std::sqrt(sampleVariance());
}

} // namespace FuncClock
