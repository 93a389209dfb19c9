#pragma once

#include <funcclock/core/events/probe_event.hpp>
#include <cstdint>

namespace FuncClock {

/**
 * @brief Final per-function timing, all values in nanoseconds
 *
 * count/mean/min/max/sample_stddev cover matched calls only.
 * discarded_frames counts this function's entries that never produced an
 * interval (mismatch recovery, rejection, end of stream).
 */
struct FunctionStats {
    FunctionId function_id;
    uint64_t count = 0;
    double mean = 0.0;
    double min = 0.0;
    double max = 0.0;
    double sample_stddev = 0.0;

    uint32_t max_depth = 0;          // Deepest recursion among matched calls
    uint64_t discarded_frames = 0;

    // min/max/stddev may be biased once any frame was discarded
    bool reliable() const { return discarded_frames == 0; }
    bool recursive() const { return max_depth > 0; }
};

/**
 * @class RunningStats
 * @brief Single-pass mean/variance accumulator (Welford)
 *
 * O(1) time per sample and O(1) memory regardless of sample count.
 */
class RunningStats {
public:
    void add(double x) {
        ++count_;
        if (count_ == 1) {
            min_ = x;
            max_ = x;
        } else {
            if (x < min_) min_ = x;
            if (x > max_) max_ = x;
        }
        const double delta = x - mean_;
        mean_ += delta / static_cast<double>(count_);
        m2_ += delta * (x - mean_);
    }

    /**
     * @brief Combine with another accumulator (Chan et al. pairwise update)
     */
    void merge(const RunningStats& other);

    uint64_t count() const { return count_; }
    double mean() const { return mean_; }
    double min() const { return min_; }
    double max() const { return max_; }
    double sumSquaredDeviation() const { return m2_; }

    // 0.0 for fewer than two samples
    double sampleVariance() const {
        return count_ > 1 ? m2_ / static_cast<double>(count_ - 1) : 0.0;
    }

    double sampleStdDev() const;

private:
    uint64_t count_ = 0;
    double mean_ = 0.0;
    double m2_ = 0.0;
    double min_ = 0.0;
    double max_ = 0.0;
};

} // namespace FuncClock
