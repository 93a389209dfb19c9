#pragma once

#include <funcclock/core/events/interval_sink.hpp>
#include <funcclock/core/stats/function_stats.hpp>
#include <optional>
#include <unordered_map>
#include <vector>

namespace FuncClock {

/**
 * @class StatsAggregator
 * @brief Reduces call intervals to per-function statistics
 *
 * One instance per pipeline run, owned by the driver: fed during the run,
 * read once at the end. Each interval is folded in O(1); nothing per call is
 * retained.
 */
class StatsAggregator : public IntervalSink {
public:
    StatsAggregator() = default;

    void onInterval(const CallInterval& interval) override;
    void onDiscardedFrame(const FunctionId& function_id, ContextId context) override;

    /**
     * @brief Fold one interval
     * @return false if the interval is invalid (end before start) and was ignored
     */
    bool add(const CallInterval& interval);

    /**
     * @brief Pool another aggregator's results into this one
     *
     * Used to combine per-context shards.
     */
    void merge(const StatsAggregator& other);

    /**
     * @brief All functions ordered by function id
     */
    std::vector<FunctionStats> snapshot() const;

    std::optional<FunctionStats> get(const FunctionId& function_id) const;

    /**
     * @brief Matched call count, 0 for unknown functions
     */
    uint64_t callCount(const FunctionId& function_id) const;

    size_t functionCount() const { return functions_.size(); }
    uint64_t totalIntervals() const { return total_intervals_; }
    uint64_t rejectedIntervals() const { return rejected_intervals_; }

    void reset();

private:
    struct Accumulator {
        RunningStats stats;
        uint32_t max_depth = 0;
        uint64_t discarded_frames = 0;
    };

    static FunctionStats buildStats(const FunctionId& function_id, const Accumulator& acc);

    std::unordered_map<FunctionId, Accumulator> functions_;
    uint64_t total_intervals_ = 0;
    uint64_t rejected_intervals_ = 0;
};

} // namespace FuncClock
