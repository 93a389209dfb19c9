#include <funcclock/core/stats/stats_aggregator.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace FuncClock {

void StatsAggregator::onInterval(const CallInterval& interval) {
    add(interval);
}

void StatsAggregator::onDiscardedFrame(const FunctionId& function_id, ContextId) {
    ++functions_[function_id].discarded_frames;
}

bool StatsAggregator::add(const CallInterval& interval) {
    if (!interval.valid()) {
        ++rejected_intervals_;
        spdlog::error("[Aggregator] Ignoring interval of {} with end {} before start {}",
                      interval.function_id, interval.end_ns, interval.start_ns);
        return false;
    }

    auto& acc = functions_[interval.function_id];
    acc.stats.add(static_cast<double>(interval.duration_ns()));
    acc.max_depth = std::max(acc.max_depth, interval.depth);
    ++total_intervals_;
    return true;
}

void StatsAggregator::merge(const StatsAggregator& other) {
    for (const auto& [function_id, theirs] : other.functions_) {
        auto& ours = functions_[function_id];
        ours.stats.merge(theirs.stats);
        ours.max_depth = std::max(ours.max_depth, theirs.max_depth);
        ours.discarded_frames += theirs.discarded_frames;
    }
    total_intervals_ += other.total_intervals_;
    rejected_intervals_ += other.rejected_intervals_;
}

std::vector<FunctionStats> StatsAggregator::snapshot() const {
    std::vector<FunctionStats> result;
    result.reserve(functions_.size());
    for (const auto& [function_id, acc] : functions_) {
        result.push_back(buildStats(function_id, acc));
    }
    std::sort(result.begin(), result.end(),
              [](const FunctionStats& a, const FunctionStats& b) {
                  return a.function_id < b.function_id;
              });
    return result;
}

std::optional<FunctionStats> StatsAggregator::get(const FunctionId& function_id) const {
    auto it = functions_.find(function_id);
    if (it == functions_.end()) return std::nullopt;
    return buildStats(it->first, it->second);
}

uint64_t StatsAggregator::callCount(const FunctionId& function_id) const {
    auto it = functions_.find(function_id);
    return it == functions_.end() ? 0 : it->second.stats.count();
}

void StatsAggregator::reset() {
    functions_.clear();
    total_intervals_ = 0;
    rejected_intervals_ = 0;
}

FunctionStats StatsAggregator::buildStats(const FunctionId& function_id, const Accumulator& acc) {
    FunctionStats s;
    s.function_id = function_id;
    s.count = acc.stats.count();
    s.mean = acc.stats.mean();
    s.min = acc.stats.min();
    s.max = acc.stats.max();
    s.sample_stddev = acc.stats.sampleStdDev();
    s.max_depth = acc.max_depth;
    s.discarded_frames = acc.discarded_frames;
    return s;
}

} // namespace FuncClock
