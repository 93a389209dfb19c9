// ============================================================================
// STATS AGGREGATOR UNIT TESTS
// ============================================================================
// Tests for running statistics and per-function aggregation
// ============================================================================

#include <gtest/gtest.h>
#include <funcclock/core/stats/stats_aggregator.hpp>
#include <cmath>
#include <random>

using namespace FuncClock;

namespace {

CallInterval makeInterval(const std::string& fn, TimestampNs start, TimestampNs end, uint32_t depth = 0) {
    CallInterval interval;
    interval.function_id = fn;
    interval.context = 1;
    interval.start_ns = start;
    interval.end_ns = end;
    interval.depth = depth;
    return interval;
}

} // anonymous namespace

// ============================================================================
// RUNNING STATS TESTS
// ============================================================================

TEST(RunningStats, EmptyAndSingleSample) {
    RunningStats stats;
    EXPECT_EQ(stats.count(), 0u);
    EXPECT_DOUBLE_EQ(stats.sampleVariance(), 0.0);

    stats.add(42.0);
    EXPECT_EQ(stats.count(), 1u);
    EXPECT_DOUBLE_EQ(stats.mean(), 42.0);
    EXPECT_DOUBLE_EQ(stats.min(), 42.0);
    EXPECT_DOUBLE_EQ(stats.max(), 42.0);
    EXPECT_DOUBLE_EQ(stats.sampleStdDev(), 0.0);
}

TEST(RunningStats, KnownSampleStdDev) {
    RunningStats stats;
    for (double x : {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0}) {
        stats.add(x);
    }
    EXPECT_NEAR(stats.mean(), 5.0, 1e-12);
    // Sum of squared deviations is 32, n - 1 = 7
    EXPECT_NEAR(stats.sampleVariance(), 32.0 / 7.0, 1e-12);
    EXPECT_DOUBLE_EQ(stats.min(), 2.0);
    EXPECT_DOUBLE_EQ(stats.max(), 9.0);
}

TEST(RunningStats, StableForLargeOffsetSamples) {
    // 1ms calls with ns jitter: large mean, small spread
    std::mt19937_64 rng(12345);
    std::uniform_real_distribution<double> jitter(0.0, 1000.0);

    std::vector<double> samples;
    samples.reserve(100000);
    for (int i = 0; i < 100000; ++i) {
        samples.push_back(1e6 + jitter(rng));
    }

    RunningStats stats;
    for (double x : samples) stats.add(x);

    double mean = 0.0;
    for (double x : samples) mean += x;
    mean /= samples.size();
    double m2 = 0.0;
    for (double x : samples) m2 += (x - mean) * (x - mean);
    double stddev = std::sqrt(m2 / (samples.size() - 1));

    EXPECT_NEAR(stats.mean(), mean, std::abs(mean) * 1e-9);
    EXPECT_NEAR(stats.sampleStdDev(), stddev, stddev * 1e-9);
}

TEST(RunningStats, MergeMatchesSequentialAdd) {
    RunningStats all;
    RunningStats left;
    RunningStats right;
    for (int i = 1; i <= 10; ++i) {
        all.add(i * 1.5);
        (i <= 4 ? left : right).add(i * 1.5);
    }
    left.merge(right);

    EXPECT_EQ(left.count(), all.count());
    EXPECT_NEAR(left.mean(), all.mean(), 1e-12);
    EXPECT_NEAR(left.sampleVariance(), all.sampleVariance(), 1e-9);
    EXPECT_DOUBLE_EQ(left.min(), all.min());
    EXPECT_DOUBLE_EQ(left.max(), all.max());
}

TEST(RunningStats, MergeWithEmpty) {
    RunningStats a;
    a.add(3.0);
    RunningStats empty;

    a.merge(empty);
    EXPECT_EQ(a.count(), 1u);

    empty.merge(a);
    EXPECT_EQ(empty.count(), 1u);
    EXPECT_DOUBLE_EQ(empty.mean(), 3.0);
}

// ============================================================================
// AGGREGATOR TESTS
// ============================================================================

TEST(StatsAggregator, AggregatesPerFunction) {
    StatsAggregator aggregator;
    aggregator.add(makeInterval("app!foo", 0, 2000));
    aggregator.add(makeInterval("app!foo", 5000, 8000));
    aggregator.add(makeInterval("app!foo", 9000, 13000));
    aggregator.add(makeInterval("app!bar", 0, 10));

    auto foo = aggregator.get("app!foo");
    ASSERT_TRUE(foo.has_value());
    EXPECT_EQ(foo->count, 3u);
    EXPECT_DOUBLE_EQ(foo->mean, 3000.0);
    EXPECT_DOUBLE_EQ(foo->min, 2000.0);
    EXPECT_DOUBLE_EQ(foo->max, 4000.0);
    EXPECT_DOUBLE_EQ(foo->sample_stddev, 1000.0);
    EXPECT_TRUE(foo->reliable());
    EXPECT_FALSE(foo->recursive());

    EXPECT_EQ(aggregator.functionCount(), 2u);
    EXPECT_EQ(aggregator.totalIntervals(), 4u);
    EXPECT_EQ(aggregator.callCount("app!bar"), 1u);
    EXPECT_EQ(aggregator.callCount("app!missing"), 0u);
    EXPECT_FALSE(aggregator.get("app!missing").has_value());
}

TEST(StatsAggregator, SnapshotIsSortedByFunctionId) {
    StatsAggregator aggregator;
    aggregator.add(makeInterval("libz!inflate", 0, 1));
    aggregator.add(makeInterval("app!main", 0, 1));
    aggregator.add(makeInterval("libc!memcpy", 0, 1));

    auto snapshot = aggregator.snapshot();
    ASSERT_EQ(snapshot.size(), 3u);
    EXPECT_EQ(snapshot[0].function_id, "app!main");
    EXPECT_EQ(snapshot[1].function_id, "libc!memcpy");
    EXPECT_EQ(snapshot[2].function_id, "libz!inflate");
}

TEST(StatsAggregator, SnapshotIsIdempotent) {
    StatsAggregator aggregator;
    aggregator.add(makeInterval("app!foo", 0, 7));
    aggregator.add(makeInterval("app!foo", 0, 11));

    auto first = aggregator.snapshot();
    auto second = aggregator.snapshot();
    ASSERT_EQ(first.size(), second.size());
    EXPECT_EQ(first[0].count, second[0].count);
    EXPECT_DOUBLE_EQ(first[0].mean, second[0].mean);
    EXPECT_DOUBLE_EQ(first[0].sample_stddev, second[0].sample_stddev);
}

TEST(StatsAggregator, RejectsInvalidInterval) {
    StatsAggregator aggregator;
    EXPECT_FALSE(aggregator.add(makeInterval("app!foo", 100, 50)));
    EXPECT_EQ(aggregator.rejectedIntervals(), 1u);
    EXPECT_EQ(aggregator.totalIntervals(), 0u);
    EXPECT_EQ(aggregator.callCount("app!foo"), 0u);
}

TEST(StatsAggregator, ZeroDurationIsValid) {
    StatsAggregator aggregator;
    EXPECT_TRUE(aggregator.add(makeInterval("app!inline", 10, 10)));
    EXPECT_DOUBLE_EQ(aggregator.get("app!inline")->mean, 0.0);
}

TEST(StatsAggregator, DiscardedFramesMarkFunctionUnreliable) {
    StatsAggregator aggregator;
    aggregator.onInterval(makeInterval("app!foo", 0, 10));
    aggregator.onDiscardedFrame("app!foo", 1);
    aggregator.onDiscardedFrame("app!lost", 1);

    auto foo = aggregator.get("app!foo");
    ASSERT_TRUE(foo.has_value());
    EXPECT_EQ(foo->count, 1u);
    EXPECT_EQ(foo->discarded_frames, 1u);
    EXPECT_FALSE(foo->reliable());

    // Function seen only through discarded frames still shows up
    auto lost = aggregator.get("app!lost");
    ASSERT_TRUE(lost.has_value());
    EXPECT_EQ(lost->count, 0u);
}

TEST(StatsAggregator, TracksMaxRecursionDepth) {
    StatsAggregator aggregator;
    aggregator.add(makeInterval("app!fib", 3, 4, 2));
    aggregator.add(makeInterval("app!fib", 2, 5, 1));
    aggregator.add(makeInterval("app!fib", 0, 9, 0));

    auto fib = aggregator.get("app!fib");
    ASSERT_TRUE(fib.has_value());
    EXPECT_EQ(fib->max_depth, 2u);
    EXPECT_TRUE(fib->recursive());
}

TEST(StatsAggregator, MergeAndReset) {
    StatsAggregator a;
    StatsAggregator b;
    a.add(makeInterval("app!foo", 0, 2));
    b.add(makeInterval("app!foo", 0, 4));
    b.onDiscardedFrame("app!foo", 2);

    a.merge(b);
    auto foo = a.get("app!foo");
    ASSERT_TRUE(foo.has_value());
    EXPECT_EQ(foo->count, 2u);
    EXPECT_DOUBLE_EQ(foo->mean, 3.0);
    EXPECT_EQ(foo->discarded_frames, 1u);
    EXPECT_EQ(a.totalIntervals(), 2u);

    a.reset();
    EXPECT_EQ(a.functionCount(), 0u);
    EXPECT_EQ(a.totalIntervals(), 0u);
}
