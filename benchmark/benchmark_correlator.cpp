// ============================================================================
// FUNCCLOCK - CORRELATION THROUGHPUT BENCHMARK
// ============================================================================
// Measures how fast the single-threaded core turns a synthetic trace into
// statistics:
//   [1] Correlator + Aggregator only (events already ordered)
//   [2] Full pipeline (reorder buffer + correlator + aggregator)
//   [3] Text parsing of perf script lines
//
// Usage: ./funcclock_benchmark [events_per_context] [contexts]
// ============================================================================

#include <funcclock/core/correlator/call_correlator.hpp>
#include <funcclock/core/ingest/record_parser.hpp>
#include <funcclock/core/pipeline/trace_pipeline.hpp>
#include <funcclock/core/stats/stats_aggregator.hpp>
#include <funcclock/core/utils/clock.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using FuncClock::Clock;
using FuncClock::ProbeEvent;
using FuncClock::ProbeKind;

// ============================================================================
// SYNTHETIC TRACE
// ============================================================================

// Each context runs outer() -> middle() -> leaf() repeatedly, with contexts
// interleaved round-robin so the global stream is time ordered.
static std::vector<ProbeEvent> buildTrace(size_t calls_per_context, size_t contexts) {
    static const char* kFunctions[] = {"libbench!outer", "libbench!middle", "libbench!leaf"};

    std::vector<ProbeEvent> events;
    events.reserve(calls_per_context * contexts * 6);

    uint64_t ts = 1'000'000;
    for (size_t call = 0; call < calls_per_context; ++call) {
        for (size_t ctx = 0; ctx < contexts; ++ctx) {
            for (const char* fn : kFunctions) {
                events.emplace_back(ts++, fn, 1000 + ctx, ProbeKind::ENTRY);
            }
            for (size_t i = 3; i-- > 0; ) {
                ts += 1 + (call % 7);
                events.emplace_back(ts, kFunctions[i], 1000 + ctx, ProbeKind::EXIT);
            }
        }
    }
    return events;
}

static void printThroughput(const char* label, size_t ops, uint64_t elapsed_ns) {
    double sec = elapsed_ns / 1e9;
    std::cout << "  " << std::left << std::setw(22) << label
              << std::right << std::fixed << std::setprecision(2)
              << (ops / sec) / 1e6 << " M events/sec  ("
              << std::setprecision(1) << (elapsed_ns / static_cast<double>(ops)) << " ns/event)"
              << std::endl;
}

// ============================================================================
// BENCHMARK 1: CORRELATOR + AGGREGATOR
// ============================================================================

static void benchmarkCorrelator(const std::vector<ProbeEvent>& events) {
    std::cout << "\n[1] Correlator + Aggregator" << std::endl;
    std::cout << std::string(50, '-') << std::endl;

    FuncClock::TraceDiagnostics diagnostics;
    FuncClock::StatsAggregator aggregator;
    FuncClock::CallCorrelator correlator(aggregator, diagnostics);

    uint64_t start = Clock::now_ns();
    for (const auto& event : events) {
        correlator.process(event);
    }
    correlator.finish();
    uint64_t elapsed = Clock::now_ns() - start;

    printThroughput("Correlate", events.size(), elapsed);
    std::cout << "  Intervals: " << aggregator.totalIntervals()
              << ", functions: " << aggregator.functionCount() << std::endl;
}

// ============================================================================
// BENCHMARK 2: FULL PIPELINE
// ============================================================================

static void benchmarkPipeline(const std::vector<ProbeEvent>& events) {
    std::cout << "\n[2] Full pipeline (reorder window 1ms)" << std::endl;
    std::cout << std::string(50, '-') << std::endl;

    FuncClock::TracePipeline pipeline;

    uint64_t start = Clock::now_ns();
    auto result = pipeline.run(events);
    uint64_t elapsed = Clock::now_ns() - start;

    printThroughput("Pipeline", events.size(), elapsed);
    for (const auto& fs : result.functions) {
        std::cout << "  " << std::left << std::setw(18) << fs.function_id
                  << " n=" << fs.count
                  << " mean=" << std::setprecision(2) << fs.mean << "ns" << std::endl;
    }
}

// ============================================================================
// BENCHMARK 3: TEXT PARSING
// ============================================================================

static void benchmarkParsing(size_t lines) {
    std::cout << "\n[3] perf script line parsing" << std::endl;
    std::cout << std::string(50, '-') << std::endl;

    const std::string line =
        "       bench-app  4242 [003]  5123.456789123: probe_libbench:middle_ret: (55d0c0a01234 <- 55d0c0a05678)";

    uint64_t checksum = 0;
    uint64_t start = Clock::now_ns();
    for (size_t i = 0; i < lines; ++i) {
        auto rec = splitPerfScriptLine(line, i);
        auto name = parseEventName(rec.event_name);
        checksum += parseTimestamp(rec.timestamp) + parseContext(rec.context) + name.function_id.size();
    }
    uint64_t elapsed = Clock::now_ns() - start;

    printThroughput("Parse", lines, elapsed);
    std::cout << "  Checksum: " << checksum << std::endl;
}

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);

    size_t calls_per_context = argc > 1 ? std::strtoull(argv[1], nullptr, 10) : 200000;
    size_t contexts = argc > 2 ? std::strtoull(argv[2], nullptr, 10) : 8;
    if (calls_per_context == 0 || contexts == 0) {
        std::cerr << "Usage: " << argv[0] << " [calls_per_context] [contexts]" << std::endl;
        return EXIT_FAILURE;
    }

    std::cout << std::string(60, '=') << std::endl;
    std::cout << "  FUNCCLOCK CORRELATION BENCHMARK" << std::endl;
    std::cout << "  " << calls_per_context << " calls x " << contexts << " contexts" << std::endl;
    std::cout << std::string(60, '=') << std::endl;

    auto events = buildTrace(calls_per_context, contexts);
    std::cout << "  Trace: " << events.size() << " events" << std::endl;

    benchmarkCorrelator(events);
    benchmarkPipeline(events);
    benchmarkParsing(1'000'000);

    return EXIT_SUCCESS;
}
