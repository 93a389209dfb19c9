#include <funcclock/core/pipeline/trace_pipeline.hpp>
#include <funcclock/core/stats/stats_aggregator.hpp>
#include <spdlog/spdlog.h>

namespace FuncClock {

namespace {

// Components of a single run; member order is construction order.
struct RunContext {
    TraceDiagnostics diagnostics;
    StatsAggregator aggregator;
    CallCorrelator correlator;
    EventNormalizer normalizer;
    std::vector<ProbeEvent> ready;
    size_t max_recent;

    explicit RunContext(const TracePipeline::Settings& s)
        : diagnostics(s.max_stored_diagnostics, s.max_logged_per_kind)
        , correlator(aggregator, diagnostics, s.correlator)
        , normalizer(s.normalizer, diagnostics, s.filter)
        , max_recent(s.max_stored_diagnostics) {
        ready.reserve(256);
    }

    void correlateReady() {
        for (const auto& event : ready) {
            correlator.process(event);
        }
        ready.clear();
    }

    PipelineResult finish(uint64_t records_read, bool stopped_early) {
        normalizer.finish(ready);
        correlateReady();
        correlator.finish();

        PipelineResult result;
        result.functions = aggregator.snapshot();
        result.diagnostics = diagnostics.summary();
        result.recent_diagnostics = diagnostics.getRecentRecords(max_recent);
        result.records_read = records_read;
        result.events_correlated = correlator.eventsProcessed();
        result.intervals = aggregator.totalIntervals();
        result.stopped_early = stopped_early;

        spdlog::info("[Pipeline] {} records, {} events correlated, {} intervals, {} functions",
                     result.records_read, result.events_correlated,
                     result.intervals, result.functions.size());
        diagnostics.logSummary();
        return result;
    }
};

} // anonymous namespace

TracePipeline::TracePipeline()
    : TracePipeline(Settings{}) {}

TracePipeline::TracePipeline(Settings settings)
    : settings_(std::move(settings)) {
    spdlog::debug("[Pipeline] Initialized with settings:");
    spdlog::debug("  - Max clock skew: {}ns", settings_.normalizer.max_clock_skew_ns);
    spdlog::debug("  - Max buffered events: {}", settings_.normalizer.max_buffered_events);
    spdlog::debug("  - Max stack depth: {}", settings_.correlator.max_stack_depth);
    spdlog::debug("  - Function filter: {} include, {} exclude",
                  settings_.filter.includePatterns().size(),
                  settings_.filter.excludePatterns().size());
}

PipelineResult TracePipeline::run(EventSource& source, const std::atomic<bool>* stop) const {
    spdlog::info("[Pipeline] Processing trace from {}", source.name());

    RunContext ctx(settings_);
    uint64_t records_read = 0;
    bool stopped_early = false;

    RawRecord record;
    while (source.next(record)) {
        ++records_read;
        ctx.normalizer.push(record, ctx.ready);
        ctx.correlateReady();

        if (stop && stop->load(std::memory_order_acquire)) {
            spdlog::warn("[Pipeline] Stop requested after {} records, draining", records_read);
            stopped_early = true;
            break;
        }
    }

    return ctx.finish(records_read, stopped_early);
}

PipelineResult TracePipeline::run(const std::vector<ProbeEvent>& events) const {
    RunContext ctx(settings_);

    for (const auto& event : events) {
        ctx.normalizer.push(event, ctx.ready);
        ctx.correlateReady();
    }

    return ctx.finish(events.size(), false);
}

} // namespace FuncClock
