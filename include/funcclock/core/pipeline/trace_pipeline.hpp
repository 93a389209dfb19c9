#pragma once

#include <funcclock/core/ingest/event_source.hpp>
#include <funcclock/core/ingest/function_filter.hpp>
#include <funcclock/core/normalizer/event_normalizer.hpp>
#include <funcclock/core/correlator/call_correlator.hpp>
#include <funcclock/core/diagnostics/trace_diagnostics.hpp>
#include <funcclock/core/stats/function_stats.hpp>
#include <atomic>
#include <cstdint>
#include <vector>

namespace FuncClock {

/**
 * @struct PipelineResult
 * @brief Everything a run hands back to the caller
 */
struct PipelineResult {
    std::vector<FunctionStats> functions;             // Ordered by function id
    DiagnosticsSummary diagnostics;
    std::vector<DiagnosticRecord> recent_diagnostics; // Newest first

    uint64_t records_read = 0;
    uint64_t events_correlated = 0;
    uint64_t intervals = 0;
    bool stopped_early = false;
};

/**
 * @class TracePipeline
 * @brief Drives Source -> Normalizer -> Correlator -> Aggregator
 *
 * Every run() builds a fresh normalizer, correlator, aggregator and
 * diagnostics set, feeds the whole source through them on the calling
 * thread, drains, and returns the snapshot. Nothing survives between runs.
 *
 * Only SourceError escapes run(); every per-record problem ends up in
 * PipelineResult::diagnostics.
 */
class TracePipeline {
public:
    /**
     * @brief Settings for the per-run components
     */
    struct Settings {
        NormalizerConfig normalizer;
        CorrelatorConfig correlator;
        FunctionFilter filter;
        size_t max_stored_diagnostics = TraceDiagnostics::DEFAULT_MAX_STORED_RECORDS;
        size_t max_logged_per_kind = TraceDiagnostics::DEFAULT_MAX_LOGGED_PER_KIND;
    };

    TracePipeline();
    explicit TracePipeline(Settings settings);

    /**
     * @brief Process the source to end of stream (or until stop is set)
     * @param source Raw record producer
     * @param stop Optional external termination flag, checked between records
     * @throws SourceError if the source fails
     */
    PipelineResult run(EventSource& source, const std::atomic<bool>* stop = nullptr) const;

    /**
     * @brief Correlate and aggregate already-canonical events
     *
     * The events still pass through the reorder buffer.
     */
    PipelineResult run(const std::vector<ProbeEvent>& events) const;

    const Settings& settings() const { return settings_; }

private:
    Settings settings_;
};

} // namespace FuncClock
