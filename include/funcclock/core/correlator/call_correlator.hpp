#pragma once

#include <funcclock/core/events/probe_event.hpp>
#include <funcclock/core/events/interval_sink.hpp>
#include <funcclock/core/diagnostics/trace_diagnostics.hpp>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace FuncClock {

struct CorrelatorConfig {
    // Per-context open frame limit; the oldest frame is dropped beyond it
    size_t max_stack_depth = 4096;
};

/**
 * @class CallCorrelator
 * @brief Matches entry and exit crossings into call intervals
 *
 * Keeps one stack of open (function, entry time) frames per execution
 * context. Contexts never share a stack, so concurrent threads are timed
 * independently.
 *
 * - Entry: push onto the context's stack.
 * - Exit matching the top: pop, emit the interval.
 * - Exit not matching the top: pop and discard frames (MISMATCHED_FRAME each)
 *   until the function is found or the stack is empty. Nothing found means
 *   ORPHAN_EXIT. Orphans are never matched later.
 * - Exit earlier than its entry: NEGATIVE_DURATION, frame discarded, no
 *   interval.
 * - finish(): every frame still open is an UNTERMINATED_CALL.
 *
 * Recursive calls are matched innermost first. Discarded frames never
 * shorten or stretch an interval that does get matched, so count and mean of
 * matched calls stay exact under probe loss; only coverage drops.
 *
 * Expects events in non-decreasing timestamp order per context.
 * Single-threaded, no locking.
 */
class CallCorrelator {
public:
    CallCorrelator(IntervalSink& sink,
                   TraceDiagnostics& diagnostics,
                   CorrelatorConfig config = CorrelatorConfig());

    void process(const ProbeEvent& event);

    /**
     * @brief Drain all open frames as unterminated calls
     *
     * Safe to call more than once.
     */
    void finish();

    size_t openContexts() const;
    size_t openFrames() const;
    uint64_t intervalsEmitted() const { return intervals_emitted_; }
    uint64_t eventsProcessed() const { return events_processed_; }

private:
    struct OpenFrame {
        FunctionId function_id;
        TimestampNs entry_ns;
        uint32_t depth;
    };

    struct ContextState {
        std::vector<OpenFrame> frames;
        // Open frame count per function, gives the recursion depth in O(1)
        std::unordered_map<FunctionId, uint32_t> open_count;
    };

    void onEntry(ContextState& state, const ProbeEvent& event);
    void onExit(ContextState& state, const ProbeEvent& event);
    OpenFrame popFrame(ContextState& state);
    void discardFrame(const OpenFrame& frame, ContextId context,
                      DiagnosticKind kind, TimestampNs at, std::string detail);
    void orphanExit(const ProbeEvent& event, const char* reason);

    IntervalSink& sink_;
    TraceDiagnostics& diagnostics_;
    CorrelatorConfig config_;

    std::unordered_map<ContextId, ContextState> contexts_;

    uint64_t events_processed_ = 0;
    uint64_t intervals_emitted_ = 0;
};

} // namespace FuncClock
