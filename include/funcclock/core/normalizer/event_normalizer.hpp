#pragma once

#include <funcclock/core/events/probe_event.hpp>
#include <funcclock/core/diagnostics/trace_diagnostics.hpp>
#include <funcclock/core/ingest/function_filter.hpp>
#include <cstdint>
#include <optional>
#include <queue>
#include <vector>

namespace FuncClock {

struct NormalizerConfig {
    // Largest expected disagreement between per-CPU clocks
    uint64_t max_clock_skew_ns = 1'000'000;

    // Hard cap on held events; the oldest is released early past this
    size_t max_buffered_events = 65536;
};

/**
 * @class EventNormalizer
 * @brief Validates raw records and releases them in timestamp order
 *
 * Events are held in a reorder buffer (min-heap on timestamp, ties broken by
 * arrival order) until the newest timestamp seen is at least
 * max_clock_skew_ns past them. An event more than max_clock_skew_ns behind
 * the newest timestamp seen, or older than one already released, is counted
 * as OUT_OF_ORDER_EVENT and skipped.
 *
 * The output sequence is finite and non-restartable: after finish() any
 * further push() throws std::logic_error.
 */
class EventNormalizer {
public:
    EventNormalizer(const NormalizerConfig& config,
                    TraceDiagnostics& diagnostics,
                    FunctionFilter filter = FunctionFilter());

    /**
     * @brief Validate one record and append any events it releases
     * @param record Raw record from the source
     * @param ready Output, events appended in timestamp order
     */
    void push(const RawRecord& record, std::vector<ProbeEvent>& ready);

    /**
     * @brief Accept an already-parsed event (bypasses text validation)
     */
    void push(ProbeEvent event, std::vector<ProbeEvent>& ready);

    /**
     * @brief Release everything still buffered and close the stream
     */
    void finish(std::vector<ProbeEvent>& ready);

    size_t buffered() const { return heap_.size(); }
    bool finished() const { return finished_; }
    uint64_t accepted() const { return accepted_; }
    uint64_t released() const { return released_; }
    uint64_t forcedReleases() const { return forced_releases_; }

private:
    struct Pending {
        ProbeEvent event;
        uint64_t seq;
    };

    // Min-heap ordering for std::priority_queue
    struct Later {
        bool operator()(const Pending& a, const Pending& b) const {
            if (a.event.timestamp != b.event.timestamp)
                return a.event.timestamp > b.event.timestamp;
            return a.seq > b.seq;
        }
    };

    void releaseReady(std::vector<ProbeEvent>& ready);
    void releaseTop(std::vector<ProbeEvent>& ready);

    NormalizerConfig config_;
    TraceDiagnostics& diagnostics_;
    FunctionFilter filter_;

    std::priority_queue<Pending, std::vector<Pending>, Later> heap_;
    std::optional<TimestampNs> last_released_;
    TimestampNs max_seen_ = 0;
    uint64_t next_seq_ = 0;
    bool finished_ = false;

    uint64_t accepted_ = 0;
    uint64_t released_ = 0;
    uint64_t forced_releases_ = 0;
};

} // namespace FuncClock
