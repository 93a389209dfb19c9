#include <funcclock/core/normalizer/event_normalizer.hpp>
#include <funcclock/core/ingest/record_parser.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace FuncClock {

EventNormalizer::EventNormalizer(const NormalizerConfig& config,
                                 TraceDiagnostics& diagnostics,
                                 FunctionFilter filter)
    : config_(config)
    , diagnostics_(diagnostics)
    , filter_(std::move(filter)) {
    if (config_.max_buffered_events == 0)
        throw std::invalid_argument("max_buffered_events must be greater than 0");

    spdlog::debug("[Normalizer] Initialized (skew: {}ns, max buffered: {})",
                  config_.max_clock_skew_ns, config_.max_buffered_events);
}

void EventNormalizer::push(const RawRecord& record, std::vector<ProbeEvent>& ready) {
    if (finished_)
        throw std::logic_error("EventNormalizer: push() after finish()");

    ProbeEvent event;
    try {
        auto parsed = parseEventName(record.event_name);
        event.function_id = std::move(parsed.function_id);
        event.kind = parsed.kind;
        event.timestamp = parseTimestamp(record.timestamp);
        event.context = parseContext(record.context);
    } catch (const std::runtime_error& e) {
        diagnostics_.record(DiagnosticKind::MALFORMED_RECORD, "", 0, 0,
                            fmt::format("line {}: {}", record.line, e.what()));
        return;
    }

    push(std::move(event), ready);
}

void EventNormalizer::push(ProbeEvent event, std::vector<ProbeEvent>& ready) {
    if (finished_)
        throw std::logic_error("EventNormalizer: push() after finish()");

    if (!filter_.accepts(event.function_id)) {
        diagnostics_.recordFiltered();
        return;
    }

    if (max_seen_ > event.timestamp && max_seen_ - event.timestamp > config_.max_clock_skew_ns) {
        diagnostics_.record(DiagnosticKind::OUT_OF_ORDER_EVENT,
                            event.function_id, event.context, event.timestamp,
                            fmt::format("{} is {}ns behind the newest event (skew limit {}ns)",
                                        toString(event.kind), max_seen_ - event.timestamp,
                                        config_.max_clock_skew_ns));
        return;
    }

    // Forced releases can move the watermark closer than the skew window
    if (last_released_ && event.timestamp < *last_released_) {
        diagnostics_.record(DiagnosticKind::OUT_OF_ORDER_EVENT,
                            event.function_id, event.context, event.timestamp,
                            fmt::format("{} is {}ns older than the last released event",
                                        toString(event.kind), *last_released_ - event.timestamp));
        return;
    }

    ++accepted_;
    max_seen_ = std::max(max_seen_, event.timestamp);
    heap_.push(Pending{std::move(event), next_seq_++});

    releaseReady(ready);
}

void EventNormalizer::finish(std::vector<ProbeEvent>& ready) {
    if (finished_) return;
    finished_ = true;

    while (!heap_.empty()) {
        releaseTop(ready);
    }
    spdlog::debug("[Normalizer] Finished: {} accepted, {} released, {} forced",
                  accepted_, released_, forced_releases_);
}

void EventNormalizer::releaseReady(std::vector<ProbeEvent>& ready) {
    while (!heap_.empty()) {
        const TimestampNs ts = heap_.top().event.timestamp;
        if (max_seen_ - ts >= config_.max_clock_skew_ns) {
            releaseTop(ready);
        } else if (heap_.size() > config_.max_buffered_events) {
            ++forced_releases_;
            releaseTop(ready);
        } else {
            break;
        }
    }
}

void EventNormalizer::releaseTop(std::vector<ProbeEvent>& ready) {
    ProbeEvent event = heap_.top().event;
    heap_.pop();

    last_released_ = event.timestamp;
    ++released_;
    ready.push_back(std::move(event));
}

} // namespace FuncClock
