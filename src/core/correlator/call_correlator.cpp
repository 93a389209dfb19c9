#include <funcclock/core/correlator/call_correlator.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace FuncClock {

CallCorrelator::CallCorrelator(IntervalSink& sink,
                               TraceDiagnostics& diagnostics,
                               CorrelatorConfig config)
    : sink_(sink)
    , diagnostics_(diagnostics)
    , config_(config) {
    if (config_.max_stack_depth == 0)
        throw std::invalid_argument("max_stack_depth must be greater than 0");
}

void CallCorrelator::process(const ProbeEvent& event) {
    ++events_processed_;

    if (event.kind == ProbeKind::ENTRY) {
        onEntry(contexts_[event.context], event);
        return;
    }

    auto it = contexts_.find(event.context);
    if (it == contexts_.end()) {
        orphanExit(event, "no entry seen in this context");
        return;
    }
    onExit(it->second, event);
}

void CallCorrelator::onEntry(ContextState& state, const ProbeEvent& event) {
    if (state.frames.size() >= config_.max_stack_depth) {
        OpenFrame oldest = std::move(state.frames.front());
        state.frames.erase(state.frames.begin());
        auto it = state.open_count.find(oldest.function_id);
        if (it != state.open_count.end() && --it->second == 0) {
            state.open_count.erase(it);
        }
        discardFrame(oldest, event.context, DiagnosticKind::MISMATCHED_FRAME, event.timestamp,
                     fmt::format("stack depth limit {} reached", config_.max_stack_depth));
    }

    uint32_t& open = state.open_count[event.function_id];
    state.frames.push_back(OpenFrame{event.function_id, event.timestamp, open});
    ++open;
}

void CallCorrelator::onExit(ContextState& state, const ProbeEvent& event) {
    if (state.frames.empty()) {
        orphanExit(event, "empty stack");
        return;
    }

    while (!state.frames.empty()) {
        OpenFrame frame = popFrame(state);

        if (frame.function_id != event.function_id) {
            discardFrame(frame, event.context, DiagnosticKind::MISMATCHED_FRAME, event.timestamp,
                         fmt::format("entry at {} popped by exit of {}", frame.entry_ns, event.function_id));
            continue;
        }

        if (event.timestamp < frame.entry_ns) {
            discardFrame(frame, event.context, DiagnosticKind::NEGATIVE_DURATION, event.timestamp,
                         fmt::format("exit at {} precedes entry at {}", event.timestamp, frame.entry_ns));
            return;
        }

        CallInterval interval;
        interval.function_id = std::move(frame.function_id);
        interval.context = event.context;
        interval.start_ns = frame.entry_ns;
        interval.end_ns = event.timestamp;
        interval.depth = frame.depth;

        ++intervals_emitted_;
        sink_.onInterval(interval);
        return;
    }

    orphanExit(event, "no matching entry on the stack");
}

CallCorrelator::OpenFrame CallCorrelator::popFrame(ContextState& state) {
    OpenFrame frame = std::move(state.frames.back());
    state.frames.pop_back();

    auto it = state.open_count.find(frame.function_id);
    if (it != state.open_count.end() && --it->second == 0) {
        state.open_count.erase(it);
    }
    return frame;
}

void CallCorrelator::discardFrame(const OpenFrame& frame, ContextId context,
                                  DiagnosticKind kind, TimestampNs at, std::string detail) {
    diagnostics_.record(kind, frame.function_id, context, at, std::move(detail));
    sink_.onDiscardedFrame(frame.function_id, context);
}

void CallCorrelator::orphanExit(const ProbeEvent& event, const char* reason) {
    diagnostics_.record(DiagnosticKind::ORPHAN_EXIT, event.function_id,
                        event.context, event.timestamp, reason);
}

void CallCorrelator::finish() {
    std::vector<ContextId> open_ids;
    for (const auto& [id, state] : contexts_) {
        if (!state.frames.empty()) open_ids.push_back(id);
    }
    std::sort(open_ids.begin(), open_ids.end());

    for (ContextId id : open_ids) {
        ContextState& state = contexts_[id];
        spdlog::warn("[Correlator] Context {} ended with {} open calls", id, state.frames.size());

        while (!state.frames.empty()) {
            OpenFrame frame = popFrame(state);
            discardFrame(frame, id, DiagnosticKind::UNTERMINATED_CALL, frame.entry_ns,
                         "no exit before end of stream");
        }
    }

    contexts_.clear();
}

size_t CallCorrelator::openContexts() const {
    return static_cast<size_t>(std::count_if(contexts_.begin(), contexts_.end(),
        [](const auto& entry) { return !entry.second.frames.empty(); }));
}

size_t CallCorrelator::openFrames() const {
    size_t total = 0;
    for (const auto& [id, state] : contexts_) {
        total += state.frames.size();
    }
    return total;
}

} // namespace FuncClock
