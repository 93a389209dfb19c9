#include <funcclock/core/diagnostics/trace_diagnostics.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <numeric>

namespace FuncClock {

const char* toString(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::MALFORMED_RECORD:   return "MalformedRecord";
        case DiagnosticKind::OUT_OF_ORDER_EVENT: return "OutOfOrderEvent";
        case DiagnosticKind::ORPHAN_EXIT:        return "OrphanExit";
        case DiagnosticKind::UNTERMINATED_CALL:  return "UnterminatedCall";
        case DiagnosticKind::NEGATIVE_DURATION:  return "NegativeDuration";
        case DiagnosticKind::MISMATCHED_FRAME:   return "MismatchedFrame";
    }
    return "Unknown";
}

uint64_t DiagnosticsSummary::total() const {
    return std::accumulate(counts.begin(), counts.end(), uint64_t{0});
}

TraceDiagnostics::TraceDiagnostics(size_t max_stored_records, size_t max_logged_per_kind)
    : max_stored_records_(max_stored_records)
    , max_logged_per_kind_(max_logged_per_kind) {}

void TraceDiagnostics::record(DiagnosticKind kind,
                              const FunctionId& function_id,
                              ContextId context,
                              TimestampNs timestamp,
                              std::string detail) {
    uint64_t seen = ++counts_[static_cast<size_t>(kind)];

    if (seen <= max_logged_per_kind_) {
        spdlog::warn("[Diagnostics] {} fn={} ctx={} ts={}: {}",
                     toString(kind), function_id.empty() ? "-" : function_id,
                     context, timestamp, detail);
        if (seen == max_logged_per_kind_) {
            spdlog::warn("[Diagnostics] Further {} diagnostics logged at debug level only",
                         toString(kind));
        }
    } else {
        spdlog::debug("[Diagnostics] {} fn={} ctx={} ts={}: {}",
                      toString(kind), function_id, context, timestamp, detail);
    }

    if (max_stored_records_ == 0) return;

    // Ring buffer: remove oldest if at capacity
    if (stored_.size() >= max_stored_records_) {
        stored_.pop_front();
    }
    stored_.push_back(DiagnosticRecord{kind, function_id, context, timestamp, std::move(detail)});
}

std::vector<DiagnosticRecord> TraceDiagnostics::getRecentRecords(size_t max_count) const {
    std::vector<DiagnosticRecord> result;
    size_t count = std::min(max_count, stored_.size());
    result.reserve(count);

    // Newest first
    auto it = stored_.rbegin();
    for (size_t i = 0; i < count && it != stored_.rend(); ++i, ++it) {
        result.push_back(*it);
    }
    return result;
}

DiagnosticsSummary TraceDiagnostics::summary() const {
    DiagnosticsSummary s;
    s.counts = counts_;
    s.filtered = filtered_;
    return s;
}

void TraceDiagnostics::logSummary() const {
    auto s = summary();
    if (s.total() == 0) {
        spdlog::info("[Diagnostics] Trace clean: no diagnostics ({} filtered)", s.filtered);
        return;
    }
    for (size_t i = 0; i < kDiagnosticKindCount; ++i) {
        if (s.counts[i] == 0) continue;
        spdlog::warn("[Diagnostics] {}: {}", toString(static_cast<DiagnosticKind>(i)), s.counts[i]);
    }
    if (s.filtered > 0) {
        spdlog::info("[Diagnostics] Filtered records: {}", s.filtered);
    }
}

void TraceDiagnostics::clear() {
    counts_.fill(0);
    filtered_ = 0;
    stored_.clear();
    spdlog::debug("[Diagnostics] Cleared");
}

} // namespace FuncClock
