#pragma once

#include <funcclock/core/events/probe_event.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

namespace FuncClock {

/**
 * @enum DiagnosticKind
 * @brief Non-fatal trace problems, each counted separately
 */
enum class DiagnosticKind : uint8_t {
    MALFORMED_RECORD = 0,    // Unparsable raw record, skipped
    OUT_OF_ORDER_EVENT = 1,  // Older than the reorder window allows, skipped
    ORPHAN_EXIT = 2,         // Exit with no matching open entry, discarded
    UNTERMINATED_CALL = 3,   // Entry still open at end of stream, discarded
    NEGATIVE_DURATION = 4,   // Exit earlier than its entry, excluded
    MISMATCHED_FRAME = 5     // Open entry popped during mismatch recovery
};

constexpr size_t kDiagnosticKindCount = 6;

const char* toString(DiagnosticKind kind);

/**
 * @struct DiagnosticRecord
 * @brief One stored diagnostic (function_id is empty for malformed records)
 */
struct DiagnosticRecord {
    DiagnosticKind kind;
    FunctionId function_id;
    ContextId context = 0;
    TimestampNs timestamp = 0;
    std::string detail;
};

/**
 * @struct DiagnosticsSummary
 * @brief Per-kind counts, handed to the caller with the statistics table
 */
struct DiagnosticsSummary {
    std::array<uint64_t, kDiagnosticKindCount> counts{};
    uint64_t filtered = 0;

    uint64_t count(DiagnosticKind kind) const {
        return counts[static_cast<size_t>(kind)];
    }

    uint64_t total() const;
};

/**
 * @class TraceDiagnostics
 * @brief Collects every non-fatal problem seen while processing a trace
 *
 * Features:
 * - Exact count per DiagnosticKind
 * - Keeps the most recent N records for inspection (ring buffer)
 * - Logs the first few occurrences of each kind at warn level, the rest
 *   at debug level, so a badly broken trace does not flood the log
 *
 * One instance per pipeline run; not thread-safe.
 */
class TraceDiagnostics {
public:
    static constexpr size_t DEFAULT_MAX_STORED_RECORDS = 1000;
    static constexpr size_t DEFAULT_MAX_LOGGED_PER_KIND = 10;

    explicit TraceDiagnostics(size_t max_stored_records = DEFAULT_MAX_STORED_RECORDS,
                              size_t max_logged_per_kind = DEFAULT_MAX_LOGGED_PER_KIND);

    /**
     * @brief Count and store one diagnostic
     */
    void record(DiagnosticKind kind,
                const FunctionId& function_id,
                ContextId context,
                TimestampNs timestamp,
                std::string detail);

    /**
     * @brief Count a record dropped by the function filter
     */
    void recordFiltered() { ++filtered_; }

    uint64_t count(DiagnosticKind kind) const {
        return counts_[static_cast<size_t>(kind)];
    }

    uint64_t filtered() const { return filtered_; }

    /**
     * @brief Get count of currently stored records
     */
    size_t size() const { return stored_.size(); }

    /**
     * @brief Get recent diagnostics (newest first)
     */
    std::vector<DiagnosticRecord> getRecentRecords(size_t max_count = 100) const;

    DiagnosticsSummary summary() const;

    /**
     * @brief Log one line per non-zero kind
     */
    void logSummary() const;

    void clear();

private:
    size_t max_stored_records_;
    size_t max_logged_per_kind_;
    std::array<uint64_t, kDiagnosticKindCount> counts_{};
    uint64_t filtered_ = 0;
    std::deque<DiagnosticRecord> stored_;
};

} // namespace FuncClock
