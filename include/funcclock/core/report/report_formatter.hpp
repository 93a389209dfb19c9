#pragma once

#include <funcclock/core/stats/function_stats.hpp>
#include <funcclock/core/diagnostics/trace_diagnostics.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace FuncClock {

enum class TimeUnit {
    NS = 0,
    US = 1,
    MS = 2,
    S = 3
};

/**
 * @brief Parse "ns", "us", "ms" or "s"
 * @throws std::runtime_error for anything else
 */
TimeUnit parseTimeUnit(const std::string& text);

const char* unitName(TimeUnit unit);

// Nanoseconds per unit
double unitDivisor(TimeUnit unit);

struct ReportOptions {
    TimeUnit unit = TimeUnit::S;
    int precision = 9;
    bool include_diagnostics = true;
};

/**
 * @class ReportFormatter
 * @brief Renders the statistics table as plain text
 *
 *   # function mean min max stdev Ncalls
 *   ## All timings in seconds
 *   libfoo!bar 0.000001200 0.000001000 0.000001500 0.000000200 3
 *
 * Functions with discarded frames print '-' for min/max/stdev; functions
 * without a single matched call print '-' for every value.
 */
class ReportFormatter {
public:
    explicit ReportFormatter(ReportOptions options = ReportOptions());

    void write(std::ostream& os,
               const std::vector<FunctionStats>& stats,
               const DiagnosticsSummary* diagnostics = nullptr) const;

    std::string formatRow(const FunctionStats& stats) const;
    std::string formatDiagnostics(const DiagnosticsSummary& diagnostics) const;

private:
    std::string formatValue(double ns) const;

    ReportOptions options_;
};

} // namespace FuncClock
