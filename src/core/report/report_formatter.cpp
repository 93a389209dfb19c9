#include <funcclock/core/report/report_formatter.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace FuncClock {

TimeUnit parseTimeUnit(const std::string& text) {
    if (text == "ns") return TimeUnit::NS;
    if (text == "us") return TimeUnit::US;
    if (text == "ms") return TimeUnit::MS;
    if (text == "s")  return TimeUnit::S;
    throw std::runtime_error(fmt::format("Unknown time unit '{}' (expected ns, us, ms or s)", text));
}

const char* unitName(TimeUnit unit) {
    switch (unit) {
        case TimeUnit::NS: return "nanoseconds";
        case TimeUnit::US: return "microseconds";
        case TimeUnit::MS: return "milliseconds";
        case TimeUnit::S:  return "seconds";
    }
    return "nanoseconds";
}

double unitDivisor(TimeUnit unit) {
    switch (unit) {
        case TimeUnit::NS: return 1.0;
        case TimeUnit::US: return 1e3;
        case TimeUnit::MS: return 1e6;
        case TimeUnit::S:  return 1e9;
    }
    return 1.0;
}

ReportFormatter::ReportFormatter(ReportOptions options)
    : options_(options) {
    if (options_.precision < 0)
        throw std::invalid_argument("report precision must not be negative");
}

std::string ReportFormatter::formatValue(double ns) const {
    return fmt::format("{:.{}f}", ns / unitDivisor(options_.unit), options_.precision);
}

std::string ReportFormatter::formatRow(const FunctionStats& s) const {
    if (s.count == 0) {
        return fmt::format("{} - - - - 0", s.function_id);
    }
    if (!s.reliable()) {
        return fmt::format("{} {} - - - {}", s.function_id, formatValue(s.mean), s.count);
    }
    return fmt::format("{} {} {} {} {} {}",
                       s.function_id,
                       formatValue(s.mean),
                       formatValue(s.min),
                       formatValue(s.max),
                       formatValue(s.sample_stddev),
                       s.count);
}

std::string ReportFormatter::formatDiagnostics(const DiagnosticsSummary& d) const {
    std::string out = "## Diagnostics\n";
    for (size_t i = 0; i < kDiagnosticKindCount; ++i) {
        out += fmt::format("# {} {}\n", toString(static_cast<DiagnosticKind>(i)), d.counts[i]);
    }
    out += fmt::format("# Filtered {}\n", d.filtered);
    return out;
}

void ReportFormatter::write(std::ostream& os,
                            const std::vector<FunctionStats>& stats,
                            const DiagnosticsSummary* diagnostics) const {
    os << "# function mean min max stdev Ncalls\n";
    os << "## All timings in " << unitName(options_.unit) << "\n";
    for (const auto& s : stats) {
        os << formatRow(s) << "\n";
    }
    if (diagnostics && options_.include_diagnostics) {
        os << formatDiagnostics(*diagnostics);
    }
    os.flush();
}

} // namespace FuncClock
