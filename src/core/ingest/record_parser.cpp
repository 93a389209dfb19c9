#include <funcclock/core/ingest/record_parser.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <charconv>
#include <limits>
#include <stdexcept>
#include <vector>


namespace {

constexpr std::string_view kProbePrefix = "probe_";
constexpr std::string_view kReturnSuffix = "__return";
constexpr std::string_view kRetSuffix = "_ret";
constexpr uint64_t kNsPerSec = 1'000'000'000ULL;
constexpr size_t kMaxFractionDigits = 9;

inline bool endsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size()
        && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline bool isDigits(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
        return c >= '0' && c <= '9';
    });
}

inline uint64_t parseUnsigned(std::string_view s, const char* what) {
    uint64_t value = 0;
    const char* end = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(s.data(), end, value);
    if (ec != std::errc() || ptr != end)
        throw std::runtime_error(fmt::format("Invalid {}: '{}'", what, s));
    return value;
}

// "<digits>.<digits>"
inline bool looksLikeTimestamp(std::string_view s) {
    auto dot = s.find('.');
    if (dot == std::string_view::npos) return false;
    return isDigits(s.substr(0, dot)) && isDigits(s.substr(dot + 1));
}

// "[003]"
inline bool isCpuToken(std::string_view s) {
    return s.size() >= 3 && s.front() == '[' && s.back() == ']'
        && isDigits(s.substr(1, s.size() - 2));
}

std::vector<std::string_view> tokenize(std::string_view line) {
    std::vector<std::string_view> tokens;
    size_t pos = 0;
    while (pos < line.size()) {
        pos = line.find_first_not_of(" \t", pos);
        if (pos == std::string_view::npos) break;
        size_t end = line.find_first_of(" \t", pos);
        if (end == std::string_view::npos) end = line.size();
        tokens.push_back(line.substr(pos, end - pos));
        pos = end;
    }
    return tokens;
}

} // anonymous namespace

ParsedEventName parseEventName(std::string_view name) {
    if (!name.empty() && name.back() == ':')
        name.remove_suffix(1);

    if (name.substr(0, kProbePrefix.size()) != kProbePrefix)
        throw std::runtime_error(fmt::format("Not a probe event: '{}'", name));
    name.remove_prefix(kProbePrefix.size());

    bool is_exit = false;
    auto stripExitSuffix = [&is_exit](std::string_view& s) {
        if (endsWith(s, kReturnSuffix)) {
            s.remove_suffix(kReturnSuffix.size());
            is_exit = true;
        } else if (endsWith(s, kRetSuffix)) {
            s.remove_suffix(kRetSuffix.size());
            is_exit = true;
        }
    };

    std::string_view lib;
    std::string_view symbol;
    auto colon = name.find(':');
    if (colon != std::string_view::npos) {
        // perf script text form: group:event
        lib = name.substr(0, colon);
        symbol = name.substr(colon + 1);
        stripExitSuffix(symbol);
    } else {
        // python perf-script form: group and event joined by "__"
        std::string_view body = name;
        stripExitSuffix(body);
        auto sep = body.rfind("__");
        if (sep == std::string_view::npos)
            throw std::runtime_error(fmt::format("Probe event without group separator: 'probe_{}'", name));
        lib = body.substr(0, sep);
        symbol = body.substr(sep + 2);
    }

    if (lib.empty())
        throw std::runtime_error("Probe event with empty library");
    if (symbol.empty())
        throw std::runtime_error("Probe event with empty symbol");

    ParsedEventName result;
    result.function_id.reserve(lib.size() + 1 + symbol.size());
    result.function_id.append(lib).append("!").append(symbol);
    result.kind = is_exit ? FuncClock::ProbeKind::EXIT : FuncClock::ProbeKind::ENTRY;
    return result;
}

FuncClock::TimestampNs parseTimestamp(std::string_view text) {
    auto dot = text.find('.');
    if (dot == std::string_view::npos)
        throw std::runtime_error(fmt::format("Timestamp without fraction: '{}'", text));

    std::string_view sec_text = text.substr(0, dot);
    std::string_view frac_text = text.substr(dot + 1);
    if (frac_text.empty() || frac_text.size() > kMaxFractionDigits)
        throw std::runtime_error(fmt::format("Timestamp fraction must have 1-9 digits: '{}'", text));

    uint64_t sec = parseUnsigned(sec_text, "timestamp seconds");
    uint64_t frac = parseUnsigned(frac_text, "timestamp fraction");
    for (size_t i = frac_text.size(); i < kMaxFractionDigits; ++i) {
        frac *= 10;
    }

    if (sec > (std::numeric_limits<uint64_t>::max() - frac) / kNsPerSec)
        throw std::runtime_error(fmt::format("Timestamp overflows nanoseconds: '{}'", text));

    return sec * kNsPerSec + frac;
}

FuncClock::ContextId parseContext(std::string_view text) {
    auto slash = text.find('/');
    if (slash != std::string_view::npos)
        text = text.substr(slash + 1);
    return parseUnsigned(text, "thread id");
}

FuncClock::RawRecord splitPerfScriptLine(std::string_view line, uint64_t line_no) {
    auto tokens = tokenize(line);

    for (size_t i = 1; i + 1 < tokens.size(); ++i) {
        std::string_view tok = tokens[i];
        if (tok.size() < 2 || tok.back() != ':') continue;

        std::string_view ts = tok.substr(0, tok.size() - 1);
        if (!looksLikeTimestamp(ts)) continue;

        size_t ctx_idx = i - 1;
        if (isCpuToken(tokens[ctx_idx])) {
            if (ctx_idx == 0) continue;
            --ctx_idx;
        }

        std::string_view event = tokens[i + 1];
        if (event.back() == ':')
            event.remove_suffix(1);

        FuncClock::RawRecord rec;
        if (ctx_idx > 0) {
            const char* comm_begin = tokens[0].data();
            const char* comm_end = tokens[ctx_idx - 1].data() + tokens[ctx_idx - 1].size();
            rec.comm.assign(comm_begin, comm_end);
        }
        rec.context = std::string(tokens[ctx_idx]);
        rec.timestamp = std::string(ts);
        rec.event_name = std::string(event);
        rec.line = line_no;
        return rec;
    }

    throw std::runtime_error(fmt::format("Unrecognised perf script line {}", line_no));
}
