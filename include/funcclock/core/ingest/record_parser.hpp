#pragma once
#include <funcclock/core/events/probe_event.hpp>
#include <string>
#include <string_view>
#include <cstdint>


/**
 * @brief Result of parsing a uprobe event name
 */
struct ParsedEventName {
    FuncClock::FunctionId function_id;
    FuncClock::ProbeKind kind;
};

/**
 * @brief Parse a probe event name into function id and crossing kind
 *
 * Accepted forms:
 *   probe_<lib>:<symbol>            entry
 *   probe_<lib>:<symbol>_ret        exit
 *   probe_<lib>:<symbol>__return    exit
 *   probe_<lib>__<symbol>[_ret]     python perf-script form
 *
 * @param name Event name (a trailing ':' is tolerated)
 * @return ParsedEventName with function id "<lib>!<symbol>"
 * @throws std::runtime_error if the name is not a probe event
 */
ParsedEventName parseEventName(std::string_view name);

/**
 * @brief Parse "<sec>.<frac>" into nanoseconds
 * @param text Timestamp text, 1-9 fraction digits
 * @throws std::runtime_error on bad digits or overflow
 */
FuncClock::TimestampNs parseTimestamp(std::string_view text);

/**
 * @brief Parse "tid" or "pid/tid" into the execution context id (the tid)
 * @throws std::runtime_error if not numeric
 */
FuncClock::ContextId parseContext(std::string_view text);

/**
 * @brief Split one `perf script` text line into raw fields
 *
 * Line shape: "<comm> <tid>[/<tid>] [<cpu>] <sec>.<frac>: <event>: <rest>".
 * comm may contain spaces; the timestamp token anchors the split.
 *
 * @param line Text line without trailing newline
 * @param line_no Line number, copied into the record
 * @throws std::runtime_error if no timestamp/event token pair is found
 */
FuncClock::RawRecord splitPerfScriptLine(std::string_view line, uint64_t line_no);
