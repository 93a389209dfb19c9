// ============================================================================
// RECORD PARSER UNIT TESTS
// ============================================================================
// Tests for perf script line splitting and probe field parsing
// ============================================================================

#include <gtest/gtest.h>
#include <funcclock/core/ingest/record_parser.hpp>

using namespace FuncClock;

// ============================================================================
// EVENT NAME TESTS
// ============================================================================

TEST(RecordParser, ParsesEntryEventName) {
    auto parsed = parseEventName("probe_libfoo:compute");
    EXPECT_EQ(parsed.function_id, "libfoo!compute");
    EXPECT_EQ(parsed.kind, ProbeKind::ENTRY);
}

TEST(RecordParser, ParsesRetSuffixAsExit) {
    auto parsed = parseEventName("probe_libfoo:compute_ret");
    EXPECT_EQ(parsed.function_id, "libfoo!compute");
    EXPECT_EQ(parsed.kind, ProbeKind::EXIT);
}

TEST(RecordParser, ParsesReturnSuffixAsExit) {
    auto parsed = parseEventName("probe_libfoo:compute__return");
    EXPECT_EQ(parsed.function_id, "libfoo!compute");
    EXPECT_EQ(parsed.kind, ProbeKind::EXIT);
}

TEST(RecordParser, ToleratesTrailingColon) {
    auto parsed = parseEventName("probe_app:main_ret:");
    EXPECT_EQ(parsed.function_id, "app!main");
    EXPECT_EQ(parsed.kind, ProbeKind::EXIT);
}

TEST(RecordParser, ParsesDoubleUnderscoreForm) {
    auto entry = parseEventName("probe_libfoo__compute");
    EXPECT_EQ(entry.function_id, "libfoo!compute");
    EXPECT_EQ(entry.kind, ProbeKind::ENTRY);

    auto exit = parseEventName("probe_libfoo__compute_ret");
    EXPECT_EQ(exit.function_id, "libfoo!compute");
    EXPECT_EQ(exit.kind, ProbeKind::EXIT);
}

TEST(RecordParser, SymbolWithUnderscoresKeepsLibraryIntact) {
    auto parsed = parseEventName("probe_libm:do_sin_slow_ret");
    EXPECT_EQ(parsed.function_id, "libm!do_sin_slow");
    EXPECT_EQ(parsed.kind, ProbeKind::EXIT);
}

TEST(RecordParser, RejectsNonProbeEvents) {
    EXPECT_THROW(parseEventName("sched:sched_switch"), std::runtime_error);
    EXPECT_THROW(parseEventName(""), std::runtime_error);
    EXPECT_THROW(parseEventName("probe_nolibrary"), std::runtime_error);
    EXPECT_THROW(parseEventName("probe_:sym"), std::runtime_error);
    EXPECT_THROW(parseEventName("probe_lib:_ret"), std::runtime_error);
}

// ============================================================================
// TIMESTAMP AND CONTEXT TESTS
// ============================================================================

TEST(RecordParser, ParsesTimestampToNanoseconds) {
    EXPECT_EQ(parseTimestamp("1.000000000"), 1'000'000'000ULL);
    EXPECT_EQ(parseTimestamp("5123.456789123"), 5'123'456'789'123ULL);
    EXPECT_EQ(parseTimestamp("0.000000001"), 1ULL);
}

TEST(RecordParser, ScalesShortFractions) {
    // perf prints microsecond precision by default
    EXPECT_EQ(parseTimestamp("12.345678"), 12'345'678'000ULL);
    EXPECT_EQ(parseTimestamp("3.5"), 3'500'000'000ULL);
}

TEST(RecordParser, RejectsBadTimestamps) {
    EXPECT_THROW(parseTimestamp("12345"), std::runtime_error);
    EXPECT_THROW(parseTimestamp("12."), std::runtime_error);
    EXPECT_THROW(parseTimestamp("1.0000000001"), std::runtime_error);
    EXPECT_THROW(parseTimestamp("1a.5"), std::runtime_error);
    EXPECT_THROW(parseTimestamp("-1.5"), std::runtime_error);
    EXPECT_THROW(parseTimestamp("99999999999999999999.0"), std::runtime_error);
    EXPECT_THROW(parseTimestamp("18446744073.709551616"), std::runtime_error);
}

TEST(RecordParser, ParsesThreadContext) {
    EXPECT_EQ(parseContext("4242"), 4242u);
    EXPECT_EQ(parseContext("4242/4250"), 4250u);
    EXPECT_THROW(parseContext("main"), std::runtime_error);
    EXPECT_THROW(parseContext(""), std::runtime_error);
}

// ============================================================================
// LINE SPLITTING TESTS
// ============================================================================

TEST(RecordParser, SplitsStandardLine) {
    auto rec = splitPerfScriptLine(
        "             app  4242 [001]     1.000001000: probe_app:foo: (401126)", 7);
    EXPECT_EQ(rec.comm, "app");
    EXPECT_EQ(rec.context, "4242");
    EXPECT_EQ(rec.timestamp, "1.000001000");
    EXPECT_EQ(rec.event_name, "probe_app:foo");
    EXPECT_EQ(rec.line, 7u);
}

TEST(RecordParser, SplitsLineWithoutCpuColumn) {
    auto rec = splitPerfScriptLine("app 4242/4243 10.5: probe_app:foo_ret: (401126 <- 40114a)", 1);
    EXPECT_EQ(rec.comm, "app");
    EXPECT_EQ(rec.context, "4242/4243");
    EXPECT_EQ(rec.timestamp, "10.5");
    EXPECT_EQ(rec.event_name, "probe_app:foo_ret");
}

TEST(RecordParser, KeepsSpacesInsideComm) {
    auto rec = splitPerfScriptLine("  app worker  4243 [002]  1.000002000: probe_app:foo: (401126)", 3);
    EXPECT_EQ(rec.comm, "app worker");
    EXPECT_EQ(rec.context, "4243");
}

TEST(RecordParser, ThrowsOnUnrecognisedLine) {
    EXPECT_THROW(splitPerfScriptLine("this line is not a perf record", 1), std::runtime_error);
    EXPECT_THROW(splitPerfScriptLine("app 4242 1.5:", 2), std::runtime_error);
}
