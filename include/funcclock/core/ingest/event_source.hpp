#pragma once
#include <funcclock/core/events/probe_event.hpp>
#include <cstdint>
#include <fstream>
#include <istream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace FuncClock {

/**
 * @brief Fatal failure to open or read the trace
 *
 * The only error the pipeline does not absorb into its diagnostics.
 */
class SourceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class EventSource
 * @brief Producer of raw probe crossings
 *
 * All blocking (waiting for trace data) happens behind next().
 */
class EventSource {
public:
    virtual ~EventSource() = default;

    /**
     * @brief Fetch the next raw record
     * @return false at end of stream
     * @throws SourceError if the underlying stream fails
     */
    virtual bool next(RawRecord& out) = 0;

    virtual const char* name() const = 0;
};

/**
 * @class VectorSource
 * @brief In-memory source over a prepared record list
 */
class VectorSource : public EventSource {
public:
    explicit VectorSource(std::vector<RawRecord> records)
        : records_(std::move(records)) {}

    bool next(RawRecord& out) override {
        if (pos_ >= records_.size()) return false;
        out = records_[pos_++];
        return true;
    }

    const char* name() const override { return "VectorSource"; }

private:
    std::vector<RawRecord> records_;
    size_t pos_ = 0;
};

/**
 * @class PerfScriptSource
 * @brief Reads the text output of `perf script` line by line
 *
 * Blank lines and '#' comment lines are skipped. Lines that cannot be split
 * into fields are still returned (with empty fields) so the normalizer
 * counts them as malformed.
 */
class PerfScriptSource : public EventSource {
public:
    /**
     * @brief Open a trace file ("-" reads stdin)
     * @throws SourceError if the file cannot be opened
     */
    explicit PerfScriptSource(const std::string& path);

    /**
     * @brief Read from an existing stream (not owned)
     */
    explicit PerfScriptSource(std::istream& in);

    bool next(RawRecord& out) override;
    const char* name() const override { return "PerfScriptSource"; }

    uint64_t linesRead() const { return line_no_; }

private:
    std::unique_ptr<std::ifstream> file_;
    std::istream* in_ = nullptr;
    std::string path_;
    uint64_t line_no_ = 0;
};

} // namespace FuncClock
