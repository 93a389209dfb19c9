#include <funcclock/core/ingest/event_source.hpp>
#include <funcclock/core/ingest/record_parser.hpp>
#include <spdlog/spdlog.h>
#include <iostream>

namespace FuncClock {

PerfScriptSource::PerfScriptSource(const std::string& path)
    : path_(path) {
    if (path == "-") {
        in_ = &std::cin;
        spdlog::info("[PerfScriptSource] Reading trace from stdin");
        return;
    }

    file_ = std::make_unique<std::ifstream>(path);
    if (!file_->is_open()) {
        spdlog::error("Failed to open trace file at {}", path);
        throw SourceError(fmt::format("Failed to open trace file: {}", path));
    }
    in_ = file_.get();
    spdlog::info("[PerfScriptSource] Reading trace from {}", path);
}

PerfScriptSource::PerfScriptSource(std::istream& in)
    : in_(&in), path_("<stream>") {}

bool PerfScriptSource::next(RawRecord& out) {
    std::string line;
    while (std::getline(*in_, line)) {
        ++line_no_;
        if (!line.empty() && line.back() == '\r') line.pop_back();

        auto first = line.find_first_not_of(" \t");
        if (first == std::string::npos || line[first] == '#') continue;

        try {
            out = splitPerfScriptLine(line, line_no_);
        } catch (const std::runtime_error& e) {
            spdlog::debug("[PerfScriptSource] {}: {}", path_, e.what());
            out = RawRecord{};
            out.line = line_no_;
        }
        return true;
    }

    if (in_->bad()) {
        throw SourceError(fmt::format("Read error on trace {} after line {}", path_, line_no_));
    }
    return false;
}

} // namespace FuncClock
