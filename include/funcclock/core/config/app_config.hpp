#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace AppConfig {

    struct SourceConfig {
        std::string path;                       // perf script text dump, "-" = stdin
    };

    struct NormalizerConfig {
        uint64_t maxClockSkewNs = 1'000'000;
        uint64_t maxBufferedEvents = 65536;
    };

    struct CorrelatorConfig {
        uint64_t maxStackDepth = 4096;
    };

    struct FunctionsConfig {
        std::vector<std::string> include;
        std::vector<std::string> exclude = {"*@plt", "*_plt", "*_omp_fn*"};
    };

    struct DiagnosticsConfig {
        uint64_t maxLoggedPerKind = 10;
        uint64_t maxStoredRecords = 1000;
    };

    struct ReportConfig {
        std::string unit = "s";
        int precision = 9;
        bool showDiagnostics = true;
    };

    struct LoggingConfig {
        std::string level = "info";
    };

    struct AppConfiguration {
        std::string app_name;
        std::string version;
        SourceConfig source;
        NormalizerConfig normalizer;
        CorrelatorConfig correlator;
        FunctionsConfig functions;
        DiagnosticsConfig diagnostics;
        ReportConfig report;
        LoggingConfig logging;
    };

}
