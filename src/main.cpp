#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <iostream>
#include <memory>
#include <string>

#include <funcclock/core/config/loader.hpp>
#include <funcclock/core/ingest/event_source.hpp>
#include <funcclock/core/pipeline/trace_pipeline.hpp>
#include <funcclock/core/report/report_formatter.hpp>

// ============================================================================
// Global State
// ============================================================================

static std::atomic<bool> g_stop_requested{false};

static void signalHandler(int) {
    g_stop_requested.store(true, std::memory_order_release);
}

// ============================================================================
// Initialization Functions
// ============================================================================

static void setupLogging() {
    // stdout carries the report; logs go to stderr
    spdlog::set_default_logger(spdlog::stderr_color_mt("funcclock"));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::info("FuncClock v1.0.0 starting...");
    spdlog::info("Build: {} {}", __DATE__, __TIME__);
}

static void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

static AppConfig::AppConfiguration loadConfiguration(int argc, char* argv[]) {
    const char* configPath = (argc > 1) ? argv[1] : "config/config.yaml";
    spdlog::info("Loading configuration from: {}", configPath);
    auto config = ConfigLoader::loadConfig(configPath);

    if (argc > 2) {
        config.source.path = argv[2];
        spdlog::info("Trace path overridden on command line: {}", config.source.path);
    }
    spdlog::set_level(spdlog::level::from_str(config.logging.level));
    return config;
}

static void printUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " [config.yaml] [trace.txt|-]\n"
              << "  trace.txt is the text output of `perf script` over\n"
              << "  probe_<lib>:<symbol> and probe_<lib>:<symbol>_ret uprobes.\n";
}

int main(int argc, char* argv[]) {
    if (argc > 1 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
        printUsage(argv[0]);
        return EXIT_SUCCESS;
    }

    setupLogging();
    setupSignalHandlers();

    try {
        auto config = loadConfiguration(argc, argv);
        spdlog::info("Configuration loaded successfully");

        FuncClock::TracePipeline pipeline(ConfigLoader::toPipelineSettings(config));
        FuncClock::ReportFormatter formatter(ConfigLoader::toReportOptions(config));

        FuncClock::PerfScriptSource source(config.source.path);
        auto result = pipeline.run(source, &g_stop_requested);

        formatter.write(std::cout, result.functions, &result.diagnostics);

        if (result.stopped_early) {
            spdlog::warn("Trace processing interrupted; statistics cover the records read so far");
        }

    } catch (const FuncClock::SourceError& e) {
        spdlog::error("Trace source failed: {}", e.what());
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("FuncClock finished");
    return EXIT_SUCCESS;
}
