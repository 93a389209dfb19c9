#pragma once
#include <funcclock/core/config/app_config.hpp>
#include <funcclock/core/pipeline/trace_pipeline.hpp>
#include <funcclock/core/report/report_formatter.hpp>
#include <string>

class ConfigLoader {
public:
    /**
     * @brief Load and validate a YAML configuration file
     * @throws std::runtime_error on missing file, parse error, missing
     *         required field, wrong type or invalid value
     */
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);

    static FuncClock::TracePipeline::Settings toPipelineSettings(const AppConfig::AppConfiguration& config);
    static FuncClock::ReportOptions toReportOptions(const AppConfig::AppConfiguration& config);
};
