#include <funcclock/core/config/loader.hpp>
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <stdexcept>

namespace {

template <typename T>
T convertField(const YAML::Node& node, const std::string& path) {
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion& e) {
        throw std::runtime_error(fmt::format("Invalid type for config field '{}': {}", path, e.what()));
    }
}

YAML::Node child(const YAML::Node& parent, const char* key) {
    if (!parent.IsDefined() || !parent.IsMap()) return YAML::Node(YAML::NodeType::Undefined);
    return parent[key];
}

template <typename T>
T requiredField(const YAML::Node& parent, const char* key, const std::string& path) {
    YAML::Node node = child(parent, key);
    if (!node.IsDefined() || node.IsNull())
        throw std::runtime_error(fmt::format("Missing required config field '{}'", path));
    return convertField<T>(node, path);
}

template <typename T>
T optionalField(const YAML::Node& parent, const char* key, const std::string& path, const T& fallback) {
    YAML::Node node = child(parent, key);
    if (!node.IsDefined() || node.IsNull()) return fallback;
    return convertField<T>(node, path);
}

void validate(const AppConfig::AppConfiguration& config) {
    if (config.app_name.empty())
        throw std::runtime_error("Config field 'app_name' must not be empty");
    if (config.source.path.empty())
        throw std::runtime_error("Config field 'source.path' must not be empty");
    if (config.normalizer.maxBufferedEvents == 0)
        throw std::runtime_error("Config field 'normalizer.max_buffered_events' must be greater than 0");
    if (config.correlator.maxStackDepth == 0)
        throw std::runtime_error("Config field 'correlator.max_stack_depth' must be greater than 0");
    if (config.report.precision < 0 || config.report.precision > 17)
        throw std::runtime_error("Config field 'report.precision' must be between 0 and 17");

    // Throws on unknown unit
    FuncClock::parseTimeUnit(config.report.unit);

    static const std::array<const char*, 7> kLevels = {
        "trace", "debug", "info", "warn", "error", "critical", "off"};
    if (std::find(kLevels.begin(), kLevels.end(), config.logging.level) == kLevels.end())
        throw std::runtime_error(fmt::format("Config field 'logging.level' has unknown level '{}'",
                                             config.logging.level));
}

} // anonymous namespace

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::BadFile&) {
        throw std::runtime_error(fmt::format("Config file not found: {}", filepath));
    } catch (const YAML::ParserException& e) {
        throw std::runtime_error(fmt::format("Failed to parse config {}: {}", filepath, e.what()));
    }

    if (!root.IsMap())
        throw std::runtime_error(fmt::format("Config {} must be a YAML mapping", filepath));

    AppConfig::AppConfiguration config;
    AppConfig::AppConfiguration defaults;

    config.app_name = requiredField<std::string>(root, "app_name", "app_name");
    config.version = requiredField<std::string>(root, "version", "version");

    YAML::Node source = child(root, "source");
    config.source.path = requiredField<std::string>(source, "path", "source.path");

    YAML::Node normalizer = child(root, "normalizer");
    config.normalizer.maxClockSkewNs =
        requiredField<uint64_t>(normalizer, "max_clock_skew_ns", "normalizer.max_clock_skew_ns");
    config.normalizer.maxBufferedEvents =
        optionalField<uint64_t>(normalizer, "max_buffered_events", "normalizer.max_buffered_events",
                                defaults.normalizer.maxBufferedEvents);

    YAML::Node correlator = child(root, "correlator");
    config.correlator.maxStackDepth =
        optionalField<uint64_t>(correlator, "max_stack_depth", "correlator.max_stack_depth",
                                defaults.correlator.maxStackDepth);

    YAML::Node functions = child(root, "functions");
    config.functions.include =
        optionalField<std::vector<std::string>>(functions, "include", "functions.include",
                                                defaults.functions.include);
    config.functions.exclude =
        optionalField<std::vector<std::string>>(functions, "exclude", "functions.exclude",
                                                defaults.functions.exclude);

    YAML::Node diagnostics = child(root, "diagnostics");
    config.diagnostics.maxLoggedPerKind =
        optionalField<uint64_t>(diagnostics, "max_logged_per_kind", "diagnostics.max_logged_per_kind",
                                defaults.diagnostics.maxLoggedPerKind);
    config.diagnostics.maxStoredRecords =
        optionalField<uint64_t>(diagnostics, "max_stored_records", "diagnostics.max_stored_records",
                                defaults.diagnostics.maxStoredRecords);

    YAML::Node report = child(root, "report");
    config.report.unit = optionalField<std::string>(report, "unit", "report.unit", defaults.report.unit);
    config.report.precision = optionalField<int>(report, "precision", "report.precision",
                                                 defaults.report.precision);
    config.report.showDiagnostics = optionalField<bool>(report, "show_diagnostics", "report.show_diagnostics",
                                                        defaults.report.showDiagnostics);

    YAML::Node logging = child(root, "logging");
    config.logging.level = optionalField<std::string>(logging, "level", "logging.level",
                                                      defaults.logging.level);

    validate(config);

    spdlog::info("Loaded configuration '{}' v{} from {}", config.app_name, config.version, filepath);
    return config;
}

FuncClock::TracePipeline::Settings ConfigLoader::toPipelineSettings(const AppConfig::AppConfiguration& config) {
    FuncClock::TracePipeline::Settings settings;
    settings.normalizer.max_clock_skew_ns = config.normalizer.maxClockSkewNs;
    settings.normalizer.max_buffered_events = static_cast<size_t>(config.normalizer.maxBufferedEvents);
    settings.correlator.max_stack_depth = static_cast<size_t>(config.correlator.maxStackDepth);
    settings.filter = FuncClock::FunctionFilter(config.functions.include, config.functions.exclude);
    settings.max_stored_diagnostics = static_cast<size_t>(config.diagnostics.maxStoredRecords);
    settings.max_logged_per_kind = static_cast<size_t>(config.diagnostics.maxLoggedPerKind);
    return settings;
}

FuncClock::ReportOptions ConfigLoader::toReportOptions(const AppConfig::AppConfiguration& config) {
    FuncClock::ReportOptions options;
    options.unit = FuncClock::parseTimeUnit(config.report.unit);
    options.precision = config.report.precision;
    options.include_diagnostics = config.report.showDiagnostics;
    return options;
}
