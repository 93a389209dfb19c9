// ============================================================================
// CONFIG LOADER UNIT TESTS
// ============================================================================
// Tests for YAML configuration loading and validation
// ============================================================================

#include <gtest/gtest.h>
#include <funcclock/core/config/loader.hpp>
#include <funcclock/core/config/app_config.hpp>

// ============================================================================
// SUCCESSFUL LOADING TESTS
// ============================================================================

TEST(ConfigLoader, LoadValidConfiguration) {
    AppConfig::AppConfiguration config = ConfigLoader::loadConfig("config/config.yaml");

    // Verify basic app info
    EXPECT_EQ(config.app_name, "FuncClock");
    EXPECT_EQ(config.version, "1.0.0");

    EXPECT_EQ(config.source.path, "unittest/data/sample_trace.txt");
    EXPECT_EQ(config.normalizer.maxClockSkewNs, 1000000u);
    EXPECT_EQ(config.normalizer.maxBufferedEvents, 65536u);
    EXPECT_EQ(config.correlator.maxStackDepth, 4096u);
    EXPECT_TRUE(config.functions.include.empty());
    ASSERT_EQ(config.functions.exclude.size(), 3u);
    EXPECT_EQ(config.functions.exclude[0], "*@plt");
    EXPECT_EQ(config.functions.exclude[1], "*_plt");
    EXPECT_EQ(config.report.unit, "s");
    EXPECT_EQ(config.report.precision, 9);
    EXPECT_TRUE(config.report.showDiagnostics);
    EXPECT_EQ(config.logging.level, "info");
}

TEST(ConfigLoader, OptionalSectionsFallBackToDefaults) {
    AppConfig::AppConfiguration config = ConfigLoader::loadConfig("unittest/data/minimal_config.yaml");
    AppConfig::AppConfiguration defaults;

    EXPECT_EQ(config.app_name, "Minimal");
    EXPECT_EQ(config.source.path, "-");
    EXPECT_EQ(config.normalizer.maxClockSkewNs, 500u);
    EXPECT_EQ(config.normalizer.maxBufferedEvents, defaults.normalizer.maxBufferedEvents);
    EXPECT_EQ(config.correlator.maxStackDepth, defaults.correlator.maxStackDepth);
    EXPECT_EQ(config.functions.exclude, defaults.functions.exclude);
    EXPECT_EQ(config.diagnostics.maxLoggedPerKind, defaults.diagnostics.maxLoggedPerKind);
    EXPECT_EQ(config.report.unit, "s");
}

TEST(ConfigLoader, ConvertsToPipelineSettings) {
    AppConfig::AppConfiguration config = ConfigLoader::loadConfig("config/config.yaml");

    auto settings = ConfigLoader::toPipelineSettings(config);
    EXPECT_EQ(settings.normalizer.max_clock_skew_ns, 1000000u);
    EXPECT_EQ(settings.normalizer.max_buffered_events, 65536u);
    EXPECT_EQ(settings.correlator.max_stack_depth, 4096u);
    EXPECT_FALSE(settings.filter.accepts("libc!puts@plt"));
    EXPECT_FALSE(settings.filter.accepts("libc!puts_plt"));
    EXPECT_TRUE(settings.filter.accepts("app!main"));
    EXPECT_EQ(settings.max_stored_diagnostics, 1000u);

    auto options = ConfigLoader::toReportOptions(config);
    EXPECT_EQ(options.unit, FuncClock::TimeUnit::S);
    EXPECT_EQ(options.precision, 9);
    EXPECT_TRUE(options.include_diagnostics);
}

// ============================================================================
// ERROR HANDLING TESTS
// ============================================================================

TEST(ConfigLoader, ThrowsOnFileNotFound) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("config/non_existent.yaml"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnMissingRequiredField) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/missing_field.yaml"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnInvalidFieldType) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/invalid_type.yaml"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnInvalidFieldValue) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/invalid_value.yaml"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnUnknownTimeUnit) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/invalid_unit.yaml"),
        std::runtime_error
    );
}
