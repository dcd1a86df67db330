/**
 * @file test_config.cpp
 * @brief SystemConfig loading and validation
 */

#include "sentrybox/core/config.hpp"

#include <gtest/gtest.h>

#include <fstream>

#include <unistd.h>

using namespace sentrybox;
using sentrybox::core::SystemConfig;
using sentrybox::utils::ErrorCode;

TEST(SystemConfigTest, EmptyObjectYieldsDefaults) {
    auto config = SystemConfig::LoadFromString("{}");
    ASSERT_TRUE(config.ok()) << config.error().message;
    const auto& c = config.value();

    EXPECT_EQ(c.max_concurrent_executions, 4u);
    EXPECT_EQ(c.block_severity_threshold, analyzers::ThreatSeverity::HIGH);
    EXPECT_EQ(c.monitor_poll_interval, std::chrono::milliseconds(500));
    EXPECT_EQ(c.snapshot_retention_cap, 1000u);
    EXPECT_EQ(c.interpreter, "/usr/bin/python3");
    EXPECT_EQ(c.log_level, "info");
    EXPECT_TRUE(c.export_directory.empty());
    EXPECT_EQ(c.default_resource_ceiling, core::ResourceLimits{});
}

TEST(SystemConfigTest, OverridesAreApplied) {
    auto config = SystemConfig::LoadFromString(R"({
        "max_concurrent_executions": 8,
        "block_severity_threshold": "medium",
        "default_resource_ceiling": { "max_memory_bytes": 134217728, "max_wall_time_ms": 10000 },
        "alert_thresholds": { "cpu_percent": 90, "thread_count": 16 },
        "monitor_poll_interval_ms": 250,
        "session_ttl_seconds": 600,
        "log_level": "debug",
        "some_future_key": true
    })");
    ASSERT_TRUE(config.ok()) << config.error().message;
    const auto& c = config.value();

    EXPECT_EQ(c.max_concurrent_executions, 8u);
    EXPECT_EQ(c.block_severity_threshold, analyzers::ThreatSeverity::MEDIUM);
    EXPECT_EQ(c.default_resource_ceiling.max_memory_bytes, 134217728u);
    EXPECT_EQ(c.default_resource_ceiling.max_wall_time, std::chrono::milliseconds(10000));
    // Keys absent from the ceiling keep their defaults
    EXPECT_EQ(c.default_resource_ceiling.max_cpu_time, core::ResourceLimits{}.max_cpu_time);
    ASSERT_TRUE(c.alert_thresholds.cpu_percent.has_value());
    EXPECT_DOUBLE_EQ(*c.alert_thresholds.cpu_percent, 90.0);
    ASSERT_TRUE(c.alert_thresholds.thread_count.has_value());
    EXPECT_EQ(*c.alert_thresholds.thread_count, 16);
    EXPECT_FALSE(c.alert_thresholds.memory_bytes.has_value());
    EXPECT_EQ(c.monitor_poll_interval, std::chrono::milliseconds(250));
    EXPECT_EQ(c.session_ttl, std::chrono::seconds(600));
    EXPECT_EQ(c.log_level, "debug");
}

TEST(SystemConfigTest, MalformedDocumentsAreParseErrors) {
    for (const char* doc : {"{", "[]", R"({"max_concurrent_executions": "many"})",
                            R"({"default_resource_ceiling": 5})", R"({"alert_thresholds": []})"}) {
        auto config = SystemConfig::LoadFromString(doc);
        ASSERT_FALSE(config.ok()) << doc;
        EXPECT_EQ(config.error().code, ErrorCode::PARSE_ERROR) << doc;
    }
}

TEST(SystemConfigTest, OutOfRangeValuesAreRejected) {
    for (const char* doc : {R"({"block_severity_threshold": "apocalyptic"})",
                            R"({"interpreter": "python3"})",
                            R"({"max_concurrent_executions": 0})",
                            R"({"monitor_poll_interval_ms": 0})",
                            R"({"log_level": "loud"})"}) {
        auto config = SystemConfig::LoadFromString(doc);
        ASSERT_FALSE(config.ok()) << doc;
        EXPECT_EQ(config.error().code, ErrorCode::INVALID_ARGUMENT) << doc;
    }
}

TEST(SystemConfigTest, MissingFileIsNotFound) {
    auto config = SystemConfig::LoadFromFile("/nonexistent/sentrybox.json");
    ASSERT_FALSE(config.ok());
    EXPECT_EQ(config.error().code, ErrorCode::NOT_FOUND);
}

TEST(SystemConfigTest, LoadsFromFile) {
    auto path = std::filesystem::temp_directory_path() /
                ("sentrybox-config-" + std::to_string(::getpid()) + ".json");
    {
        std::ofstream out(path);
        out << R"({"pbkdf2_iterations": 5000, "database_path": "/tmp/sb.db"})";
    }
    auto config = SystemConfig::LoadFromFile(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(config.ok()) << config.error().message;
    EXPECT_EQ(config.value().pbkdf2_iterations, 5000);
    EXPECT_EQ(config.value().database_path, std::filesystem::path("/tmp/sb.db"));
}

TEST(SystemConfigTest, DerivedSandboxSettings) {
    auto config = SystemConfig::LoadFromString(R"({
        "max_concurrent_executions": 2,
        "container_mode_default": true,
        "require_filesystem_isolation": false,
        "sandbox_root": "/var/tmp/sb"
    })");
    ASSERT_TRUE(config.ok()) << config.error().message;

    auto sandbox = config.value().ToSandboxConfig();
    EXPECT_EQ(sandbox.max_concurrent_executions, 2u);
    EXPECT_FALSE(sandbox.require_filesystem_isolation);
    EXPECT_EQ(sandbox.sandbox_root, std::filesystem::path("/var/tmp/sb"));
    EXPECT_FALSE(sandbox.ceiling.container_mode);

    auto limits = config.value().DefaultLimits();
    EXPECT_TRUE(limits.container_mode);
    EXPECT_EQ(limits.max_memory_bytes, sandbox.ceiling.max_memory_bytes);
}
