/**
 * @file config.hpp
 * @brief System-wide settings with defaults and JSON file loading
 *
 * Every field has a default, so an empty JSON object is a valid file. Unknown
 * keys are ignored with a warning; keys with the wrong type are an error.
 *
 * **Example file**:
 * ```json
 * {
 *   "max_concurrent_executions": 8,
 *   "block_severity_threshold": "medium",
 *   "default_resource_ceiling": { "max_memory_bytes": 134217728, "max_wall_time_ms": 10000 },
 *   "alert_thresholds": { "cpu_percent": 90, "thread_count": 16 },
 *   "log_level": "debug"
 * }
 * ```
 *
 * @date 2025
 */

#pragma once

#include "sentrybox/analyzers/threat_types.hpp"
#include "sentrybox/core/sandbox_engine.hpp"
#include "sentrybox/monitors/execution_monitor.hpp"
#include "sentrybox/utils/result.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace sentrybox {
namespace core {

/**
 * @struct SystemConfig
 * @brief Settings for every SentryBox component
 */
struct SystemConfig {
    // Executor
    std::size_t max_concurrent_executions{4};                   ///< Excess runs queue FIFO
    ResourceLimits default_resource_ceiling;                    ///< Hard upper bound for every run
    bool container_mode_default{false};                         ///< Namespace isolation by default
    std::string interpreter{"/usr/bin/python3"};                ///< Absolute interpreter path
    std::filesystem::path sandbox_root{std::filesystem::temp_directory_path() / "sentrybox"};
    bool require_filesystem_isolation{true};                    ///< Refuse to run without Landlock

    // Scanner
    analyzers::ThreatSeverity block_severity_threshold{analyzers::ThreatSeverity::HIGH};

    // Monitor
    std::chrono::milliseconds monitor_poll_interval{500};
    std::size_t snapshot_retention_cap{1000};
    monitors::AlertThresholds alert_thresholds;

    // Permission service
    std::filesystem::path database_path{"sentrybox.db"};
    std::chrono::seconds session_ttl{8 * 3600};
    int pbkdf2_iterations{100000};

    // Output
    std::filesystem::path export_directory;                     ///< Empty disables exports
    std::string log_level{"info"};

    /**
     * @brief Load settings from a JSON file
     * @return PARSE_ERROR for malformed JSON or mistyped keys,
     *         NOT_FOUND when the file cannot be opened,
     *         INVALID_ARGUMENT for out-of-range values
     */
    static utils::Result<SystemConfig> LoadFromFile(const std::filesystem::path& path);

    /// Same as LoadFromFile for an in-memory document
    static utils::Result<SystemConfig> LoadFromString(const std::string& content);

    /// Reject values no component can work with
    utils::Status Validate() const;

    /// Sandbox settings derived from this configuration
    SandboxConfig ToSandboxConfig() const;

    /// Limits for runs without overrides: the ceiling, in the default isolation mode
    ResourceLimits DefaultLimits() const;
};

} // namespace core
} // namespace sentrybox
