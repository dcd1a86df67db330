/**
 * @file json_reporter.hpp
 * @brief Machine-readable JSON for execution results, scans and summaries
 *
 * Timestamps are written twice: as integer milliseconds since the epoch
 * (`*_ms`, used when reading back) and as an ISO 8601 UTC string for people.
 *
 * @date 2025
 */

#pragma once

#include "sentrybox/analyzers/threat_types.hpp"
#include "sentrybox/core/sandbox_engine.hpp"
#include "sentrybox/monitors/execution_monitor.hpp"
#include "sentrybox/security/permission_types.hpp"
#include "sentrybox/utils/result.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace sentrybox {

namespace core {
    struct PipelineResult;
}

namespace reporters {

using json = nlohmann::json;

/**
 * @struct JsonReporterConfig
 * @brief Content and formatting options for full reports
 */
struct JsonReporterConfig {
    bool include_output{true};        ///< stdout/stderr of the execution
    bool include_snapshots{true};     ///< Full resource timeline
    bool include_findings{true};      ///< Individual scan findings
    bool pretty_print{true};
    int indent_size{2};
    std::filesystem::path output_directory{"./reports"};
};

/**
 * @class JsonReporter
 * @brief Converts SentryBox results to and from JSON
 *
 * **Usage Example**:
 * @code
 * auto result = pipeline.RunUserCode(token, code);
 *
 * JsonReporter reporter;
 * auto path = reporter.GenerateReport(result);
 *
 * auto parsed = JsonReporter::ExecutionResultFromJson(JsonReporter::ToJson(result.execution));
 * // parsed.value() == result.execution
 * @endcode
 */
class JsonReporter {
public:
    explicit JsonReporter(const JsonReporterConfig& config = JsonReporterConfig{});

    /**
     * @brief Write a pipeline result to the output directory
     * @return Path of the report (<execution_id>.json)
     */
    utils::Result<std::filesystem::path> GenerateReport(const core::PipelineResult& result) const;

    /// Report body as a string, honouring the content options
    std::string GenerateJsonString(const core::PipelineResult& result) const;

    // Converters
    static json ToJson(const core::ExecutionResult& result);
    static json ToJson(const core::ResourceLimits& limits);
    static json ToJson(const analyzers::ThreatFinding& finding);
    static json ToJson(const analyzers::ScanResult& scan);
    static json ToJson(const monitors::ResourceSnapshot& snapshot);
    static json ToJson(const monitors::ExecutionSummary& summary);
    static json ToJson(const security::AccessLogEntry& entry);
    static json ToJson(const std::vector<security::AccessLogEntry>& entries);
    static json ToJson(const core::PipelineResult& result);

    /**
     * @brief Rebuild an ExecutionResult written by ToJson
     * @return PARSE_ERROR on missing or mistyped fields
     */
    static utils::Result<core::ExecutionResult> ExecutionResultFromJson(const json& j);

    /// Write JSON to a file, creating parent directories
    static utils::Status SaveToFile(const json& j, const std::filesystem::path& path, int indent = 2);

    static std::string FormatTimestamp(const std::chrono::system_clock::time_point& time);

    const JsonReporterConfig& GetConfig() const { return config_; }

private:
    JsonReporterConfig config_;
};

} // namespace reporters
} // namespace sentrybox
