/**
 * @file json_reporter.cpp
 * @brief JSON conversion of SentryBox results
 *
 * **Report Layout**:
 * ```json
 * {
 *   "execution_id": "9f1c...",
 *   "principal_id": "4ab0...",
 *   "phase_reached": "done",
 *   "execution": { "termination_reason": "completed", "exit_code": 0, ... },
 *   "scan": { "max_severity": "low", "blocking": false, "findings": [...] },
 *   "summary": { "final_state": "detached", "snapshots": [...], ... }
 * }
 * ```
 *
 * @date 2025
 */

#include "sentrybox/reporters/json_reporter.hpp"
#include "sentrybox/core/execution_pipeline.hpp"
#include "sentrybox/security/credential_utils.hpp"
#include "sentrybox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace sentrybox {
namespace reporters {

namespace {

std::int64_t EpochMillis(const std::chrono::system_clock::time_point& time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

std::chrono::system_clock::time_point FromEpochMillis(std::int64_t ms) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ms)));
}

// Captured output is arbitrary bytes: text stays readable, anything else is base64
void PutStream(json& j, const char* key, const std::string& bytes) {
    const std::string encoding_key = std::string(key) + "_encoding";
    if (utils::StringUtils::IsValidUtf8(bytes)) {
        j[key] = bytes;
        j[encoding_key] = "utf-8";
    } else {
        j[key] = security::CredentialUtils::Base64Encode(bytes);
        j[encoding_key] = "base64";
    }
}

std::string GetStream(const json& j, const char* key) {
    const std::string encoding_key = std::string(key) + "_encoding";
    const std::string value = j.at(key).get<std::string>();
    const std::string encoding = j.value(encoding_key, std::string("utf-8"));
    if (encoding == "base64") {
        return security::CredentialUtils::Base64Decode(value);
    }
    if (encoding != "utf-8") {
        throw std::invalid_argument("unknown " + encoding_key + " '" + encoding + "'");
    }
    return value;
}

json Stats(const monitors::MetricStats& stats) {
    return {{"peak", stats.peak}, {"average", stats.average}};
}

} // anonymous namespace

JsonReporter::JsonReporter(const JsonReporterConfig& config)
    : config_(config) {
    spdlog::debug("JSON Reporter initialized (output: {})", config_.output_directory.string());
}

// ============================================================================
// CONVERTERS
// ============================================================================

json JsonReporter::ToJson(const core::ExecutionResult& result) {
    json j = {
        {"execution_id", result.execution_id},
        {"success", result.success},
        {"exit_code", result.exit_code},
        {"wall_duration_ms", result.wall_duration.count()},
        {"cpu_time_ms", result.cpu_time.count()},
        {"termination_reason", core::TerminationReasonToString(result.termination_reason)},
        {"peak_memory_bytes", result.peak_memory_bytes},
        {"stdout_truncated", result.stdout_truncated},
        {"stderr_truncated", result.stderr_truncated},
        {"error_message", result.error_message},
        {"started_at_ms", EpochMillis(result.started_at)},
        {"started_at", FormatTimestamp(result.started_at)}
    };
    PutStream(j, "stdout", result.stdout_output);
    PutStream(j, "stderr", result.stderr_output);
    return j;
}

json JsonReporter::ToJson(const core::ResourceLimits& limits) {
    return {
        {"max_cpu_time_ms", limits.max_cpu_time.count()},
        {"max_wall_time_ms", limits.max_wall_time.count()},
        {"max_memory_bytes", limits.max_memory_bytes},
        {"max_open_files", limits.max_open_files},
        {"max_processes", limits.max_processes},
        {"max_threads", limits.max_threads},
        {"allowed_paths", limits.allowed_paths},
        {"denied_paths", limits.denied_paths},
        {"container_mode", limits.container_mode},
        {"allow_network", limits.allow_network},
        {"max_output_bytes", limits.max_output_bytes},
        {"max_file_size_bytes", limits.max_file_size_bytes}
    };
}

json JsonReporter::ToJson(const analyzers::ThreatFinding& finding) {
    return {
        {"pattern_id", finding.pattern_id},
        {"category", analyzers::CategoryToString(finding.category)},
        {"severity", analyzers::SeverityToString(finding.severity)},
        {"line", finding.line},
        {"offset", finding.offset},
        {"description", finding.description},
        {"source", analyzers::FindingSourceToString(finding.source)}
    };
}

json JsonReporter::ToJson(const analyzers::ScanResult& scan) {
    json j;
    j["max_severity"] = analyzers::SeverityToString(scan.max_severity);
    j["blocking"] = scan.blocking;
    j["scan_failed"] = scan.scan_failed;
    j["parsed"] = scan.parsed;
    j["duration_us"] = scan.duration.count();

    json findings = json::array();
    for (const auto& finding : scan.findings) {
        findings.push_back(ToJson(finding));
    }
    j["findings"] = findings;
    j["finding_count"] = scan.findings.size();

    if (scan.complexity) {
        const auto& c = *scan.complexity;
        j["complexity"] = {
            {"total_lines", c.total_lines},
            {"function_count", c.function_count},
            {"class_count", c.class_count},
            {"loop_count", c.loop_count},
            {"condition_count", c.condition_count},
            {"import_count", c.import_count},
            {"max_depth", c.max_depth},
            {"total_complexity", c.total_complexity}
        };
    }
    return j;
}

json JsonReporter::ToJson(const monitors::ResourceSnapshot& snapshot) {
    return {
        {"timestamp_ms", EpochMillis(snapshot.timestamp)},
        {"cpu_percent", snapshot.cpu_percent},
        {"memory_bytes", snapshot.memory_bytes},
        {"memory_percent", snapshot.memory_percent},
        {"disk_read_bytes", snapshot.disk_read_bytes},
        {"disk_write_bytes", snapshot.disk_write_bytes},
        {"network_connections", snapshot.network_connections},
        {"open_files", snapshot.open_files},
        {"thread_count", snapshot.thread_count}
    };
}

json JsonReporter::ToJson(const monitors::ExecutionSummary& summary) {
    json j;
    j["session_id"] = summary.session_id;
    j["pid"] = summary.pid;
    j["started_at_ms"] = EpochMillis(summary.started_at);
    j["ended_at_ms"] = EpochMillis(summary.ended_at);
    j["started_at"] = FormatTimestamp(summary.started_at);
    j["duration_ms"] = summary.duration.count();
    j["final_state"] = monitors::FinalStateToString(summary.final_state);
    j["breach_count"] = summary.breach_count;
    j["total_snapshots"] = summary.total_snapshots;
    j["dropped_snapshots"] = summary.dropped_snapshots;

    j["metrics"] = {
        {"cpu_percent", Stats(summary.cpu_percent)},
        {"memory_bytes", Stats(summary.memory_bytes)},
        {"memory_percent", Stats(summary.memory_percent)},
        {"disk_read_bytes", Stats(summary.disk_read_bytes)},
        {"disk_write_bytes", Stats(summary.disk_write_bytes)},
        {"network_connections", Stats(summary.network_connections)},
        {"open_files", Stats(summary.open_files)},
        {"thread_count", Stats(summary.thread_count)}
    };

    json snapshots = json::array();
    for (const auto& snapshot : summary.snapshots) {
        snapshots.push_back(ToJson(snapshot));
    }
    j["snapshots"] = snapshots;

    json events = json::array();
    for (const auto& event : summary.events) {
        events.push_back({
            {"timestamp_ms", EpochMillis(event.timestamp)},
            {"type", monitors::MonitorEventTypeToString(event.type)},
            {"message", event.message}
        });
    }
    j["events"] = events;
    return j;
}

json JsonReporter::ToJson(const security::AccessLogEntry& entry) {
    json j = {
        {"id", entry.id},
        {"timestamp_ms", EpochMillis(entry.timestamp)},
        {"timestamp", FormatTimestamp(entry.timestamp)},
        {"principal", entry.principal},
        {"action", entry.action},
        {"permission", entry.permission},
        {"resource_type", entry.resource_type},
        {"decision", security::DecisionToString(entry.decision)},
        {"source_context", entry.source_context},
        {"details", entry.details}
    };
    j["resource_scope"] = entry.resource_scope ? json(*entry.resource_scope) : json(nullptr);
    return j;
}

json JsonReporter::ToJson(const std::vector<security::AccessLogEntry>& entries) {
    json array = json::array();
    for (const auto& entry : entries) {
        array.push_back(ToJson(entry));
    }
    return array;
}

json JsonReporter::ToJson(const core::PipelineResult& result) {
    json j;
    j["execution_id"] = result.execution_id;
    j["principal_id"] = result.principal_id;
    j["phase_reached"] = core::PipelinePhaseToString(result.phase_reached);
    j["total_duration_ms"] = result.total_duration.count();
    j["execution"] = ToJson(result.execution);
    j["scan"] = result.scan ? ToJson(*result.scan) : json(nullptr);
    j["summary"] = result.summary ? ToJson(*result.summary) : json(nullptr);
    return j;
}

utils::Result<core::ExecutionResult> JsonReporter::ExecutionResultFromJson(const json& j) {
    try {
        core::ExecutionResult result;
        result.execution_id = j.at("execution_id").get<std::string>();
        result.success = j.at("success").get<bool>();
        result.stdout_output = GetStream(j, "stdout");
        result.stderr_output = GetStream(j, "stderr");
        result.exit_code = j.at("exit_code").get<int>();
        result.wall_duration = std::chrono::milliseconds(j.at("wall_duration_ms").get<std::int64_t>());
        result.cpu_time = std::chrono::milliseconds(j.at("cpu_time_ms").get<std::int64_t>());

        auto reason = core::TerminationReasonFromString(j.at("termination_reason").get<std::string>());
        if (!reason) {
            return utils::Result<core::ExecutionResult>::Failure(utils::ErrorCode::PARSE_ERROR,
                                                                 "unknown termination_reason");
        }
        result.termination_reason = *reason;

        result.peak_memory_bytes = j.at("peak_memory_bytes").get<std::uint64_t>();
        result.stdout_truncated = j.at("stdout_truncated").get<bool>();
        result.stderr_truncated = j.at("stderr_truncated").get<bool>();
        result.error_message = j.at("error_message").get<std::string>();
        result.started_at = FromEpochMillis(j.at("started_at_ms").get<std::int64_t>());
        return result;
    }
    catch (const json::exception& e) {
        return utils::Result<core::ExecutionResult>::Failure(utils::ErrorCode::PARSE_ERROR, e.what());
    }
    catch (const std::invalid_argument& e) {
        return utils::Result<core::ExecutionResult>::Failure(utils::ErrorCode::PARSE_ERROR, e.what());
    }
}

// ============================================================================
// OUTPUT
// ============================================================================

std::string JsonReporter::GenerateJsonString(const core::PipelineResult& result) const {
    json j = ToJson(result);

    if (!config_.include_output) {
        for (const char* key : {"stdout", "stderr", "stdout_encoding", "stderr_encoding"}) {
            j["execution"].erase(key);
        }
    }
    if (!config_.include_findings && j["scan"].is_object()) {
        j["scan"].erase("findings");
    }
    if (!config_.include_snapshots && j["summary"].is_object()) {
        j["summary"].erase("snapshots");
    }
    j["generated_at"] = FormatTimestamp(std::chrono::system_clock::now());

    // Output streams are already valid UTF-8 or base64; other text fields are best effort
    return config_.pretty_print
        ? j.dump(config_.indent_size, ' ', false, json::error_handler_t::replace)
        : j.dump(-1, ' ', false, json::error_handler_t::replace);
}

utils::Result<std::filesystem::path> JsonReporter::GenerateReport(const core::PipelineResult& result) const {
    try {
        std::filesystem::create_directories(config_.output_directory);
        auto path = config_.output_directory / (result.execution_id + ".json");

        std::ofstream file(path);
        if (!file) {
            return utils::Result<std::filesystem::path>::Failure(utils::ErrorCode::INTERNAL_ERROR,
                                                                 "cannot open report file");
        }
        file << GenerateJsonString(result);
        if (!file) {
            return utils::Result<std::filesystem::path>::Failure(utils::ErrorCode::INTERNAL_ERROR,
                                                                 "cannot write report file");
        }

        spdlog::info("✓ JSON report written to {}", path.string());
        return path;
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to generate JSON report: {}", e.what());
        return utils::Result<std::filesystem::path>::Failure(utils::ErrorCode::INTERNAL_ERROR, e.what());
    }
}

utils::Status JsonReporter::SaveToFile(const json& j, const std::filesystem::path& path, int indent) {
    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        std::ofstream file(path);
        if (!file) {
            return utils::Status::Failure(utils::ErrorCode::INTERNAL_ERROR, "cannot open " + path.string());
        }
        file << j.dump(indent, ' ', false, json::error_handler_t::replace);
        if (!file) {
            return utils::Status::Failure(utils::ErrorCode::INTERNAL_ERROR, "cannot write " + path.string());
        }
        return utils::Status::Ok();
    }
    catch (const std::exception& e) {
        return utils::Status::Failure(utils::ErrorCode::INTERNAL_ERROR, e.what());
    }
}

std::string JsonReporter::FormatTimestamp(const std::chrono::system_clock::time_point& time) {
    auto t = std::chrono::system_clock::to_time_t(time);
    auto ms = EpochMillis(time) % 1000;
    if (ms < 0) {
        ms += 1000;
    }
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return oss.str();
}

} // namespace reporters
} // namespace sentrybox
