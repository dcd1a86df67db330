/**
 * @file config.cpp
 * @brief JSON loading and validation of SystemConfig
 *
 * @date 2025
 */

#include "sentrybox/core/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <set>
#include <sstream>

using json = nlohmann::json;

namespace sentrybox {
namespace core {

namespace {

const std::set<std::string> kKnownKeys = {
    "max_concurrent_executions", "default_resource_ceiling", "container_mode_default",
    "interpreter", "sandbox_root", "require_filesystem_isolation", "block_severity_threshold",
    "monitor_poll_interval_ms", "snapshot_retention_cap", "alert_thresholds", "database_path",
    "session_ttl_seconds", "pbkdf2_iterations", "export_directory", "log_level"
};

const std::set<std::string> kLogLevels = {"trace", "debug", "info", "warn", "error", "critical", "off"};

template <typename T>
void ReadIf(const json& j, const char* key, T& out) {
    if (j.contains(key)) {
        out = j.at(key).get<T>();
    }
}

void ReadMillis(const json& j, const char* key, std::chrono::milliseconds& out) {
    if (j.contains(key)) {
        out = std::chrono::milliseconds(j.at(key).get<std::int64_t>());
    }
}

ResourceLimits ParseLimits(const json& j, ResourceLimits limits) {
    ReadMillis(j, "max_cpu_time_ms", limits.max_cpu_time);
    ReadMillis(j, "max_wall_time_ms", limits.max_wall_time);
    ReadIf(j, "max_memory_bytes", limits.max_memory_bytes);
    ReadIf(j, "max_open_files", limits.max_open_files);
    ReadIf(j, "max_processes", limits.max_processes);
    ReadIf(j, "max_threads", limits.max_threads);
    ReadIf(j, "allowed_paths", limits.allowed_paths);
    ReadIf(j, "denied_paths", limits.denied_paths);
    ReadIf(j, "container_mode", limits.container_mode);
    ReadIf(j, "allow_network", limits.allow_network);
    ReadIf(j, "max_output_bytes", limits.max_output_bytes);
    ReadIf(j, "max_file_size_bytes", limits.max_file_size_bytes);
    return limits;
}

monitors::AlertThresholds ParseThresholds(const json& j) {
    monitors::AlertThresholds thresholds;
    if (j.contains("cpu_percent")) thresholds.cpu_percent = j.at("cpu_percent").get<double>();
    if (j.contains("memory_bytes")) thresholds.memory_bytes = j.at("memory_bytes").get<std::uint64_t>();
    if (j.contains("network_connections")) thresholds.network_connections = j.at("network_connections").get<int>();
    if (j.contains("open_files")) thresholds.open_files = j.at("open_files").get<int>();
    if (j.contains("thread_count")) thresholds.thread_count = j.at("thread_count").get<int>();
    return thresholds;
}

} // anonymous namespace

utils::Result<SystemConfig> SystemConfig::LoadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return utils::Result<SystemConfig>::Failure(utils::ErrorCode::NOT_FOUND,
                                                    "cannot open config file " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto config = LoadFromString(buffer.str());
    if (config) {
        spdlog::info("✓ Configuration loaded from {}", path.string());
    }
    return config;
}

utils::Result<SystemConfig> SystemConfig::LoadFromString(const std::string& content) {
    SystemConfig config;
    try {
        json j = json::parse(content);
        if (!j.is_object()) {
            return utils::Result<SystemConfig>::Failure(utils::ErrorCode::PARSE_ERROR,
                                                        "configuration must be a JSON object");
        }

        for (const auto& item : j.items()) {
            if (!kKnownKeys.count(item.key())) {
                spdlog::warn("Ignoring unknown configuration key '{}'", item.key());
            }
        }

        ReadIf(j, "max_concurrent_executions", config.max_concurrent_executions);
        for (const char* key : {"default_resource_ceiling", "alert_thresholds"}) {
            if (j.contains(key) && !j.at(key).is_object()) {
                return utils::Result<SystemConfig>::Failure(utils::ErrorCode::PARSE_ERROR,
                                                            std::string(key) + " must be an object");
            }
        }
        if (j.contains("default_resource_ceiling")) {
            config.default_resource_ceiling = ParseLimits(j.at("default_resource_ceiling"),
                                                          config.default_resource_ceiling);
        }
        ReadIf(j, "container_mode_default", config.container_mode_default);
        ReadIf(j, "interpreter", config.interpreter);
        if (j.contains("sandbox_root")) {
            config.sandbox_root = j.at("sandbox_root").get<std::string>();
        }
        ReadIf(j, "require_filesystem_isolation", config.require_filesystem_isolation);

        if (j.contains("block_severity_threshold")) {
            auto name = j.at("block_severity_threshold").get<std::string>();
            auto severity = analyzers::SeverityFromString(name);
            if (!severity) {
                return utils::Result<SystemConfig>::Failure(utils::ErrorCode::INVALID_ARGUMENT,
                                                            "unknown severity '" + name + "'");
            }
            config.block_severity_threshold = *severity;
        }

        ReadMillis(j, "monitor_poll_interval_ms", config.monitor_poll_interval);
        ReadIf(j, "snapshot_retention_cap", config.snapshot_retention_cap);
        if (j.contains("alert_thresholds")) {
            config.alert_thresholds = ParseThresholds(j.at("alert_thresholds"));
        }

        if (j.contains("database_path")) {
            config.database_path = j.at("database_path").get<std::string>();
        }
        if (j.contains("session_ttl_seconds")) {
            config.session_ttl = std::chrono::seconds(j.at("session_ttl_seconds").get<std::int64_t>());
        }
        ReadIf(j, "pbkdf2_iterations", config.pbkdf2_iterations);
        if (j.contains("export_directory")) {
            config.export_directory = j.at("export_directory").get<std::string>();
        }
        ReadIf(j, "log_level", config.log_level);
    }
    catch (const json::exception& e) {
        return utils::Result<SystemConfig>::Failure(utils::ErrorCode::PARSE_ERROR, e.what());
    }

    auto status = config.Validate();
    if (!status.ok()) {
        return status.error();
    }
    return config;
}

utils::Status SystemConfig::Validate() const {
    if (max_concurrent_executions == 0) {
        return utils::Status::Failure(utils::ErrorCode::INVALID_ARGUMENT,
                                      "max_concurrent_executions must be positive");
    }
    if (monitor_poll_interval.count() <= 0) {
        return utils::Status::Failure(utils::ErrorCode::INVALID_ARGUMENT,
                                      "monitor_poll_interval_ms must be positive");
    }
    if (snapshot_retention_cap == 0) {
        return utils::Status::Failure(utils::ErrorCode::INVALID_ARGUMENT,
                                      "snapshot_retention_cap must be positive");
    }
    if (session_ttl.count() <= 0) {
        return utils::Status::Failure(utils::ErrorCode::INVALID_ARGUMENT,
                                      "session_ttl_seconds must be positive");
    }
    if (pbkdf2_iterations < 1) {
        return utils::Status::Failure(utils::ErrorCode::INVALID_ARGUMENT,
                                      "pbkdf2_iterations must be positive");
    }
    if (!std::filesystem::path(interpreter).is_absolute()) {
        return utils::Status::Failure(utils::ErrorCode::INVALID_ARGUMENT,
                                      "interpreter must be an absolute path");
    }
    if (!kLogLevels.count(log_level)) {
        return utils::Status::Failure(utils::ErrorCode::INVALID_ARGUMENT,
                                      "unknown log_level '" + log_level + "'");
    }
    return utils::Status::Ok();
}

SandboxConfig SystemConfig::ToSandboxConfig() const {
    SandboxConfig sandbox;
    sandbox.ceiling = default_resource_ceiling;
    sandbox.interpreter = interpreter;
    sandbox.sandbox_root = sandbox_root;
    sandbox.max_concurrent_executions = max_concurrent_executions;
    sandbox.require_filesystem_isolation = require_filesystem_isolation;
    return sandbox;
}

ResourceLimits SystemConfig::DefaultLimits() const {
    ResourceLimits limits = default_resource_ceiling;
    limits.container_mode = container_mode_default;
    return limits;
}

} // namespace core
} // namespace sentrybox
