/**
 * @file execution_monitor.hpp
 * @brief Resource timeline and threshold alerts for running executions
 *
 * Each attached process gets its own polling thread that samples /proc at a
 * fixed interval, appends a ResourceSnapshot, and evaluates edge-triggered
 * alert thresholds. Detach stops the thread immediately and returns the
 * summary.
 *
 * @date 2025
 */

#pragma once

#include "sentrybox/utils/result.hpp"

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sentrybox {
namespace monitors {

/**
 * @struct ResourceSnapshot
 * @brief One sample of a process's resource usage
 */
struct ResourceSnapshot {
    std::chrono::system_clock::time_point timestamp;
    double cpu_percent{0.0};             ///< Over the previous interval; may exceed 100 with threads
    std::uint64_t memory_bytes{0};       ///< Resident set size
    double memory_percent{0.0};          ///< Of host MemTotal
    std::uint64_t disk_read_bytes{0};    ///< Cumulative
    std::uint64_t disk_write_bytes{0};   ///< Cumulative
    int network_connections{0};          ///< Open socket descriptors
    int open_files{0};                   ///< All open descriptors
    int thread_count{0};
};

/**
 * @enum AlertMetric
 * @brief Metrics that can carry an alert threshold
 */
enum class AlertMetric {
    CPU_PERCENT,
    MEMORY_BYTES,
    NETWORK_CONNECTIONS,
    OPEN_FILES,
    THREAD_COUNT
};

std::string AlertMetricToString(AlertMetric metric);

/**
 * @struct AlertThresholds
 * @brief Upper bounds; unset metrics never alert
 */
struct AlertThresholds {
    std::optional<double> cpu_percent;
    std::optional<std::uint64_t> memory_bytes;
    std::optional<int> network_connections;
    std::optional<int> open_files;
    std::optional<int> thread_count;
};

/**
 * @struct Alert
 * @brief A threshold crossing
 */
struct Alert {
    std::string session_id;
    AlertMetric metric{AlertMetric::CPU_PERCENT};
    double value{0.0};
    double threshold{0.0};
    std::chrono::system_clock::time_point timestamp;
};

using AlertCallback = std::function<void(const Alert&)>;

/**
 * @enum MonitorEventType
 * @brief Entries of the per-session event log
 */
enum class MonitorEventType {
    START,
    ALERT,
    END
};

std::string MonitorEventTypeToString(MonitorEventType type);

struct MonitorEvent {
    std::chrono::system_clock::time_point timestamp;
    MonitorEventType type{MonitorEventType::START};
    std::string message;
};

/**
 * @enum FinalState
 * @brief How a monitoring session ended
 */
enum class FinalState {
    DETACHED,             ///< Detach() while the process was still observable
    PROCESS_UNAVAILABLE   ///< Process exited or /proc became unreadable first
};

std::string FinalStateToString(FinalState state);
std::optional<FinalState> FinalStateFromString(const std::string& str);

/**
 * @struct MetricStats
 * @brief Peak and mean of one metric across every sample taken
 */
struct MetricStats {
    double peak{0.0};
    double average{0.0};
};

/**
 * @struct ExecutionSummary
 * @brief Everything a session collected
 */
struct ExecutionSummary {
    std::string session_id;
    pid_t pid{0};
    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point ended_at;
    std::chrono::milliseconds duration{0};

    MetricStats cpu_percent;
    MetricStats memory_bytes;
    MetricStats memory_percent;
    MetricStats disk_read_bytes;
    MetricStats disk_write_bytes;
    MetricStats network_connections;
    MetricStats open_files;
    MetricStats thread_count;

    int breach_count{0};
    std::vector<ResourceSnapshot> snapshots;   ///< Most recent window, oldest first
    std::uint64_t total_snapshots{0};
    std::uint64_t dropped_snapshots{0};
    FinalState final_state{FinalState::DETACHED};
    std::vector<MonitorEvent> events;
};

/**
 * @struct MonitorHandle
 * @brief Returned by Attach()
 */
struct MonitorHandle {
    std::string session_id;
    pid_t pid{0};
    std::chrono::system_clock::time_point attached_at;
};

/**
 * @class ExecutionMonitor
 * @brief Per-process resource sampler
 *
 * **Thread Safety**: All methods may be called from any thread. Alert
 * callbacks run on the session's polling thread.
 *
 * **Usage Example**:
 * @code
 * ExecutionMonitor monitor;
 * monitor.SetAlertCallback([](const Alert& alert) {
 *     spdlog::warn("{} over threshold", AlertMetricToString(alert.metric));
 * });
 *
 * auto handle = monitor.Attach(pid, "exec-1");
 * // ... process runs ...
 * auto summary = monitor.Detach("exec-1");
 * @endcode
 */
class ExecutionMonitor {
public:
    struct Config {
        std::chrono::milliseconds poll_interval{500};   ///< Sampling period
        std::size_t snapshot_retention_cap{1000};       ///< Oldest snapshots dropped beyond this
        AlertThresholds thresholds;                     ///< Defaults for Attach()
        bool verbose_logging{false};
    };

    ExecutionMonitor();
    explicit ExecutionMonitor(const Config& config);
    ~ExecutionMonitor();

    ExecutionMonitor(const ExecutionMonitor&) = delete;
    ExecutionMonitor& operator=(const ExecutionMonitor&) = delete;

    void SetAlertCallback(AlertCallback callback);

    /**
     * @brief Start sampling @p pid
     *
     * A process that is already gone still gets a session; it finalises as
     * process_unavailable.
     *
     * @return INVALID_ARGUMENT for a bad pid or a session id already in use
     */
    utils::Result<MonitorHandle> Attach(pid_t pid,
                                        const std::string& session_id,
                                        std::optional<AlertThresholds> thresholds = std::nullopt);

    /**
     * @brief Stop sampling and collect the summary
     * @return NOT_FOUND for an unknown session
     */
    utils::Result<ExecutionSummary> Detach(const std::string& session_id);

    std::vector<std::string> ActiveSessions() const;

    /// Copy of the retained snapshots so far
    std::optional<std::vector<ResourceSnapshot>> PeekSnapshots(const std::string& session_id) const;

    /// Write a summary as JSON
    static utils::Status ExportSummary(const ExecutionSummary& summary,
                                       const std::filesystem::path& path);

    const Config& GetConfig() const { return config_; }

private:
    struct Session;

    Config config_;
    mutable std::mutex sessions_mutex_;
    std::map<std::string, std::shared_ptr<Session>> sessions_;

    mutable std::mutex callback_mutex_;
    AlertCallback alert_callback_;

    void PollLoop(const std::shared_ptr<Session>& session);
    bool Sample(Session& session);
    void Evaluate(Session& session, const ResourceSnapshot& snapshot);
    void NotifyAlert(const Alert& alert);
};

} // namespace monitors
} // namespace sentrybox
