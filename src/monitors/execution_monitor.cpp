/**
 * @file execution_monitor.cpp
 * @brief Per-session /proc sampling with edge-triggered alerts
 *
 * **Sampling**:
 * - /proc/<pid>/stat: utime+stime (CPU%), thread count, state
 * - /proc/<pid>/status: VmRSS
 * - /proc/<pid>/io: cumulative storage reads and writes
 * - /proc/<pid>/fd: open descriptors and sockets
 * - /proc/meminfo: MemTotal for memory percent
 *
 * CPU% is the tick delta over the wall delta since the previous sample, so
 * a multi-threaded process can exceed 100.
 *
 * **Alerting**:
 * ```
 * value <= threshold  →  armed
 * value >  threshold  →  fire once, disarm, breach_count++
 * ```
 *
 * @date 2025
 */

#include "sentrybox/monitors/execution_monitor.hpp"
#include "sentrybox/reporters/json_reporter.hpp"
#include "sentrybox/utils/procfs.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <thread>

namespace sentrybox {
namespace monitors {

namespace {

struct Accumulator {
    double peak{0.0};
    double sum{0.0};

    void Add(double value) {
        peak = std::max(peak, value);
        sum += value;
    }

    MetricStats Stats(std::uint64_t count) const {
        return MetricStats{peak, count ? sum / static_cast<double>(count) : 0.0};
    }
};

} // anonymous namespace

struct ExecutionMonitor::Session {
    std::string id;
    pid_t pid{0};
    AlertThresholds thresholds;
    std::chrono::system_clock::time_point attached_at;

    std::mutex mutex;
    std::condition_variable cv;
    bool stop{false};
    bool finished{false};
    std::thread worker;

    std::deque<ResourceSnapshot> snapshots;
    std::uint64_t total{0};
    std::uint64_t dropped{0};
    std::chrono::system_clock::time_point last_timestamp;

    Accumulator cpu;
    Accumulator memory;
    Accumulator memory_pct;
    Accumulator disk_read;
    Accumulator disk_write;
    Accumulator connections;
    Accumulator files;
    Accumulator threads;

    int breach_count{0};
    std::map<AlertMetric, bool> armed;
    FinalState final_state{FinalState::DETACHED};
    std::vector<MonitorEvent> events;

    std::optional<std::uint64_t> last_ticks;
    std::chrono::steady_clock::time_point last_sample;
};

std::string AlertMetricToString(AlertMetric metric) {
    switch (metric) {
        case AlertMetric::CPU_PERCENT:         return "cpu_percent";
        case AlertMetric::MEMORY_BYTES:        return "memory_bytes";
        case AlertMetric::NETWORK_CONNECTIONS: return "network_connections";
        case AlertMetric::OPEN_FILES:          return "open_files";
        case AlertMetric::THREAD_COUNT:        return "thread_count";
    }
    return "unknown";
}

std::string MonitorEventTypeToString(MonitorEventType type) {
    switch (type) {
        case MonitorEventType::START: return "start";
        case MonitorEventType::ALERT: return "alert";
        case MonitorEventType::END:   return "end";
    }
    return "unknown";
}

std::string FinalStateToString(FinalState state) {
    return state == FinalState::DETACHED ? "detached" : "process_unavailable";
}

std::optional<FinalState> FinalStateFromString(const std::string& str) {
    if (str == "detached") return FinalState::DETACHED;
    if (str == "process_unavailable") return FinalState::PROCESS_UNAVAILABLE;
    return std::nullopt;
}

// Constructors
ExecutionMonitor::ExecutionMonitor() : ExecutionMonitor(Config{}) {}

ExecutionMonitor::ExecutionMonitor(const Config& config)
    : config_(config) {
    if (config_.poll_interval.count() <= 0) {
        config_.poll_interval = std::chrono::milliseconds(500);
    }
    if (config_.snapshot_retention_cap == 0) {
        config_.snapshot_retention_cap = 1;
    }
    spdlog::info("Execution Monitor initialized");
    spdlog::debug("Poll interval: {}ms", config_.poll_interval.count());
    spdlog::debug("Snapshot retention cap: {}", config_.snapshot_retention_cap);
}

// Destructor
ExecutionMonitor::~ExecutionMonitor() {
    for (const auto& id : ActiveSessions()) {
        auto summary = Detach(id);
        if (!summary) {
            spdlog::debug("Session {} already gone: {}", id, summary.error().message);
        }
    }
}

void ExecutionMonitor::SetAlertCallback(AlertCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    alert_callback_ = std::move(callback);
}

utils::Result<MonitorHandle> ExecutionMonitor::Attach(pid_t pid,
                                                      const std::string& session_id,
                                                      std::optional<AlertThresholds> thresholds) {
    if (pid <= 0) {
        return utils::Result<MonitorHandle>::Failure(utils::ErrorCode::INVALID_ARGUMENT, "invalid pid");
    }
    if (session_id.empty()) {
        return utils::Result<MonitorHandle>::Failure(utils::ErrorCode::INVALID_ARGUMENT, "empty session id");
    }

    auto session = std::make_shared<Session>();
    session->id = session_id;
    session->pid = pid;
    session->thresholds = thresholds.value_or(config_.thresholds);
    session->attached_at = std::chrono::system_clock::now();
    session->last_timestamp = session->attached_at;
    session->last_sample = std::chrono::steady_clock::now();
    session->events.push_back({session->attached_at, MonitorEventType::START,
                               "monitoring started for pid " + std::to_string(pid)});

    if (auto stat = utils::ProcFs::ReadStat(pid)) {
        session->last_ticks = stat->utime_ticks + stat->stime_ticks;
    }

    {
        // The worker starts under the lock so Detach() always finds it joinable
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        if (sessions_.count(session_id)) {
            return utils::Result<MonitorHandle>::Failure(utils::ErrorCode::INVALID_ARGUMENT,
                                                         "session already attached");
        }
        session->worker = std::thread([this, session]() { PollLoop(session); });
        sessions_.emplace(session_id, session);
    }

    spdlog::debug("Monitor attached to pid {} (session {})", pid, session_id);
    return MonitorHandle{session_id, pid, session->attached_at};
}

utils::Result<ExecutionSummary> ExecutionMonitor::Detach(const std::string& session_id) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return utils::Result<ExecutionSummary>::Failure(utils::ErrorCode::NOT_FOUND, "unknown session");
        }
        session = it->second;
        sessions_.erase(it);
    }

    {
        std::lock_guard<std::mutex> lock(session->mutex);
        session->stop = true;
    }
    session->cv.notify_all();
    if (session->worker.joinable()) {
        session->worker.join();
    }

    std::lock_guard<std::mutex> lock(session->mutex);
    auto ended = std::max(std::chrono::system_clock::now(), session->last_timestamp);
    session->events.push_back({ended, MonitorEventType::END,
                               "monitoring ended: " + FinalStateToString(session->final_state)});

    ExecutionSummary summary;
    summary.session_id = session->id;
    summary.pid = session->pid;
    summary.started_at = session->attached_at;
    summary.ended_at = ended;
    summary.duration = std::chrono::duration_cast<std::chrono::milliseconds>(ended - session->attached_at);

    const auto count = session->total;
    summary.cpu_percent = session->cpu.Stats(count);
    summary.memory_bytes = session->memory.Stats(count);
    summary.memory_percent = session->memory_pct.Stats(count);
    summary.disk_read_bytes = session->disk_read.Stats(count);
    summary.disk_write_bytes = session->disk_write.Stats(count);
    summary.network_connections = session->connections.Stats(count);
    summary.open_files = session->files.Stats(count);
    summary.thread_count = session->threads.Stats(count);

    summary.breach_count = session->breach_count;
    summary.snapshots.assign(session->snapshots.begin(), session->snapshots.end());
    summary.total_snapshots = session->total;
    summary.dropped_snapshots = session->dropped;
    summary.final_state = session->final_state;
    summary.events = std::move(session->events);

    spdlog::info("✓ Monitor detached from pid {}: {} snapshots, {} breaches, {}",
                 summary.pid, summary.total_snapshots, summary.breach_count,
                 FinalStateToString(summary.final_state));
    return summary;
}

std::vector<std::string> ExecutionMonitor::ActiveSessions() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        ids.push_back(id);
    }
    return ids;
}

std::optional<std::vector<ResourceSnapshot>> ExecutionMonitor::PeekSnapshots(const std::string& session_id) const {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return std::nullopt;
        }
        session = it->second;
    }
    std::lock_guard<std::mutex> lock(session->mutex);
    return std::vector<ResourceSnapshot>(session->snapshots.begin(), session->snapshots.end());
}

utils::Status ExecutionMonitor::ExportSummary(const ExecutionSummary& summary,
                                              const std::filesystem::path& path) {
    return reporters::JsonReporter::SaveToFile(reporters::JsonReporter::ToJson(summary), path);
}

// ============================================================================
// POLLING
// ============================================================================

void ExecutionMonitor::PollLoop(const std::shared_ptr<Session>& session) {
    for (;;) {
        if (!Sample(*session)) {
            std::lock_guard<std::mutex> lock(session->mutex);
            session->final_state = FinalState::PROCESS_UNAVAILABLE;
            session->finished = true;
            spdlog::debug("Process {} unavailable, session {} finalised", session->pid, session->id);
            return;
        }

        std::unique_lock<std::mutex> lock(session->mutex);
        if (session->cv.wait_for(lock, config_.poll_interval, [&] { return session->stop; })) {
            session->finished = true;
            return;
        }
    }
}

bool ExecutionMonitor::Sample(Session& session) {
    {
        std::lock_guard<std::mutex> lock(session.mutex);
        if (session.stop) {
            return true;
        }
    }

    auto stat = utils::ProcFs::ReadStat(session.pid);
    if (!stat || stat->state == 'Z' || stat->state == 'X') {
        return false;
    }

    ResourceSnapshot snapshot;
    auto now_steady = std::chrono::steady_clock::now();

    const std::uint64_t ticks = stat->utime_ticks + stat->stime_ticks;
    const double wall = std::chrono::duration<double>(now_steady - session.last_sample).count();
    if (session.last_ticks && wall > 0.0 && ticks >= *session.last_ticks) {
        double cpu_seconds = static_cast<double>(ticks - *session.last_ticks) /
                             static_cast<double>(utils::ProcFs::ClockTicksPerSecond());
        snapshot.cpu_percent = cpu_seconds / wall * 100.0;
    }
    session.last_ticks = ticks;
    session.last_sample = now_steady;

    auto rss = utils::ProcFs::ReadResidentBytes(session.pid);
    snapshot.memory_bytes = rss ? *rss
                                : stat->rss_pages * static_cast<std::uint64_t>(utils::ProcFs::PageSize());
    const auto total_memory = utils::ProcFs::TotalMemoryBytes();
    if (total_memory > 0) {
        snapshot.memory_percent = static_cast<double>(snapshot.memory_bytes) /
                                  static_cast<double>(total_memory) * 100.0;
    }

    // /proc/<pid>/io needs ptrace access; missing counters are reported as zero
    if (auto io = utils::ProcFs::ReadIo(session.pid)) {
        snapshot.disk_read_bytes = io->read_bytes;
        snapshot.disk_write_bytes = io->write_bytes;
    }
    if (auto fds = utils::ProcFs::CountFds(session.pid)) {
        snapshot.open_files = fds->open_files;
        snapshot.network_connections = fds->sockets;
    }
    snapshot.thread_count = static_cast<int>(stat->num_threads);

    {
        std::lock_guard<std::mutex> lock(session.mutex);
        snapshot.timestamp = std::max(std::chrono::system_clock::now(), session.last_timestamp);
        session.last_timestamp = snapshot.timestamp;

        session.snapshots.push_back(snapshot);
        ++session.total;
        while (session.snapshots.size() > config_.snapshot_retention_cap) {
            session.snapshots.pop_front();
            ++session.dropped;
        }

        session.cpu.Add(snapshot.cpu_percent);
        session.memory.Add(static_cast<double>(snapshot.memory_bytes));
        session.memory_pct.Add(snapshot.memory_percent);
        session.disk_read.Add(static_cast<double>(snapshot.disk_read_bytes));
        session.disk_write.Add(static_cast<double>(snapshot.disk_write_bytes));
        session.connections.Add(snapshot.network_connections);
        session.files.Add(snapshot.open_files);
        session.threads.Add(snapshot.thread_count);
    }

    if (config_.verbose_logging) {
        spdlog::debug("[{}] cpu={:.1f}% rss={} fds={} threads={}", session.id, snapshot.cpu_percent,
                      snapshot.memory_bytes, snapshot.open_files, snapshot.thread_count);
    }

    Evaluate(session, snapshot);
    return true;
}

void ExecutionMonitor::Evaluate(Session& session, const ResourceSnapshot& snapshot) {
    std::vector<Alert> fired;
    {
        std::lock_guard<std::mutex> lock(session.mutex);

        auto check = [&](AlertMetric metric, double value, std::optional<double> threshold) {
            if (!threshold) {
                return;
            }
            auto it = session.armed.emplace(metric, true).first;
            if (value > *threshold) {
                if (it->second) {
                    it->second = false;
                    ++session.breach_count;
                    fired.push_back({session.id, metric, value, *threshold, snapshot.timestamp});
                    session.events.push_back({snapshot.timestamp, MonitorEventType::ALERT,
                        AlertMetricToString(metric) + " exceeded threshold: " +
                        std::to_string(value) + " > " + std::to_string(*threshold)});
                }
            } else {
                it->second = true;
            }
        };

        const auto& t = session.thresholds;
        check(AlertMetric::CPU_PERCENT, snapshot.cpu_percent, t.cpu_percent);
        check(AlertMetric::MEMORY_BYTES, static_cast<double>(snapshot.memory_bytes),
              t.memory_bytes ? std::optional<double>(static_cast<double>(*t.memory_bytes)) : std::nullopt);
        check(AlertMetric::NETWORK_CONNECTIONS, snapshot.network_connections,
              t.network_connections ? std::optional<double>(*t.network_connections) : std::nullopt);
        check(AlertMetric::OPEN_FILES, snapshot.open_files,
              t.open_files ? std::optional<double>(*t.open_files) : std::nullopt);
        check(AlertMetric::THREAD_COUNT, snapshot.thread_count,
              t.thread_count ? std::optional<double>(*t.thread_count) : std::nullopt);
    }

    for (const auto& alert : fired) {
        spdlog::warn("Alert [{}]: {} = {:.1f} exceeds {:.1f}", alert.session_id,
                     AlertMetricToString(alert.metric), alert.value, alert.threshold);
        NotifyAlert(alert);
    }
}

void ExecutionMonitor::NotifyAlert(const Alert& alert) {
    AlertCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = alert_callback_;
    }
    if (!callback) {
        return;
    }
    try {
        callback(alert);
    }
    catch (const std::exception& e) {
        spdlog::error("Alert callback failed: {}", e.what());
    }
}

} // namespace monitors
} // namespace sentrybox
