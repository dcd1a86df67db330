/**
 * @file test_execution_monitor.cpp
 * @brief Sampling, alerting and summaries against real child processes
 */

#include "sentrybox/monitors/execution_monitor.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <csignal>
#include <fstream>
#include <thread>

#include <sys/wait.h>
#include <unistd.h>

using namespace sentrybox::monitors;
using sentrybox::utils::ErrorCode;
using namespace std::chrono_literals;

namespace {

// Child that idles until killed
class IdleChild {
public:
    IdleChild() {
        pid_ = ::fork();
        if (pid_ == 0) {
            for (;;) {
                ::pause();
            }
        }
    }

    ~IdleChild() { Kill(); }

    IdleChild(const IdleChild&) = delete;
    IdleChild& operator=(const IdleChild&) = delete;

    void Kill() {
        if (pid_ > 0) {
            ::kill(pid_, SIGKILL);
            int status = 0;
            ::waitpid(pid_, &status, 0);
            pid_ = -1;
        }
    }

    pid_t pid() const { return pid_; }

private:
    pid_t pid_{-1};
};

ExecutionMonitor::Config FastConfig() {
    ExecutionMonitor::Config config;
    config.poll_interval = 20ms;
    return config;
}

} // namespace

TEST(ExecutionMonitorTest, RejectsBadArguments) {
    ExecutionMonitor monitor(FastConfig());
    EXPECT_EQ(monitor.Attach(0, "s").error().code, ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(monitor.Attach(::getpid(), "").error().code, ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(monitor.Detach("unknown").error().code, ErrorCode::NOT_FOUND);
}

TEST(ExecutionMonitorTest, DuplicateSessionIsRejected) {
    IdleChild child;
    ASSERT_GT(child.pid(), 0);
    ExecutionMonitor monitor(FastConfig());
    ASSERT_TRUE(monitor.Attach(child.pid(), "dup").ok());
    EXPECT_FALSE(monitor.Attach(child.pid(), "dup").ok());
    EXPECT_TRUE(monitor.Detach("dup").ok());
}

TEST(ExecutionMonitorTest, SnapshotsAreOrderedAndBoundedBySession) {
    IdleChild child;
    ASSERT_GT(child.pid(), 0);
    ExecutionMonitor monitor(FastConfig());

    auto handle = monitor.Attach(child.pid(), "ordered");
    ASSERT_TRUE(handle.ok());
    EXPECT_EQ(monitor.ActiveSessions(), std::vector<std::string>{"ordered"});
    std::this_thread::sleep_for(200ms);

    auto summary = monitor.Detach("ordered");
    ASSERT_TRUE(summary.ok());
    const auto& s = summary.value();

    EXPECT_EQ(s.pid, child.pid());
    EXPECT_EQ(s.final_state, FinalState::DETACHED);
    EXPECT_GE(s.total_snapshots, 3u);
    ASSERT_FALSE(s.snapshots.empty());
    for (std::size_t i = 1; i < s.snapshots.size(); ++i) {
        EXPECT_LE(s.snapshots[i - 1].timestamp, s.snapshots[i].timestamp);
    }
    EXPECT_LE(s.snapshots.back().timestamp, s.ended_at);
    EXPECT_GE(s.ended_at, s.started_at);
    EXPECT_GT(s.memory_bytes.peak, 0.0);
    EXPECT_GE(s.memory_bytes.peak, s.memory_bytes.average);

    ASSERT_GE(s.events.size(), 2u);
    EXPECT_EQ(s.events.front().type, MonitorEventType::START);
    EXPECT_EQ(s.events.back().type, MonitorEventType::END);
    EXPECT_TRUE(monitor.ActiveSessions().empty());
}

TEST(ExecutionMonitorTest, AlertsAreEdgeTriggered) {
    IdleChild child;
    ASSERT_GT(child.pid(), 0);
    ExecutionMonitor monitor(FastConfig());

    std::atomic<int> alerts{0};
    monitor.SetAlertCallback([&](const Alert& alert) {
        if (alert.metric == AlertMetric::THREAD_COUNT) ++alerts;
    });

    AlertThresholds thresholds;
    thresholds.thread_count = 0;
    ASSERT_TRUE(monitor.Attach(child.pid(), "alerts", thresholds).ok());
    std::this_thread::sleep_for(200ms);
    auto summary = monitor.Detach("alerts");
    ASSERT_TRUE(summary.ok());

    // The thread count stays above the threshold, so only the first crossing fires
    EXPECT_EQ(alerts.load(), 1);
    EXPECT_EQ(summary.value().breach_count, 1);
}

TEST(ExecutionMonitorTest, ThrowingCallbackDoesNotStopSampling) {
    IdleChild child;
    ASSERT_GT(child.pid(), 0);
    ExecutionMonitor monitor(FastConfig());
    monitor.SetAlertCallback([](const Alert&) { throw std::runtime_error("callback failure"); });

    AlertThresholds thresholds;
    thresholds.open_files = 0;
    ASSERT_TRUE(monitor.Attach(child.pid(), "throwing", thresholds).ok());
    std::this_thread::sleep_for(150ms);
    auto summary = monitor.Detach("throwing");
    ASSERT_TRUE(summary.ok());
    EXPECT_GE(summary.value().total_snapshots, 3u);
}

TEST(ExecutionMonitorTest, RetentionCapDropsOldestSnapshots) {
    IdleChild child;
    ASSERT_GT(child.pid(), 0);
    auto config = FastConfig();
    config.poll_interval = 10ms;
    config.snapshot_retention_cap = 5;
    ExecutionMonitor monitor(config);

    ASSERT_TRUE(monitor.Attach(child.pid(), "capped").ok());
    std::this_thread::sleep_for(250ms);
    auto peek = monitor.PeekSnapshots("capped");
    ASSERT_TRUE(peek.has_value());
    EXPECT_LE(peek->size(), 5u);

    auto summary = monitor.Detach("capped").value();
    EXPECT_EQ(summary.snapshots.size(), 5u);
    EXPECT_GT(summary.total_snapshots, 5u);
    EXPECT_EQ(summary.dropped_snapshots, summary.total_snapshots - 5);
}

TEST(ExecutionMonitorTest, ExitedProcessFinalisesAsUnavailable) {
    IdleChild child;
    ASSERT_GT(child.pid(), 0);
    ExecutionMonitor monitor(FastConfig());

    ASSERT_TRUE(monitor.Attach(child.pid(), "gone").ok());
    std::this_thread::sleep_for(60ms);
    child.Kill();
    std::this_thread::sleep_for(100ms);

    auto summary = monitor.Detach("gone");
    ASSERT_TRUE(summary.ok());
    EXPECT_EQ(summary.value().final_state, FinalState::PROCESS_UNAVAILABLE);
    EXPECT_EQ(summary.value().events.back().type, MonitorEventType::END);
}

TEST(ExecutionMonitorTest, LastSnapshotIsWithinOnePollIntervalOfTheEnd) {
    ExecutionMonitor::Config config;
    config.poll_interval = 100ms;
    // Sampling itself reads several /proc files
    const auto slack = 50ms;

    {
        IdleChild child;
        ASSERT_GT(child.pid(), 0);
        ExecutionMonitor monitor(config);
        ASSERT_TRUE(monitor.Attach(child.pid(), "detached").ok());
        std::this_thread::sleep_for(350ms);
        auto summary = monitor.Detach("detached");
        ASSERT_TRUE(summary.ok());
        ASSERT_FALSE(summary.value().snapshots.empty());
        EXPECT_LE(summary.value().ended_at - summary.value().snapshots.back().timestamp,
                  config.poll_interval + slack);
    }

    IdleChild child;
    ASSERT_GT(child.pid(), 0);
    ExecutionMonitor monitor(config);
    ASSERT_TRUE(monitor.Attach(child.pid(), "terminated").ok());
    std::this_thread::sleep_for(250ms);
    const auto killed_at = std::chrono::system_clock::now();
    child.Kill();
    std::this_thread::sleep_for(300ms);

    auto summary = monitor.Detach("terminated");
    ASSERT_TRUE(summary.ok());
    EXPECT_EQ(summary.value().final_state, FinalState::PROCESS_UNAVAILABLE);
    ASSERT_FALSE(summary.value().snapshots.empty());
    EXPECT_GE(summary.value().snapshots.back().timestamp, killed_at - config.poll_interval - slack);
}

TEST(ExecutionMonitorTest, ExportedSummaryIsJson) {
    IdleChild child;
    ASSERT_GT(child.pid(), 0);
    ExecutionMonitor monitor(FastConfig());
    ASSERT_TRUE(monitor.Attach(child.pid(), "export").ok());
    std::this_thread::sleep_for(60ms);
    auto summary = monitor.Detach("export").value();

    auto path = std::filesystem::temp_directory_path() /
                ("sentrybox-summary-" + std::to_string(::getpid()) + ".json");
    auto status = ExecutionMonitor::ExportSummary(summary, path);
    ASSERT_TRUE(status.ok()) << status.error().message;

    std::ifstream in(path);
    auto j = nlohmann::json::parse(in);
    std::filesystem::remove(path);

    EXPECT_EQ(j["session_id"], "export");
    EXPECT_EQ(j["final_state"], "detached");
    EXPECT_EQ(j["snapshots"].size(), summary.snapshots.size());
    EXPECT_TRUE(j["metrics"].contains("thread_count"));
}

TEST(ExecutionMonitorTest, FinalStateNamesRoundTrip) {
    for (auto state : {FinalState::DETACHED, FinalState::PROCESS_UNAVAILABLE}) {
        auto parsed = FinalStateFromString(FinalStateToString(state));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, state);
    }
}
