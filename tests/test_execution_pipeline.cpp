/**
 * @file test_execution_pipeline.cpp
 * @brief Gating order and audit trail of RunUserCode
 */

#include "sentrybox/core/execution_pipeline.hpp"
#include "sentrybox/core/sandbox_engine.hpp"
#include "sentrybox/analyzers/threat_scanner.hpp"
#include "sentrybox/security/permission_service.hpp"
#include "sentrybox/security/permission_store.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <mutex>
#include <thread>

#include <unistd.h>

using namespace sentrybox;
using namespace sentrybox::core;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

constexpr const char* kPython = "/usr/bin/python3";

// Records requests and reports the test process itself as the launched child
class SpyExecutor : public CodeExecutor {
public:
    ExecutionResult Execute(const ExecutionRequest& request) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
        }
        if (launch_) launch_(::getpid(), request.execution_id);
        std::this_thread::sleep_for(60ms);
        if (exit_) exit_(::getpid(), request.execution_id);

        ExecutionResult result;
        result.execution_id = request.execution_id;
        result.success = true;
        result.exit_code = 0;
        result.stdout_output = "ok\n";
        result.termination_reason = TerminationReason::COMPLETED;
        return result;
    }

    bool Cancel(const std::string&) override { return false; }
    void SetLaunchObserver(LaunchObserver observer) override { launch_ = std::move(observer); }
    void SetExitObserver(ExitObserver observer) override { exit_ = std::move(observer); }

    std::vector<ExecutionRequest> Requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<ExecutionRequest> requests_;
    LaunchObserver launch_;
    ExitObserver exit_;
};

class ExecutionPipelineTest : public ::testing::Test {
protected:
    std::shared_ptr<security::PermissionService> permissions_;
    std::shared_ptr<SpyExecutor> executor_;
    std::unique_ptr<ExecutionPipeline> pipeline_;
    ResourceLimits defaults_;

    void SetUp() override {
        security::PermissionService::Config permission_config;
        permission_config.pbkdf2_iterations = 1000;
        permissions_ = std::make_shared<security::PermissionService>(
            std::make_shared<security::PermissionStore>(":memory:"), permission_config);

        monitors::ExecutionMonitor::Config monitor_config;
        monitor_config.poll_interval = 10ms;

        defaults_.max_wall_time = 5s;
        defaults_.max_memory_bytes = 64ull * 1024 * 1024;

        ExecutionPipeline::Config config;
        config.default_limits = defaults_;

        executor_ = std::make_shared<SpyExecutor>();
        pipeline_ = std::make_unique<ExecutionPipeline>(
            permissions_, std::make_shared<analyzers::ThreatScanner>(), executor_,
            std::make_shared<monitors::ExecutionMonitor>(monitor_config), config);
    }

    std::string Login(const std::string& name, const std::string& role) {
        auto id = permissions_->CreatePrincipal(name, name + "-pass");
        EXPECT_TRUE(id.ok());
        EXPECT_TRUE(permissions_->AssignRole(id.value(), role).ok());
        auto token = permissions_->Authenticate(name, name + "-pass");
        EXPECT_TRUE(token.ok());
        return token.value();
    }

    std::vector<security::AccessLogEntry> Log(const std::string& action) {
        security::AccessLogFilter filter;
        filter.action = action;
        return permissions_->QueryAccessLog(filter).value();
    }
};

// Same wiring as the command-line tool: real sandbox, real monitor
class SandboxPipelineTest : public ::testing::Test {
protected:
    fs::path root_;
    std::shared_ptr<security::PermissionService> permissions_;
    std::unique_ptr<ExecutionPipeline> pipeline_;

    void SetUp() override {
        if (::access(kPython, X_OK) != 0) {
            GTEST_SKIP() << "python3 not available";
        }
        root_ = fs::temp_directory_path() / ("sentrybox-pipeline-" + std::to_string(::getpid()));

        security::PermissionService::Config permission_config;
        permission_config.pbkdf2_iterations = 1000;
        permissions_ = std::make_shared<security::PermissionService>(
            std::make_shared<security::PermissionStore>(":memory:"), permission_config);

        auto engine = std::make_shared<SandboxEngine>(
            SandboxBuilder()
                .WithInterpreter(kPython)
                .WithSandboxRoot(root_)
                .WithMaxConcurrent(2)
                .RequireFilesystemIsolation(SandboxEngine::IsFilesystemIsolationSupported())
                .Build());

        monitors::ExecutionMonitor::Config monitor_config;
        monitor_config.poll_interval = 20ms;

        ExecutionPipeline::Config config;
        config.default_limits.max_wall_time = 10s;

        pipeline_ = std::make_unique<ExecutionPipeline>(
            permissions_, std::make_shared<analyzers::ThreatScanner>(), engine,
            std::make_shared<monitors::ExecutionMonitor>(monitor_config), config);
    }

    void TearDown() override {
        pipeline_.reset();
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    std::string Login(const std::string& name) {
        auto id = permissions_->CreatePrincipal(name, name + "-pass");
        EXPECT_TRUE(id.ok());
        EXPECT_TRUE(permissions_->AssignRole(id.value(), "developer").ok());
        return permissions_->Authenticate(name, name + "-pass").value();
    }
};

} // namespace

TEST_F(SandboxPipelineTest, MonitoredRunProducesSummary) {
    auto token = Login("dev");
    auto result = pipeline_->RunUserCode(token, "import time\ntime.sleep(0.3)\nprint('done')\n");

    EXPECT_EQ(result.execution.termination_reason, TerminationReason::COMPLETED)
        << result.execution.stderr_output;
    EXPECT_EQ(result.execution.stdout_output, "done\n");
    EXPECT_EQ(result.phase_reached, PipelinePhase::DONE);

    ASSERT_TRUE(result.summary.has_value());
    EXPECT_EQ(result.summary->session_id, result.execution_id);
    EXPECT_NE(result.summary->pid, ::getpid());
    EXPECT_GE(result.summary->total_snapshots, 1u);
    EXPECT_GT(result.summary->memory_bytes.peak, 0.0);
    EXPECT_TRUE(pipeline_->GetActiveRuns().empty());
}

TEST_F(SandboxPipelineTest, CancelStopsARunningExecution) {
    auto token = Login("dev");

    PipelineResult result;
    std::thread runner([&] {
        result = pipeline_->RunUserCode(token, "import time\ntime.sleep(30)\n");
    });

    // The sandbox only knows the run once it has been handed over
    bool cancelled = false;
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!cancelled && std::chrono::steady_clock::now() < deadline) {
        for (const auto& run : pipeline_->GetActiveRuns()) {
            if (run.phase == PipelinePhase::EXECUTING && pipeline_->Cancel(run.execution_id)) {
                cancelled = true;
            }
        }
        std::this_thread::sleep_for(10ms);
    }
    runner.join();

    ASSERT_TRUE(cancelled);
    EXPECT_EQ(result.execution.termination_reason, TerminationReason::CANCELLED);
    EXPECT_FALSE(result.execution.success);
    EXPECT_LT(result.execution.wall_duration, 10s);
    EXPECT_FALSE(pipeline_->Cancel(result.execution_id));
}

TEST_F(ExecutionPipelineTest, DeveloperRunsWithDefaultLimits) {
    auto token = Login("dev", "developer");
    auto result = pipeline_->RunUserCode(token, "print(sum(range(100)))");

    EXPECT_EQ(result.execution.termination_reason, TerminationReason::COMPLETED);
    EXPECT_EQ(result.phase_reached, PipelinePhase::DONE);
    ASSERT_TRUE(result.scan.has_value());
    EXPECT_FALSE(result.scan->blocking);

    auto requests = executor_->Requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].limits, defaults_);
    EXPECT_EQ(requests[0].execution_id, result.execution_id);
    EXPECT_EQ(requests[0].principal_id, result.principal_id);

    // Monitor attached on launch and detached on exit
    ASSERT_TRUE(result.summary.has_value());
    EXPECT_EQ(result.summary->session_id, result.execution_id);
    EXPECT_GE(result.summary->total_snapshots, 1u);

    auto executes = Log("execute");
    ASSERT_EQ(executes.size(), 1u);
    EXPECT_EQ(executes[0].decision, security::AccessDecision::ALLOW);
    ASSERT_TRUE(executes[0].resource_scope.has_value());
    EXPECT_EQ(*executes[0].resource_scope, result.execution_id);
    EXPECT_TRUE(pipeline_->GetActiveRuns().empty());
}

TEST_F(ExecutionPipelineTest, OverridesAreLayeredOnDefaults) {
    auto token = Login("dev", "developer");
    LimitOverrides overrides;
    overrides.max_wall_time = 2s;
    overrides.allow_network = true;

    pipeline_->RunUserCode(token, "x = 1", overrides);

    auto requests = executor_->Requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].limits.max_wall_time, std::chrono::milliseconds(2000));
    EXPECT_TRUE(requests[0].limits.allow_network);
    EXPECT_EQ(requests[0].limits.max_memory_bytes, defaults_.max_memory_bytes);
}

TEST_F(ExecutionPipelineTest, BlockedCodeNeverReachesExecutor) {
    auto token = Login("dev", "developer");
    auto result = pipeline_->RunUserCode(token, "import os\nos.system('rm -rf /')\n");

    EXPECT_EQ(result.execution.termination_reason, TerminationReason::BLOCKED_BY_SCAN);
    EXPECT_FALSE(result.execution.success);
    ASSERT_TRUE(result.scan.has_value());
    EXPECT_TRUE(result.scan->blocking);
    EXPECT_FALSE(result.summary.has_value());
    EXPECT_TRUE(executor_->Requests().empty());

    auto executes = Log("execute");
    ASSERT_EQ(executes.size(), 1u);
    EXPECT_EQ(executes[0].decision, security::AccessDecision::DENY);
    EXPECT_EQ(executes[0].principal, result.principal_id);
}

TEST_F(ExecutionPipelineTest, ObserverIsDeniedBeforeScanning) {
    auto token = Login("watcher", "observer");
    auto result = pipeline_->RunUserCode(token, "print(1)");

    EXPECT_EQ(result.execution.termination_reason, TerminationReason::PERMISSION_DENIED);
    EXPECT_FALSE(result.scan.has_value());
    EXPECT_TRUE(executor_->Requests().empty());
    EXPECT_TRUE(Log("execute").empty());

    auto checks = Log("check");
    ASSERT_FALSE(checks.empty());
    EXPECT_EQ(checks[0].decision, security::AccessDecision::DENY);
    EXPECT_EQ(checks[0].permission, security::permissions::CODE_EXECUTE);
}

TEST_F(ExecutionPipelineTest, InvalidTokenIsDenied) {
    auto result = pipeline_->RunUserCode("not-a-token", "print(1)");

    EXPECT_EQ(result.execution.termination_reason, TerminationReason::PERMISSION_DENIED);
    EXPECT_TRUE(result.principal_id.empty());
    EXPECT_TRUE(executor_->Requests().empty());

    auto checks = Log("check");
    ASSERT_FALSE(checks.empty());
    EXPECT_EQ(checks[0].principal, security::kUnknownPrincipal);
}

TEST_F(ExecutionPipelineTest, MissingComponentThrows) {
    EXPECT_THROW(ExecutionPipeline(permissions_, nullptr, executor_,
                                   std::make_shared<monitors::ExecutionMonitor>()),
                 std::invalid_argument);
}
