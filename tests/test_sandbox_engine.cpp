/**
 * @file test_sandbox_engine.cpp
 * @brief End-to-end executions under resource limits
 *
 * Requires /usr/bin/python3. Filesystem confinement tests additionally
 * require Landlock.
 */

#include "sentrybox/core/sandbox_engine.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <csignal>
#include <filesystem>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace sentrybox::core;
using namespace std::chrono_literals;

namespace {

constexpr const char* kPython = "/usr/bin/python3";

class SandboxEngineTest : public ::testing::Test {
protected:
    fs::path root_;
    std::unique_ptr<SandboxEngine> engine_;

    void SetUp() override {
        if (::access(kPython, X_OK) != 0) {
            GTEST_SKIP() << "python3 not available";
        }
        root_ = fs::temp_directory_path() / ("sentrybox-engine-" + std::to_string(::getpid()));
        engine_ = std::make_unique<SandboxEngine>(MakeConfig());
    }

    void TearDown() override {
        engine_.reset();
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    SandboxConfig MakeConfig(std::size_t concurrency = 4) {
        return SandboxBuilder()
            .WithInterpreter(kPython)
            .WithSandboxRoot(root_)
            .WithMaxConcurrent(concurrency)
            .RequireFilesystemIsolation(SandboxEngine::IsFilesystemIsolationSupported())
            .Build();
    }

    ExecutionResult Run(const std::string& code, ResourceLimits limits = ResourceLimits{}) {
        return engine_->Execute(ExecutionRequest::Create(code, std::move(limits), "tester"));
    }
};

} // namespace

TEST_F(SandboxEngineTest, SimpleProgramCompletes) {
    auto result = Run("print(sum(range(100)))\n");
    EXPECT_EQ(result.termination_reason, TerminationReason::COMPLETED) << result.stderr_output;
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_output, "4950\n");
    EXPECT_FALSE(result.stdout_truncated);
}

TEST_F(SandboxEngineTest, NonZeroExitIsStillCompleted) {
    auto result = Run("import sys\nsys.stderr.write('bad input\\n')\nraise SystemExit(3)\n");
    EXPECT_EQ(result.termination_reason, TerminationReason::COMPLETED);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_NE(result.stderr_output.find("bad input"), std::string::npos);
}

TEST_F(SandboxEngineTest, WallTimeoutKillsWithinBound) {
    ResourceLimits limits;
    limits.max_wall_time = 1000ms;
    limits.max_cpu_time = 10000ms;

    const auto start = std::chrono::steady_clock::now();
    auto result = Run("import time\nwhile True:\n    time.sleep(0.05)\n", limits);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.termination_reason, TerminationReason::TIMEOUT);
    EXPECT_FALSE(result.success);
    EXPECT_GE(result.wall_duration, 1000ms);
    EXPECT_LT(elapsed, 5s);
}

TEST_F(SandboxEngineTest, CpuLimitIsEnforced) {
    ResourceLimits limits;
    limits.max_cpu_time = 1000ms;
    limits.max_wall_time = 20000ms;

    auto result = Run("while True:\n    pass\n", limits);
    EXPECT_EQ(result.termination_reason, TerminationReason::RESOURCE_LIMIT_EXCEEDED);
    EXPECT_GE(result.cpu_time, 900ms);
}

TEST_F(SandboxEngineTest, MemoryLimitIsEnforced) {
    ResourceLimits limits;
    limits.max_memory_bytes = 16ull * 1024 * 1024;

    auto result = Run("data = bytearray(256 * 1024 * 1024)\nprint(len(data))\n", limits);
    EXPECT_EQ(result.termination_reason, TerminationReason::RESOURCE_LIMIT_EXCEEDED)
        << result.stderr_output;
    EXPECT_FALSE(result.success);
}

TEST_F(SandboxEngineTest, SelfInflictedKillIsNotALimitBreach) {
    auto result = Run("import os, signal\nprint('bye', flush=True)\nos.kill(os.getpid(), signal.SIGKILL)\n");
    EXPECT_EQ(result.termination_reason, TerminationReason::COMPLETED) << result.stderr_output;
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 128 + SIGKILL);
    EXPECT_EQ(result.stdout_output, "bye\n");
}

TEST_F(SandboxEngineTest, AllocationWithinLimitSucceeds) {
    ResourceLimits limits;
    limits.max_memory_bytes = 256ull * 1024 * 1024;

    auto result = Run("data = b'x' * (64 * 1024 * 1024)\nprint(len(data))\n", limits);
    EXPECT_EQ(result.termination_reason, TerminationReason::COMPLETED) << result.stderr_output;
    EXPECT_EQ(result.stdout_output, std::to_string(64 * 1024 * 1024) + "\n");
    EXPECT_GT(result.peak_memory_bytes, 64ull * 1024 * 1024);
}

TEST_F(SandboxEngineTest, OutputIsCappedAndFlagged) {
    ResourceLimits limits;
    limits.max_output_bytes = 1024;

    auto result = Run("import sys\nsys.stdout.write('x' * 100000)\n", limits);
    EXPECT_EQ(result.termination_reason, TerminationReason::COMPLETED);
    EXPECT_TRUE(result.stdout_truncated);
    EXPECT_EQ(result.stdout_output.size(), 1024u);
}

TEST_F(SandboxEngineTest, CancelStopsRunningExecution) {
    auto request = ExecutionRequest::Create("import time\ntime.sleep(30)\n", ResourceLimits{}, "tester");
    const std::string id = request.execution_id;
    auto future = engine_->ExecuteAsync(std::move(request));

    for (int i = 0; i < 100; ++i) {
        auto active = engine_->ActiveExecutions();
        if (std::find(active.begin(), active.end(), id) != active.end()) break;
        std::this_thread::sleep_for(10ms);
    }
    std::this_thread::sleep_for(300ms);
    EXPECT_TRUE(engine_->Cancel(id));

    auto result = future.get();
    EXPECT_EQ(result.termination_reason, TerminationReason::CANCELLED);
    EXPECT_FALSE(engine_->Cancel(id));
}

TEST_F(SandboxEngineTest, DuplicateExecutionIdIsRejected) {
    auto request = ExecutionRequest::Create("import time\ntime.sleep(1)\n", ResourceLimits{}, "tester");
    auto first = engine_->ExecuteAsync(request);
    for (int i = 0; i < 100 && engine_->ActiveExecutions().empty(); ++i) {
        std::this_thread::sleep_for(5ms);
    }
    auto second = engine_->Execute(request);
    EXPECT_EQ(second.termination_reason, TerminationReason::INTERNAL_ERROR);
    EXPECT_EQ(first.get().termination_reason, TerminationReason::COMPLETED);
}

TEST_F(SandboxEngineTest, QueuedExecutionsAllComplete) {
    engine_ = std::make_unique<SandboxEngine>(MakeConfig(1));
    std::vector<std::future<ExecutionResult>> runs;
    for (int i = 0; i < 3; ++i) {
        runs.push_back(engine_->ExecuteAsync(
            ExecutionRequest::Create("print(" + std::to_string(i) + ")\n", ResourceLimits{}, "tester")));
    }
    for (int i = 0; i < 3; ++i) {
        auto result = runs[i].get();
        EXPECT_EQ(result.termination_reason, TerminationReason::COMPLETED);
        EXPECT_EQ(result.stdout_output, std::to_string(i) + "\n");
    }
}

TEST_F(SandboxEngineTest, ObserversSeeLaunchAndExit) {
    pid_t launched = 0;
    pid_t exited = 0;
    std::string seen_id;
    engine_->SetLaunchObserver([&](pid_t pid, const std::string& id) { launched = pid; seen_id = id; });
    engine_->SetExitObserver([&](pid_t pid, const std::string&) { exited = pid; });

    auto request = ExecutionRequest::Create("print('hi')\n", ResourceLimits{}, "tester");
    auto result = engine_->Execute(request);
    EXPECT_EQ(result.termination_reason, TerminationReason::COMPLETED);
    EXPECT_GT(launched, 0);
    EXPECT_EQ(launched, exited);
    EXPECT_EQ(seen_id, request.execution_id);
}

TEST_F(SandboxEngineTest, WritesOutsideWorkingDirectoryAreBlocked) {
    if (!SandboxEngine::IsFilesystemIsolationSupported()) {
        GTEST_SKIP() << "Landlock not available";
    }
    const fs::path outside = fs::temp_directory_path() / ("sentrybox-escape-" + std::to_string(::getpid()));
    auto result = Run("open('" + outside.string() + "', 'w').write('x')\n");
    EXPECT_EQ(result.termination_reason, TerminationReason::COMPLETED);
    EXPECT_NE(result.exit_code, 0);
    EXPECT_FALSE(fs::exists(outside));
    EXPECT_NE(result.stderr_output.find("PermissionError"), std::string::npos);
}

TEST_F(SandboxEngineTest, WorkingDirectoryIsWritableAndRemoved) {
    auto result = Run("open('scratch.txt', 'w').write('data')\nprint(open('scratch.txt').read())\n");
    EXPECT_EQ(result.stdout_output, "data\n") << result.stderr_output;

    std::size_t leftovers = 0;
    if (fs::exists(root_)) {
        leftovers = static_cast<std::size_t>(std::distance(fs::directory_iterator(root_),
                                                           fs::directory_iterator()));
    }
    EXPECT_EQ(leftovers, 0u);
}

TEST(ResourceLimitsTest, ClampTakesTheStricterValue) {
    ResourceLimits ceiling;
    ceiling.max_cpu_time = 5000ms;
    ceiling.max_memory_bytes = 128ull * 1024 * 1024;
    ceiling.allowed_paths = {"/data/shared"};
    ceiling.denied_paths = {"/etc/shadow"};
    ceiling.container_mode = true;

    ResourceLimits requested;
    requested.max_cpu_time = 60000ms;
    requested.max_memory_bytes = 64ull * 1024 * 1024;
    requested.allow_network = true;
    requested.allowed_paths = {"/data/shared/prices", "/home"};
    requested.denied_paths = {"/data/shared/prices/private"};

    auto clamped = requested.ClampTo(ceiling);
    EXPECT_EQ(clamped.max_cpu_time, 5000ms);
    EXPECT_EQ(clamped.max_memory_bytes, 64ull * 1024 * 1024);
    EXPECT_FALSE(clamped.allow_network);
    EXPECT_TRUE(clamped.container_mode);
    EXPECT_EQ(clamped.allowed_paths, std::vector<std::string>{"/data/shared/prices"});
    EXPECT_NE(std::find(clamped.denied_paths.begin(), clamped.denied_paths.end(), "/etc/shadow"),
              clamped.denied_paths.end());
    EXPECT_NE(std::find(clamped.denied_paths.begin(), clamped.denied_paths.end(),
                        "/data/shared/prices/private"),
              clamped.denied_paths.end());
}

TEST(ResourceLimitsTest, OverridesApplyOnlySetFields) {
    ResourceLimits base;
    LimitOverrides overrides;
    overrides.max_wall_time = 2000ms;
    overrides.extra_denied_paths = {"/srv"};

    auto limits = overrides.ApplyTo(base);
    EXPECT_EQ(limits.max_wall_time, 2000ms);
    EXPECT_EQ(limits.max_cpu_time, base.max_cpu_time);
    EXPECT_NE(std::find(limits.denied_paths.begin(), limits.denied_paths.end(), "/srv"),
              limits.denied_paths.end());
}

TEST(TerminationReasonTest, NamesRoundTrip) {
    for (auto reason : {TerminationReason::COMPLETED, TerminationReason::TIMEOUT,
                        TerminationReason::RESOURCE_LIMIT_EXCEEDED, TerminationReason::BLOCKED_BY_SCAN,
                        TerminationReason::PERMISSION_DENIED, TerminationReason::CANCELLED,
                        TerminationReason::INTERNAL_ERROR}) {
        auto parsed = TerminationReasonFromString(TerminationReasonToString(reason));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, reason);
    }
}
