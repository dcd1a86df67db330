/**
 * @file sandbox_engine.hpp
 * @brief Isolated execution of untrusted Python code under resource limits
 *
 * Runs a script in a child process fenced by rlimits, PR_SET_NO_NEW_PRIVS,
 * Landlock filesystem rules and, in container mode, Linux namespaces. Output
 * is captured through pipes, a wall-clock watchdog kills the whole process
 * group, and every outcome is reported as a termination reason rather than an
 * exception.
 *
 * @date 2025
 */

#pragma once

#include "sentrybox/core/execution_gate.hpp"

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sentrybox {
namespace core {

/**
 * @enum TerminationReason
 * @brief Why an execution ended; exactly one per result
 */
enum class TerminationReason {
    COMPLETED,                ///< Process exited on its own
    TIMEOUT,                  ///< Killed by the wall-clock watchdog
    RESOURCE_LIMIT_EXCEEDED,  ///< CPU, memory, file size or process limit hit
    BLOCKED_BY_SCAN,          ///< Never launched: threat scan blocked it
    PERMISSION_DENIED,        ///< Never launched: caller lacks code:execute
    CANCELLED,                ///< Cancel() was called
    INTERNAL_ERROR            ///< Sandbox setup or host failure
};

std::string TerminationReasonToString(TerminationReason reason);
std::optional<TerminationReason> TerminationReasonFromString(const std::string& str);

/**
 * @enum ExecutionState
 * @brief Lifecycle of one execution inside the engine
 */
enum class ExecutionState {
    PENDING,
    LAUNCHING,
    RUNNING,
    COMPLETED,
    TIMED_OUT,
    LIMIT_EXCEEDED,
    CANCELLED,
    LAUNCH_FAILED
};

std::string ExecutionStateToString(ExecutionState state);

/**
 * @struct ResourceLimits
 * @brief Constraints applied to one execution
 *
 * Treated as an immutable value: ClampTo() returns a new instance.
 */
struct ResourceLimits {
    std::chrono::milliseconds max_cpu_time{10000};       ///< RLIMIT_CPU (rounded up to seconds)
    std::chrono::milliseconds max_wall_time{30000};      ///< Watchdog deadline
    std::uint64_t max_memory_bytes{256ull * 1024 * 1024};///< RLIMIT_DATA
    std::uint64_t max_open_files{64};                    ///< RLIMIT_NOFILE
    std::uint64_t max_processes{16};                     ///< RLIMIT_NPROC
    std::uint64_t max_threads{32};                       ///< Also counted by RLIMIT_NPROC
    std::vector<std::string> allowed_paths;              ///< Extra read-only prefixes
    std::vector<std::string> denied_paths;               ///< Wins over any allow rule
    bool container_mode{false};                          ///< Namespace isolation
    bool allow_network{false};
    std::uint64_t max_output_bytes{1024 * 1024};         ///< Per stream
    std::uint64_t max_file_size_bytes{16ull * 1024 * 1024};  ///< RLIMIT_FSIZE

    /**
     * @brief Restrict these limits to a ceiling
     *
     * Numeric fields take the minimum, network access is ANDed, deny lists
     * are unioned and container mode is ORed. Allowed paths survive only if
     * they lie beneath one of the ceiling's allowed paths.
     */
    ResourceLimits ClampTo(const ResourceLimits& ceiling) const;

    bool operator==(const ResourceLimits& other) const;
};

/**
 * @struct LimitOverrides
 * @brief Caller-supplied partial limits
 */
struct LimitOverrides {
    std::optional<std::chrono::milliseconds> max_cpu_time;
    std::optional<std::chrono::milliseconds> max_wall_time;
    std::optional<std::uint64_t> max_memory_bytes;
    std::optional<std::uint64_t> max_open_files;
    std::optional<std::uint64_t> max_processes;
    std::optional<std::uint64_t> max_threads;
    std::optional<std::vector<std::string>> allowed_paths;
    std::vector<std::string> extra_denied_paths;
    std::optional<bool> container_mode;
    std::optional<bool> allow_network;
    std::optional<std::uint64_t> max_output_bytes;
    std::optional<std::uint64_t> max_file_size_bytes;

    /// Overlay onto @p base (the result still needs ClampTo)
    ResourceLimits ApplyTo(const ResourceLimits& base) const;
};

/**
 * @struct ExecutionRequest
 * @brief One unit of work for the executor
 */
struct ExecutionRequest {
    std::string execution_id;   ///< 32 hex chars
    std::string code;
    ResourceLimits limits;
    std::string principal_id;
    std::chrono::system_clock::time_point created_at;

    /// Build a request with a fresh random execution id
    static ExecutionRequest Create(std::string code,
                                   ResourceLimits limits,
                                   std::string principal_id);
};

/**
 * @struct ExecutionResult
 * @brief Outcome of one execution
 */
struct ExecutionResult {
    std::string execution_id;
    bool success{false};                          ///< COMPLETED with exit code 0
    std::string stdout_output;
    std::string stderr_output;
    int exit_code{-1};                            ///< 128+N when killed by signal N
    std::chrono::milliseconds wall_duration{0};
    std::chrono::milliseconds cpu_time{0};
    TerminationReason termination_reason{TerminationReason::INTERNAL_ERROR};
    std::uint64_t peak_memory_bytes{0};
    bool stdout_truncated{false};
    bool stderr_truncated{false};
    std::string error_message;
    std::chrono::system_clock::time_point started_at;

    /// Result for an execution that never reached the executor
    static ExecutionResult NotLaunched(const std::string& execution_id,
                                       TerminationReason reason,
                                       const std::string& message);

    bool operator==(const ExecutionResult& other) const;
};

/**
 * @struct SandboxConfig
 * @brief Engine-wide settings
 */
struct SandboxConfig {
    ResourceLimits ceiling;                                ///< Upper bound for every request
    std::string interpreter{"/usr/bin/python3"};           ///< Absolute path
    std::vector<std::string> interpreter_args{"-B", "-s"}; ///< Before the script name
    std::filesystem::path sandbox_root{std::filesystem::temp_directory_path() / "sentrybox"};
    std::vector<std::string> system_read_paths{            ///< Read/execute for the interpreter
        "/usr", "/lib", "/lib64", "/lib32", "/bin",
        "/etc/ld.so.cache", "/etc/localtime", "/etc/alternatives",
        "/dev/null", "/dev/urandom"
    };
    std::size_t max_concurrent_executions{4};
    std::uint64_t address_space_headroom{1024ull * 1024 * 1024}; ///< RLIMIT_AS = memory + this
    bool require_filesystem_isolation{true};               ///< Fail closed without Landlock
    bool verbose_logging{false};
};

/**
 * @class CodeExecutor
 * @brief Seam between the pipeline and the process sandbox
 */
class CodeExecutor {
public:
    using LaunchObserver = std::function<void(pid_t pid, const std::string& execution_id)>;
    using ExitObserver = std::function<void(pid_t pid, const std::string& execution_id)>;

    virtual ~CodeExecutor() = default;

    virtual ExecutionResult Execute(const ExecutionRequest& request) = 0;
    virtual bool Cancel(const std::string& execution_id) = 0;
    virtual void SetLaunchObserver(LaunchObserver observer) = 0;
    virtual void SetExitObserver(ExitObserver observer) = 0;
};

/**
 * @class SandboxEngine
 * @brief Linux process sandbox for interpreted code
 *
 * **Execution Flow**:
 * ```
 * Execute(request)
 *   ├─ clamp limits to the ceiling
 *   ├─ wait for a slot (FIFO)
 *   ├─ private working directory with main.py
 *   ├─ fork → IsolatedChild::Run (rlimits, Landlock, namespaces, execve)
 *   ├─ poll stdout/stderr until exit or deadline
 *   └─ wait4 → classify → ExecutionResult
 * ```
 *
 * **Thread Safety**: Execute() may be called concurrently; the number of
 * simultaneous children is bounded by max_concurrent_executions.
 *
 * **Usage Example**:
 * @code
 * SandboxEngine engine(SandboxBuilder()
 *     .WithWallTimeout(std::chrono::seconds(5))
 *     .WithMemoryLimit(64 * 1024 * 1024)
 *     .Build());
 *
 * auto request = ExecutionRequest::Create("print(1 + 1)", engine.GetConfig().ceiling, "alice");
 * auto result = engine.Execute(request);
 * // result.stdout_output == "2\n"
 * @endcode
 */
class SandboxEngine : public CodeExecutor {
public:
    explicit SandboxEngine(const SandboxConfig& config = SandboxConfig{});
    ~SandboxEngine() override;

    SandboxEngine(const SandboxEngine&) = delete;
    SandboxEngine& operator=(const SandboxEngine&) = delete;

    /**
     * @brief Run the request's code to completion
     *
     * Blocks for at most the wall timeout plus setup time (and any time spent
     * queued for a slot). Never throws for execution-time faults.
     */
    ExecutionResult Execute(const ExecutionRequest& request) override;

    /// Execute on a background thread
    std::future<ExecutionResult> ExecuteAsync(ExecutionRequest request);

    /**
     * @brief Kill a queued or running execution
     * @return true if the id was known and not already finished
     */
    bool Cancel(const std::string& execution_id) override;

    void SetLaunchObserver(LaunchObserver observer) override;
    void SetExitObserver(ExitObserver observer) override;

    /// Ids of executions queued or running
    std::vector<std::string> ActiveExecutions() const;

    const SandboxConfig& GetConfig() const { return config_; }

    /// True if the kernel offers Landlock
    static bool IsFilesystemIsolationSupported();

    /// Environment handed to the child
    static std::vector<std::string> BuildEnvironment(const std::string& working_directory);

private:
    struct Slot {
        std::atomic<bool> cancelled{false};
        ExecutionState state{ExecutionState::PENDING};
        pid_t pgid{-1};
        bool finished{false};
    };

    SandboxConfig config_;
    ExecutionGate gate_;

    mutable std::mutex slots_mutex_;
    std::map<std::string, std::shared_ptr<Slot>> slots_;

    mutable std::mutex observers_mutex_;
    LaunchObserver launch_observer_;
    ExitObserver exit_observer_;

    ExecutionResult Run(const ExecutionRequest& request,
                        const ResourceLimits& limits,
                        const std::shared_ptr<Slot>& slot);
    void SetState(const std::shared_ptr<Slot>& slot, ExecutionState state);
    void NotifyLaunch(pid_t pid, const std::string& execution_id);
    void NotifyExit(pid_t pid, const std::string& execution_id);
};

/**
 * @class SandboxBuilder
 * @brief Fluent API for constructing sandbox configurations
 *
 * **Usage Example**:
 * @code
 * auto config = SandboxBuilder()
 *     .WithCpuLimit(std::chrono::seconds(2))
 *     .WithContainerMode()
 *     .WithMaxConcurrent(8)
 *     .Build();
 * @endcode
 */
class SandboxBuilder {
public:
    SandboxBuilder& WithCpuLimit(std::chrono::milliseconds limit) {
        config_.ceiling.max_cpu_time = limit;
        return *this;
    }

    SandboxBuilder& WithWallTimeout(std::chrono::milliseconds timeout) {
        config_.ceiling.max_wall_time = timeout;
        return *this;
    }

    SandboxBuilder& WithMemoryLimit(std::uint64_t bytes) {
        config_.ceiling.max_memory_bytes = bytes;
        return *this;
    }

    SandboxBuilder& WithProcessLimit(std::uint64_t processes) {
        config_.ceiling.max_processes = processes;
        return *this;
    }

    SandboxBuilder& WithContainerMode(bool enable = true) {
        config_.ceiling.container_mode = enable;
        return *this;
    }

    SandboxBuilder& AllowNetwork(bool enable = true) {
        config_.ceiling.allow_network = enable;
        return *this;
    }

    SandboxBuilder& DenyPath(const std::string& path) {
        config_.ceiling.denied_paths.push_back(path);
        return *this;
    }

    SandboxBuilder& AllowPath(const std::string& path) {
        config_.ceiling.allowed_paths.push_back(path);
        return *this;
    }

    SandboxBuilder& WithInterpreter(const std::string& path) {
        config_.interpreter = path;
        return *this;
    }

    SandboxBuilder& WithSandboxRoot(const std::filesystem::path& root) {
        config_.sandbox_root = root;
        return *this;
    }

    SandboxBuilder& WithMaxConcurrent(std::size_t count) {
        config_.max_concurrent_executions = count;
        return *this;
    }

    SandboxBuilder& RequireFilesystemIsolation(bool required = true) {
        config_.require_filesystem_isolation = required;
        return *this;
    }

    SandboxConfig Build() const {
        return config_;
    }

private:
    SandboxConfig config_;
};

} // namespace core
} // namespace sentrybox
