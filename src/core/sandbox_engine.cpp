/**
 * @file sandbox_engine.cpp
 * @brief Process sandbox: launch, supervise, classify
 *
 * **Execution Workflow**:
 * 1. **Clamp**: request limits are restricted to the engine ceiling
 * 2. **Admission**: wait for a slot in the FIFO execution gate
 * 3. **Preparation**: private working directory holding main.py
 * 4. **Launch**: fork; the child applies every isolation layer and execs the
 *    interpreter, reporting setup failures through a close-on-exec pipe
 * 5. **Supervision**: poll stdout/stderr, enforce the output cap, kill the
 *    process group at the wall-clock deadline or on cancellation
 * 6. **Collection**: wait4 for CPU time and peak RSS, then classify
 *
 * **Termination Mapping**:
 * - Watchdog kill → timeout
 * - SIGXCPU, SIGXFSZ, SIGKILL from the kernel → resource_limit_exceeded
 * - SIGSEGV / SIGABRT / SIGBUS near the memory ceiling → resource_limit_exceeded
 * - Interpreter out-of-memory markers on stderr → resource_limit_exceeded
 *
 * @date 2025
 */

#include "sentrybox/core/sandbox_engine.hpp"
#include "sentrybox/core/isolation.hpp"
#include "sentrybox/security/credential_utils.hpp"
#include "sentrybox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>

namespace sentrybox {
namespace core {

namespace fs = std::filesystem;

namespace {

constexpr int kPollSliceMs = 50;
constexpr std::size_t kReadChunk = 8192;

std::chrono::system_clock::time_point NowMillis() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

std::chrono::milliseconds ToMillis(const struct timeval& tv) {
    return std::chrono::milliseconds(static_cast<std::int64_t>(tv.tv_sec) * 1000 + tv.tv_usec / 1000);
}

// ============================================================================
// FILE DESCRIPTORS
// ============================================================================

class Pipe {
public:
    Pipe() {
        if (pipe2(fds_, O_CLOEXEC) != 0) {
            throw std::runtime_error(std::string("pipe2 failed: ") + std::strerror(errno));
        }
    }

    ~Pipe() {
        CloseRead();
        CloseWrite();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int ReadEnd() const { return fds_[0]; }
    int WriteEnd() const { return fds_[1]; }

    void CloseRead() { Close(fds_[0]); }
    void CloseWrite() { Close(fds_[1]); }

    void SetReadNonBlocking() {
        int flags = fcntl(fds_[0], F_GETFL);
        if (flags < 0 || fcntl(fds_[0], F_SETFL, flags | O_NONBLOCK) < 0) {
            throw std::runtime_error(std::string("fcntl failed: ") + std::strerror(errno));
        }
    }

private:
    int fds_[2]{-1, -1};

    static void Close(int& fd) {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }
};

// ============================================================================
// WORKING DIRECTORY
// ============================================================================

class WorkingDirectory {
public:
    explicit WorkingDirectory(const fs::path& root) {
        fs::create_directories(root);
        fs::permissions(root, fs::perms::owner_all, fs::perm_options::replace);

        std::string pattern = (root / "exec-XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (!mkdtemp(buffer.data())) {
            throw std::runtime_error(std::string("mkdtemp failed: ") + std::strerror(errno));
        }
        path_ = buffer.data();
    }

    ~WorkingDirectory() {
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) {
            spdlog::warn("Failed to remove working directory {}: {}", path_.string(), ec.message());
        }
    }

    WorkingDirectory(const WorkingDirectory&) = delete;
    WorkingDirectory& operator=(const WorkingDirectory&) = delete;

    void WriteFile(const std::string& name, const std::string& content) const {
        std::ofstream file(path_ / name, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw std::runtime_error("cannot create " + name);
        }
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!file) {
            throw std::runtime_error("cannot write " + name);
        }
    }

    const fs::path& Path() const { return path_; }

private:
    fs::path path_;
};

// ============================================================================
// OUTPUT CAPTURE
// ============================================================================

struct Capture {
    std::string data;
    bool truncated{false};
};

// Read everything currently available. Returns false once the stream is closed.
bool Drain(int fd, Capture& capture, std::uint64_t limit) {
    char buffer[kReadChunk];
    for (;;) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            std::size_t size = static_cast<std::size_t>(n);
            std::size_t room = capture.data.size() < limit
                ? static_cast<std::size_t>(limit - capture.data.size()) : 0;
            std::size_t take = std::min(room, size);
            capture.data.append(buffer, take);
            if (take < size) {
                capture.truncated = true;
            }
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

pid_t Reap(pid_t pid, int& status, struct rusage& usage) {
    pid_t r;
    do {
        r = wait4(pid, &status, 0, &usage);
    } while (r < 0 && errno == EINTR);
    return r;
}

void KillGroup(pid_t pgid) {
    if (killpg(pgid, SIGKILL) != 0 && errno != ESRCH) {
        spdlog::warn("killpg({}) failed: {}", pgid, std::strerror(errno));
    }
}

bool LooksLikeOutOfMemory(const std::string& stderr_output) {
    return utils::StringUtils::Contains(stderr_output, "MemoryError") ||
           utils::StringUtils::Contains(stderr_output, "Cannot allocate memory") ||
           utils::StringUtils::Contains(stderr_output, "out of memory");
}

struct Outcome {
    int wait_status{0};
    bool cancelled{false};
    bool timed_out{false};
    std::chrono::milliseconds cpu_time{0};
    std::uint64_t peak_memory_bytes{0};
};

bool NearMemoryCeiling(const Outcome& outcome, const ResourceLimits& limits) {
    return limits.max_memory_bytes > 0 && outcome.peak_memory_bytes * 2 >= limits.max_memory_bytes;
}

TerminationReason Classify(const Outcome& outcome,
                           const ResourceLimits& limits,
                           const std::string& stderr_output) {
    if (outcome.cancelled) {
        return TerminationReason::CANCELLED;
    }
    if (outcome.timed_out) {
        return TerminationReason::TIMEOUT;
    }

    const int status = outcome.wait_status;
    if (WIFSIGNALED(status)) {
        switch (WTERMSIG(status)) {
            case SIGXCPU:
            case SIGXFSZ:
                return TerminationReason::RESOURCE_LIMIT_EXCEEDED;
            case SIGKILL:
                // Hard RLIMIT_CPU or the cgroup OOM killer; otherwise the program killed itself
                if (outcome.cpu_time >= limits.max_cpu_time || NearMemoryCeiling(outcome, limits)) {
                    return TerminationReason::RESOURCE_LIMIT_EXCEEDED;
                }
                break;
            case SIGSEGV:
            case SIGABRT:
            case SIGBUS:
                if (NearMemoryCeiling(outcome, limits)) {
                    return TerminationReason::RESOURCE_LIMIT_EXCEEDED;
                }
                break;
            default:
                break;
        }
        return TerminationReason::COMPLETED;
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        if (LooksLikeOutOfMemory(stderr_output) || outcome.cpu_time >= limits.max_cpu_time) {
            return TerminationReason::RESOURCE_LIMIT_EXCEEDED;
        }
    }
    return TerminationReason::COMPLETED;
}

std::vector<std::string> MergePaths(std::vector<std::string> base, const std::vector<std::string>& extra) {
    for (const auto& path : extra) {
        if (std::find(base.begin(), base.end(), path) == base.end()) {
            base.push_back(path);
        }
    }
    return base;
}

rlim_t CpuSeconds(std::chrono::milliseconds limit) {
    auto ms = std::max<std::int64_t>(limit.count(), 1);
    return static_cast<rlim_t>((ms + 999) / 1000);
}

} // anonymous namespace

// ============================================================================
// VALUE TYPES
// ============================================================================

std::string TerminationReasonToString(TerminationReason reason) {
    switch (reason) {
        case TerminationReason::COMPLETED:               return "completed";
        case TerminationReason::TIMEOUT:                 return "timeout";
        case TerminationReason::RESOURCE_LIMIT_EXCEEDED: return "resource_limit_exceeded";
        case TerminationReason::BLOCKED_BY_SCAN:         return "blocked_by_scan";
        case TerminationReason::PERMISSION_DENIED:       return "permission_denied";
        case TerminationReason::CANCELLED:               return "cancelled";
        case TerminationReason::INTERNAL_ERROR:          return "internal_error";
    }
    return "internal_error";
}

std::optional<TerminationReason> TerminationReasonFromString(const std::string& str) {
    static const std::map<std::string, TerminationReason> kByName = {
        {"completed", TerminationReason::COMPLETED},
        {"timeout", TerminationReason::TIMEOUT},
        {"resource_limit_exceeded", TerminationReason::RESOURCE_LIMIT_EXCEEDED},
        {"blocked_by_scan", TerminationReason::BLOCKED_BY_SCAN},
        {"permission_denied", TerminationReason::PERMISSION_DENIED},
        {"cancelled", TerminationReason::CANCELLED},
        {"internal_error", TerminationReason::INTERNAL_ERROR}
    };
    auto it = kByName.find(str);
    if (it == kByName.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string ExecutionStateToString(ExecutionState state) {
    switch (state) {
        case ExecutionState::PENDING:        return "pending";
        case ExecutionState::LAUNCHING:      return "launching";
        case ExecutionState::RUNNING:        return "running";
        case ExecutionState::COMPLETED:      return "completed";
        case ExecutionState::TIMED_OUT:      return "timed_out";
        case ExecutionState::LIMIT_EXCEEDED: return "limit_exceeded";
        case ExecutionState::CANCELLED:      return "cancelled";
        case ExecutionState::LAUNCH_FAILED:  return "launch_failed";
    }
    return "unknown";
}

ResourceLimits ResourceLimits::ClampTo(const ResourceLimits& ceiling) const {
    ResourceLimits clamped = *this;
    clamped.max_cpu_time = std::min(max_cpu_time, ceiling.max_cpu_time);
    clamped.max_wall_time = std::min(max_wall_time, ceiling.max_wall_time);
    clamped.max_memory_bytes = std::min(max_memory_bytes, ceiling.max_memory_bytes);
    clamped.max_open_files = std::min(max_open_files, ceiling.max_open_files);
    clamped.max_processes = std::min(max_processes, ceiling.max_processes);
    clamped.max_threads = std::min(max_threads, ceiling.max_threads);
    clamped.max_output_bytes = std::min(max_output_bytes, ceiling.max_output_bytes);
    clamped.max_file_size_bytes = std::min(max_file_size_bytes, ceiling.max_file_size_bytes);

    clamped.allow_network = allow_network && ceiling.allow_network;
    clamped.container_mode = container_mode || ceiling.container_mode;
    clamped.denied_paths = MergePaths(ceiling.denied_paths, denied_paths);

    clamped.allowed_paths.clear();
    for (const auto& path : allowed_paths) {
        auto normalized = utils::StringUtils::NormalizePath(path);
        bool covered = std::any_of(ceiling.allowed_paths.begin(), ceiling.allowed_paths.end(),
            [&](const std::string& limit) {
                return utils::StringUtils::IsPathBeneath(normalized,
                                                         utils::StringUtils::NormalizePath(limit));
            });
        if (covered) {
            clamped.allowed_paths.push_back(normalized);
        }
    }
    return clamped;
}

bool ResourceLimits::operator==(const ResourceLimits& other) const {
    return max_cpu_time == other.max_cpu_time &&
           max_wall_time == other.max_wall_time &&
           max_memory_bytes == other.max_memory_bytes &&
           max_open_files == other.max_open_files &&
           max_processes == other.max_processes &&
           max_threads == other.max_threads &&
           allowed_paths == other.allowed_paths &&
           denied_paths == other.denied_paths &&
           container_mode == other.container_mode &&
           allow_network == other.allow_network &&
           max_output_bytes == other.max_output_bytes &&
           max_file_size_bytes == other.max_file_size_bytes;
}

ResourceLimits LimitOverrides::ApplyTo(const ResourceLimits& base) const {
    ResourceLimits limits = base;
    if (max_cpu_time) limits.max_cpu_time = *max_cpu_time;
    if (max_wall_time) limits.max_wall_time = *max_wall_time;
    if (max_memory_bytes) limits.max_memory_bytes = *max_memory_bytes;
    if (max_open_files) limits.max_open_files = *max_open_files;
    if (max_processes) limits.max_processes = *max_processes;
    if (max_threads) limits.max_threads = *max_threads;
    if (allowed_paths) limits.allowed_paths = *allowed_paths;
    if (container_mode) limits.container_mode = *container_mode;
    if (allow_network) limits.allow_network = *allow_network;
    if (max_output_bytes) limits.max_output_bytes = *max_output_bytes;
    if (max_file_size_bytes) limits.max_file_size_bytes = *max_file_size_bytes;
    limits.denied_paths = MergePaths(limits.denied_paths, extra_denied_paths);
    return limits;
}

ExecutionRequest ExecutionRequest::Create(std::string code,
                                          ResourceLimits limits,
                                          std::string principal_id) {
    ExecutionRequest request;
    request.execution_id = security::CredentialUtils::GenerateId();
    request.code = std::move(code);
    request.limits = std::move(limits);
    request.principal_id = std::move(principal_id);
    request.created_at = NowMillis();
    return request;
}

ExecutionResult ExecutionResult::NotLaunched(const std::string& execution_id,
                                             TerminationReason reason,
                                             const std::string& message) {
    ExecutionResult result;
    result.execution_id = execution_id;
    result.success = false;
    result.termination_reason = reason;
    result.error_message = message;
    result.started_at = NowMillis();
    return result;
}

bool ExecutionResult::operator==(const ExecutionResult& other) const {
    return execution_id == other.execution_id &&
           success == other.success &&
           stdout_output == other.stdout_output &&
           stderr_output == other.stderr_output &&
           exit_code == other.exit_code &&
           wall_duration == other.wall_duration &&
           cpu_time == other.cpu_time &&
           termination_reason == other.termination_reason &&
           peak_memory_bytes == other.peak_memory_bytes &&
           stdout_truncated == other.stdout_truncated &&
           stderr_truncated == other.stderr_truncated &&
           error_message == other.error_message &&
           started_at == other.started_at;
}

// ============================================================================
// SANDBOX ENGINE
// ============================================================================

SandboxEngine::SandboxEngine(const SandboxConfig& config)
    : config_(config)
    , gate_(config.max_concurrent_executions) {

    if (!fs::path(config_.interpreter).is_absolute()) {
        throw std::invalid_argument("interpreter must be an absolute path");
    }

    spdlog::info("Sandbox Engine initialized");
    spdlog::debug("Interpreter: {}", config_.interpreter);
    spdlog::debug("Sandbox root: {}", config_.sandbox_root.string());
    spdlog::debug("Max concurrent executions: {}", config_.max_concurrent_executions);
    spdlog::debug("Landlock ABI: {}", Isolation::LandlockAbiVersion());
}

SandboxEngine::~SandboxEngine() {
    for (const auto& id : ActiveExecutions()) {
        Cancel(id);
    }
    spdlog::debug("Sandbox Engine destroyed");
}

bool SandboxEngine::IsFilesystemIsolationSupported() {
    return Isolation::LandlockAbiVersion() > 0;
}

std::vector<std::string> SandboxEngine::BuildEnvironment(const std::string& working_directory) {
    return {
        "PATH=/usr/local/bin:/usr/bin:/bin",
        "HOME=" + working_directory,
        "LANG=C.UTF-8",
        "PYTHONDONTWRITEBYTECODE=1",
        "PYTHONIOENCODING=utf-8"
    };
}

void SandboxEngine::SetLaunchObserver(LaunchObserver observer) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    launch_observer_ = std::move(observer);
}

void SandboxEngine::SetExitObserver(ExitObserver observer) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    exit_observer_ = std::move(observer);
}

std::vector<std::string> SandboxEngine::ActiveExecutions() const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    std::vector<std::string> ids;
    ids.reserve(slots_.size());
    for (const auto& [id, slot] : slots_) {
        if (!slot->finished) {
            ids.push_back(id);
        }
    }
    return ids;
}

bool SandboxEngine::Cancel(const std::string& execution_id) {
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        auto it = slots_.find(execution_id);
        if (it == slots_.end() || it->second->finished) {
            return false;
        }
        it->second->cancelled = true;
        if (it->second->pgid > 0) {
            KillGroup(it->second->pgid);
        }
    }
    gate_.Wake();
    spdlog::warn("Execution {} cancelled", execution_id);
    return true;
}

std::future<ExecutionResult> SandboxEngine::ExecuteAsync(ExecutionRequest request) {
    return std::async(std::launch::async, [this, request = std::move(request)]() {
        return Execute(request);
    });
}

ExecutionResult SandboxEngine::Execute(const ExecutionRequest& request) {
    if (request.execution_id.empty()) {
        return ExecutionResult::NotLaunched(request.execution_id, TerminationReason::INTERNAL_ERROR,
                                            "invalid execution request");
    }

    const ResourceLimits limits = request.limits.ClampTo(config_.ceiling);

    auto slot = std::make_shared<Slot>();
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        if (!slots_.emplace(request.execution_id, slot).second) {
            return ExecutionResult::NotLaunched(request.execution_id, TerminationReason::INTERNAL_ERROR,
                                                "duplicate execution id");
        }
    }

    ExecutionResult result;
    try {
        auto permit = gate_.Acquire(slot->cancelled);
        if (!permit) {
            SetState(slot, ExecutionState::CANCELLED);
            result = ExecutionResult::NotLaunched(request.execution_id, TerminationReason::CANCELLED,
                                                  "cancelled before launch");
        } else {
            result = Run(request, limits, slot);
        }
    }
    catch (const std::exception& e) {
        spdlog::error("Execution {} failed: {}", request.execution_id, e.what());
        SetState(slot, ExecutionState::LAUNCH_FAILED);
        result = ExecutionResult::NotLaunched(request.execution_id, TerminationReason::INTERNAL_ERROR,
                                              "sandbox internal error");
    }

    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        slots_.erase(request.execution_id);
    }
    return result;
}

ExecutionResult SandboxEngine::Run(const ExecutionRequest& request,
                                   const ResourceLimits& limits,
                                   const std::shared_ptr<Slot>& slot) {
    const std::string& id = request.execution_id;

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("SANDBOX EXECUTION");
    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("Execution: {}", id);
    spdlog::info("Limits: cpu={}ms wall={}ms memory={}B processes={} container={}",
                 limits.max_cpu_time.count(), limits.max_wall_time.count(),
                 limits.max_memory_bytes, limits.max_processes, limits.container_mode);

    ExecutionResult result;
    result.execution_id = id;
    result.started_at = NowMillis();
    const auto start = std::chrono::steady_clock::now();
    const auto deadline = start + limits.max_wall_time;

    auto finish_failed = [&](const std::string& message) {
        SetState(slot, ExecutionState::LAUNCH_FAILED);
        result.success = false;
        result.termination_reason = TerminationReason::INTERNAL_ERROR;
        result.error_message = message;
        result.wall_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        return result;
    };

    SetState(slot, ExecutionState::LAUNCHING);

    WorkingDirectory workdir(config_.sandbox_root);
    workdir.WriteFile("main.py", request.code);
    const std::string workdir_path = workdir.Path().string();

    // Isolation plan
    IsolationPlan plan;
    plan.argv.push_back(config_.interpreter);
    plan.argv.insert(plan.argv.end(), config_.interpreter_args.begin(), config_.interpreter_args.end());
    plan.argv.push_back("main.py");
    plan.environment = BuildEnvironment(workdir_path);
    plan.working_directory = workdir_path;

    plan.cpu_seconds = CpuSeconds(limits.max_cpu_time);
    plan.data_bytes = static_cast<rlim_t>(limits.max_memory_bytes);
    plan.address_space_bytes = limits.max_memory_bytes > UINT64_MAX - config_.address_space_headroom
        ? RLIM_INFINITY
        : static_cast<rlim_t>(limits.max_memory_bytes + config_.address_space_headroom);
    plan.open_files = static_cast<rlim_t>(limits.max_open_files);
    plan.processes = static_cast<rlim_t>(std::max(limits.max_processes, limits.max_threads));
    plan.file_size_bytes = static_cast<rlim_t>(limits.max_file_size_bytes);

    std::vector<PathRule> allowed;
    allowed.push_back({workdir_path, true, false});
    for (const auto& path : config_.system_read_paths) {
        allowed.push_back({path, path == "/dev/null", true});
    }
    allowed.push_back({config_.interpreter, false, true});
    for (const auto& path : limits.allowed_paths) {
        allowed.push_back({path, false, false});
    }
    plan.path_rules = Isolation::ExpandAllowRules(allowed, limits.denied_paths);
    plan.allow_network = limits.allow_network;
    plan.container_mode = limits.container_mode;
    if (plan.container_mode) {
        plan.masked_paths = Isolation::ExistingMaskTargets(limits.denied_paths);
    }
    plan.require_filesystem_isolation = config_.require_filesystem_isolation;

    IsolatedChild child(plan);
    if (child.LandlockAbi() == 0 && config_.require_filesystem_isolation) {
        spdlog::error("Landlock unavailable; refusing to launch {}", id);
        return finish_failed("filesystem isolation unavailable");
    }

    if (config_.verbose_logging) {
        spdlog::debug("Path rules: {}", plan.path_rules.size());
        spdlog::debug("Masked paths: {}", plan.masked_paths.size());
    }

    Pipe out;
    Pipe err;
    Pipe status;
    out.SetReadNonBlocking();
    err.SetReadNonBlocking();

    pid_t pid = fork();
    if (pid < 0) {
        spdlog::error("fork failed: {}", std::strerror(errno));
        return finish_failed("sandbox launch failed");
    }
    if (pid == 0) {
        child.Run(out.WriteEnd(), err.WriteEnd(), status.WriteEnd());
    }

    // The child does the same; whichever runs first wins
    if (setpgid(pid, pid) != 0 && errno != EACCES && errno != ESRCH) {
        spdlog::debug("setpgid({}) failed: {}", pid, std::strerror(errno));
    }
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        slot->pgid = pid;
        if (slot->cancelled) {
            KillGroup(pid);
        }
    }

    out.CloseWrite();
    err.CloseWrite();
    status.CloseWrite();

    // Setup report: EOF means execve succeeded
    ChildFailure failure{};
    ssize_t n;
    do {
        n = read(status.ReadEnd(), &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);

    if (n != 0) {
        int wait_status = 0;
        struct rusage usage{};
        if (Reap(pid, wait_status, usage) < 0) {
            spdlog::error("wait4({}) failed: {}", pid, std::strerror(errno));
        }
        {
            std::lock_guard<std::mutex> lock(slots_mutex_);
            slot->finished = true;
        }
        std::string stage = n == static_cast<ssize_t>(sizeof(failure))
            ? ChildStageToString(static_cast<ChildStage>(failure.stage)) : "unknown";
        spdlog::warn("Sandbox setup failed for {} at stage {}: {}",
                     id, stage, n > 0 ? std::strerror(failure.error) : "status pipe error");
        return finish_failed("sandbox setup failed: " + stage);
    }

    SetState(slot, ExecutionState::RUNNING);
    spdlog::info("✓ Child {} running", pid);
    NotifyLaunch(pid, id);

    // Supervision loop
    Capture stdout_capture;
    Capture stderr_capture;
    bool out_open = true;
    bool err_open = true;
    bool exited = false;
    bool kill_sent = false;
    Outcome outcome;

    while (!exited) {
        siginfo_t info{};
        int rc = waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT);
        if (rc == 0 && info.si_pid == pid) {
            exited = true;
            break;
        }
        if (rc < 0 && errno != EINTR) {
            spdlog::error("waitid({}) failed: {}", pid, std::strerror(errno));
            break;
        }

        if (!kill_sent) {
            if (slot->cancelled) {
                KillGroup(pid);
                kill_sent = true;
            } else if (std::chrono::steady_clock::now() >= deadline) {
                spdlog::warn("Execution {} exceeded wall time of {}ms", id, limits.max_wall_time.count());
                outcome.timed_out = true;
                KillGroup(pid);
                kill_sent = true;
            }
        }

        int timeout_ms = kPollSliceMs;
        if (!kill_sent) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            timeout_ms = static_cast<int>(std::clamp<std::int64_t>(remaining, 1, kPollSliceMs));
        }

        struct pollfd fds[2];
        nfds_t count = 0;
        if (out_open) fds[count++] = {out.ReadEnd(), POLLIN, 0};
        if (err_open) fds[count++] = {err.ReadEnd(), POLLIN, 0};

        int ready = poll(count ? fds : nullptr, count, timeout_ms);
        if (ready < 0 && errno != EINTR) {
            spdlog::error("poll failed: {}", std::strerror(errno));
            break;
        }
        for (nfds_t i = 0; ready > 0 && i < count; ++i) {
            if (!fds[i].revents) {
                continue;
            }
            if (fds[i].fd == out.ReadEnd()) {
                out_open = Drain(out.ReadEnd(), stdout_capture, limits.max_output_bytes);
            } else {
                err_open = Drain(err.ReadEnd(), stderr_capture, limits.max_output_bytes);
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        slot->finished = true;
        outcome.cancelled = slot->cancelled;
    }

    // Leader is still a zombie here, so the group id cannot have been reused
    KillGroup(pid);
    if (out_open) Drain(out.ReadEnd(), stdout_capture, limits.max_output_bytes);
    if (err_open) Drain(err.ReadEnd(), stderr_capture, limits.max_output_bytes);
    NotifyExit(pid, id);

    struct rusage usage{};
    if (Reap(pid, outcome.wait_status, usage) < 0) {
        spdlog::error("wait4({}) failed: {}", pid, std::strerror(errno));
        result.stdout_output = std::move(stdout_capture.data);
        result.stderr_output = std::move(stderr_capture.data);
        return finish_failed("sandbox supervision failed");
    }
    outcome.cpu_time = ToMillis(usage.ru_utime) + ToMillis(usage.ru_stime);
    outcome.peak_memory_bytes = static_cast<std::uint64_t>(usage.ru_maxrss) * 1024;

    result.wall_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    result.cpu_time = outcome.cpu_time;
    result.peak_memory_bytes = outcome.peak_memory_bytes;
    result.stdout_output = std::move(stdout_capture.data);
    result.stderr_output = std::move(stderr_capture.data);
    result.stdout_truncated = stdout_capture.truncated;
    result.stderr_truncated = stderr_capture.truncated;

    if (WIFEXITED(outcome.wait_status)) {
        result.exit_code = WEXITSTATUS(outcome.wait_status);
    } else if (WIFSIGNALED(outcome.wait_status)) {
        result.exit_code = 128 + WTERMSIG(outcome.wait_status);
    }

    result.termination_reason = exited
        ? Classify(outcome, limits, result.stderr_output)
        : TerminationReason::INTERNAL_ERROR;
    result.success = result.termination_reason == TerminationReason::COMPLETED && result.exit_code == 0;

    switch (result.termination_reason) {
        case TerminationReason::COMPLETED:
            SetState(slot, ExecutionState::COMPLETED);
            spdlog::info("✓ Execution {} completed (exit {}, {}ms)", id, result.exit_code,
                         result.wall_duration.count());
            break;
        case TerminationReason::TIMEOUT:
            SetState(slot, ExecutionState::TIMED_OUT);
            result.error_message = "wall-clock timeout";
            break;
        case TerminationReason::RESOURCE_LIMIT_EXCEEDED:
            SetState(slot, ExecutionState::LIMIT_EXCEEDED);
            result.error_message = "resource limit exceeded";
            spdlog::warn("Execution {} exceeded a resource limit (exit {})", id, result.exit_code);
            break;
        case TerminationReason::CANCELLED:
            SetState(slot, ExecutionState::CANCELLED);
            result.error_message = "cancelled";
            break;
        default:
            SetState(slot, ExecutionState::LAUNCH_FAILED);
            result.error_message = "sandbox supervision failed";
            break;
    }

    spdlog::info("═══════════════════════════════════════════════════════════════");
    return result;
}

void SandboxEngine::SetState(const std::shared_ptr<Slot>& slot, ExecutionState state) {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    slot->state = state;
    if (config_.verbose_logging) {
        spdlog::debug("Execution state -> {}", ExecutionStateToString(state));
    }
}

void SandboxEngine::NotifyLaunch(pid_t pid, const std::string& execution_id) {
    LaunchObserver observer;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        observer = launch_observer_;
    }
    if (!observer) {
        return;
    }
    try {
        observer(pid, execution_id);
    }
    catch (const std::exception& e) {
        spdlog::error("Launch observer failed for {}: {}", execution_id, e.what());
    }
}

void SandboxEngine::NotifyExit(pid_t pid, const std::string& execution_id) {
    ExitObserver observer;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        observer = exit_observer_;
    }
    if (!observer) {
        return;
    }
    try {
        observer(pid, execution_id);
    }
    catch (const std::exception& e) {
        spdlog::error("Exit observer failed for {}: {}", execution_id, e.what());
    }
}

} // namespace core
} // namespace sentrybox
