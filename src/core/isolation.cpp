/**
 * @file isolation.cpp
 * @brief Landlock, namespaces and resource limits for sandboxed children
 *
 * The Landlock ABI is declared locally instead of through <linux/landlock.h>,
 * because distribution headers often lag behind the running kernel (network
 * rules need ABI 4). The kernel accepts the larger ruleset structure from
 * older headers as long as the unknown trailing fields are zero.
 *
 * @date 2025
 */

#include "sentrybox/core/isolation.hpp"
#include "sentrybox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sched.h>
#include <signal.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <stdexcept>

#if !defined(__NR_landlock_create_ruleset)
#define __NR_landlock_create_ruleset 444
#endif
#if !defined(__NR_landlock_add_rule)
#define __NR_landlock_add_rule 445
#endif
#if !defined(__NR_landlock_restrict_self)
#define __NR_landlock_restrict_self 446
#endif

namespace fs = std::filesystem;

namespace sentrybox {
namespace core {

namespace {

// ============================================================================
// LANDLOCK ABI
// ============================================================================

constexpr std::uint32_t kCreateRulesetVersion = 1u << 0;
constexpr int kRulePathBeneath = 1;

struct RulesetAttr {
    std::uint64_t handled_access_fs;
    std::uint64_t handled_access_net;
};

struct PathBeneathAttr {
    std::uint64_t allowed_access;
    std::int32_t parent_fd;
} __attribute__((packed));

constexpr std::uint64_t kFsExecute    = 1ull << 0;
constexpr std::uint64_t kFsWriteFile  = 1ull << 1;
constexpr std::uint64_t kFsReadFile   = 1ull << 2;
constexpr std::uint64_t kFsReadDir    = 1ull << 3;
constexpr std::uint64_t kFsRemoveDir  = 1ull << 4;
constexpr std::uint64_t kFsRemoveFile = 1ull << 5;
constexpr std::uint64_t kFsMakeChar   = 1ull << 6;
constexpr std::uint64_t kFsMakeDir    = 1ull << 7;
constexpr std::uint64_t kFsMakeReg    = 1ull << 8;
constexpr std::uint64_t kFsMakeSock   = 1ull << 9;
constexpr std::uint64_t kFsMakeFifo   = 1ull << 10;
constexpr std::uint64_t kFsMakeBlock  = 1ull << 11;
constexpr std::uint64_t kFsMakeSym    = 1ull << 12;
constexpr std::uint64_t kFsRefer      = 1ull << 13;
constexpr std::uint64_t kFsTruncate   = 1ull << 14;
constexpr std::uint64_t kFsIoctlDev   = 1ull << 15;

constexpr std::uint64_t kNetBindTcp    = 1ull << 0;
constexpr std::uint64_t kNetConnectTcp = 1ull << 1;

constexpr std::uint64_t kAccessRead = kFsReadFile | kFsReadDir;
constexpr std::uint64_t kAccessWrite = kFsWriteFile | kFsRemoveDir | kFsRemoveFile | kFsMakeDir |
                                       kFsMakeReg | kFsMakeSock | kFsMakeFifo | kFsMakeSym |
                                       kFsRefer | kFsTruncate;
constexpr std::uint64_t kAccessFile = kFsExecute | kFsWriteFile | kFsReadFile | kFsTruncate | kFsIoctlDev;

std::uint64_t HandledFsAccess(int abi) {
    std::uint64_t handled = kFsExecute | kFsWriteFile | kFsReadFile | kFsReadDir | kFsRemoveDir |
                            kFsRemoveFile | kFsMakeChar | kFsMakeDir | kFsMakeReg | kFsMakeSock |
                            kFsMakeFifo | kFsMakeBlock | kFsMakeSym;
    if (abi >= 2) handled |= kFsRefer;
    if (abi >= 3) handled |= kFsTruncate;
    if (abi >= 5) handled |= kFsIoctlDev;
    return handled;
}

// ============================================================================
// ASYNC-SIGNAL-SAFE HELPERS (child side)
// ============================================================================

bool WriteAll(int fd, const char* data, std::size_t length) noexcept {
    while (length > 0) {
        ssize_t written = write(fd, data, length);
        if (written < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += written;
        length -= static_cast<std::size_t>(written);
    }
    return true;
}

bool WriteProcFile(const char* path, const char* data, std::size_t length) noexcept {
    int fd = open(path, O_WRONLY | O_CLOEXEC);
    if (fd < 0) {
        return false;
    }
    bool ok = WriteAll(fd, data, length);
    int saved = errno;
    close(fd);
    errno = saved;
    return ok;
}

[[noreturn]] void Fail(int status_fd, ChildStage stage) noexcept {
    ChildFailure failure;
    failure.stage = static_cast<int>(stage);
    failure.error = errno;
    if (!WriteAll(status_fd, reinterpret_cast<const char*>(&failure), sizeof(failure))) {
        _exit(126);
    }
    _exit(127);
}

// ============================================================================
// PATH HELPERS (parent side)
// ============================================================================

std::string Canonical(const std::string& path) {
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(fs::path(path), ec);
    if (ec || canonical.empty()) {
        return utils::StringUtils::NormalizePath(path);
    }
    return canonical.string();
}

constexpr int kMaxCarveDepth = 16;

void ExpandInto(const std::string& path,
                const PathRule& proto,
                const std::vector<std::string>& denied,
                std::vector<PathRule>& out,
                int depth) {
    bool denied_beneath = false;
    for (const auto& d : denied) {
        if (utils::StringUtils::IsPathBeneath(path, d)) {
            return;
        }
        if (utils::StringUtils::IsPathBeneath(d, path)) {
            denied_beneath = true;
        }
    }

    std::error_code ec;
    if (!denied_beneath) {
        PathRule rule = proto;
        rule.path = path;
        out.push_back(std::move(rule));
        return;
    }

    // Deny wins: if the directory cannot be split, nothing beneath it is granted
    if (depth >= kMaxCarveDepth || !fs::is_directory(path, ec)) {
        return;
    }

    fs::directory_iterator it(path, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        const std::string child = Canonical(it->path().string());
        // A symlink leading out of the directory is not covered by this rule
        if (!utils::StringUtils::IsPathBeneath(child, path)) {
            continue;
        }
        ExpandInto(child, proto, denied, out, depth + 1);
    }
}

} // namespace

std::string ChildStageToString(ChildStage stage) {
    switch (stage) {
        case ChildStage::PROCESS_SETUP: return "process setup";
        case ChildStage::REDIRECT: return "stdio redirection";
        case ChildStage::WORKING_DIRECTORY: return "working directory";
        case ChildStage::NAMESPACES: return "namespace creation";
        case ChildStage::ID_MAPPING: return "id mapping";
        case ChildStage::MOUNTS: return "mount setup";
        case ChildStage::RESOURCE_LIMITS: return "resource limits";
        case ChildStage::NO_NEW_PRIVS: return "privilege lock";
        case ChildStage::LANDLOCK_UNAVAILABLE: return "filesystem isolation unavailable";
        case ChildStage::LANDLOCK: return "filesystem isolation";
        case ChildStage::EXEC: return "interpreter start";
    }
    return "unknown stage";
}

// ============================================================================
// ISOLATED CHILD
// ============================================================================

IsolatedChild::IsolatedChild(const IsolationPlan& plan) : plan_(plan) {
    if (plan_.argv.empty()) {
        throw std::invalid_argument("Isolation plan has no interpreter");
    }

    for (auto& arg : plan_.argv) {
        argv_.push_back(arg.data());
    }
    argv_.push_back(nullptr);
    for (auto& entry : plan_.environment) {
        envp_.push_back(entry.data());
    }
    envp_.push_back(nullptr);

    landlock_abi_ = Isolation::LandlockAbiVersion();
    if (landlock_abi_ > 0) {
        handled_fs_ = HandledFsAccess(landlock_abi_);
        if (!plan_.allow_network && landlock_abi_ >= 4) {
            handled_net_ = kNetBindTcp | kNetConnectTcp;
        }

        for (const auto& rule : plan_.path_rules) {
            struct stat st;
            if (stat(rule.path.c_str(), &st) != 0) {
                continue;
            }
            std::uint64_t access = kAccessRead;
            if (rule.writable) access |= kAccessWrite;
            if (rule.executable) access |= kFsExecute;
            if (!S_ISDIR(st.st_mode)) access &= kAccessFile;
            access &= handled_fs_;
            landlock_rules_.push_back({rule.path.c_str(), access});
        }
    }

    if (!plan_.allow_network && handled_net_ == 0 && !plan_.container_mode) {
        spdlog::warn("Landlock ABI {} cannot restrict TCP; network is only blocked in container mode",
                     landlock_abi_);
    }

    if (plan_.container_mode) {
        for (const auto& path : plan_.masked_paths) {
            struct stat st;
            if (lstat(path.c_str(), &st) != 0) {
                continue;
            }
            masks_.push_back({path.c_str(), S_ISDIR(st.st_mode)});
        }

        const std::string uid = std::to_string(getuid());
        const std::string gid = std::to_string(getgid());
        uid_map_ = uid + " " + uid + " 1\n";
        gid_map_ = gid + " " + gid + " 1\n";
    }
}

void IsolatedChild::Run(int stdout_fd, int stderr_fd, int status_fd) const noexcept {
    const pid_t parent = getppid();

    // 1. Process setup
    if (setpgid(0, 0) != 0) {
        Fail(status_fd, ChildStage::PROCESS_SETUP);
    }
    if (prctl(PR_SET_PDEATHSIG, SIGKILL, 0, 0, 0) != 0) {
        Fail(status_fd, ChildStage::PROCESS_SETUP);
    }
    if (getppid() != parent) {
        _exit(127);
    }

    sigset_t all;
    sigemptyset(&all);
    sigprocmask(SIG_SETMASK, &all, nullptr);

    int null_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (null_fd < 0 ||
        dup2(null_fd, STDIN_FILENO) < 0 ||
        dup2(stdout_fd, STDOUT_FILENO) < 0 ||
        dup2(stderr_fd, STDERR_FILENO) < 0) {
        Fail(status_fd, ChildStage::REDIRECT);
    }

    struct rlimit nofile;
    int max_fd = 4096;
    if (getrlimit(RLIMIT_NOFILE, &nofile) == 0 && nofile.rlim_cur != RLIM_INFINITY) {
        max_fd = static_cast<int>(std::min<rlim_t>(nofile.rlim_cur, 65536));
    }
    for (int fd = 3; fd < max_fd; ++fd) {
        if (fd != status_fd) {
            close(fd);
        }
    }

    if (chdir(plan_.working_directory.c_str()) != 0) {
        Fail(status_fd, ChildStage::WORKING_DIRECTORY);
    }

    // 2. Container mode
    if (plan_.container_mode) {
        if (!EnterNamespaces()) {
            Fail(status_fd, ChildStage::NAMESPACES);
        }
        if (!WriteProcFile("/proc/self/setgroups", "deny", 4) ||
            !WriteProcFile("/proc/self/uid_map", uid_map_.data(), uid_map_.size()) ||
            !WriteProcFile("/proc/self/gid_map", gid_map_.data(), gid_map_.size())) {
            Fail(status_fd, ChildStage::ID_MAPPING);
        }
        if (!ApplyMasks()) {
            Fail(status_fd, ChildStage::MOUNTS);
        }
    }

    // 3. Resource limits
    if (!ApplyResourceLimits()) {
        Fail(status_fd, ChildStage::RESOURCE_LIMITS);
    }

    // 4. No privilege gain through exec
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        Fail(status_fd, ChildStage::NO_NEW_PRIVS);
    }

    // 5. Filesystem mediation
    if (landlock_abi_ == 0) {
        if (plan_.require_filesystem_isolation) {
            errno = ENOSYS;
            Fail(status_fd, ChildStage::LANDLOCK_UNAVAILABLE);
        }
    } else if (!ApplyLandlock()) {
        Fail(status_fd, ChildStage::LANDLOCK);
    }

    // 6. Exec
    execve(argv_[0], argv_.data(), envp_.data());
    Fail(status_fd, ChildStage::EXEC);
}

bool IsolatedChild::EnterNamespaces() const noexcept {
    int flags = CLONE_NEWUSER | CLONE_NEWNS | CLONE_NEWIPC | CLONE_NEWUTS | CLONE_NEWCGROUP;
    if (!plan_.allow_network) {
        flags |= CLONE_NEWNET;
    }
    if (unshare(flags) != 0) {
        return false;
    }
    const char hostname[] = "sentrybox";
    return sethostname(hostname, sizeof(hostname) - 1) == 0;
}

bool IsolatedChild::ApplyMasks() const noexcept {
    if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) {
        return false;
    }
    for (const auto& mask : masks_) {
        int rc;
        if (mask.directory) {
            rc = mount("tmpfs", mask.path, "tmpfs", MS_RDONLY | MS_NOSUID | MS_NODEV | MS_NOEXEC,
                       "size=4k,mode=000");
        } else {
            rc = mount("/dev/null", mask.path, nullptr, MS_BIND, nullptr);
        }
        if (rc != 0) {
            return false;
        }
    }
    return true;
}

bool IsolatedChild::ApplyResourceLimits() const noexcept {
    auto apply = [](int resource, rlim_t soft, rlim_t hard) {
        struct rlimit current;
        if (getrlimit(resource, &current) != 0) {
            return false;
        }
        // Unprivileged processes cannot raise the hard limit
        if (current.rlim_max != RLIM_INFINITY) {
            hard = std::min(hard, current.rlim_max);
            soft = std::min(soft, hard);
        }
        struct rlimit limit;
        limit.rlim_cur = soft;
        limit.rlim_max = hard;
        return setrlimit(resource, &limit) == 0;
    };

    const rlim_t cpu_hard = plan_.cpu_seconds == RLIM_INFINITY ? RLIM_INFINITY : plan_.cpu_seconds + 1;

    return apply(RLIMIT_CPU, plan_.cpu_seconds, cpu_hard) &&
           apply(RLIMIT_DATA, plan_.data_bytes, plan_.data_bytes) &&
           apply(RLIMIT_AS, plan_.address_space_bytes, plan_.address_space_bytes) &&
           apply(RLIMIT_NOFILE, plan_.open_files, plan_.open_files) &&
           apply(RLIMIT_NPROC, plan_.processes, plan_.processes) &&
           apply(RLIMIT_FSIZE, plan_.file_size_bytes, plan_.file_size_bytes) &&
           apply(RLIMIT_CORE, 0, 0);
}

bool IsolatedChild::ApplyLandlock() const noexcept {
    RulesetAttr attr;
    attr.handled_access_fs = handled_fs_;
    attr.handled_access_net = handled_net_;

    int ruleset = static_cast<int>(syscall(__NR_landlock_create_ruleset, &attr, sizeof(attr), 0));
    if (ruleset < 0) {
        return false;
    }

    for (const auto& rule : landlock_rules_) {
        PathBeneathAttr beneath;
        beneath.allowed_access = rule.access;
        beneath.parent_fd = open(rule.path, O_PATH | O_CLOEXEC);
        if (beneath.parent_fd < 0) {
            if (errno == ENOENT) {
                continue;
            }
            close(ruleset);
            return false;
        }
        long rc = syscall(__NR_landlock_add_rule, ruleset, kRulePathBeneath, &beneath, 0);
        int saved = errno;
        close(beneath.parent_fd);
        if (rc != 0) {
            close(ruleset);
            errno = saved;
            return false;
        }
    }

    long rc = syscall(__NR_landlock_restrict_self, ruleset, 0);
    int saved = errno;
    close(ruleset);
    errno = saved;
    return rc == 0;
}

// ============================================================================
// HOST PROBES AND RULE COMPUTATION
// ============================================================================

int Isolation::LandlockAbiVersion() {
    long abi = syscall(__NR_landlock_create_ruleset, nullptr, 0, kCreateRulesetVersion);
    return abi < 0 ? 0 : static_cast<int>(abi);
}

std::vector<PathRule> Isolation::ExpandAllowRules(const std::vector<PathRule>& allowed,
                                                  const std::vector<std::string>& denied) {
    std::vector<std::string> canonical_denied;
    for (const auto& d : denied) {
        if (!d.empty()) {
            canonical_denied.push_back(Canonical(d));
        }
    }

    std::vector<PathRule> expanded;
    for (const auto& rule : allowed) {
        if (rule.path.empty()) {
            continue;
        }
        const std::string path = Canonical(rule.path);
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            continue;
        }
        ExpandInto(path, rule, canonical_denied, expanded, 0);
    }

    std::sort(expanded.begin(), expanded.end(), [](const PathRule& a, const PathRule& b) {
        if (a.path != b.path) return a.path < b.path;
        if (a.writable != b.writable) return a.writable < b.writable;
        return a.executable < b.executable;
    });
    expanded.erase(std::unique(expanded.begin(), expanded.end()), expanded.end());
    return expanded;
}

std::vector<std::string> Isolation::ExistingMaskTargets(const std::vector<std::string>& denied) {
    std::vector<std::string> targets;
    for (const auto& d : denied) {
        if (d.empty()) {
            continue;
        }
        const std::string path = Canonical(d);
        std::error_code ec;
        if (fs::exists(path, ec)) {
            targets.push_back(path);
        }
    }

    std::sort(targets.begin(), targets.end());
    targets.erase(std::unique(targets.begin(), targets.end()), targets.end());

    std::vector<std::string> outermost;
    for (const auto& path : targets) {
        bool nested = std::any_of(outermost.begin(), outermost.end(), [&](const std::string& outer) {
            return utils::StringUtils::IsPathBeneath(path, outer);
        });
        if (!nested) {
            outermost.push_back(path);
        }
    }
    return outermost;
}

} // namespace core
} // namespace sentrybox
