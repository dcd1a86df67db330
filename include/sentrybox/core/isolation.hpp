/**
 * @file isolation.hpp
 * @brief Linux isolation primitives applied to a freshly forked child
 *
 * The parent prepares everything that needs memory allocation (argument
 * vectors, Landlock rule set, uid/gid map lines, mask lists) into an
 * IsolatedChild. After fork() the child only issues system calls, so it is
 * safe to fork from a multi-threaded process.
 *
 * Layers, applied in order inside the child:
 * 1. Process group, parent-death signal, stdio redirection, fd hygiene
 * 2. Container mode: user/mount/IPC/UTS/cgroup (and network) namespaces,
 *    deny-listed paths masked by empty read-only mounts
 * 3. Resource limits (RLIMIT_CPU, DATA, AS, NOFILE, NPROC, FSIZE, CORE)
 * 4. PR_SET_NO_NEW_PRIVS
 * 5. Landlock filesystem (and, with ABI >= 4, TCP) rules
 * 6. execve of the interpreter
 *
 * Any failure is written to a close-on-exec status pipe as a ChildFailure
 * and the child exits; a successful exec closes the pipe with no data.
 *
 * @date 2025
 */

#pragma once

#include <sys/resource.h>
#include <sys/types.h>

#include <cstdint>
#include <string>
#include <vector>

namespace sentrybox {
namespace core {

/**
 * @struct PathRule
 * @brief Filesystem access granted beneath one path
 */
struct PathRule {
    std::string path;
    bool writable{false};
    bool executable{false};

    bool operator==(const PathRule& other) const {
        return path == other.path && writable == other.writable && executable == other.executable;
    }
};

/**
 * @enum ChildStage
 * @brief Setup step that failed inside the child
 */
enum class ChildStage : int {
    PROCESS_SETUP = 1,
    REDIRECT,
    WORKING_DIRECTORY,
    NAMESPACES,
    ID_MAPPING,
    MOUNTS,
    RESOURCE_LIMITS,
    NO_NEW_PRIVS,
    LANDLOCK_UNAVAILABLE,
    LANDLOCK,
    EXEC
};

std::string ChildStageToString(ChildStage stage);

/**
 * @struct ChildFailure
 * @brief Record written by the child to the status pipe
 */
struct ChildFailure {
    int stage{0};
    int error{0};
};

/**
 * @struct IsolationPlan
 * @brief Everything the child needs, in owning form
 */
struct IsolationPlan {
    std::vector<std::string> argv;           ///< argv[0] is the interpreter path
    std::vector<std::string> environment;    ///< KEY=VALUE entries
    std::string working_directory;

    // Resource limits
    rlim_t cpu_seconds{10};
    rlim_t data_bytes{256u * 1024 * 1024};
    rlim_t address_space_bytes{RLIM_INFINITY};
    rlim_t open_files{64};
    rlim_t processes{16};
    rlim_t file_size_bytes{16u * 1024 * 1024};

    // Filesystem and network
    std::vector<PathRule> path_rules;        ///< Already expanded (see ExpandAllowRules)
    std::vector<std::string> masked_paths;   ///< Container mode only
    bool allow_network{false};

    bool container_mode{false};
    bool require_filesystem_isolation{true};
};

/**
 * @class IsolatedChild
 * @brief Allocation-free view of an IsolationPlan for use after fork()
 */
class IsolatedChild {
public:
    /**
     * @brief Prepare the child setup
     *
     * Probes the Landlock ABI and stats masked paths, so it must run in the
     * parent before fork().
     */
    explicit IsolatedChild(const IsolationPlan& plan);

    IsolatedChild(const IsolatedChild&) = delete;
    IsolatedChild& operator=(const IsolatedChild&) = delete;

    /**
     * @brief Apply every isolation layer and exec the interpreter
     *
     * Only async-signal-safe calls are made. Never returns.
     *
     * @param stdout_fd Write end of the stdout pipe
     * @param stderr_fd Write end of the stderr pipe
     * @param status_fd Close-on-exec write end of the status pipe
     */
    [[noreturn]] void Run(int stdout_fd, int stderr_fd, int status_fd) const noexcept;

    /// Landlock ABI the rules were built for (0 when unavailable)
    int LandlockAbi() const { return landlock_abi_; }

private:
    struct LandlockRule {
        const char* path;
        std::uint64_t access;
    };

    struct Mask {
        const char* path;
        bool directory;
    };

    IsolationPlan plan_;
    std::vector<char*> argv_;
    std::vector<char*> envp_;
    std::vector<LandlockRule> landlock_rules_;
    std::vector<Mask> masks_;
    std::string uid_map_;
    std::string gid_map_;
    std::uint64_t handled_fs_{0};
    std::uint64_t handled_net_{0};
    int landlock_abi_{0};

    bool EnterNamespaces() const noexcept;
    bool ApplyMasks() const noexcept;
    bool ApplyResourceLimits() const noexcept;
    bool ApplyLandlock() const noexcept;
};

/**
 * @class Isolation
 * @brief Host capability probes and rule computation
 */
class Isolation {
public:
    /**
     * @brief Highest Landlock ABI supported by the running kernel
     * @return ABI version, or 0 when Landlock is unavailable
     */
    static int LandlockAbiVersion();

    /**
     * @brief Resolve allow rules against a deny-list
     *
     * Landlock can only grant access, so a denied path beneath an allowed
     * directory is carved out by replacing the directory with rules for each
     * of its entries except the one leading to the denied path, recursively.
     * Allowed paths equal to or beneath a denied path are dropped, and so are
     * paths that do not exist. Paths are canonicalised first so that symlinks
     * cannot re-open a denied location.
     */
    static std::vector<PathRule> ExpandAllowRules(const std::vector<PathRule>& allowed,
                                                  const std::vector<std::string>& denied);

    /// Deny-listed paths that exist and are not beneath another masked path
    static std::vector<std::string> ExistingMaskTargets(const std::vector<std::string>& denied);
};

} // namespace core
} // namespace sentrybox
