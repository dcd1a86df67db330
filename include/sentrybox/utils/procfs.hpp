/**
 * @file procfs.hpp
 * @brief Readers for per-process counters exposed under /proc
 *
 * Every reader returns std::nullopt when the process has exited or the file
 * became unreadable between open and read; callers treat that as "process
 * unavailable" rather than an error.
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <sys/types.h>

namespace sentrybox {
namespace utils {

/**
 * @struct ProcStat
 * @brief Fields of /proc/<pid>/stat used for CPU accounting
 */
struct ProcStat {
    char state{'?'};           ///< R, S, D, Z, T, ...
    std::uint64_t utime_ticks{0};   ///< User CPU time (clock ticks)
    std::uint64_t stime_ticks{0};   ///< System CPU time (clock ticks)
    long num_threads{0};       ///< Thread count
    std::uint64_t rss_pages{0};     ///< Resident set size (pages)
};

/**
 * @struct ProcIo
 * @brief Cumulative storage I/O from /proc/<pid>/io
 */
struct ProcIo {
    std::uint64_t read_bytes{0};
    std::uint64_t write_bytes{0};
};

/**
 * @struct FdCounts
 * @brief Open descriptor census from /proc/<pid>/fd
 */
struct FdCounts {
    int open_files{0};   ///< All open descriptors
    int sockets{0};      ///< Descriptors that are sockets
};

class ProcFs {
public:
    static std::optional<std::string> ReadFile(const std::string& path);

    static std::optional<ProcStat> ReadStat(pid_t pid);
    static std::optional<ProcIo> ReadIo(pid_t pid);
    static std::optional<FdCounts> CountFds(pid_t pid);

    /**
     * @brief VmRSS from /proc/<pid>/status in bytes
     */
    static std::optional<std::uint64_t> ReadResidentBytes(pid_t pid);

    /**
     * @brief MemTotal from /proc/meminfo in bytes
     */
    static std::uint64_t TotalMemoryBytes();

    static long ClockTicksPerSecond();
    static long PageSize();

    /**
     * @brief True while the pid exists and is not a zombie
     */
    static bool IsAlive(pid_t pid);

    /**
     * @brief Parse the content of a stat file (exposed for tests)
     *
     * The command name may contain spaces and parentheses; parsing starts
     * after the last ')'.
     */
    static std::optional<ProcStat> ParseStat(const std::string& content);
};

} // namespace utils
} // namespace sentrybox
