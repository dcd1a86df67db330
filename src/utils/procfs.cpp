/**
 * @file procfs.cpp
 * @brief Implementation of /proc readers
 *
 * @date 2025
 */

#include "sentrybox/utils/procfs.hpp"

#include <dirent.h>
#include <unistd.h>

#include <array>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>
#include <vector>

namespace sentrybox {
namespace utils {

namespace {

std::string ProcPath(pid_t pid, const char* leaf) {
    return "/proc/" + std::to_string(pid) + "/" + leaf;
}

// Value of a "Key:   1234 kB" line, in bytes
std::optional<std::uint64_t> ReadKbField(const std::string& content, const std::string& key) {
    std::istringstream iss(content);
    std::string line;
    while (std::getline(iss, line)) {
        if (line.compare(0, key.size(), key) != 0 || line.size() <= key.size() ||
            line[key.size()] != ':') {
            continue;
        }
        std::istringstream fields(line.substr(key.size() + 1));
        std::uint64_t value = 0;
        std::string unit;
        if (!(fields >> value)) {
            return std::nullopt;
        }
        fields >> unit;
        return unit == "kB" ? value * 1024 : value;
    }
    return std::nullopt;
}

} // namespace

std::optional<std::string> ProcFs::ReadFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) return std::nullopt;
    std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        // File disappeared or became unreadable between open and read
        return std::nullopt;
    }
    return s;
}

std::optional<ProcStat> ProcFs::ParseStat(const std::string& content) {
    auto close = content.rfind(')');
    if (close == std::string::npos || close + 2 >= content.size()) {
        return std::nullopt;
    }

    // Fields after comm start at field 3 (state)
    std::istringstream iss(content.substr(close + 2));
    std::vector<std::string> fields;
    std::string field;
    while (iss >> field) {
        fields.push_back(field);
    }
    // state(3) .. rss(24) => need at least 22 entries
    if (fields.size() < 22) {
        return std::nullopt;
    }

    ProcStat stat;
    try {
        stat.state = fields[0].empty() ? '?' : fields[0][0];
        stat.utime_ticks = std::stoull(fields[11]);
        stat.stime_ticks = std::stoull(fields[12]);
        stat.num_threads = std::stol(fields[17]);
        stat.rss_pages = std::stoull(fields[21]);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return stat;
}

std::optional<ProcStat> ProcFs::ReadStat(pid_t pid) {
    auto content = ReadFile(ProcPath(pid, "stat"));
    if (!content) return std::nullopt;
    return ParseStat(*content);
}

std::optional<ProcIo> ProcFs::ReadIo(pid_t pid) {
    auto content = ReadFile(ProcPath(pid, "io"));
    if (!content) return std::nullopt;

    ProcIo io;
    std::istringstream iss(*content);
    std::string key;
    std::uint64_t value = 0;
    while (iss >> key >> value) {
        if (key == "read_bytes:") {
            io.read_bytes = value;
        } else if (key == "write_bytes:") {
            io.write_bytes = value;
        }
    }
    return io;
}

std::optional<FdCounts> ProcFs::CountFds(pid_t pid) {
    const std::string dir = ProcPath(pid, "fd");
    DIR* d = ::opendir(dir.c_str());
    if (!d) return std::nullopt;

    FdCounts counts;
    std::array<char, 256> target{};
    while (auto* ent = ::readdir(d)) {
        const char* name = ent->d_name;
        if (std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0) continue;
        ++counts.open_files;

        const std::string link = dir + "/" + name;
        ssize_t n = ::readlink(link.c_str(), target.data(), target.size() - 1);
        if (n > 0) {
            target[static_cast<std::size_t>(n)] = '\0';
            if (std::strncmp(target.data(), "socket:", 7) == 0) {
                ++counts.sockets;
            }
        }
    }
    ::closedir(d);
    return counts;
}

std::optional<std::uint64_t> ProcFs::ReadResidentBytes(pid_t pid) {
    auto content = ReadFile(ProcPath(pid, "status"));
    if (!content) return std::nullopt;
    return ReadKbField(*content, "VmRSS");
}

std::uint64_t ProcFs::TotalMemoryBytes() {
    static const std::uint64_t total = [] {
        auto content = ReadFile("/proc/meminfo");
        if (!content) return std::uint64_t{0};
        return ReadKbField(*content, "MemTotal").value_or(0);
    }();
    return total;
}

long ProcFs::ClockTicksPerSecond() {
    static const long ticks = [] {
        long t = ::sysconf(_SC_CLK_TCK);
        return t > 0 ? t : 100L;
    }();
    return ticks;
}

long ProcFs::PageSize() {
    static const long page = [] {
        long p = ::sysconf(_SC_PAGESIZE);
        return p > 0 ? p : 4096L;
    }();
    return page;
}

bool ProcFs::IsAlive(pid_t pid) {
    auto stat = ReadStat(pid);
    return stat && stat->state != 'Z' && stat->state != 'X';
}

} // namespace utils
} // namespace sentrybox
