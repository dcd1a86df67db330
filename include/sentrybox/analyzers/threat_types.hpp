/**
 * @file threat_types.hpp
 * @brief Findings, severities and categories produced by the threat scanner
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace sentrybox {
namespace analyzers {

/**
 * @enum ThreatSeverity
 * @brief Ordered severity scale (comparison operators follow the order)
 */
enum class ThreatSeverity {
    SAFE = 0,      ///< Nothing suspicious
    LOW = 1,       ///< Worth noting
    MEDIUM = 2,    ///< Suspicious
    HIGH = 3,      ///< Dangerous (blocks by default)
    CRITICAL = 4   ///< Malicious
};

/**
 * @enum ThreatCategory
 * @brief Threat taxonomy for findings
 */
enum class ThreatCategory {
    COMMAND_INJECTION,
    FILE_OPERATION,
    NETWORK_ACCESS,
    SYSTEM_CALL,
    CODE_INJECTION,
    PRIVILEGE_ESCALATION,
    CRYPTOGRAPHIC_OPERATION,
    NETWORK_SCAN,
    DYNAMIC_CODE_EXECUTION,
    UNAUTHORIZED_ACCESS,
    DATA_EXFILTRATION
};

/**
 * @enum FindingSource
 * @brief Which scanner pass produced a finding
 */
enum class FindingSource {
    STRUCTURAL,  ///< AST walk
    PATTERN,     ///< Regex rule table
    HEURISTIC,   ///< Entropy / concatenation scoring
    SCANNER      ///< Scanner-level condition (failure, size limit)
};

/**
 * @struct ThreatFinding
 * @brief One detected suspicious construct
 */
struct ThreatFinding {
    std::string pattern_id;               ///< Rule or check identifier (e.g. "CMD-001")
    ThreatCategory category{ThreatCategory::CODE_INJECTION};
    ThreatSeverity severity{ThreatSeverity::SAFE};
    int line{0};                          ///< 1-based line, 0 when not applicable
    std::size_t offset{0};                ///< Byte offset in the code unit
    std::string description;              ///< Human-readable explanation
    FindingSource source{FindingSource::PATTERN};
};

/**
 * @struct ComplexityMetrics
 * @brief Structural size metrics of a parsed code unit
 */
struct ComplexityMetrics {
    int total_lines{0};
    int function_count{0};
    int class_count{0};
    int loop_count{0};
    int condition_count{0};
    int import_count{0};
    int max_depth{0};
    int total_complexity{0};   ///< Weighted sum of the counters above
};

/**
 * @struct ScanResult
 * @brief Aggregated verdict for one code unit
 */
struct ScanResult {
    std::vector<ThreatFinding> findings;               ///< Deduplicated findings
    ThreatSeverity max_severity{ThreatSeverity::SAFE}; ///< Max over findings
    bool blocking{false};                              ///< max_severity >= block threshold
    bool scan_failed{false};                           ///< Scanner faulted (fail-closed verdict)
    bool parsed{false};                                ///< Structural pass parsed the input
    std::optional<ComplexityMetrics> complexity;       ///< Present when parsed
    std::chrono::microseconds duration{0};             ///< Scan time
};

std::string SeverityToString(ThreatSeverity severity);
std::optional<ThreatSeverity> SeverityFromString(const std::string& name);
std::string CategoryToString(ThreatCategory category);
std::optional<ThreatCategory> CategoryFromString(const std::string& name);
std::string FindingSourceToString(FindingSource source);

} // namespace analyzers
} // namespace sentrybox
