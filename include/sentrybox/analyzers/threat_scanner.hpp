/**
 * @file threat_scanner.hpp
 * @brief Static pre-execution screening of user code units
 *
 * Runs three independent passes over a code unit and folds their findings
 * into a single verdict:
 *
 * - **Structural**: parses the code into a syntax tree and flags process
 *   spawning, string-as-code execution, undeclared imports of OS/network
 *   modules and reflection primitives. Unparsable input is itself a finding.
 * - **Pattern**: ordered regex rule table over the raw text.
 * - **Heuristic**: obfuscation scoring from string literal entropy, the
 *   string-concatenation ratio and dynamic execution of obfuscated content.
 *
 * The scanner fails closed: an internal fault yields a high-severity finding
 * and `scan_failed = true` instead of an empty verdict.
 *
 * @date 2025
 */

#pragma once

#include "sentrybox/analyzers/threat_rules.hpp"
#include "sentrybox/analyzers/threat_types.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sentrybox {
namespace analyzers {

/**
 * @class ThreatScanner
 * @brief Pure, deterministic code-unit scanner
 *
 * **Thread Safety**: Scan() is const and may be called concurrently.
 *
 * **Usage Example**:
 * @code
 * ThreatScanner scanner;
 * auto result = scanner.Scan("import os\nos.system('rm -rf /')\n");
 * if (result.blocking) {
 *     spdlog::warn("Blocked: {}", SeverityToString(result.max_severity));
 * }
 * @endcode
 */
class ThreatScanner {
public:
    /**
     * @struct Config
     * @brief Scanner configuration
     */
    struct Config {
        ThreatSeverity block_threshold{ThreatSeverity::HIGH};  ///< Verdict blocks at or above

        /// Modules a strategy may import without a finding
        std::set<std::string> declared_modules{
            "math", "statistics", "numpy", "pandas", "datetime", "decimal",
            "fractions", "itertools", "functools", "collections", "json", "re",
            "random", "typing"
        };

        // Heuristic thresholds
        double entropy_threshold{4.5};            ///< Bits per byte for a suspicious literal
        std::size_t min_literal_length{32};       ///< Shorter literals are not scored
        double concat_ratio_threshold{0.15};      ///< Concatenations per token
        std::size_t min_tokens_for_ratio{10};     ///< Below this the ratio is not scored
        std::size_t max_hex_escapes{8};           ///< \xNN escapes tolerated in one literal

        // Structural limits
        int max_complexity{1000};                 ///< Weighted complexity ceiling (low finding)

        // Input limits
        std::size_t max_code_bytes{1024 * 1024};  ///< Larger inputs are rejected (high finding)
        std::size_t max_line_length{4096};        ///< Regex window size

        bool verbose_logging{false};
    };

    ThreatScanner();
    explicit ThreatScanner(const Config& config);
    virtual ~ThreatScanner() = default;

    ThreatScanner(const ThreatScanner&) = delete;
    ThreatScanner& operator=(const ThreatScanner&) = delete;

    /**
     * @brief Scan a code unit
     *
     * Empty (or whitespace-only) input returns `safe` with zero findings.
     * Findings at the same line and category are deduplicated keeping the
     * highest severity; `blocking` is max severity >= block threshold.
     *
     * Never throws.
     */
    ScanResult Scan(const std::string& code) const;

    const Config& GetConfig() const { return config_; }

protected:
    /**
     * @brief Parse and walk the syntax tree
     * @param metrics Filled with complexity metrics when parsing succeeds
     * @return Findings, or a single "unparsable input" finding
     */
    virtual std::vector<ThreatFinding> StructuralPass(const std::string& code,
                                                      std::optional<ComplexityMetrics>& metrics) const;

    virtual std::vector<ThreatFinding> PatternPass(const std::string& code) const;

    virtual std::vector<ThreatFinding> HeuristicPass(const std::string& code) const;

private:
    Config config_;

    ScanResult Aggregate(std::vector<ThreatFinding> findings) const;
};

} // namespace analyzers
} // namespace sentrybox
