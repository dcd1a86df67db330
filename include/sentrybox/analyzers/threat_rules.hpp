/**
 * @file threat_rules.hpp
 * @brief Ordered regular-expression rule table for the pattern pass
 *
 * @date 2025
 */

#pragma once

#include "sentrybox/analyzers/threat_types.hpp"

#include <regex>
#include <string>
#include <vector>

namespace sentrybox {
namespace analyzers {

/**
 * @struct ThreatRule
 * @brief One pattern rule: a compiled regex and the finding it produces
 */
struct ThreatRule {
    std::string id;               ///< Stable identifier ("CMD-001")
    ThreatCategory category{ThreatCategory::CODE_INJECTION};
    ThreatSeverity severity{ThreatSeverity::SAFE};
    std::string expression;       ///< Source of the regex
    std::regex pattern;           ///< Compiled regex
    std::string description;
};

/**
 * @class ThreatRules
 * @brief Built-in rule table, applied in order
 *
 * Rules run line by line, so every match carries a line number and a byte
 * offset into the original code unit.
 */
class ThreatRules {
public:
    /**
     * @brief The built-in rule table (compiled once, immutable)
     */
    static const std::vector<ThreatRule>& Default();

    /**
     * @brief Apply rules to a code unit
     *
     * Each rule yields at most one finding per line. Lines longer than
     * @p max_line_length are matched in overlapping windows.
     *
     * @throws std::regex_error if the regex engine fails on the input
     */
    static std::vector<ThreatFinding> Apply(const std::vector<ThreatRule>& rules,
                                            const std::string& code,
                                            std::size_t max_line_length = 4096);
};

} // namespace analyzers
} // namespace sentrybox
