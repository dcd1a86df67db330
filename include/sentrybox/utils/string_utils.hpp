/**
 * @file string_utils.hpp
 * @brief String helpers shared by the scanner, sandbox and permission layers
 *
 * Small, stateless utilities: trimming, case folding, splitting, path-prefix
 * tests, entropy calculation and message truncation.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace sentrybox {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string utilities
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * if (StringUtils::IsPathBeneath("/srv/data/x.csv", "/srv/data")) {
 *     // path lies inside the allowed prefix
 * }
 * double h = StringUtils::ShannonEntropy("aGVsbG8gd29ybGQ=");
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * String Manipulation
     ***************************************************************************/

    static std::string Trim(const std::string& str);
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter, skipping empty tokens
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    static std::string Join(const std::vector<std::string>& strings,
                            const std::string& delimiter);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool Contains(const std::string& str, const std::string& substring);

    /***************************************************************************
     * Paths
     ***************************************************************************/

    /**
     * @brief Component-wise prefix test on normalized absolute paths
     *
     * "/srv/data2" is NOT beneath "/srv/data". A path is beneath itself.
     */
    static bool IsPathBeneath(const std::string& path, const std::string& prefix);

    /**
     * @brief Lexically normalize a path (collapse "//", ".", "..")
     */
    static std::string NormalizePath(const std::string& path);

    /***************************************************************************
     * Analysis
     ***************************************************************************/

    /**
     * @brief Shannon entropy in bits per character (0.0 - 8.0)
     *
     * **Entropy Formula**: H(X) = -sum P(xi) * log2(P(xi))
     */
    static double ShannonEntropy(const std::string& data);

    /**
     * @brief 1-based line number of a byte offset
     */
    static int LineOfOffset(const std::string& text, std::size_t offset);

    /***************************************************************************
     * Encoding and Truncation
     ***************************************************************************/

    static std::string ToHex(const unsigned char* data, std::size_t length);

    /**
     * @brief Well-formed UTF-8 test (rejects overlongs, surrogates, > U+10FFFF)
     */
    static bool IsValidUtf8(const std::string& str);

    static std::string Truncate(const std::string& str,
                                std::size_t max_length,
                                const std::string& suffix = "...");
};

} // namespace utils
} // namespace sentrybox
