/**
 * @file string_utils.cpp
 * @brief Implementation of shared string helpers
 *
 * @date 2025
 */

#include "sentrybox/utils/string_utils.hpp"
#include "sentrybox/utils/result.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace sentrybox {
namespace utils {

std::string ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::AUTH_ERROR: return "auth_error";
        case ErrorCode::PERMISSION_DENIED: return "permission_denied";
        case ErrorCode::SCAN_BLOCKED: return "scan_blocked";
        case ErrorCode::LAUNCH_FAILURE: return "launch_failure";
        case ErrorCode::TIMEOUT: return "timeout";
        case ErrorCode::RESOURCE_LIMIT_EXCEEDED: return "resource_limit_exceeded";
        case ErrorCode::CANCELLED: return "cancelled";
        case ErrorCode::PARSE_ERROR: return "parse_error";
        case ErrorCode::NOT_FOUND: return "not_found";
        case ErrorCode::INVALID_ARGUMENT: return "invalid_argument";
        case ErrorCode::INTERNAL_ERROR: return "internal_error";
    }
    return "internal_error";
}

// ============================================================================
// STRING MANIPULATION UTILITIES
// ============================================================================

std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::string StringUtils::Join(const std::vector<std::string>& strings,
                             const std::string& delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << strings[0];
    for (std::size_t i = 1; i < strings.size(); ++i) {
        oss << delimiter << strings[i];
    }
    return oss.str();
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

// ============================================================================
// PATH UTILITIES
// ============================================================================

std::string StringUtils::NormalizePath(const std::string& path) {
    if (path.empty()) {
        return path;
    }

    const bool absolute = path.front() == '/';
    std::vector<std::string> parts;
    for (const auto& part : Split(path, '/')) {
        if (part == ".") {
            continue;
        }
        if (part == "..") {
            if (!parts.empty() && parts.back() != "..") {
                parts.pop_back();
            } else if (!absolute) {
                parts.push_back(part);
            }
            continue;
        }
        parts.push_back(part);
    }

    std::string joined = Join(parts, "/");
    if (absolute) {
        return "/" + joined;
    }
    return joined.empty() ? "." : joined;
}

bool StringUtils::IsPathBeneath(const std::string& path, const std::string& prefix) {
    const std::string p = NormalizePath(path);
    const std::string root = NormalizePath(prefix);

    if (root == "/") {
        return !p.empty() && p.front() == '/';
    }
    if (p == root) {
        return true;
    }
    return StartsWith(p, root) && p.size() > root.size() && p[root.size()] == '/';
}

// ============================================================================
// ANALYSIS HELPERS
// ============================================================================

double StringUtils::ShannonEntropy(const std::string& data) {
    if (data.empty()) return 0.0;

    std::array<std::size_t, 256> frequencies = {};
    for (unsigned char byte : data) {
        frequencies[byte]++;
    }

    double entropy = 0.0;
    const double size = static_cast<double>(data.size());
    for (std::size_t freq : frequencies) {
        if (freq > 0) {
            double probability = freq / size;
            entropy -= probability * std::log2(probability);
        }
    }
    return entropy;
}

int StringUtils::LineOfOffset(const std::string& text, std::size_t offset) {
    offset = std::min(offset, text.size());
    return 1 + static_cast<int>(std::count(text.begin(), text.begin() + offset, '\n'));
}

// ============================================================================
// ENCODING AND TRUNCATION
// ============================================================================

std::string StringUtils::ToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

bool StringUtils::IsValidUtf8(const std::string& str) {
    std::size_t i = 0;
    while (i < str.size()) {
        const auto c = static_cast<unsigned char>(str[i]);
        std::size_t length = 0;
        unsigned char low = 0x80;
        unsigned char high = 0xBF;
        if (c < 0x80) {
            ++i;
            continue;
        } else if (c >= 0xC2 && c <= 0xDF) {
            length = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            length = 3;
            if (c == 0xE0) low = 0xA0;
            if (c == 0xED) high = 0x9F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            length = 4;
            if (c == 0xF0) low = 0x90;
            if (c == 0xF4) high = 0x8F;
        } else {
            return false;
        }
        if (i + length > str.size()) {
            return false;
        }
        // Only the first continuation byte has a narrowed range
        for (std::size_t k = 1; k < length; ++k) {
            const auto cont = static_cast<unsigned char>(str[i + k]);
            const unsigned char lo = k == 1 ? low : 0x80;
            const unsigned char hi = k == 1 ? high : 0xBF;
            if (cont < lo || cont > hi) {
                return false;
            }
        }
        i += length;
    }
    return true;
}

std::string StringUtils::Truncate(const std::string& str,
                                 std::size_t max_length,
                                 const std::string& suffix) {
    if (str.length() <= max_length) {
        return str;
    }
    if (max_length <= suffix.length()) {
        return str.substr(0, max_length);
    }
    return str.substr(0, max_length - suffix.length()) + suffix;
}

} // namespace utils
} // namespace sentrybox
