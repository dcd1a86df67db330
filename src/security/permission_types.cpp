/**
 * @file permission_types.cpp
 * @brief Permission catalogue and scope matching
 *
 * @date 2025
 */

#include "sentrybox/security/permission_types.hpp"

#include <algorithm>

namespace sentrybox {
namespace security {

namespace permissions {

const std::vector<std::string>& All() {
    static const std::vector<std::string> all = {
        FILE_READ, FILE_WRITE, FILE_DELETE, FILE_EXECUTE, FILE_CREATE,
        NETWORK_CONNECT, NETWORK_LISTEN, NETWORK_BROADCAST,
        SYSTEM_EXECUTE, SYSTEM_MODIFY, SYSTEM_ADMIN,
        CODE_EXECUTE, CODE_INJECT, CODE_DEBUG,
        DATA_READ, DATA_WRITE, DATA_DELETE, DATA_EXPORT,
        API_ACCESS, API_MODIFY, API_ADMIN,
        TRADE_EXECUTE, TRADE_MODIFY, TRADE_ADMIN,
        STRATEGY_EXECUTE, STRATEGY_MODIFY, STRATEGY_CREATE,
        USER_VIEW, USER_MODIFY, USER_ADMIN
    };
    return all;
}

bool IsKnown(const std::string& permission) {
    const auto& all = All();
    return std::find(all.begin(), all.end(), permission) != all.end();
}

} // namespace permissions

namespace resources {

const std::vector<std::string>& All() {
    static const std::vector<std::string> all = {
        FILE, DIRECTORY, DATABASE, API_ENDPOINT, NETWORK_HOST,
        PROCESS, PORT, STRATEGY, TRADE, USER
    };
    return all;
}

bool IsKnown(const std::string& resource_type) {
    const auto& all = All();
    return std::find(all.begin(), all.end(), resource_type) != all.end();
}

} // namespace resources

std::string DecisionToString(AccessDecision decision) {
    return decision == AccessDecision::ALLOW ? "allow" : "deny";
}

std::string GrantStateToString(GrantState state) {
    switch (state) {
        case GrantState::ACTIVE: return "active";
        case GrantState::EXPIRED: return "expired";
        case GrantState::REVOKED: return "revoked";
    }
    return "unknown";
}

bool ScopeMatches(const std::optional<std::string>& grant_scope,
                  const std::optional<std::string>& requested_scope) {
    if (!grant_scope) {
        return true;
    }
    if (!requested_scope) {
        return false;
    }

    const std::string& granted = *grant_scope;
    const std::string& requested = *requested_scope;
    if (requested == granted) {
        return true;
    }
    if (granted.empty() || requested.compare(0, granted.size(), granted) != 0) {
        return false;
    }

    auto is_separator = [](char c) { return c == '/' || c == ':' || c == '.'; };
    return is_separator(granted.back()) || is_separator(requested[granted.size()]);
}

} // namespace security
} // namespace sentrybox
