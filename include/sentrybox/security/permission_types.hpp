/**
 * @file permission_types.hpp
 * @brief Principals, roles, grants and audit records
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sentrybox {
namespace security {

// ============================================================================
// PERMISSION AND RESOURCE TYPES
// ============================================================================

namespace permissions {
constexpr const char* FILE_READ = "file:read";
constexpr const char* FILE_WRITE = "file:write";
constexpr const char* FILE_DELETE = "file:delete";
constexpr const char* FILE_EXECUTE = "file:execute";
constexpr const char* FILE_CREATE = "file:create";
constexpr const char* NETWORK_CONNECT = "network:connect";
constexpr const char* NETWORK_LISTEN = "network:listen";
constexpr const char* NETWORK_BROADCAST = "network:broadcast";
constexpr const char* SYSTEM_EXECUTE = "system:execute";
constexpr const char* SYSTEM_MODIFY = "system:modify";
constexpr const char* SYSTEM_ADMIN = "system:admin";
constexpr const char* CODE_EXECUTE = "code:execute";
constexpr const char* CODE_INJECT = "code:inject";
constexpr const char* CODE_DEBUG = "code:debug";
constexpr const char* DATA_READ = "data:read";
constexpr const char* DATA_WRITE = "data:write";
constexpr const char* DATA_DELETE = "data:delete";
constexpr const char* DATA_EXPORT = "data:export";
constexpr const char* API_ACCESS = "api:access";
constexpr const char* API_MODIFY = "api:modify";
constexpr const char* API_ADMIN = "api:admin";
constexpr const char* TRADE_EXECUTE = "trade:execute";
constexpr const char* TRADE_MODIFY = "trade:modify";
constexpr const char* TRADE_ADMIN = "trade:admin";
constexpr const char* STRATEGY_EXECUTE = "strategy:execute";
constexpr const char* STRATEGY_MODIFY = "strategy:modify";
constexpr const char* STRATEGY_CREATE = "strategy:create";
constexpr const char* USER_VIEW = "user:view";
constexpr const char* USER_MODIFY = "user:modify";
constexpr const char* USER_ADMIN = "user:admin";

/// Every permission type, in declaration order
const std::vector<std::string>& All();

bool IsKnown(const std::string& permission);
} // namespace permissions

namespace resources {
constexpr const char* FILE = "file";
constexpr const char* DIRECTORY = "directory";
constexpr const char* DATABASE = "database";
constexpr const char* API_ENDPOINT = "api_endpoint";
constexpr const char* NETWORK_HOST = "network_host";
constexpr const char* PROCESS = "process";
constexpr const char* PORT = "port";
constexpr const char* STRATEGY = "strategy";
constexpr const char* TRADE = "trade";
constexpr const char* USER = "user";

/// Role assignments use this to cover every resource type
constexpr const char* ANY = "*";

const std::vector<std::string>& All();

bool IsKnown(const std::string& resource_type);
} // namespace resources

// ============================================================================
// RECORDS
// ============================================================================

/**
 * @struct Principal
 * @brief Authenticated identity subject to permission checks
 */
struct Principal {
    std::string id;                  ///< 32 hex chars
    std::string name;                ///< Unique login name
    std::string email;
    std::string credential_hash;     ///< PBKDF2 encoded hash, never logged
    bool active{true};               ///< Disabled principals fail every check
    bool is_admin{false};            ///< Admins pass every check
    std::chrono::system_clock::time_point created_at;
    std::optional<std::chrono::system_clock::time_point> last_login;
    std::vector<std::string> roles;  ///< Assigned role names
};

/**
 * @struct RolePermission
 * @brief Static (permission x resource type) assignment of a role
 */
struct RolePermission {
    std::string permission;
    std::string resource_type;  ///< resources::ANY matches every type
};

struct Role {
    std::string name;
    std::string description;
    std::vector<RolePermission> permissions;
};

/**
 * @enum GrantState
 * @brief Lifecycle of a direct grant; EXPIRED and REVOKED are terminal
 */
enum class GrantState {
    ACTIVE,
    EXPIRED,
    REVOKED
};

/**
 * @struct Grant
 * @brief Time-bounded, revocable assignment of one permission
 *
 * Grants are never deleted; expiry is evaluated lazily against the clock and
 * revocation sets a flag.
 */
struct Grant {
    std::string id;
    std::string principal_id;
    std::string permission;
    std::string resource_type;
    std::optional<std::string> resource_scope;  ///< Unset covers every scope
    std::string granted_by;
    std::chrono::system_clock::time_point issued_at;
    std::optional<std::chrono::system_clock::time_point> expires_at;
    bool revoked{false};
    std::optional<std::chrono::system_clock::time_point> revoked_at;

    GrantState StateAt(std::chrono::system_clock::time_point now) const {
        if (revoked) {
            return GrantState::REVOKED;
        }
        if (expires_at && *expires_at <= now) {
            return GrantState::EXPIRED;
        }
        return GrantState::ACTIVE;
    }
};

/**
 * @enum AccessDecision
 */
enum class AccessDecision {
    ALLOW,
    DENY
};

/**
 * @struct AccessLogEntry
 * @brief Append-only audit record
 */
struct AccessLogEntry {
    std::int64_t id{0};                  ///< Assigned by the store
    std::chrono::system_clock::time_point timestamp;
    std::string principal;               ///< Principal id, or "<unknown>"
    std::string action;                  ///< check, grant, revoke, authenticate, admin
    std::string permission;
    std::string resource_type;
    std::optional<std::string> resource_scope;
    AccessDecision decision{AccessDecision::DENY};
    std::string source_context;          ///< Calling IP, session or tool
    std::string details;
};

/**
 * @struct AccessLogFilter
 * @brief Criteria for QueryAccessLog; unset fields match everything
 */
struct AccessLogFilter {
    std::optional<std::string> principal;
    std::optional<std::string> action;
    std::optional<std::string> permission;
    std::optional<AccessDecision> decision;
    std::optional<std::chrono::system_clock::time_point> since;
    std::optional<std::chrono::system_clock::time_point> until;
    std::size_t limit{100};
};

/**
 * @struct Session
 * @brief Issued session; only the SHA-256 of the token is stored
 */
struct Session {
    std::string token_hash;
    std::string principal_id;
    std::chrono::system_clock::time_point issued_at;
    std::chrono::system_clock::time_point expires_at;
};

std::string DecisionToString(AccessDecision decision);
std::string GrantStateToString(GrantState state);

/**
 * @brief Scope match used by direct grants
 *
 * An unscoped grant covers every request. A scoped grant covers a request
 * whose scope equals it or extends it past a separator ('/', ':' or '.'),
 * so "strategies/alpha" covers "strategies/alpha/v2" but not
 * "strategies/alphabet". A scoped grant never covers an unscoped request.
 */
bool ScopeMatches(const std::optional<std::string>& grant_scope,
                  const std::optional<std::string>& requested_scope);

} // namespace security
} // namespace sentrybox
