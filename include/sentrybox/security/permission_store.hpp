/**
 * @file permission_store.hpp
 * @brief SQLite persistence for principals, roles, grants, sessions and the audit log
 *
 * One connection per store, opened in WAL mode. All statements are prepared
 * and bound; nothing is ever spliced into SQL text. The access log and the
 * grants table are protected by triggers that make them append-only (grants
 * may only have their revocation flag set).
 *
 * Built-in roles (admin, developer, trader, analyst, observer) are seeded the
 * first time a database is opened.
 *
 * @date 2025
 */

#pragma once

#include "sentrybox/security/permission_types.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

struct sqlite3;

namespace sentrybox {
namespace security {

/**
 * @class PermissionStore
 * @brief Typed access to the permission database
 *
 * Every method throws std::runtime_error when SQLite reports a failure.
 * Methods are individually thread-safe; use Transaction() to group several
 * of them into one atomic unit. The store holds a single SQLite connection,
 * so concurrent callers are serialised, readers included.
 *
 * **Usage Example**:
 * @code
 * PermissionStore store(":memory:");
 * store.Transaction([&] {
 *     store.InsertPrincipal(principal);
 *     store.AssignRole(principal.id, "developer");
 * });
 * @endcode
 */
class PermissionStore {
public:
    /**
     * @brief Open (or create) a database
     * @param path File path, or ":memory:" for a private in-memory database
     * @throws std::runtime_error if the database cannot be opened or initialised
     */
    explicit PermissionStore(const std::string& path);
    ~PermissionStore();

    PermissionStore(const PermissionStore&) = delete;
    PermissionStore& operator=(const PermissionStore&) = delete;

    /**
     * @brief Run @p fn inside a BEGIN IMMEDIATE transaction
     *
     * Commits when @p fn returns, rolls back and rethrows when it throws.
     * Transactions do not nest.
     */
    template <typename Fn>
    auto Transaction(Fn&& fn) -> decltype(fn()) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        Exec("BEGIN IMMEDIATE");
        try {
            if constexpr (std::is_void_v<decltype(fn())>) {
                fn();
                Exec("COMMIT");
            } else {
                auto result = fn();
                Exec("COMMIT");
                return result;
            }
        } catch (...) {
            Rollback();
            throw;
        }
    }

    // ========================================================================
    // PRINCIPALS
    // ========================================================================

    void InsertPrincipal(const Principal& principal);
    std::optional<Principal> FindPrincipalById(const std::string& id) const;
    std::optional<Principal> FindPrincipalByName(const std::string& name) const;
    std::vector<Principal> ListPrincipals() const;

    /// @return false if no principal has @p id
    bool SetPrincipalActive(const std::string& id, bool active);

    void UpdateLastLogin(const std::string& id, std::chrono::system_clock::time_point when);

    // ========================================================================
    // ROLES
    // ========================================================================

    /// Insert the role if missing and add its permission assignments
    void UpsertRole(const Role& role);
    std::optional<Role> FindRole(const std::string& name) const;
    std::vector<Role> ListRoles() const;

    /// @return false if the principal already holds the role
    bool AssignRole(const std::string& principal_id, const std::string& role);

    /// True when any role of the principal assigns @p permission on @p resource_type
    bool RoleAllows(const std::string& principal_id,
                    const std::string& permission,
                    const std::string& resource_type) const;

    /// Union of the role assignments of a principal
    std::vector<RolePermission> RolePermissionsOf(const std::string& principal_id) const;

    // ========================================================================
    // GRANTS
    // ========================================================================

    void InsertGrant(const Grant& grant);
    std::optional<Grant> FindGrant(const std::string& id) const;

    /// Grants of a principal for one (permission, resource type), any state
    std::vector<Grant> GrantsFor(const std::string& principal_id,
                                 const std::string& permission,
                                 const std::string& resource_type) const;

    std::vector<Grant> GrantsOf(const std::string& principal_id) const;

    /**
     * @brief Set the revoked flag
     * @return false if the grant was already revoked (nothing changed)
     */
    bool MarkGrantRevoked(const std::string& id, std::chrono::system_clock::time_point when);

    // ========================================================================
    // SESSIONS
    // ========================================================================

    void InsertSession(const Session& session);
    std::optional<Session> FindSession(const std::string& token_hash) const;
    std::size_t PurgeExpiredSessions(std::chrono::system_clock::time_point now);

    // ========================================================================
    // AUDIT LOG
    // ========================================================================

    /// @return Row id of the new entry
    std::int64_t AppendAccessLog(const AccessLogEntry& entry);

    /// Newest first, at most filter.limit entries
    std::vector<AccessLogEntry> QueryAccessLog(const AccessLogFilter& filter) const;

    std::size_t CountAccessLog() const;

    const std::string& GetPath() const { return path_; }

private:
    sqlite3* db_{nullptr};
    std::string path_;
    // One connection per store: every call and transaction runs under this lock
    mutable std::recursive_mutex mutex_;

    void Exec(const std::string& sql);
    void Rollback() noexcept;
    void InitSchema();
    void SeedRoles();
    std::vector<std::string> RolesOf(const std::string& principal_id) const;
};

} // namespace security
} // namespace sentrybox
