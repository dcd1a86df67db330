/**
 * @file permission_service.hpp
 * @brief Authentication, authorization and audit for privileged operations
 *
 * Every privileged operation is gated by Check(). A check resolves the
 * session to a principal, then allows the request when:
 * - the principal is an administrator, or
 * - one of its roles assigns the permission on the resource type, or
 * - a direct grant matches permission, resource type and scope and is
 *   neither expired nor revoked.
 *
 * Each check appends exactly one access log entry inside the same SQLite
 * transaction as the decision, so a decision is never returned without its
 * audit record.
 *
 * @date 2025
 */

#pragma once

#include "sentrybox/security/credential_utils.hpp"
#include "sentrybox/security/permission_store.hpp"
#include "sentrybox/security/permission_types.hpp"
#include "sentrybox/utils/result.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sentrybox {
namespace security {

/// Principal recorded for checks whose session does not resolve
constexpr const char* kUnknownPrincipal = "<unknown>";

/**
 * @class PermissionService
 * @brief Session-based access control over a PermissionStore
 *
 * **Thread Safety**: All methods are thread-safe. Each decision runs as one
 * store transaction, and the store owns a single SQLite connection, so
 * checks and writes are serialised across all principals. Credential
 * hashing runs outside the transaction.
 *
 * **Usage Example**:
 * @code
 * auto store = std::make_shared<PermissionStore>("data/permissions.db");
 * PermissionService service(store);
 *
 * auto token = service.Authenticate("alice", "s3cret", "cli");
 * if (token && service.Check(token.value(), permissions::CODE_EXECUTE, resources::PROCESS)) {
 *     // run the code
 * }
 * @endcode
 */
class PermissionService {
public:
    /**
     * @struct Config
     * @brief Permission service configuration
     */
    struct Config {
        std::chrono::seconds session_ttl{8 * 3600};                  ///< Lifetime of issued sessions
        int pbkdf2_iterations{CredentialUtils::kDefaultIterations};  ///< Work factor for new hashes
        std::function<std::chrono::system_clock::time_point()> clock;  ///< Defaults to system_clock::now
        bool verbose_logging{false};
    };

    explicit PermissionService(std::shared_ptr<PermissionStore> store);
    PermissionService(std::shared_ptr<PermissionStore> store, const Config& config);
    ~PermissionService() = default;

    PermissionService(const PermissionService&) = delete;
    PermissionService& operator=(const PermissionService&) = delete;

    // ========================================================================
    // AUTHENTICATION AND AUTHORIZATION
    // ========================================================================

    /**
     * @brief Issue a session token for a principal
     *
     * Unknown names, wrong credentials and disabled principals all yield the
     * same AUTH_ERROR. A credential hash is computed in every case.
     *
     * @param context Source context recorded in the audit log (e.g. caller IP)
     * @return Session token (64 hex chars)
     */
    utils::Result<std::string> Authenticate(const std::string& name,
                                            const std::string& credential,
                                            const std::string& context = "");

    /**
     * @brief Decide whether the session's principal may perform an operation
     *
     * Unknown or malformed permission/resource types, invalid or expired
     * sessions, disabled principals and store failures all deny.
     */
    bool Check(const std::string& token,
               const std::string& permission,
               const std::string& resource_type,
               const std::optional<std::string>& resource_scope = std::nullopt,
               const std::string& context = "");

    /**
     * @brief Resolve a live session to its principal
     * @return AUTH_ERROR for unknown, expired or disabled sessions
     */
    utils::Result<Principal> ResolveSession(const std::string& token) const;

    /**
     * @brief Issue a direct grant
     *
     * The granter must be an administrator or hold user:admin on user.
     *
     * @param expires_in Lifetime from now; unset never expires, a negative
     *                   value produces an already expired grant
     * @return Grant id
     */
    utils::Result<std::string> Grant(const std::string& granter_id,
                                     const std::string& target_id,
                                     const std::string& permission,
                                     const std::string& resource_type,
                                     const std::optional<std::string>& resource_scope = std::nullopt,
                                     std::optional<std::chrono::seconds> expires_in = std::nullopt,
                                     const std::string& context = "");

    /**
     * @brief Revoke a grant
     *
     * The revoker needs the same authority as a granter: admin, or
     * user:admin on the grant holder. Refusals are audited as deny rows.
     * Idempotent: revoking an already revoked grant changes nothing and
     * returns true. Returns false for unknown grant ids, refusals and
     * store errors.
     */
    bool Revoke(const std::string& grant_id,
                const std::string& revoked_by,
                const std::string& context = "");

    /**
     * @brief Append an audit entry for an event outside check/grant/revoke
     */
    utils::Status RecordEvent(AccessLogEntry entry);

    // ========================================================================
    // ADMINISTRATION
    // ========================================================================

    /// @return Id of the new principal; INVALID_ARGUMENT if the name is taken
    utils::Result<std::string> CreatePrincipal(const std::string& name,
                                               const std::string& credential,
                                               const std::string& email = "",
                                               bool is_admin = false);

    utils::Status AssignRole(const std::string& principal_id, const std::string& role);

    utils::Status SetPrincipalActive(const std::string& principal_id, bool active);

    utils::Result<Principal> GetPrincipal(const std::string& principal_id) const;
    utils::Result<Principal> FindPrincipalByName(const std::string& name) const;
    utils::Result<std::vector<Principal>> ListPrincipals() const;

    utils::Result<std::vector<AccessLogEntry>> QueryAccessLog(const AccessLogFilter& filter) const;

    utils::Result<security::Grant> GetGrant(const std::string& grant_id) const;

    /**
     * @brief Permissions a principal currently holds through roles or active grants
     */
    utils::Result<std::set<std::string>> EffectivePermissions(const std::string& principal_id) const;

    const Config& GetConfig() const { return config_; }

private:
    std::shared_ptr<PermissionStore> store_;
    Config config_;

    std::chrono::system_clock::time_point Now() const;

    /// Admin, or user:admin on @p target_id through a role or active scoped grant
    bool MayAdminister(const std::optional<Principal>& actor, const std::string& target_id,
                       std::chrono::system_clock::time_point now) const;
};

} // namespace security
} // namespace sentrybox
