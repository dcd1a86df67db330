/**
 * @file permission_store.cpp
 * @brief SQLite backend of the permission service
 *
 * @date 2025
 */

#include "sentrybox/security/permission_store.hpp"

#include <spdlog/spdlog.h>
#include <sqlite3.h>

#include <filesystem>

namespace fs = std::filesystem;

namespace sentrybox {
namespace security {

namespace {

using Clock = std::chrono::system_clock;

// ============================================================================
// HELPERS
// ============================================================================

std::int64_t ToMillis(Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

Clock::time_point FromMillis(std::int64_t ms) {
    return Clock::time_point(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

/**
 * @brief Owns one prepared statement
 */
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
        }
    }

    ~Statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void BindText(int index, const std::string& value) {
        Check(sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT));
    }

    void BindText(int index, const std::optional<std::string>& value) {
        if (value) {
            BindText(index, *value);
        } else {
            Check(sqlite3_bind_null(stmt_, index));
        }
    }

    void BindInt64(int index, std::int64_t value) {
        Check(sqlite3_bind_int64(stmt_, index, value));
    }

    void BindTime(int index, const std::optional<Clock::time_point>& value) {
        if (value) {
            BindInt64(index, ToMillis(*value));
        } else {
            Check(sqlite3_bind_null(stmt_, index));
        }
    }

    /// @return true on SQLITE_ROW, false on SQLITE_DONE
    bool Step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        throw std::runtime_error(std::string("SQL step failed: ") + sqlite3_errmsg(db_));
    }

    void Run() {
        if (Step()) {
            throw std::runtime_error("Unexpected row from write statement");
        }
    }

    std::string Text(int column) const {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, column));
        return text ? text : "";
    }

    std::optional<std::string> OptionalText(int column) const {
        if (sqlite3_column_type(stmt_, column) == SQLITE_NULL) {
            return std::nullopt;
        }
        return Text(column);
    }

    std::int64_t Int64(int column) const {
        return sqlite3_column_int64(stmt_, column);
    }

    Clock::time_point Time(int column) const {
        return FromMillis(Int64(column));
    }

    std::optional<Clock::time_point> OptionalTime(int column) const {
        if (sqlite3_column_type(stmt_, column) == SQLITE_NULL) {
            return std::nullopt;
        }
        return Time(column);
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_{nullptr};

    void Check(int rc) {
        if (rc != SQLITE_OK) {
            throw std::runtime_error(std::string("Failed to bind parameter: ") + sqlite3_errmsg(db_));
        }
    }
};

const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS principals (
    id              TEXT PRIMARY KEY,
    name            TEXT NOT NULL UNIQUE,
    email           TEXT NOT NULL DEFAULT '',
    credential_hash TEXT NOT NULL,
    active          INTEGER NOT NULL DEFAULT 1,
    is_admin        INTEGER NOT NULL DEFAULT 0,
    created_at      INTEGER NOT NULL,
    last_login      INTEGER
);

CREATE TABLE IF NOT EXISTS roles (
    name        TEXT PRIMARY KEY,
    description TEXT NOT NULL DEFAULT ''
);

CREATE TABLE IF NOT EXISTS role_permissions (
    role          TEXT NOT NULL REFERENCES roles(name),
    permission    TEXT NOT NULL,
    resource_type TEXT NOT NULL,
    PRIMARY KEY (role, permission, resource_type)
);

CREATE TABLE IF NOT EXISTS principal_roles (
    principal_id TEXT NOT NULL REFERENCES principals(id),
    role         TEXT NOT NULL REFERENCES roles(name),
    PRIMARY KEY (principal_id, role)
);

CREATE TABLE IF NOT EXISTS grants (
    id             TEXT PRIMARY KEY,
    principal_id   TEXT NOT NULL REFERENCES principals(id),
    permission     TEXT NOT NULL,
    resource_type  TEXT NOT NULL,
    resource_scope TEXT,
    granted_by     TEXT NOT NULL,
    issued_at      INTEGER NOT NULL,
    expires_at     INTEGER,
    revoked        INTEGER NOT NULL DEFAULT 0,
    revoked_at     INTEGER
);

CREATE INDEX IF NOT EXISTS idx_grants_lookup
    ON grants(principal_id, permission, resource_type);

CREATE TABLE IF NOT EXISTS sessions (
    token_hash   TEXT PRIMARY KEY,
    principal_id TEXT NOT NULL REFERENCES principals(id),
    issued_at    INTEGER NOT NULL,
    expires_at   INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS access_log (
    id             INTEGER PRIMARY KEY AUTOINCREMENT,
    timestamp      INTEGER NOT NULL,
    principal      TEXT NOT NULL,
    action         TEXT NOT NULL,
    permission     TEXT NOT NULL DEFAULT '',
    resource_type  TEXT NOT NULL DEFAULT '',
    resource_scope TEXT,
    decision       TEXT NOT NULL,
    source_context TEXT NOT NULL DEFAULT '',
    details        TEXT NOT NULL DEFAULT ''
);

CREATE INDEX IF NOT EXISTS idx_access_log_timestamp ON access_log(timestamp);
CREATE INDEX IF NOT EXISTS idx_access_log_principal ON access_log(principal);

CREATE TRIGGER IF NOT EXISTS access_log_no_update BEFORE UPDATE ON access_log
BEGIN
    SELECT RAISE(ABORT, 'access_log is append-only');
END;

CREATE TRIGGER IF NOT EXISTS access_log_no_delete BEFORE DELETE ON access_log
BEGIN
    SELECT RAISE(ABORT, 'access_log is append-only');
END;

CREATE TRIGGER IF NOT EXISTS grants_no_delete BEFORE DELETE ON grants
BEGIN
    SELECT RAISE(ABORT, 'grants are never deleted');
END;

CREATE TRIGGER IF NOT EXISTS grants_revocation_only BEFORE UPDATE ON grants
WHEN NEW.id IS NOT OLD.id
  OR NEW.principal_id IS NOT OLD.principal_id
  OR NEW.permission IS NOT OLD.permission
  OR NEW.resource_type IS NOT OLD.resource_type
  OR NEW.resource_scope IS NOT OLD.resource_scope
  OR NEW.issued_at IS NOT OLD.issued_at
  OR NEW.expires_at IS NOT OLD.expires_at
  OR (OLD.revoked = 1 AND NEW.revoked = 0)
BEGIN
    SELECT RAISE(ABORT, 'only revocation may change a grant');
END;
)SQL";

std::vector<Role> BuiltinRoles() {
    namespace p = permissions;
    auto assign = [](std::initializer_list<const char*> perms) {
        std::vector<RolePermission> out;
        for (const char* perm : perms) {
            out.push_back({perm, resources::ANY});
        }
        return out;
    };

    std::vector<RolePermission> everything;
    for (const auto& perm : p::All()) {
        everything.push_back({perm, resources::ANY});
    }

    return {
        {"admin", "Every permission on every resource", everything},
        {"developer", "Write and run strategies",
         assign({p::CODE_EXECUTE, p::CODE_DEBUG, p::DATA_READ, p::DATA_WRITE,
                 p::STRATEGY_EXECUTE, p::STRATEGY_MODIFY, p::STRATEGY_CREATE})},
        {"trader", "Run strategies and trade",
         assign({p::CODE_EXECUTE, p::DATA_READ, p::TRADE_EXECUTE, p::TRADE_MODIFY,
                 p::STRATEGY_EXECUTE})},
        {"analyst", "Read and export data",
         assign({p::DATA_READ, p::DATA_EXPORT, p::STRATEGY_EXECUTE})},
        {"observer", "Read-only access", assign({p::DATA_READ})}
    };
}

const char* kPrincipalColumns =
    "SELECT id, name, email, credential_hash, active, is_admin, created_at, last_login FROM principals";

Principal ReadPrincipal(const Statement& stmt) {
    Principal principal;
    principal.id = stmt.Text(0);
    principal.name = stmt.Text(1);
    principal.email = stmt.Text(2);
    principal.credential_hash = stmt.Text(3);
    principal.active = stmt.Int64(4) != 0;
    principal.is_admin = stmt.Int64(5) != 0;
    principal.created_at = stmt.Time(6);
    principal.last_login = stmt.OptionalTime(7);
    return principal;
}

const char* kGrantColumns =
    "SELECT id, principal_id, permission, resource_type, resource_scope, granted_by, "
    "issued_at, expires_at, revoked, revoked_at FROM grants";

Grant ReadGrant(const Statement& stmt) {
    Grant grant;
    grant.id = stmt.Text(0);
    grant.principal_id = stmt.Text(1);
    grant.permission = stmt.Text(2);
    grant.resource_type = stmt.Text(3);
    grant.resource_scope = stmt.OptionalText(4);
    grant.granted_by = stmt.Text(5);
    grant.issued_at = stmt.Time(6);
    grant.expires_at = stmt.OptionalTime(7);
    grant.revoked = stmt.Int64(8) != 0;
    grant.revoked_at = stmt.OptionalTime(9);
    return grant;
}

} // namespace

// ============================================================================
// LIFECYCLE
// ============================================================================

PermissionStore::PermissionStore(const std::string& path) : path_(path) {
    if (path != ":memory:") {
        fs::path parent = fs::path(path).parent_path();
        std::error_code ec;
        if (!parent.empty() && !fs::exists(parent, ec)) {
            fs::create_directories(parent, ec);
            if (ec) {
                throw std::runtime_error("Cannot create database directory: " + parent.string());
            }
        }
    }

    int rc = sqlite3_open_v2(path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open permission database: " + message);
    }

    try {
        // WAL keeps readers off the writer's back; in-memory databases ignore it
        Exec("PRAGMA journal_mode=WAL");
        Exec("PRAGMA synchronous=NORMAL");
        Exec("PRAGMA busy_timeout=5000");
        Exec("PRAGMA foreign_keys=ON");
        InitSchema();
        SeedRoles();
    } catch (const std::exception&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }

    spdlog::debug("Permission store opened: {}", path_);
}

PermissionStore::~PermissionStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void PermissionStore::Exec(const std::string& sql) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string message = err_msg ? err_msg : sqlite3_errmsg(db_);
        if (err_msg) {
            sqlite3_free(err_msg);
        }
        throw std::runtime_error("SQL error: " + message);
    }
}

void PermissionStore::Rollback() noexcept {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        spdlog::error("Permission store rollback failed: {}", err_msg ? err_msg : "unknown");
    }
    if (err_msg) {
        sqlite3_free(err_msg);
    }
}

void PermissionStore::InitSchema() {
    Exec(kSchema);
}

void PermissionStore::SeedRoles() {
    Transaction([&] {
        for (const auto& role : BuiltinRoles()) {
            UpsertRole(role);
        }
    });
}

// ============================================================================
// PRINCIPALS
// ============================================================================

void PermissionStore::InsertPrincipal(const Principal& principal) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    Statement stmt(db_,
        "INSERT INTO principals (id, name, email, credential_hash, active, is_admin, created_at, last_login) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
    stmt.BindText(1, principal.id);
    stmt.BindText(2, principal.name);
    stmt.BindText(3, principal.email);
    stmt.BindText(4, principal.credential_hash);
    stmt.BindInt64(5, principal.active ? 1 : 0);
    stmt.BindInt64(6, principal.is_admin ? 1 : 0);
    stmt.BindInt64(7, ToMillis(principal.created_at));
    stmt.BindTime(8, principal.last_login);
    stmt.Run();
}

std::optional<Principal> PermissionStore::FindPrincipalById(const std::string& id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    Statement stmt(db_, std::string(kPrincipalColumns) + " WHERE id = ?");
    stmt.BindText(1, id);
    if (!stmt.Step()) {
        return std::nullopt;
    }
    Principal principal = ReadPrincipal(stmt);
    principal.roles = RolesOf(principal.id);
    return principal;
}

std::optional<Principal> PermissionStore::FindPrincipalByName(const std::string& name) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    Statement stmt(db_, std::string(kPrincipalColumns) + " WHERE name = ?");
    stmt.BindText(1, name);
    if (!stmt.Step()) {
        return std::nullopt;
    }
    Principal principal = ReadPrincipal(stmt);
    principal.roles = RolesOf(principal.id);
    return principal;
}

std::vector<Principal> PermissionStore::ListPrincipals() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    std::vector<Principal> principals;
    {
        Statement stmt(db_, std::string(kPrincipalColumns) + " ORDER BY name");
        while (stmt.Step()) {
            principals.push_back(ReadPrincipal(stmt));
        }
    }
    for (auto& principal : principals) {
        principal.roles = RolesOf(principal.id);
    }
    return principals;
}

bool PermissionStore::SetPrincipalActive(const std::string& id, bool active) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    Statement stmt(db_, "UPDATE principals SET active = ? WHERE id = ?");
    stmt.BindInt64(1, active ? 1 : 0);
    stmt.BindText(2, id);
    stmt.Run();
    return sqlite3_changes(db_) > 0;
}

void PermissionStore::UpdateLastLogin(const std::string& id, Clock::time_point when) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    Statement stmt(db_, "UPDATE principals SET last_login = ? WHERE id = ?");
    stmt.BindInt64(1, ToMillis(when));
    stmt.BindText(2, id);
    stmt.Run();
}

std::vector<std::string> PermissionStore::RolesOf(const std::string& principal_id) const {
    Statement stmt(db_, "SELECT role FROM principal_roles WHERE principal_id = ? ORDER BY role");
    stmt.BindText(1, principal_id);

    std::vector<std::string> roles;
    while (stmt.Step()) {
        roles.push_back(stmt.Text(0));
    }
    return roles;
}

// ============================================================================
// ROLES
// ============================================================================

void PermissionStore::UpsertRole(const Role& role) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    Statement insert_role(db_, "INSERT OR IGNORE INTO roles (name, description) VALUES (?, ?)");
    insert_role.BindText(1, role.name);
    insert_role.BindText(2, role.description);
    insert_role.Run();

    for (const auto& assignment : role.permissions) {
        Statement stmt(db_,
            "INSERT OR IGNORE INTO role_permissions (role, permission, resource_type) VALUES (?, ?, ?)");
        stmt.BindText(1, role.name);
        stmt.BindText(2, assignment.permission);
        stmt.BindText(3, assignment.resource_type);
        stmt.Run();
    }
}

std::optional<Role> PermissionStore::FindRole(const std::string& name) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    Role role;
    {
        Statement stmt(db_, "SELECT name, description FROM roles WHERE name = ?");
        stmt.BindText(1, name);
        if (!stmt.Step()) {
            return std::nullopt;
        }
        role.name = stmt.Text(0);
        role.description = stmt.Text(1);
    }

    Statement stmt(db_,
        "SELECT permission, resource_type FROM role_permissions WHERE role = ? ORDER BY permission");
    stmt.BindText(1, name);
    while (stmt.Step()) {
        role.permissions.push_back({stmt.Text(0), stmt.Text(1)});
    }
    return role;
}

std::vector<Role> PermissionStore::ListRoles() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    std::vector<std::string> names;
    {
        Statement stmt(db_, "SELECT name FROM roles ORDER BY name");
        while (stmt.Step()) {
            names.push_back(stmt.Text(0));
        }
    }

    std::vector<Role> roles;
    for (const auto& name : names) {
        if (auto role = FindRole(name)) {
            roles.push_back(std::move(*role));
        }
    }
    return roles;
}

bool PermissionStore::AssignRole(const std::string& principal_id, const std::string& role) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    Statement stmt(db_, "INSERT OR IGNORE INTO principal_roles (principal_id, role) VALUES (?, ?)");
    stmt.BindText(1, principal_id);
    stmt.BindText(2, role);
    stmt.Run();
    return sqlite3_changes(db_) > 0;
}

bool PermissionStore::RoleAllows(const std::string& principal_id,
                                 const std::string& permission,
                                 const std::string& resource_type) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    Statement stmt(db_,
        "SELECT 1 FROM principal_roles pr "
        "JOIN role_permissions rp ON rp.role = pr.role "
        "WHERE pr.principal_id = ? AND rp.permission = ? "
        "AND (rp.resource_type = ? OR rp.resource_type = '*') LIMIT 1");
    stmt.BindText(1, principal_id);
    stmt.BindText(2, permission);
    stmt.BindText(3, resource_type);
    return stmt.Step();
}

std::vector<RolePermission> PermissionStore::RolePermissionsOf(const std::string& principal_id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    Statement stmt(db_,
        "SELECT DISTINCT rp.permission, rp.resource_type FROM principal_roles pr "
        "JOIN role_permissions rp ON rp.role = pr.role "
        "WHERE pr.principal_id = ? ORDER BY rp.permission, rp.resource_type");
    stmt.BindText(1, principal_id);

    std::vector<RolePermission> assignments;
    while (stmt.Step()) {
        assignments.push_back({stmt.Text(0), stmt.Text(1)});
    }
    return assignments;
}

// ============================================================================
// GRANTS
// ============================================================================

void PermissionStore::InsertGrant(const Grant& grant) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    Statement stmt(db_,
        "INSERT INTO grants (id, principal_id, permission, resource_type, resource_scope, "
        "granted_by, issued_at, expires_at, revoked, revoked_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    stmt.BindText(1, grant.id);
    stmt.BindText(2, grant.principal_id);
    stmt.BindText(3, grant.permission);
    stmt.BindText(4, grant.resource_type);
    stmt.BindText(5, grant.resource_scope);
    stmt.BindText(6, grant.granted_by);
    stmt.BindInt64(7, ToMillis(grant.issued_at));
    stmt.BindTime(8, grant.expires_at);
    stmt.BindInt64(9, grant.revoked ? 1 : 0);
    stmt.BindTime(10, grant.revoked_at);
    stmt.Run();
}

std::optional<Grant> PermissionStore::FindGrant(const std::string& id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    Statement stmt(db_, std::string(kGrantColumns) + " WHERE id = ?");
    stmt.BindText(1, id);
    if (!stmt.Step()) {
        return std::nullopt;
    }
    return ReadGrant(stmt);
}

std::vector<Grant> PermissionStore::GrantsFor(const std::string& principal_id,
                                              const std::string& permission,
                                              const std::string& resource_type) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    Statement stmt(db_, std::string(kGrantColumns) +
        " WHERE principal_id = ? AND permission = ? AND resource_type = ? ORDER BY issued_at");
    stmt.BindText(1, principal_id);
    stmt.BindText(2, permission);
    stmt.BindText(3, resource_type);

    std::vector<Grant> grants;
    while (stmt.Step()) {
        grants.push_back(ReadGrant(stmt));
    }
    return grants;
}

std::vector<Grant> PermissionStore::GrantsOf(const std::string& principal_id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    Statement stmt(db_, std::string(kGrantColumns) + " WHERE principal_id = ? ORDER BY issued_at");
    stmt.BindText(1, principal_id);

    std::vector<Grant> grants;
    while (stmt.Step()) {
        grants.push_back(ReadGrant(stmt));
    }
    return grants;
}

bool PermissionStore::MarkGrantRevoked(const std::string& id, Clock::time_point when) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    Statement stmt(db_, "UPDATE grants SET revoked = 1, revoked_at = ? WHERE id = ? AND revoked = 0");
    stmt.BindInt64(1, ToMillis(when));
    stmt.BindText(2, id);
    stmt.Run();
    return sqlite3_changes(db_) > 0;
}

// ============================================================================
// SESSIONS
// ============================================================================

void PermissionStore::InsertSession(const Session& session) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    Statement stmt(db_,
        "INSERT INTO sessions (token_hash, principal_id, issued_at, expires_at) VALUES (?, ?, ?, ?)");
    stmt.BindText(1, session.token_hash);
    stmt.BindText(2, session.principal_id);
    stmt.BindInt64(3, ToMillis(session.issued_at));
    stmt.BindInt64(4, ToMillis(session.expires_at));
    stmt.Run();
}

std::optional<Session> PermissionStore::FindSession(const std::string& token_hash) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    Statement stmt(db_,
        "SELECT token_hash, principal_id, issued_at, expires_at FROM sessions WHERE token_hash = ?");
    stmt.BindText(1, token_hash);
    if (!stmt.Step()) {
        return std::nullopt;
    }

    Session session;
    session.token_hash = stmt.Text(0);
    session.principal_id = stmt.Text(1);
    session.issued_at = stmt.Time(2);
    session.expires_at = stmt.Time(3);
    return session;
}

std::size_t PermissionStore::PurgeExpiredSessions(Clock::time_point now) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    Statement stmt(db_, "DELETE FROM sessions WHERE expires_at <= ?");
    stmt.BindInt64(1, ToMillis(now));
    stmt.Run();
    return static_cast<std::size_t>(sqlite3_changes(db_));
}

// ============================================================================
// AUDIT LOG
// ============================================================================

std::int64_t PermissionStore::AppendAccessLog(const AccessLogEntry& entry) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    Statement stmt(db_,
        "INSERT INTO access_log (timestamp, principal, action, permission, resource_type, "
        "resource_scope, decision, source_context, details) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
    stmt.BindInt64(1, ToMillis(entry.timestamp));
    stmt.BindText(2, entry.principal);
    stmt.BindText(3, entry.action);
    stmt.BindText(4, entry.permission);
    stmt.BindText(5, entry.resource_type);
    stmt.BindText(6, entry.resource_scope);
    stmt.BindText(7, DecisionToString(entry.decision));
    stmt.BindText(8, entry.source_context);
    stmt.BindText(9, entry.details);
    stmt.Run();
    return sqlite3_last_insert_rowid(db_);
}

std::vector<AccessLogEntry> PermissionStore::QueryAccessLog(const AccessLogFilter& filter) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    std::string sql =
        "SELECT id, timestamp, principal, action, permission, resource_type, resource_scope, "
        "decision, source_context, details FROM access_log WHERE 1 = 1";
    if (filter.principal) sql += " AND principal = ?";
    if (filter.action) sql += " AND action = ?";
    if (filter.permission) sql += " AND permission = ?";
    if (filter.decision) sql += " AND decision = ?";
    if (filter.since) sql += " AND timestamp >= ?";
    if (filter.until) sql += " AND timestamp <= ?";
    sql += " ORDER BY timestamp DESC, id DESC LIMIT ?";

    Statement stmt(db_, sql);
    int index = 1;
    if (filter.principal) stmt.BindText(index++, *filter.principal);
    if (filter.action) stmt.BindText(index++, *filter.action);
    if (filter.permission) stmt.BindText(index++, *filter.permission);
    if (filter.decision) stmt.BindText(index++, DecisionToString(*filter.decision));
    if (filter.since) stmt.BindInt64(index++, ToMillis(*filter.since));
    if (filter.until) stmt.BindInt64(index++, ToMillis(*filter.until));
    stmt.BindInt64(index, static_cast<std::int64_t>(filter.limit));

    std::vector<AccessLogEntry> entries;
    while (stmt.Step()) {
        AccessLogEntry entry;
        entry.id = stmt.Int64(0);
        entry.timestamp = stmt.Time(1);
        entry.principal = stmt.Text(2);
        entry.action = stmt.Text(3);
        entry.permission = stmt.Text(4);
        entry.resource_type = stmt.Text(5);
        entry.resource_scope = stmt.OptionalText(6);
        entry.decision = stmt.Text(7) == "allow" ? AccessDecision::ALLOW : AccessDecision::DENY;
        entry.source_context = stmt.Text(8);
        entry.details = stmt.Text(9);
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::size_t PermissionStore::CountAccessLog() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    Statement stmt(db_, "SELECT COUNT(*) FROM access_log");
    if (!stmt.Step()) {
        return 0;
    }
    return static_cast<std::size_t>(stmt.Int64(0));
}

} // namespace security
} // namespace sentrybox
