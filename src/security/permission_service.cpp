/**
 * @file permission_service.cpp
 * @brief Session-based access control and audit logging
 *
 * @date 2025
 */

#include "sentrybox/security/permission_service.hpp"

#include <spdlog/spdlog.h>

namespace sentrybox {
namespace security {

using utils::ErrorCode;
using utils::Result;
using utils::Status;
using Clock = std::chrono::system_clock;

namespace {

const char* kAuthFailed = "authentication failed";
const char* kStoreUnavailable = "permission store unavailable";

AccessLogEntry MakeEntry(Clock::time_point now,
                         const std::string& principal,
                         const std::string& action,
                         const std::string& permission,
                         const std::string& resource_type,
                         const std::optional<std::string>& scope,
                         AccessDecision decision,
                         const std::string& context,
                         const std::string& details) {
    AccessLogEntry entry;
    entry.timestamp = now;
    entry.principal = principal;
    entry.action = action;
    entry.permission = permission;
    entry.resource_type = resource_type;
    entry.resource_scope = scope;
    entry.decision = decision;
    entry.source_context = context;
    entry.details = details;
    return entry;
}

} // namespace

// ============================================================================
// CONSTRUCTION
// ============================================================================

PermissionService::PermissionService(std::shared_ptr<PermissionStore> store)
    : PermissionService(std::move(store), Config{}) {}

PermissionService::PermissionService(std::shared_ptr<PermissionStore> store, const Config& config)
    : store_(std::move(store)), config_(config) {
    if (!store_) {
        throw std::invalid_argument("PermissionService requires a store");
    }
    if (!config_.clock) {
        config_.clock = [] { return Clock::now(); };
    }
    spdlog::debug("Permission service ready (store: {})", store_->GetPath());
}

Clock::time_point PermissionService::Now() const {
    return config_.clock();
}

// ============================================================================
// AUTHENTICATION
// ============================================================================

Result<std::string> PermissionService::Authenticate(const std::string& name,
                                                    const std::string& credential,
                                                    const std::string& context) {
    try {
        auto principal = store_->FindPrincipalByName(name);
        const auto now = Now();

        if (!principal) {
            // Keep the timing of unknown names in line with wrong credentials
            bool ignored = CredentialUtils::VerifyPassword(
                credential, CredentialUtils::DummyHash(config_.pbkdf2_iterations));
            (void)ignored;
            store_->AppendAccessLog(MakeEntry(now, kUnknownPrincipal, "authenticate", "", "",
                                              std::nullopt, AccessDecision::DENY, context,
                                              "unknown principal"));
            spdlog::warn("Authentication failed (context: {})", context.empty() ? "-" : context);
            return Result<std::string>::Failure(ErrorCode::AUTH_ERROR, kAuthFailed);
        }

        const bool verified = CredentialUtils::VerifyPassword(credential, principal->credential_hash);
        if (!verified || !principal->active) {
            store_->AppendAccessLog(MakeEntry(now, principal->id, "authenticate", "", "",
                                              std::nullopt, AccessDecision::DENY, context,
                                              verified ? "principal disabled" : "bad credential"));
            spdlog::warn("Authentication failed (context: {})", context.empty() ? "-" : context);
            return Result<std::string>::Failure(ErrorCode::AUTH_ERROR, kAuthFailed);
        }

        const std::string token = CredentialUtils::GenerateSessionToken();

        store_->Transaction([&] {
            store_->PurgeExpiredSessions(now);

            Session session;
            session.token_hash = CredentialUtils::SHA256Hex(token);
            session.principal_id = principal->id;
            session.issued_at = now;
            session.expires_at = now + config_.session_ttl;
            store_->InsertSession(session);

            store_->UpdateLastLogin(principal->id, now);
            store_->AppendAccessLog(MakeEntry(now, principal->id, "authenticate", "", "",
                                              std::nullopt, AccessDecision::ALLOW, context,
                                              "session issued"));
        });

        spdlog::info("Principal {} authenticated", principal->name);
        return token;

    } catch (const std::exception& e) {
        spdlog::error("Authentication error: {}", e.what());
        return Result<std::string>::Failure(ErrorCode::AUTH_ERROR, kAuthFailed);
    }
}

Result<Principal> PermissionService::ResolveSession(const std::string& token) const {
    try {
        if (!CredentialUtils::IsValidHex(token)) {
            return Result<Principal>::Failure(ErrorCode::AUTH_ERROR, "invalid session");
        }
        auto session = store_->FindSession(CredentialUtils::SHA256Hex(token));
        if (!session || session->expires_at <= Now()) {
            return Result<Principal>::Failure(ErrorCode::AUTH_ERROR, "invalid session");
        }
        auto principal = store_->FindPrincipalById(session->principal_id);
        if (!principal || !principal->active) {
            return Result<Principal>::Failure(ErrorCode::AUTH_ERROR, "invalid session");
        }
        return *principal;

    } catch (const std::exception& e) {
        spdlog::error("Session lookup error: {}", e.what());
        return Result<Principal>::Failure(ErrorCode::INTERNAL_ERROR, kStoreUnavailable);
    }
}

// ============================================================================
// AUTHORIZATION
// ============================================================================

bool PermissionService::Check(const std::string& token,
                              const std::string& permission,
                              const std::string& resource_type,
                              const std::optional<std::string>& resource_scope,
                              const std::string& context) {
    try {
        const std::string token_hash =
            CredentialUtils::IsValidHex(token) ? CredentialUtils::SHA256Hex(token) : "";

        const auto now = Now();
        bool allowed = false;

        store_->Transaction([&] {
            std::string principal_id = kUnknownPrincipal;
            std::string details;

            std::optional<Session> session;
            if (!token_hash.empty()) {
                session = store_->FindSession(token_hash);
            }
            std::optional<Principal> principal;
            if (session && session->expires_at > now) {
                principal = store_->FindPrincipalById(session->principal_id);
            }

            if (!principal) {
                details = session ? "session expired" : "invalid session";
            } else {
                principal_id = principal->id;
                if (!principal->active) {
                    details = "principal disabled";
                } else if (!permissions::IsKnown(permission) || !resources::IsKnown(resource_type)) {
                    details = "unknown permission or resource type";
                } else if (principal->is_admin) {
                    allowed = true;
                    details = "administrator";
                } else if (store_->RoleAllows(principal->id, permission, resource_type)) {
                    allowed = true;
                    details = "role assignment";
                } else {
                    for (const auto& grant : store_->GrantsFor(principal->id, permission, resource_type)) {
                        if (grant.StateAt(now) == GrantState::ACTIVE &&
                            ScopeMatches(grant.resource_scope, resource_scope)) {
                            allowed = true;
                            details = "grant " + grant.id;
                            break;
                        }
                    }
                    if (!allowed) {
                        details = "no matching role or active grant";
                    }
                }
            }

            store_->AppendAccessLog(MakeEntry(now, principal_id, "check", permission, resource_type,
                                              resource_scope,
                                              allowed ? AccessDecision::ALLOW : AccessDecision::DENY,
                                              context, details));
        });

        if (!allowed) {
            spdlog::warn("Access denied: {} on {}{}", permission, resource_type,
                         resource_scope ? " (" + *resource_scope + ")" : "");
        } else if (config_.verbose_logging) {
            spdlog::debug("Access allowed: {} on {}", permission, resource_type);
        }
        return allowed;

    } catch (const std::exception& e) {
        spdlog::error("Permission check failed closed: {}", e.what());
        return false;
    }
}

Result<std::string> PermissionService::Grant(const std::string& granter_id,
                                             const std::string& target_id,
                                             const std::string& permission,
                                             const std::string& resource_type,
                                             const std::optional<std::string>& resource_scope,
                                             std::optional<std::chrono::seconds> expires_in,
                                             const std::string& context) {
    if (!permissions::IsKnown(permission) || !resources::IsKnown(resource_type)) {
        return Result<std::string>::Failure(ErrorCode::INVALID_ARGUMENT,
                                            "unknown permission or resource type");
    }

    try {
        const auto now = Now();

        return store_->Transaction([&]() -> Result<std::string> {
            auto granter = store_->FindPrincipalById(granter_id);
            if (!MayAdminister(granter, target_id, now)) {
                store_->AppendAccessLog(MakeEntry(now, granter ? granter->id : kUnknownPrincipal,
                                                  "grant", permission, resource_type, resource_scope,
                                                  AccessDecision::DENY, context,
                                                  "granter lacks user:admin; target " + target_id));
                spdlog::warn("Grant refused: granter lacks user:admin");
                return Result<std::string>::Failure(ErrorCode::PERMISSION_DENIED,
                                                    "granter lacks user:admin");
            }

            if (!store_->FindPrincipalById(target_id)) {
                return Result<std::string>::Failure(ErrorCode::NOT_FOUND, "target principal not found");
            }

            security::Grant grant;
            grant.id = CredentialUtils::GenerateId();
            grant.principal_id = target_id;
            grant.permission = permission;
            grant.resource_type = resource_type;
            grant.resource_scope = resource_scope;
            grant.granted_by = granter_id;
            grant.issued_at = now;
            if (expires_in) {
                grant.expires_at = now + *expires_in;
            }
            store_->InsertGrant(grant);

            store_->AppendAccessLog(MakeEntry(now, granter_id, "grant", permission, resource_type,
                                              resource_scope, AccessDecision::ALLOW, context,
                                              "grant " + grant.id + " to " + target_id));
            spdlog::info("Granted {} on {} to {} (grant {})", permission, resource_type, target_id, grant.id);
            return grant.id;
        });

    } catch (const std::exception& e) {
        spdlog::error("Grant failed: {}", e.what());
        return Result<std::string>::Failure(ErrorCode::INTERNAL_ERROR, kStoreUnavailable);
    }
}

bool PermissionService::Revoke(const std::string& grant_id,
                               const std::string& revoked_by,
                               const std::string& context) {
    try {
        auto existing = store_->FindGrant(grant_id);
        if (!existing) {
            spdlog::warn("Revoke of unknown grant {}", grant_id);
            return false;
        }

        const auto now = Now();

        return store_->Transaction([&] {
            auto revoker = store_->FindPrincipalById(revoked_by);
            if (!MayAdminister(revoker, existing->principal_id, now)) {
                store_->AppendAccessLog(MakeEntry(now, revoker ? revoker->id : kUnknownPrincipal,
                                                  "revoke", existing->permission,
                                                  existing->resource_type, existing->resource_scope,
                                                  AccessDecision::DENY, context,
                                                  "revoker lacks user:admin; grant " + grant_id));
                spdlog::warn("Revoke of grant {} refused: revoker lacks user:admin", grant_id);
                return false;
            }

            const bool changed = store_->MarkGrantRevoked(grant_id, now);
            store_->AppendAccessLog(MakeEntry(now, revoked_by, "revoke", existing->permission,
                                              existing->resource_type, existing->resource_scope,
                                              AccessDecision::ALLOW, context,
                                              changed ? "grant " + grant_id + " revoked"
                                                      : "grant " + grant_id + " already revoked"));
            if (changed) {
                spdlog::info("Revoked grant {}", grant_id);
            }
            return true;
        });

    } catch (const std::exception& e) {
        spdlog::error("Revoke failed: {}", e.what());
        return false;
    }
}

bool PermissionService::MayAdminister(const std::optional<Principal>& actor,
                                      const std::string& target_id,
                                      Clock::time_point now) const {
    if (!actor || !actor->active) {
        return false;
    }
    if (actor->is_admin || store_->RoleAllows(actor->id, permissions::USER_ADMIN, resources::USER)) {
        return true;
    }
    for (const auto& g : store_->GrantsFor(actor->id, permissions::USER_ADMIN, resources::USER)) {
        if (g.StateAt(now) == GrantState::ACTIVE && ScopeMatches(g.resource_scope, target_id)) {
            return true;
        }
    }
    return false;
}

Status PermissionService::RecordEvent(AccessLogEntry entry) {
    try {
        if (entry.timestamp == Clock::time_point{}) {
            entry.timestamp = Now();
        }
        store_->Transaction([&] { store_->AppendAccessLog(entry); });
        return Status::Ok();

    } catch (const std::exception& e) {
        spdlog::error("Failed to record audit event: {}", e.what());
        return Status::Failure(ErrorCode::INTERNAL_ERROR, kStoreUnavailable);
    }
}

// ============================================================================
// ADMINISTRATION
// ============================================================================

Result<std::string> PermissionService::CreatePrincipal(const std::string& name,
                                                       const std::string& credential,
                                                       const std::string& email,
                                                       bool is_admin) {
    if (name.empty() || credential.empty()) {
        return Result<std::string>::Failure(ErrorCode::INVALID_ARGUMENT,
                                            "name and credential are required");
    }

    try {
        Principal principal;
        principal.id = CredentialUtils::GenerateId();
        principal.name = name;
        principal.email = email;
        principal.credential_hash = CredentialUtils::HashPassword(credential, config_.pbkdf2_iterations);
        principal.is_admin = is_admin;
        principal.created_at = Now();

        const bool created = store_->Transaction([&] {
            if (store_->FindPrincipalByName(name)) {
                return false;
            }
            store_->InsertPrincipal(principal);
            store_->AppendAccessLog(MakeEntry(principal.created_at, principal.id, "admin", "", "",
                                              std::nullopt, AccessDecision::ALLOW, "",
                                              is_admin ? "administrator created" : "principal created"));
            return true;
        });

        if (!created) {
            return Result<std::string>::Failure(ErrorCode::INVALID_ARGUMENT, "principal name already exists");
        }
        spdlog::info("Created principal {} ({})", name, principal.id);
        return principal.id;

    } catch (const std::exception& e) {
        spdlog::error("Failed to create principal: {}", e.what());
        return Result<std::string>::Failure(ErrorCode::INTERNAL_ERROR, kStoreUnavailable);
    }
}

Status PermissionService::AssignRole(const std::string& principal_id, const std::string& role) {
    try {

        return store_->Transaction([&]() -> Status {
            if (!store_->FindPrincipalById(principal_id)) {
                return Status::Failure(ErrorCode::NOT_FOUND, "principal not found");
            }
            if (!store_->FindRole(role)) {
                return Status::Failure(ErrorCode::NOT_FOUND, "role not found: " + role);
            }
            if (store_->AssignRole(principal_id, role)) {
                store_->AppendAccessLog(MakeEntry(Now(), principal_id, "admin", "", "", std::nullopt,
                                                  AccessDecision::ALLOW, "", "role " + role + " assigned"));
                spdlog::info("Assigned role {} to {}", role, principal_id);
            }
            return Status::Ok();
        });

    } catch (const std::exception& e) {
        spdlog::error("Failed to assign role: {}", e.what());
        return Status::Failure(ErrorCode::INTERNAL_ERROR, kStoreUnavailable);
    }
}

Status PermissionService::SetPrincipalActive(const std::string& principal_id, bool active) {
    try {

        return store_->Transaction([&]() -> Status {
            if (!store_->SetPrincipalActive(principal_id, active)) {
                return Status::Failure(ErrorCode::NOT_FOUND, "principal not found");
            }
            store_->AppendAccessLog(MakeEntry(Now(), principal_id, "admin", "", "", std::nullopt,
                                              AccessDecision::ALLOW, "",
                                              active ? "principal enabled" : "principal disabled"));
            spdlog::info("Principal {} {}", principal_id, active ? "enabled" : "disabled");
            return Status::Ok();
        });

    } catch (const std::exception& e) {
        spdlog::error("Failed to update principal: {}", e.what());
        return Status::Failure(ErrorCode::INTERNAL_ERROR, kStoreUnavailable);
    }
}

Result<Principal> PermissionService::GetPrincipal(const std::string& principal_id) const {
    try {
        auto principal = store_->FindPrincipalById(principal_id);
        if (!principal) {
            return Result<Principal>::Failure(ErrorCode::NOT_FOUND, "principal not found");
        }
        return *principal;
    } catch (const std::exception& e) {
        spdlog::error("Principal lookup failed: {}", e.what());
        return Result<Principal>::Failure(ErrorCode::INTERNAL_ERROR, kStoreUnavailable);
    }
}

Result<Principal> PermissionService::FindPrincipalByName(const std::string& name) const {
    try {
        auto principal = store_->FindPrincipalByName(name);
        if (!principal) {
            return Result<Principal>::Failure(ErrorCode::NOT_FOUND, "principal not found");
        }
        return *principal;
    } catch (const std::exception& e) {
        spdlog::error("Principal lookup failed: {}", e.what());
        return Result<Principal>::Failure(ErrorCode::INTERNAL_ERROR, kStoreUnavailable);
    }
}

Result<std::vector<Principal>> PermissionService::ListPrincipals() const {
    try {
        return store_->ListPrincipals();
    } catch (const std::exception& e) {
        spdlog::error("Principal listing failed: {}", e.what());
        return Result<std::vector<Principal>>::Failure(ErrorCode::INTERNAL_ERROR, kStoreUnavailable);
    }
}

Result<std::vector<AccessLogEntry>> PermissionService::QueryAccessLog(const AccessLogFilter& filter) const {
    try {
        return store_->QueryAccessLog(filter);
    } catch (const std::exception& e) {
        spdlog::error("Access log query failed: {}", e.what());
        return Result<std::vector<AccessLogEntry>>::Failure(ErrorCode::INTERNAL_ERROR, kStoreUnavailable);
    }
}

Result<security::Grant> PermissionService::GetGrant(const std::string& grant_id) const {
    try {
        auto grant = store_->FindGrant(grant_id);
        if (!grant) {
            return Result<security::Grant>::Failure(ErrorCode::NOT_FOUND, "grant not found");
        }
        return *grant;
    } catch (const std::exception& e) {
        spdlog::error("Grant lookup failed: {}", e.what());
        return Result<security::Grant>::Failure(ErrorCode::INTERNAL_ERROR, kStoreUnavailable);
    }
}

Result<std::set<std::string>> PermissionService::EffectivePermissions(const std::string& principal_id) const {
    try {
        auto principal = store_->FindPrincipalById(principal_id);
        if (!principal) {
            return Result<std::set<std::string>>::Failure(ErrorCode::NOT_FOUND, "principal not found");
        }

        std::set<std::string> effective;
        if (!principal->active) {
            return effective;
        }
        if (principal->is_admin) {
            const auto& all = permissions::All();
            return std::set<std::string>(all.begin(), all.end());
        }

        for (const auto& assignment : store_->RolePermissionsOf(principal_id)) {
            effective.insert(assignment.permission);
        }
        const auto now = Now();
        for (const auto& grant : store_->GrantsOf(principal_id)) {
            if (grant.StateAt(now) == GrantState::ACTIVE) {
                effective.insert(grant.permission);
            }
        }
        return effective;

    } catch (const std::exception& e) {
        spdlog::error("Effective permission lookup failed: {}", e.what());
        return Result<std::set<std::string>>::Failure(ErrorCode::INTERNAL_ERROR, kStoreUnavailable);
    }
}

} // namespace security
} // namespace sentrybox
