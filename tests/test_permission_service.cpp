/**
 * @file test_permission_service.cpp
 * @brief Authentication, role and grant decisions, and the audit trail
 */

#include "sentrybox/security/permission_service.hpp"
#include "sentrybox/security/permission_store.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <unistd.h>

using namespace sentrybox::security;
using sentrybox::utils::ErrorCode;
using namespace std::chrono_literals;

namespace {

class PermissionServiceTest : public ::testing::Test {
protected:
    std::chrono::system_clock::time_point now_{std::chrono::system_clock::now()};
    std::shared_ptr<PermissionStore> store_;
    std::unique_ptr<PermissionService> service_;
    std::string admin_id_;

    void SetUp() override {
        store_ = std::make_shared<PermissionStore>(":memory:");
        PermissionService::Config config;
        config.pbkdf2_iterations = 1000;
        config.session_ttl = 1h;
        config.clock = [this] { return now_; };
        service_ = std::make_unique<PermissionService>(store_, config);

        admin_id_ = service_->CreatePrincipal("root", "root-pass", "", true).value();
    }

    std::string Create(const std::string& name, const std::string& role) {
        auto id = service_->CreatePrincipal(name, name + "-pass");
        EXPECT_TRUE(id.ok());
        if (!role.empty()) {
            EXPECT_TRUE(service_->AssignRole(id.value(), role).ok());
        }
        return id.value();
    }

    std::string Login(const std::string& name) {
        auto token = service_->Authenticate(name, name + "-pass", "test");
        EXPECT_TRUE(token.ok());
        return token.value();
    }

    std::size_t CountLog(const std::string& principal, const std::string& action,
                         std::optional<AccessDecision> decision = std::nullopt) {
        AccessLogFilter filter;
        filter.principal = principal;
        filter.action = action;
        filter.decision = decision;
        filter.limit = 1000;
        return service_->QueryAccessLog(filter).value().size();
    }
};

} // namespace

TEST_F(PermissionServiceTest, AuthenticateIssuesResolvableSession) {
    const auto id = Create("alice", "developer");
    auto token = Login("alice");
    EXPECT_EQ(token.size(), 64u);

    auto principal = service_->ResolveSession(token);
    ASSERT_TRUE(principal.ok());
    EXPECT_EQ(principal.value().id, id);
    EXPECT_EQ(principal.value().name, "alice");
    EXPECT_TRUE(principal.value().last_login.has_value());
}

TEST_F(PermissionServiceTest, AuthenticationFailuresAreIndistinguishable) {
    Create("alice", "developer");
    const auto disabled = Create("mallory", "developer");
    ASSERT_TRUE(service_->SetPrincipalActive(disabled, false).ok());

    auto unknown = service_->Authenticate("nobody", "whatever");
    auto wrong = service_->Authenticate("alice", "not-her-password");
    auto inactive = service_->Authenticate("mallory", "mallory-pass");

    ASSERT_FALSE(unknown.ok());
    ASSERT_FALSE(wrong.ok());
    ASSERT_FALSE(inactive.ok());
    EXPECT_EQ(unknown.error().code, ErrorCode::AUTH_ERROR);
    EXPECT_EQ(unknown.error().code, wrong.error().code);
    EXPECT_EQ(unknown.error().message, wrong.error().message);
    EXPECT_EQ(wrong.error().message, inactive.error().message);
}

TEST_F(PermissionServiceTest, ObserverIsDeniedWithExactlyOneAuditRow) {
    const auto id = Create("olivia", "observer");
    auto token = Login("olivia");

    const auto before = CountLog(id, "check", AccessDecision::DENY);
    EXPECT_FALSE(service_->Check(token, permissions::CODE_EXECUTE, resources::PROCESS));
    EXPECT_EQ(CountLog(id, "check", AccessDecision::DENY), before + 1);

    AccessLogFilter filter;
    filter.principal = id;
    filter.limit = 1;
    auto latest = service_->QueryAccessLog(filter).value();
    ASSERT_EQ(latest.size(), 1u);
    EXPECT_EQ(latest[0].permission, permissions::CODE_EXECUTE);
    EXPECT_EQ(latest[0].resource_type, resources::PROCESS);
    EXPECT_EQ(latest[0].decision, AccessDecision::DENY);
}

TEST_F(PermissionServiceTest, RoleAssignmentAllows) {
    Create("dev", "developer");
    auto token = Login("dev");
    EXPECT_TRUE(service_->Check(token, permissions::CODE_EXECUTE, resources::PROCESS));
    EXPECT_FALSE(service_->Check(token, permissions::SYSTEM_ADMIN, resources::PROCESS));
}

TEST_F(PermissionServiceTest, AdministratorPassesEveryKnownCheck) {
    auto token = service_->Authenticate("root", "root-pass").value();
    EXPECT_TRUE(service_->Check(token, permissions::TRADE_ADMIN, resources::TRADE));
    EXPECT_FALSE(service_->Check(token, "trade:everything", resources::TRADE));
}

TEST_F(PermissionServiceTest, InvalidTokensDeny) {
    EXPECT_FALSE(service_->Check("", permissions::DATA_READ, resources::FILE));
    EXPECT_FALSE(service_->Check("not-hex", permissions::DATA_READ, resources::FILE));
    EXPECT_FALSE(service_->Check(std::string(64, 'a'), permissions::DATA_READ, resources::FILE));
    EXPECT_GE(CountLog(kUnknownPrincipal, "check", AccessDecision::DENY), 3u);
}

TEST_F(PermissionServiceTest, GrantExpiresWithTheClock) {
    const auto id = Create("olivia", "observer");
    auto token = Login("olivia");

    auto grant = service_->Grant(admin_id_, id, permissions::CODE_EXECUTE, resources::PROCESS,
                                 std::nullopt, std::chrono::seconds(60));
    ASSERT_TRUE(grant.ok());
    EXPECT_TRUE(service_->Check(token, permissions::CODE_EXECUTE, resources::PROCESS));

    now_ += 61s;
    EXPECT_FALSE(service_->Check(token, permissions::CODE_EXECUTE, resources::PROCESS));
    EXPECT_EQ(service_->GetGrant(grant.value()).value().StateAt(now_), GrantState::EXPIRED);
}

TEST_F(PermissionServiceTest, NegativeLifetimeGrantIsAlreadyExpired) {
    const auto id = Create("olivia", "observer");
    auto token = Login("olivia");
    auto grant = service_->Grant(admin_id_, id, permissions::CODE_EXECUTE, resources::PROCESS,
                                 std::nullopt, std::chrono::seconds(-1));
    ASSERT_TRUE(grant.ok());
    EXPECT_FALSE(service_->Check(token, permissions::CODE_EXECUTE, resources::PROCESS));
}

TEST_F(PermissionServiceTest, RevokeIsIdempotent) {
    const auto id = Create("olivia", "observer");
    auto token = Login("olivia");
    auto grant = service_->Grant(admin_id_, id, permissions::CODE_EXECUTE, resources::PROCESS).value();
    ASSERT_TRUE(service_->Check(token, permissions::CODE_EXECUTE, resources::PROCESS));

    EXPECT_TRUE(service_->Revoke(grant, admin_id_));
    EXPECT_FALSE(service_->Check(token, permissions::CODE_EXECUTE, resources::PROCESS));

    auto first = service_->GetGrant(grant).value();
    EXPECT_TRUE(service_->Revoke(grant, admin_id_));
    auto second = service_->GetGrant(grant).value();
    EXPECT_TRUE(second.revoked);
    EXPECT_EQ(first.revoked_at, second.revoked_at);

    EXPECT_FALSE(service_->Revoke("0123456789abcdef0123456789abcdef", admin_id_));
}

TEST_F(PermissionServiceTest, RevokerNeedsUserAdmin) {
    const auto dev = Create("dev", "developer");
    const auto obs = Create("obs", "observer");
    auto token = Login("dev");
    auto grant = service_->Grant(admin_id_, dev, permissions::TRADE_EXECUTE, resources::TRADE).value();

    EXPECT_FALSE(service_->Revoke(grant, obs));
    EXPECT_FALSE(service_->GetGrant(grant).value().revoked);
    EXPECT_TRUE(service_->Check(token, permissions::TRADE_EXECUTE, resources::TRADE));
    EXPECT_EQ(CountLog(obs, "revoke", AccessDecision::DENY), 1u);
    EXPECT_EQ(CountLog(obs, "revoke", AccessDecision::ALLOW), 0u);

    // user:admin scoped to the grant holder is enough
    ASSERT_TRUE(service_->Grant(admin_id_, obs, permissions::USER_ADMIN, resources::USER, dev).ok());
    EXPECT_TRUE(service_->Revoke(grant, obs));
    EXPECT_TRUE(service_->GetGrant(grant).value().revoked);
    EXPECT_FALSE(service_->Check(token, permissions::TRADE_EXECUTE, resources::TRADE));
}

TEST_F(PermissionServiceTest, ExpiredGrantDoesNotMaskOtherSources) {
    const auto olivia = Create("olivia", "observer");
    const auto dev = Create("dev", "developer");
    auto olivia_token = Login("olivia");
    auto dev_token = Login("dev");

    ASSERT_TRUE(service_->Grant(admin_id_, olivia, permissions::CODE_EXECUTE, resources::PROCESS,
                                std::nullopt, std::chrono::seconds(60)).ok());
    ASSERT_TRUE(service_->Grant(admin_id_, olivia, permissions::CODE_EXECUTE, resources::PROCESS).ok());
    ASSERT_TRUE(service_->Grant(admin_id_, dev, permissions::CODE_EXECUTE, resources::PROCESS,
                                std::nullopt, std::chrono::seconds(60)).ok());

    now_ += 61s;
    EXPECT_TRUE(service_->Check(olivia_token, permissions::CODE_EXECUTE, resources::PROCESS));
    EXPECT_TRUE(service_->Check(dev_token, permissions::CODE_EXECUTE, resources::PROCESS));
}

TEST_F(PermissionServiceTest, ScopedGrantCoversOnlyItsSubtree) {
    const auto id = Create("olivia", "observer");
    auto token = Login("olivia");
    ASSERT_TRUE(service_->Grant(admin_id_, id, permissions::STRATEGY_EXECUTE, resources::STRATEGY,
                                std::string("strategies/alpha")).ok());

    EXPECT_TRUE(service_->Check(token, permissions::STRATEGY_EXECUTE, resources::STRATEGY,
                                std::string("strategies/alpha")));
    EXPECT_TRUE(service_->Check(token, permissions::STRATEGY_EXECUTE, resources::STRATEGY,
                                std::string("strategies/alpha/v2")));
    EXPECT_FALSE(service_->Check(token, permissions::STRATEGY_EXECUTE, resources::STRATEGY,
                                 std::string("strategies/alphabet")));
    EXPECT_FALSE(service_->Check(token, permissions::STRATEGY_EXECUTE, resources::STRATEGY));
}

TEST_F(PermissionServiceTest, GranterNeedsUserAdmin) {
    const auto dev = Create("dev", "developer");
    const auto target = Create("olivia", "observer");
    auto grant = service_->Grant(dev, target, permissions::CODE_EXECUTE, resources::PROCESS);
    ASSERT_FALSE(grant.ok());
    EXPECT_EQ(grant.error().code, ErrorCode::PERMISSION_DENIED);
    EXPECT_EQ(CountLog(dev, "grant", AccessDecision::DENY), 1u);
}

TEST_F(PermissionServiceTest, GrantOfUnknownPermissionIsRejected) {
    const auto id = Create("olivia", "observer");
    auto grant = service_->Grant(admin_id_, id, "code:teleport", resources::PROCESS);
    ASSERT_FALSE(grant.ok());
    EXPECT_EQ(grant.error().code, ErrorCode::INVALID_ARGUMENT);
}

TEST_F(PermissionServiceTest, DisablingRevokesAccessOfLiveSessions) {
    const auto id = Create("dev", "developer");
    auto token = Login("dev");
    ASSERT_TRUE(service_->Check(token, permissions::CODE_EXECUTE, resources::PROCESS));

    ASSERT_TRUE(service_->SetPrincipalActive(id, false).ok());
    EXPECT_FALSE(service_->Check(token, permissions::CODE_EXECUTE, resources::PROCESS));
    EXPECT_FALSE(service_->ResolveSession(token).ok());
}

TEST_F(PermissionServiceTest, SessionsExpire) {
    Create("dev", "developer");
    auto token = Login("dev");
    now_ += 2h;
    EXPECT_FALSE(service_->ResolveSession(token).ok());
    EXPECT_FALSE(service_->Check(token, permissions::CODE_EXECUTE, resources::PROCESS));
}

TEST_F(PermissionServiceTest, DuplicateNamesAreRejected) {
    Create("dev", "developer");
    auto again = service_->CreatePrincipal("dev", "other");
    ASSERT_FALSE(again.ok());
    EXPECT_EQ(again.error().code, ErrorCode::INVALID_ARGUMENT);
}

TEST_F(PermissionServiceTest, UnknownRoleIsNotFound) {
    const auto id = Create("dev", "");
    auto status = service_->AssignRole(id, "wizard");
    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.error().code, ErrorCode::NOT_FOUND);
}

TEST_F(PermissionServiceTest, EffectivePermissionsUnionRolesAndGrants) {
    const auto id = Create("olivia", "observer");
    ASSERT_TRUE(service_->Grant(admin_id_, id, permissions::DATA_EXPORT, resources::DATABASE).ok());

    auto effective = service_->EffectivePermissions(id);
    ASSERT_TRUE(effective.ok());
    EXPECT_TRUE(effective.value().count(permissions::DATA_READ));
    EXPECT_TRUE(effective.value().count(permissions::DATA_EXPORT));
    EXPECT_FALSE(effective.value().count(permissions::CODE_EXECUTE));
}

TEST_F(PermissionServiceTest, RecordEventAppendsCustomAction) {
    AccessLogEntry entry;
    entry.principal = admin_id_;
    entry.action = "execute";
    entry.permission = permissions::CODE_EXECUTE;
    entry.resource_type = resources::PROCESS;
    entry.decision = AccessDecision::ALLOW;
    entry.details = "termination=completed";
    ASSERT_TRUE(service_->RecordEvent(entry).ok());
    EXPECT_EQ(CountLog(admin_id_, "execute"), 1u);
}

TEST(PermissionStoreTest, StatePersistsAcrossReopen) {
    const auto path = std::filesystem::temp_directory_path() /
                      ("sentrybox-store-" + std::to_string(::getpid()) + ".db");
    std::filesystem::remove(path);

    PermissionService::Config config;
    config.pbkdf2_iterations = 1000;
    {
        PermissionService service(std::make_shared<PermissionStore>(path.string()), config);
        auto id = service.CreatePrincipal("dev", "dev-pass");
        ASSERT_TRUE(id.ok());
        ASSERT_TRUE(service.AssignRole(id.value(), "developer").ok());
    }
    {
        PermissionService service(std::make_shared<PermissionStore>(path.string()), config);
        auto token = service.Authenticate("dev", "dev-pass");
        ASSERT_TRUE(token.ok());
        EXPECT_TRUE(service.Check(token.value(), permissions::CODE_EXECUTE, resources::PROCESS));
    }
    std::filesystem::remove(path);
    std::filesystem::remove(path.string() + "-wal");
    std::filesystem::remove(path.string() + "-shm");
}

TEST(ScopeMatchesTest, SeparatorAwarePrefix) {
    EXPECT_TRUE(ScopeMatches(std::nullopt, std::nullopt));
    EXPECT_TRUE(ScopeMatches(std::nullopt, std::string("x")));
    EXPECT_FALSE(ScopeMatches(std::string("x"), std::nullopt));
    EXPECT_TRUE(ScopeMatches(std::string("db"), std::string("db:orders")));
    EXPECT_TRUE(ScopeMatches(std::string("a.b"), std::string("a.b.c")));
    EXPECT_FALSE(ScopeMatches(std::string("a.b"), std::string("a.bc")));
}
