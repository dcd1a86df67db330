/**
 * @file main.cpp
 * @brief SentryBox command-line interface
 *
 * Administrative and execution front end over the SentryBox components:
 * threat scanning of scripts, sandboxed execution on behalf of an
 * authenticated principal, and management of principals, roles, grants and
 * the access log.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "sentrybox/analyzers/threat_scanner.hpp"
#include "sentrybox/core/config.hpp"
#include "sentrybox/core/execution_pipeline.hpp"
#include "sentrybox/core/sandbox_engine.hpp"
#include "sentrybox/monitors/execution_monitor.hpp"
#include "sentrybox/reporters/json_reporter.hpp"
#include "sentrybox/security/permission_service.hpp"
#include "sentrybox/security/permission_store.hpp"

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>

using json = nlohmann::json;

namespace {

using namespace sentrybox;

/*******************************************************************************
 * Helpers
 ******************************************************************************/

void PrintBanner() {
    std::cerr << R"(
╔═══════════════════════════════════════════════════════════════╗
║                   SentryBox Code Sandbox v1.0                 ║
║          Scan, authorise and contain untrusted scripts        ║
╚═══════════════════════════════════════════════════════════════╝
)" << std::endl;
}

std::optional<std::string> ReadScript(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        spdlog::error("[ERROR] Cannot open {}", path);
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::shared_ptr<security::PermissionService> OpenPermissions(const core::SystemConfig& config) {
    auto store = std::make_shared<security::PermissionStore>(config.database_path.string());
    security::PermissionService::Config service_config;
    service_config.session_ttl = config.session_ttl;
    service_config.pbkdf2_iterations = config.pbkdf2_iterations;
    return std::make_shared<security::PermissionService>(store, service_config);
}

/**
 * Authenticate an operator and require administrative rights
 * (is_admin or user:admin on user).
 */
utils::Result<security::Principal> AuthenticateOperator(security::PermissionService& service,
                                                        const std::string& name,
                                                        const std::string& password) {
    auto token = service.Authenticate(name, password, "cli");
    if (!token) {
        return token.error();
    }
    auto principal = service.ResolveSession(token.value());
    if (!principal) {
        return principal.error();
    }
    if (!principal.value().is_admin &&
        !service.Check(token.value(), security::permissions::USER_ADMIN, security::resources::USER,
                       std::nullopt, "cli")) {
        return utils::Result<security::Principal>::Failure(utils::ErrorCode::PERMISSION_DENIED,
                                                           "operator lacks user:admin");
    }
    return principal;
}

utils::Result<std::string> PrincipalIdByName(security::PermissionService& service, const std::string& name) {
    auto principal = service.FindPrincipalByName(name);
    if (!principal) {
        return principal.error();
    }
    return principal.value().id;
}

void PrintScan(const analyzers::ScanResult& scan) {
    spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
    spdlog::info("[SCAN] Verdict: {}{}", analyzers::SeverityToString(scan.max_severity),
                 scan.blocking ? " (BLOCKED)" : "");
    for (const auto& finding : scan.findings) {
        spdlog::info("  [{}] line {} {} ({}): {}", analyzers::SeverityToString(finding.severity),
                     finding.line, finding.pattern_id, analyzers::CategoryToString(finding.category),
                     finding.description);
    }
    spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
}

void PrintRun(const core::PipelineResult& result) {
    const auto& execution = result.execution;
    std::cout << execution.stdout_output;
    if (!execution.stderr_output.empty()) {
        std::cerr << execution.stderr_output;
    }

    spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
    spdlog::info("[RUN] Execution {}", result.execution_id);
    spdlog::info("Termination: {}", core::TerminationReasonToString(execution.termination_reason));
    spdlog::info("Exit code: {}", execution.exit_code);
    spdlog::info("Wall time: {} ms, CPU time: {} ms", execution.wall_duration.count(),
                 execution.cpu_time.count());
    spdlog::info("Peak memory: {} bytes", execution.peak_memory_bytes);
    if (!execution.error_message.empty()) {
        spdlog::info("Message: {}", execution.error_message);
    }
    if (execution.stdout_truncated || execution.stderr_truncated) {
        spdlog::warn("[WARN] Output truncated");
    }
    if (result.summary) {
        spdlog::info("Monitor: {} snapshots, {} threshold breaches", result.summary->total_snapshots,
                     result.summary->breach_count);
    }
    spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
}

int ExitCodeFor(const core::PipelineResult& result) {
    switch (result.execution.termination_reason) {
        case core::TerminationReason::COMPLETED:
            return result.execution.exit_code == 0 ? 0 : 1;
        case core::TerminationReason::BLOCKED_BY_SCAN:
            return 2;
        case core::TerminationReason::PERMISSION_DENIED:
            return 3;
        default:
            return 1;
    }
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"SentryBox - sandboxed execution of untrusted Python scripts"};
    app.require_subcommand(1);

    std::string config_path;
    std::string database_override;
    bool verbose = false;
    bool json_output = false;

    app.add_option("-c,--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_option("--db", database_override, "Permission database (overrides configuration)");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("--json", json_output, "Print results as JSON");

    // Operator credentials for administrative commands
    std::string operator_name;
    std::string operator_password;

    auto add_operator = [&](CLI::App* sub) {
        sub->add_option("--as", operator_name, "Administrator name")->required();
        sub->add_option("--as-password", operator_password, "Administrator password")
            ->envname("SENTRYBOX_ADMIN_PASSWORD")
            ->required();
    };

    // scan
    auto* scan_cmd = app.add_subcommand("scan", "Scan a script without running it");
    std::string script_path;
    scan_cmd->add_option("script", script_path, "Python script")->required()->check(CLI::ExistingFile);

    // run
    auto* run_cmd = app.add_subcommand("run", "Scan and run a script in the sandbox");
    std::string user_name;
    std::string user_password;
    std::optional<std::int64_t> cpu_ms;
    std::optional<std::int64_t> wall_ms;
    std::optional<std::uint64_t> memory_bytes;
    bool container = false;
    bool network = false;
    run_cmd->add_option("script", script_path, "Python script")->required()->check(CLI::ExistingFile);
    run_cmd->add_option("-u,--user", user_name, "Principal name")->required();
    run_cmd->add_option("-p,--password", user_password, "Principal password")
        ->envname("SENTRYBOX_PASSWORD")
        ->required();
    run_cmd->add_option("--cpu-ms", cpu_ms, "CPU time limit in milliseconds");
    run_cmd->add_option("--wall-ms", wall_ms, "Wall-clock limit in milliseconds");
    run_cmd->add_option("--memory", memory_bytes, "Memory limit in bytes");
    run_cmd->add_flag("--container", container, "Run in new namespaces");
    run_cmd->add_flag("--network", network, "Keep network access (needs ceiling permission)");

    // create-principal
    auto* create_cmd = app.add_subcommand("create-principal",
                                          "Create a principal (the first one needs no operator)");
    std::string target_name;
    std::string target_password;
    std::string email;
    bool make_admin = false;
    create_cmd->add_option("name", target_name, "Principal name")->required();
    create_cmd->add_option("--password", target_password, "Initial password")
        ->envname("SENTRYBOX_NEW_PASSWORD")
        ->required();
    create_cmd->add_option("--email", email, "Contact address");
    create_cmd->add_flag("--admin", make_admin, "Grant administrative rights");
    create_cmd->add_option("--as", operator_name, "Administrator name");
    create_cmd->add_option("--as-password", operator_password, "Administrator password")
        ->envname("SENTRYBOX_ADMIN_PASSWORD");

    // assign-role
    auto* role_cmd = app.add_subcommand("assign-role", "Assign a built-in role");
    std::string role_name;
    role_cmd->add_option("name", target_name, "Principal name")->required();
    role_cmd->add_option("role", role_name, "admin, developer, trader, analyst or observer")->required();
    add_operator(role_cmd);

    // grant
    auto* grant_cmd = app.add_subcommand("grant", "Issue a direct grant");
    std::string permission;
    std::string resource_type;
    std::optional<std::string> scope;
    std::optional<std::int64_t> expires_in;
    grant_cmd->add_option("name", target_name, "Principal name")->required();
    grant_cmd->add_option("permission", permission, "Permission type, e.g. code:execute")->required();
    grant_cmd->add_option("resource", resource_type, "Resource type, e.g. process")->required();
    grant_cmd->add_option("--scope", scope, "Resource scope");
    grant_cmd->add_option("--expires-in", expires_in, "Lifetime in seconds");
    add_operator(grant_cmd);

    // revoke
    auto* revoke_cmd = app.add_subcommand("revoke", "Revoke a grant");
    std::string grant_id;
    revoke_cmd->add_option("grant", grant_id, "Grant id")->required();
    add_operator(revoke_cmd);

    // enable / disable
    auto* disable_cmd = app.add_subcommand("disable", "Disable a principal");
    disable_cmd->add_option("name", target_name, "Principal name")->required();
    add_operator(disable_cmd);
    auto* enable_cmd = app.add_subcommand("enable", "Re-enable a principal");
    enable_cmd->add_option("name", target_name, "Principal name")->required();
    add_operator(enable_cmd);

    // permissions
    auto* perms_cmd = app.add_subcommand("permissions", "List effective permissions of a principal");
    perms_cmd->add_option("name", target_name, "Principal name")->required();
    add_operator(perms_cmd);

    // access-log
    auto* log_cmd = app.add_subcommand("access-log", "Query the audit log");
    std::optional<std::string> log_principal;
    std::optional<std::string> log_action;
    std::size_t log_limit = 100;
    log_cmd->add_option("--principal", log_principal, "Principal name");
    log_cmd->add_option("--action", log_action, "check, grant, revoke, authenticate, admin or execute");
    log_cmd->add_option("--limit", log_limit, "Maximum entries")->default_val(100);
    add_operator(log_cmd);

    CLI11_PARSE(app, argc, argv);

    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    if (!json_output) {
        PrintBanner();
    }

    try {
        // Load configuration
        core::SystemConfig config;
        if (!config_path.empty()) {
            auto loaded = core::SystemConfig::LoadFromFile(config_path);
            if (!loaded) {
                spdlog::error("[ERROR] Configuration ({}): {}", utils::ErrorCodeToString(loaded.error().code),
                              loaded.error().message);
                return 1;
            }
            config = std::move(loaded).value();
        }
        if (!database_override.empty()) {
            config.database_path = database_override;
        }

        spdlog::set_level(spdlog::level::from_str(config.log_level));
        if (verbose) {
            spdlog::set_level(spdlog::level::debug);
            spdlog::debug("[DEBUG] Verbose logging enabled");
        }

        // scan needs no database
        if (scan_cmd->parsed()) {
            auto code = ReadScript(script_path);
            if (!code) {
                return 1;
            }
            analyzers::ThreatScanner::Config scanner_config;
            scanner_config.block_threshold = config.block_severity_threshold;
            analyzers::ThreatScanner scanner(scanner_config);
            auto scan = scanner.Scan(*code);
            if (json_output) {
                std::cout << reporters::JsonReporter::ToJson(scan).dump(2) << std::endl;
            } else {
                PrintScan(scan);
            }
            return scan.blocking ? 2 : 0;
        }

        auto permissions = OpenPermissions(config);

        if (run_cmd->parsed()) {
            auto code = ReadScript(script_path);
            if (!code) {
                return 1;
            }
            auto token = permissions->Authenticate(user_name, user_password, "cli");
            if (!token) {
                spdlog::error("[ERROR] {}", token.error().message);
                return 3;
            }

            analyzers::ThreatScanner::Config scanner_config;
            scanner_config.block_threshold = config.block_severity_threshold;

            monitors::ExecutionMonitor::Config monitor_config;
            monitor_config.poll_interval = config.monitor_poll_interval;
            monitor_config.snapshot_retention_cap = config.snapshot_retention_cap;
            monitor_config.thresholds = config.alert_thresholds;
            auto monitor = std::make_shared<monitors::ExecutionMonitor>(monitor_config);
            monitor->SetAlertCallback([](const monitors::Alert& alert) {
                spdlog::warn("[ALERT] {} = {:.1f} over threshold {:.1f}",
                             monitors::AlertMetricToString(alert.metric), alert.value, alert.threshold);
            });

            core::ExecutionPipeline::Config pipeline_config;
            pipeline_config.default_limits = config.DefaultLimits();
            pipeline_config.export_directory = config.export_directory;
            pipeline_config.verbose_logging = verbose;

            core::ExecutionPipeline pipeline(permissions,
                                             std::make_shared<analyzers::ThreatScanner>(scanner_config),
                                             std::make_shared<core::SandboxEngine>(config.ToSandboxConfig()),
                                             monitor,
                                             pipeline_config);

            core::LimitOverrides overrides;
            if (cpu_ms) overrides.max_cpu_time = std::chrono::milliseconds(*cpu_ms);
            if (wall_ms) overrides.max_wall_time = std::chrono::milliseconds(*wall_ms);
            if (memory_bytes) overrides.max_memory_bytes = *memory_bytes;
            if (container) overrides.container_mode = true;
            if (network) overrides.allow_network = true;

            auto result = pipeline.RunUserCode(token.value(), *code, overrides, "cli");
            if (json_output) {
                std::cout << reporters::JsonReporter::ToJson(result).dump(2) << std::endl;
            } else {
                if (result.scan && !result.scan->findings.empty()) {
                    PrintScan(*result.scan);
                }
                PrintRun(result);
            }
            return ExitCodeFor(result);
        }

        if (create_cmd->parsed()) {
            auto existing = permissions->ListPrincipals();
            if (!existing) {
                spdlog::error("[ERROR] {}", existing.error().message);
                return 1;
            }
            if (!existing.value().empty()) {
                auto op = AuthenticateOperator(*permissions, operator_name, operator_password);
                if (!op) {
                    spdlog::error("[ERROR] {}", op.error().message);
                    return 3;
                }
            } else {
                spdlog::info("[INIT] Empty database, creating the first principal");
            }
            auto id = permissions->CreatePrincipal(target_name, target_password, email, make_admin);
            if (!id) {
                spdlog::error("[ERROR] {}", id.error().message);
                return 1;
            }
            spdlog::info("✓ Created principal {} ({})", target_name, id.value());
            if (json_output) {
                std::cout << json{{"id", id.value()}, {"name", target_name}}.dump(2) << std::endl;
            }
            return 0;
        }

        // Every remaining command is administrative
        auto op = AuthenticateOperator(*permissions, operator_name, operator_password);
        if (!op) {
            spdlog::error("[ERROR] {}", op.error().message);
            return 3;
        }
        const std::string operator_id = op.value().id;

        if (role_cmd->parsed()) {
            auto id = PrincipalIdByName(*permissions, target_name);
            if (!id) {
                spdlog::error("[ERROR] {}", id.error().message);
                return 1;
            }
            auto status = permissions->AssignRole(id.value(), role_name);
            if (!status) {
                spdlog::error("[ERROR] {}", status.error().message);
                return 1;
            }
            spdlog::info("✓ {} now holds role {}", target_name, role_name);
            return 0;
        }

        if (grant_cmd->parsed()) {
            auto id = PrincipalIdByName(*permissions, target_name);
            if (!id) {
                spdlog::error("[ERROR] {}", id.error().message);
                return 1;
            }
            std::optional<std::chrono::seconds> lifetime;
            if (expires_in) {
                lifetime = std::chrono::seconds(*expires_in);
            }
            auto grant = permissions->Grant(operator_id, id.value(), permission, resource_type,
                                            scope, lifetime, "cli");
            if (!grant) {
                spdlog::error("[ERROR] {}", grant.error().message);
                return 1;
            }
            spdlog::info("✓ Grant {} issued", grant.value());
            if (json_output) {
                std::cout << json{{"grant_id", grant.value()}}.dump(2) << std::endl;
            }
            return 0;
        }

        if (revoke_cmd->parsed()) {
            if (!permissions->Revoke(grant_id, operator_id, "cli")) {
                spdlog::error("[ERROR] Grant {} not revoked (unknown grant or operator lacks user:admin)",
                              grant_id);
                return 1;
            }
            spdlog::info("✓ Grant {} revoked", grant_id);
            return 0;
        }

        if (disable_cmd->parsed() || enable_cmd->parsed()) {
            auto id = PrincipalIdByName(*permissions, target_name);
            if (!id) {
                spdlog::error("[ERROR] {}", id.error().message);
                return 1;
            }
            const bool active = enable_cmd->parsed();
            auto status = permissions->SetPrincipalActive(id.value(), active);
            if (!status) {
                spdlog::error("[ERROR] {}", status.error().message);
                return 1;
            }
            spdlog::info("✓ {} {}", target_name, active ? "enabled" : "disabled");
            return 0;
        }

        if (perms_cmd->parsed()) {
            auto id = PrincipalIdByName(*permissions, target_name);
            if (!id) {
                spdlog::error("[ERROR] {}", id.error().message);
                return 1;
            }
            auto effective = permissions->EffectivePermissions(id.value());
            if (!effective) {
                spdlog::error("[ERROR] {}", effective.error().message);
                return 1;
            }
            if (json_output) {
                std::cout << json(effective.value()).dump(2) << std::endl;
            } else {
                for (const auto& perm : effective.value()) {
                    std::cout << perm << "\n";
                }
            }
            return 0;
        }

        if (log_cmd->parsed()) {
            security::AccessLogFilter filter;
            filter.limit = log_limit;
            filter.action = log_action;
            if (log_principal) {
                auto id = PrincipalIdByName(*permissions, *log_principal);
                if (!id) {
                    spdlog::error("[ERROR] {}", id.error().message);
                    return 1;
                }
                filter.principal = id.value();
            }
            auto entries = permissions->QueryAccessLog(filter);
            if (!entries) {
                spdlog::error("[ERROR] {}", entries.error().message);
                return 1;
            }
            if (json_output) {
                std::cout << reporters::JsonReporter::ToJson(entries.value()).dump(2) << std::endl;
            } else {
                for (const auto& entry : entries.value()) {
                    std::cout << reporters::JsonReporter::FormatTimestamp(entry.timestamp) << "  "
                              << security::DecisionToString(entry.decision) << "  "
                              << entry.action << "  " << entry.principal << "  "
                              << entry.permission << " " << entry.resource_type
                              << (entry.resource_scope ? ":" + *entry.resource_scope : "")
                              << "  " << entry.details << "\n";
                }
            }
            return 0;
        }

        return 0;

    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("[ERROR] Filesystem error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}
