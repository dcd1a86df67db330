/**
 * @file execution_pipeline.hpp
 * @brief Authorise, screen, execute and monitor one unit of user code
 *
 * Sequences the four components behind a single call:
 *
 * ```
 * RunUserCode(token, code, overrides)
 *   ├─ PermissionService::Check(code:execute on process)   → permission_denied
 *   ├─ ThreatScanner::Scan(code)                           → blocked_by_scan
 *   ├─ CodeExecutor::Execute(request)
 *   │    ├─ on launch: ExecutionMonitor::Attach
 *   │    └─ on exit:   ExecutionMonitor::Detach
 *   └─ PermissionService::RecordEvent(execute)
 * ```
 *
 * @date 2025
 */

#pragma once

#include "sentrybox/analyzers/threat_types.hpp"
#include "sentrybox/core/sandbox_engine.hpp"
#include "sentrybox/monitors/execution_monitor.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sentrybox {

namespace analyzers {
    class ThreatScanner;
}

namespace security {
    class PermissionService;
}

namespace core {

/**
 * @enum PipelinePhase
 * @brief Stage reached by a run
 */
enum class PipelinePhase {
    AUTHORIZING,
    SCANNING,
    EXECUTING,
    FINALIZING,
    DONE
};

std::string PipelinePhaseToString(PipelinePhase phase);

/**
 * @struct PipelineResult
 * @brief Scan verdict, execution outcome and resource summary of one run
 */
struct PipelineResult {
    std::string execution_id;
    std::string principal_id;                          ///< Empty when the session did not resolve
    ExecutionResult execution;
    std::optional<analyzers::ScanResult> scan;         ///< Unset when authorisation failed
    std::optional<monitors::ExecutionSummary> summary; ///< Unset when nothing was launched
    PipelinePhase phase_reached{PipelinePhase::AUTHORIZING};
    std::chrono::milliseconds total_duration{0};
};

/**
 * @struct PipelineStatus
 * @brief Progress of an in-flight run
 */
struct PipelineStatus {
    std::string execution_id;
    std::string principal_id;
    PipelinePhase phase{PipelinePhase::AUTHORIZING};
    std::chrono::system_clock::time_point started_at;
};

/**
 * @class ExecutionPipeline
 * @brief Entry point for running user code
 *
 * **Thread Safety**: RunUserCode() may be called concurrently. The pipeline
 * installs launch and exit observers on the executor, so one executor should
 * serve one pipeline.
 *
 * **Usage Example**:
 * @code
 * auto store = std::make_shared<security::PermissionStore>("sentrybox.db");
 * auto permissions = std::make_shared<security::PermissionService>(store);
 * ExecutionPipeline pipeline(permissions,
 *                            std::make_shared<analyzers::ThreatScanner>(),
 *                            std::make_shared<SandboxEngine>(),
 *                            std::make_shared<monitors::ExecutionMonitor>());
 *
 * auto token = permissions->Authenticate("alice", "secret");
 * auto result = pipeline.RunUserCode(token.value(), "print(sum(range(100)))");
 * @endcode
 */
class ExecutionPipeline {
public:
    struct Config {
        ResourceLimits default_limits;               ///< Base for caller overrides
        std::filesystem::path export_directory;      ///< Empty disables JSON export
        bool verbose_logging{false};
    };

    ExecutionPipeline(std::shared_ptr<security::PermissionService> permissions,
                      std::shared_ptr<analyzers::ThreatScanner> scanner,
                      std::shared_ptr<CodeExecutor> executor,
                      std::shared_ptr<monitors::ExecutionMonitor> monitor);

    ExecutionPipeline(std::shared_ptr<security::PermissionService> permissions,
                      std::shared_ptr<analyzers::ThreatScanner> scanner,
                      std::shared_ptr<CodeExecutor> executor,
                      std::shared_ptr<monitors::ExecutionMonitor> monitor,
                      const Config& config);

    ~ExecutionPipeline();

    ExecutionPipeline(const ExecutionPipeline&) = delete;
    ExecutionPipeline& operator=(const ExecutionPipeline&) = delete;

    /**
     * @brief Run user code on behalf of a session
     *
     * Never throws; every failure is expressed as a termination reason.
     * Blocked or unauthorised code never reaches the executor.
     *
     * @param token Session token from PermissionService::Authenticate
     * @param code Python source
     * @param overrides Requested limits, clamped to the executor ceiling
     * @param source_context Recorded in the audit log
     */
    PipelineResult RunUserCode(const std::string& token,
                               const std::string& code,
                               const std::optional<LimitOverrides>& overrides = std::nullopt,
                               const std::string& source_context = "api");

    /// Cancel an in-flight run by execution id
    bool Cancel(const std::string& execution_id);

    std::vector<PipelineStatus> GetActiveRuns() const;

    const Config& GetConfig() const { return config_; }

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
    Config config_;

    PipelineResult Execute(const std::string& execution_id,
                           const std::string& token,
                           const std::string& code,
                           const std::optional<LimitOverrides>& overrides,
                           const std::string& source_context);
    void SetPhase(const std::string& execution_id, PipelinePhase phase);
    void Audit(const PipelineResult& result, const std::string& source_context);
    void Export(const PipelineResult& result) const;
};

} // namespace core
} // namespace sentrybox
