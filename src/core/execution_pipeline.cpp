/**
 * @file execution_pipeline.cpp
 * @brief Orchestration of permission check, threat scan, sandbox and monitor
 *
 * **Gating**:
 * - A failed permission check returns permission_denied; the check itself has
 *   already written the deny row to the audit log.
 * - A blocking scan returns blocked_by_scan and records a deny event. The
 *   executor is never called for blocked code.
 *
 * **Monitoring**:
 * The executor reports launch and exit through observers keyed by execution
 * id. The monitor attaches on launch and detaches on exit, while the child is
 * still a zombie, so the summary never outlives the process.
 *
 * @date 2025
 */

#include "sentrybox/core/execution_pipeline.hpp"
#include "sentrybox/analyzers/threat_scanner.hpp"
#include "sentrybox/reporters/json_reporter.hpp"
#include "sentrybox/security/credential_utils.hpp"
#include "sentrybox/security/permission_service.hpp"
#include "sentrybox/security/permission_types.hpp"

#include <spdlog/spdlog.h>

#include <map>
#include <mutex>
#include <stdexcept>

namespace sentrybox {
namespace core {

// ============================================================================
// PRIVATE IMPLEMENTATION (PIMPL PATTERN)
// ============================================================================

class ExecutionPipeline::Impl {
public:
    std::shared_ptr<security::PermissionService> permissions;
    std::shared_ptr<analyzers::ThreatScanner> scanner;
    std::shared_ptr<CodeExecutor> executor;
    std::shared_ptr<monitors::ExecutionMonitor> monitor;

    mutable std::mutex mutex;
    std::map<std::string, PipelineStatus> active;
    std::map<std::string, monitors::ExecutionSummary> summaries;

    std::optional<monitors::ExecutionSummary> TakeSummary(const std::string& execution_id) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = summaries.find(execution_id);
        if (it == summaries.end()) {
            return std::nullopt;
        }
        auto summary = std::move(it->second);
        summaries.erase(it);
        return summary;
    }
};

std::string PipelinePhaseToString(PipelinePhase phase) {
    switch (phase) {
        case PipelinePhase::AUTHORIZING: return "authorizing";
        case PipelinePhase::SCANNING:    return "scanning";
        case PipelinePhase::EXECUTING:   return "executing";
        case PipelinePhase::FINALIZING:  return "finalizing";
        case PipelinePhase::DONE:        return "done";
    }
    return "unknown";
}

ExecutionPipeline::ExecutionPipeline(std::shared_ptr<security::PermissionService> permissions,
                                     std::shared_ptr<analyzers::ThreatScanner> scanner,
                                     std::shared_ptr<CodeExecutor> executor,
                                     std::shared_ptr<monitors::ExecutionMonitor> monitor)
    : ExecutionPipeline(std::move(permissions), std::move(scanner), std::move(executor),
                        std::move(monitor), Config{}) {
}

ExecutionPipeline::ExecutionPipeline(std::shared_ptr<security::PermissionService> permissions,
                                     std::shared_ptr<analyzers::ThreatScanner> scanner,
                                     std::shared_ptr<CodeExecutor> executor,
                                     std::shared_ptr<monitors::ExecutionMonitor> monitor,
                                     const Config& config)
    : impl_(std::make_unique<Impl>())
    , config_(config) {

    if (!permissions || !scanner || !executor || !monitor) {
        throw std::invalid_argument("ExecutionPipeline requires all components");
    }
    impl_->permissions = std::move(permissions);
    impl_->scanner = std::move(scanner);
    impl_->executor = std::move(executor);
    impl_->monitor = std::move(monitor);

    Impl* impl = impl_.get();
    impl_->executor->SetLaunchObserver([impl](pid_t pid, const std::string& execution_id) {
        auto handle = impl->monitor->Attach(pid, execution_id);
        if (!handle) {
            spdlog::warn("Monitor attach failed for {}: {}", execution_id, handle.error().message);
        }
    });
    impl_->executor->SetExitObserver([impl](pid_t, const std::string& execution_id) {
        auto summary = impl->monitor->Detach(execution_id);
        if (!summary) {
            spdlog::debug("No monitor session for {}: {}", execution_id, summary.error().message);
            return;
        }
        std::lock_guard<std::mutex> lock(impl->mutex);
        impl->summaries[execution_id] = std::move(summary).value();
    });

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("SentryBox Execution Pipeline v1.0");
    spdlog::info("═══════════════════════════════════════════════════════════════");

    if (config_.verbose_logging) {
        spdlog::set_level(spdlog::level::debug);
    }
}

ExecutionPipeline::~ExecutionPipeline() {
    impl_->executor->SetLaunchObserver(nullptr);
    impl_->executor->SetExitObserver(nullptr);
}

PipelineResult ExecutionPipeline::RunUserCode(const std::string& token,
                                              const std::string& code,
                                              const std::optional<LimitOverrides>& overrides,
                                              const std::string& source_context) {
    const std::string execution_id = security::CredentialUtils::GenerateId();
    const auto start = std::chrono::steady_clock::now();

    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->active[execution_id] = PipelineStatus{execution_id, "", PipelinePhase::AUTHORIZING,
                                                     std::chrono::system_clock::now()};
    }

    PipelineResult result;
    try {
        result = Execute(execution_id, token, code, overrides, source_context);
    }
    catch (const std::exception& e) {
        spdlog::error("Pipeline run {} failed: {}", execution_id, e.what());
        result.execution_id = execution_id;
        result.execution = ExecutionResult::NotLaunched(execution_id, TerminationReason::INTERNAL_ERROR,
                                                        "internal error");
        result.summary = impl_->TakeSummary(execution_id);
        if (impl_->monitor->PeekSnapshots(execution_id)) {
            auto summary = impl_->monitor->Detach(execution_id);
            if (summary) {
                result.summary = std::move(summary).value();
            }
        }
    }

    result.total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->active.erase(execution_id);
    }
    return result;
}

PipelineResult ExecutionPipeline::Execute(const std::string& execution_id,
                                          const std::string& token,
                                          const std::string& code,
                                          const std::optional<LimitOverrides>& overrides,
                                          const std::string& source_context) {
    PipelineResult result;
    result.execution_id = execution_id;

    // Phase 1: authorisation
    auto principal = impl_->permissions->ResolveSession(token);
    if (principal) {
        result.principal_id = principal.value().id;
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->active[execution_id].principal_id = result.principal_id;
    }

    const bool allowed = impl_->permissions->Check(token, security::permissions::CODE_EXECUTE,
                                                   security::resources::PROCESS, std::nullopt,
                                                   source_context);
    if (!allowed) {
        spdlog::warn("Run {} denied: missing {} on {}", execution_id,
                     security::permissions::CODE_EXECUTE, security::resources::PROCESS);
        result.execution = ExecutionResult::NotLaunched(execution_id, TerminationReason::PERMISSION_DENIED,
                                                        "permission denied");
        result.phase_reached = PipelinePhase::DONE;
        return result;
    }

    // Phase 2: threat scan
    SetPhase(execution_id, PipelinePhase::SCANNING);
    result.phase_reached = PipelinePhase::SCANNING;
    result.scan = impl_->scanner->Scan(code);

    if (result.scan->blocking) {
        spdlog::warn("Run {} blocked by scan: {} ({} findings)", execution_id,
                     analyzers::SeverityToString(result.scan->max_severity), result.scan->findings.size());
        result.execution = ExecutionResult::NotLaunched(
            execution_id, TerminationReason::BLOCKED_BY_SCAN,
            "blocked by threat scan (" + analyzers::SeverityToString(result.scan->max_severity) + ")");
        result.phase_reached = PipelinePhase::DONE;
        Audit(result, source_context);
        Export(result);
        return result;
    }

    // Phase 3: execution
    SetPhase(execution_id, PipelinePhase::EXECUTING);
    result.phase_reached = PipelinePhase::EXECUTING;

    ResourceLimits limits = overrides ? overrides->ApplyTo(config_.default_limits) : config_.default_limits;
    ExecutionRequest request;
    request.execution_id = execution_id;
    request.code = code;
    request.limits = std::move(limits);
    request.principal_id = result.principal_id;
    request.created_at = std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());

    result.execution = impl_->executor->Execute(request);

    // Phase 4: finalisation
    SetPhase(execution_id, PipelinePhase::FINALIZING);
    result.phase_reached = PipelinePhase::FINALIZING;
    result.summary = impl_->TakeSummary(execution_id);
    if (!result.summary && impl_->monitor->PeekSnapshots(execution_id)) {
        // Exit observer did not run; never leave a session polling
        auto summary = impl_->monitor->Detach(execution_id);
        if (summary) {
            result.summary = std::move(summary).value();
        }
    }

    Audit(result, source_context);
    Export(result);
    result.phase_reached = PipelinePhase::DONE;

    spdlog::info("Run {} finished: {}", execution_id,
                 TerminationReasonToString(result.execution.termination_reason));
    return result;
}

bool ExecutionPipeline::Cancel(const std::string& execution_id) {
    return impl_->executor->Cancel(execution_id);
}

std::vector<PipelineStatus> ExecutionPipeline::GetActiveRuns() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::vector<PipelineStatus> runs;
    runs.reserve(impl_->active.size());
    for (const auto& [id, status] : impl_->active) {
        runs.push_back(status);
    }
    return runs;
}

void ExecutionPipeline::SetPhase(const std::string& execution_id, PipelinePhase phase) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->active.find(execution_id);
    if (it != impl_->active.end()) {
        it->second.phase = phase;
    }
    if (config_.verbose_logging) {
        spdlog::debug("Run {} -> {}", execution_id, PipelinePhaseToString(phase));
    }
}

void ExecutionPipeline::Audit(const PipelineResult& result, const std::string& source_context) {
    security::AccessLogEntry entry;
    entry.principal = result.principal_id.empty() ? security::kUnknownPrincipal : result.principal_id;
    entry.action = "execute";
    entry.permission = security::permissions::CODE_EXECUTE;
    entry.resource_type = security::resources::PROCESS;
    entry.resource_scope = result.execution_id;
    entry.source_context = source_context;

    const auto reason = result.execution.termination_reason;
    entry.decision = reason == TerminationReason::BLOCKED_BY_SCAN
        ? security::AccessDecision::DENY : security::AccessDecision::ALLOW;
    entry.details = "termination=" + TerminationReasonToString(reason);
    if (reason != TerminationReason::BLOCKED_BY_SCAN) {
        entry.details += " exit=" + std::to_string(result.execution.exit_code) +
                         " wall_ms=" + std::to_string(result.execution.wall_duration.count());
    } else if (result.scan) {
        entry.details += " severity=" + analyzers::SeverityToString(result.scan->max_severity);
    }

    auto status = impl_->permissions->RecordEvent(entry);
    if (!status.ok()) {
        spdlog::error("Audit record for run {} was not written: {}", result.execution_id,
                      status.error().message);
    }
}

void ExecutionPipeline::Export(const PipelineResult& result) const {
    if (config_.export_directory.empty()) {
        return;
    }
    auto path = config_.export_directory / (result.execution_id + ".json");
    auto status = reporters::JsonReporter::SaveToFile(reporters::JsonReporter::ToJson(result), path);
    if (!status.ok()) {
        spdlog::warn("Export of run {} failed: {}", result.execution_id, status.error().message);
    }
}

} // namespace core
} // namespace sentrybox
