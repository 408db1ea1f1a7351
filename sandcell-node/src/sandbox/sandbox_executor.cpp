// sandbox_executor.cpp - Validation gate in front of the lifecycle manager
#include "sandbox/sandbox_executor.h"
#include "sandbox/lifecycle_manager.h"
#include "security/audit_logger.h"
#include "security/security_validator.h"
#include "core/metrics_collector.h"
#include <spdlog/spdlog.h>

namespace sandcell::node::sandbox {

SandboxExecutor::SandboxExecutor(security::SecurityValidator& validator,
                                 IsolationLifecycleManager& lifecycle,
                                 security::AuditLogger* audit,
                                 core::MetricsCollector* metrics)
    : validator_(validator), lifecycle_(lifecycle), audit_(audit), metrics_(metrics) {}

ExecutionResult SandboxExecutor::Run(const ExecutionRequest& request) {
    auto report = validator_.Validate(request.GetCode(), request.GetCapabilities());
    if (metrics_) metrics_->RecordValidation(!report.is_valid);

    if (!report.is_valid) {
        spdlog::info("SandboxExecutor: Rejected candidate with {} violation(s)", report.errors.size());
        if (audit_) {
            const auto& first = report.errors.front();
            audit_->Log(security::AuditEvent::VALIDATION_REJECTED, "validator", "", false,
                        std::string(security::GetRuleKindName(first.rule_kind)) + ": " + first.message);
        }
        if (metrics_) metrics_->RecordExecution(GetErrorTypeName(ErrorType::VALIDATION_REJECTED), 0.0);

        ExecutionResult result;
        result.success = false;
        result.error_type = ErrorType::VALIDATION_REJECTED;
        result.validation_errors = std::move(report.errors);
        return result;
    }

    return lifecycle_.Execute(request);
}

} // namespace sandcell::node::sandbox
