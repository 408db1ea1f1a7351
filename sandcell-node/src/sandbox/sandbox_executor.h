// sandbox_executor.h - Validate, then execute: the caller-facing entry point
#pragma once

#include "sandbox/execution_types.h"

namespace sandcell::node::security {
class AuditLogger;
class SecurityValidator;
}
namespace sandcell::node::core { class MetricsCollector; }

namespace sandcell::node::sandbox {

class IsolationLifecycleManager;

class SandboxExecutor {
public:
    SandboxExecutor(security::SecurityValidator& validator,
                    IsolationLifecycleManager& lifecycle,
                    security::AuditLogger* audit = nullptr,
                    core::MetricsCollector* metrics = nullptr);

    // Rejected code never reaches the lifecycle manager: no environment is
    // allocated and the result carries VALIDATION_REJECTED plus every violation.
    // InfrastructureError propagates.
    ExecutionResult Run(const ExecutionRequest& request);

private:
    security::SecurityValidator& validator_;
    IsolationLifecycleManager& lifecycle_;
    security::AuditLogger* audit_;
    core::MetricsCollector* metrics_;
};

} // namespace sandcell::node::sandbox
