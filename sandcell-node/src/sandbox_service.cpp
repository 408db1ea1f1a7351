// sandbox_service.cpp - gRPC service implementation
#include "sandbox_service.h"
#include "sandbox/container_runtime.h"
#include "sandbox/lifecycle_manager.h"
#include "sandbox/orphan_reaper.h"
#include "sandbox/sandbox_executor.h"
#include "security/security_validator.h"
#include "core/metrics_collector.h"
#include "common/version.h"
#include <spdlog/spdlog.h>
#include <optional>
#include <set>
#include <stdexcept>

namespace sandcell::node {

namespace pb = sandcell::protocol;

namespace {

void FillViolation(const security::ValidationError& error, pb::ValidationViolation* out) {
    out->set_rule_kind(security::GetRuleKindName(error.rule_kind));
    out->set_message(error.message);
    out->set_line(error.line.value_or(0));
    out->set_column(error.column.value_or(0));
}

pb::ErrorType ToProto(sandbox::ErrorType type) {
    switch (type) {
        case sandbox::ErrorType::VALIDATION_REJECTED: return pb::VALIDATION_REJECTED;
        case sandbox::ErrorType::TIMEOUT: return pb::TIMEOUT;
        case sandbox::ErrorType::RUNTIME_POLICY_KILLED: return pb::RUNTIME_POLICY_KILLED;
        case sandbox::ErrorType::NONZERO_EXIT: return pb::NONZERO_EXIT;
        case sandbox::ErrorType::MISSING_RESULT: return pb::MISSING_RESULT;
        case sandbox::ErrorType::MALFORMED_RESULT: return pb::MALFORMED_RESULT;
        case sandbox::ErrorType::INFRASTRUCTURE_ERROR: return pb::INFRASTRUCTURE_ERROR;
        case sandbox::ErrorType::SUCCESS: return pb::SUCCESS;
        default: return pb::ERROR_TYPE_UNSPECIFIED;
    }
}

sandbox::PolicyThresholds ApplyOverride(sandbox::PolicyThresholds t, const pb::PolicyOverride& o) {
    using std::chrono::milliseconds;
    if (o.has_max_cpu_percent()) t.max_cpu_percent = o.max_cpu_percent();
    if (o.has_max_memory_percent()) t.max_memory_percent = o.max_memory_percent();
    if (o.has_max_pids()) t.max_pids = o.max_pids();
    if (o.has_cpu_sustained_window_ms()) t.cpu_sustained_window = milliseconds(o.cpu_sustained_window_ms());
    if (o.has_memory_sustained_window_ms()) t.memory_sustained_window = milliseconds(o.memory_sustained_window_ms());
    if (o.has_pid_sustained_window_ms()) t.pid_sustained_window = milliseconds(o.pid_sustained_window_ms());
    if (o.has_combined_threshold()) t.combined_threshold = o.combined_threshold();
    if (o.has_combined_sustained_window_ms()) t.combined_sustained_window = milliseconds(o.combined_sustained_window_ms());
    if (o.has_sample_interval_ms()) t.sample_interval = milliseconds(o.sample_interval_ms());
    return t;
}

} // namespace

SandboxServiceImpl::SandboxServiceImpl(SandboxServiceDeps deps, core::SandboxConfig defaults)
    : deps_(deps), defaults_(std::move(defaults)) {}

SandboxServiceImpl::~SandboxServiceImpl() {
    StopServer();
}

bool SandboxServiceImpl::StartServer(const std::string& listen_address) {
    if (is_running_) {
        spdlog::warn("SandboxService already running");
        return false;
    }

    try {
        grpc::ServerBuilder builder;
        builder.AddListeningPort(listen_address, grpc::InsecureServerCredentials());
        builder.RegisterService(this);

        // Candidate code and diagnostics stay well below this
        builder.SetMaxReceiveMessageSize(8 * 1024 * 1024);
        builder.SetMaxSendMessageSize(8 * 1024 * 1024);

        server_ = builder.BuildAndStart();
        if (!server_) {
            spdlog::error("Failed to start SandboxService on {}", listen_address);
            return false;
        }

        is_running_ = true;
        spdlog::info("SandboxService listening on {}", listen_address);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to start SandboxService: {}", e.what());
        return false;
    }
}

void SandboxServiceImpl::StopServer() {
    if (!is_running_.exchange(false) || !server_) {
        return;
    }
    spdlog::info("Stopping SandboxService...");
    // In-flight executions finish their own teardown before their handlers return
    server_->Shutdown();
    spdlog::info("SandboxService stopped");
}

void SandboxServiceImpl::Wait() {
    if (server_) {
        server_->Wait();
    }
}

grpc::Status SandboxServiceImpl::Validate(grpc::ServerContext* /*context*/,
                                          const pb::ValidateRequest* request,
                                          pb::ValidateResponse* response) {
    std::set<std::string> capabilities(request->capabilities().begin(), request->capabilities().end());
    try {
        auto report = deps_.validator->Validate(request->code(), capabilities);
        if (deps_.metrics) deps_.metrics->RecordValidation(!report.is_valid);

        response->set_is_valid(report.is_valid);
        for (const auto& error : report.errors) {
            FillViolation(error, response->add_errors());
        }
        return grpc::Status::OK;
    } catch (const std::exception& e) {
        spdlog::error("SandboxService: Validate failed: {}", e.what());
        return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
    }
}

grpc::Status SandboxServiceImpl::Execute(grpc::ServerContext* /*context*/,
                                         const pb::ExecuteRequest* request,
                                         pb::ExecuteResponse* response) {
    int timeout_seconds = request->timeout_seconds() > 0 ? request->timeout_seconds()
                                                         : defaults_.default_timeout_seconds;
    if (timeout_seconds > core::kMaxTimeoutSeconds) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                            "timeout_seconds exceeds " + std::to_string(core::kMaxTimeoutSeconds));
    }

    std::optional<sandbox::SecurityPolicy> policy;
    try {
        policy.emplace(ApplyOverride(core::ToPolicyThresholds(defaults_), request->policy()));
    } catch (const std::invalid_argument& e) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
    }

    std::set<std::string> capabilities(request->capabilities().begin(), request->capabilities().end());
    sandbox::ExecutionRequest execution(request->code(), *policy,
                                        std::chrono::seconds(timeout_seconds), capabilities);

    sandbox::ExecutionResult result;
    try {
        result = deps_.executor->Run(execution);
    } catch (const sandbox::InfrastructureError& e) {
        return grpc::Status(grpc::StatusCode::UNAVAILABLE, e.what());
    } catch (const std::exception& e) {
        spdlog::error("SandboxService: Execute failed: {}", e.what());
        return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
    }

    response->set_success(result.success);
    response->set_error_type(ToProto(result.error_type));
    if (result.metrics) {
        response->set_has_metrics(true);
        for (const auto& [key, value] : *result.metrics) {
            (*response->mutable_metrics())[key] = value;
        }
    }
    response->set_execution_time_ms(result.execution_time.count());
    auto* usage = response->mutable_resource_usage();
    usage->set_peak_cpu_percent(result.resource_usage.peak_cpu_percent);
    usage->set_peak_memory_percent(result.resource_usage.peak_memory_percent);
    usage->set_peak_pids(result.resource_usage.peak_pids);
    if (result.killed_reason) response->set_killed_reason(*result.killed_reason);
    if (result.exit_code) response->set_exit_code(*result.exit_code);
    response->set_diagnostics(result.diagnostics);
    response->set_environment_id(result.environment_id);
    for (const auto& error : result.validation_errors) {
        FillViolation(error, response->add_validation_errors());
    }
    return grpc::Status::OK;
}

grpc::Status SandboxServiceImpl::Reap(grpc::ServerContext* /*context*/,
                                      const pb::ReapRequest* /*request*/,
                                      pb::ReapResponse* response) {
    try {
        response->set_removed(deps_.reaper->Cleanup());
        return grpc::Status::OK;
    } catch (const sandbox::InfrastructureError& e) {
        return grpc::Status(grpc::StatusCode::UNAVAILABLE, e.what());
    }
}

grpc::Status SandboxServiceImpl::GetStatus(grpc::ServerContext* /*context*/,
                                           const pb::StatusRequest* /*request*/,
                                           pb::StatusResponse* response) {
    pb::FillVersion(response->mutable_version());
    response->set_runtime_reachable(deps_.runtime && deps_.runtime->Ping());
    response->set_active_environments(deps_.lifecycle ? deps_.lifecycle->GetActiveCount() : 0);
    if (deps_.metrics) {
        response->set_metrics_json(deps_.metrics->ExportAsJSON());
    }
    return grpc::Status::OK;
}

} // namespace sandcell::node
