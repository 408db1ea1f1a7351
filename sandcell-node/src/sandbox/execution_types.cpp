// execution_types.cpp - Request/result/handle implementation
#include "sandbox/execution_types.h"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace sandcell::node::sandbox {

const char* GetErrorTypeName(ErrorType type) {
    switch (type) {
        case ErrorType::VALIDATION_REJECTED: return "VALIDATION_REJECTED";
        case ErrorType::TIMEOUT: return "TIMEOUT";
        case ErrorType::RUNTIME_POLICY_KILLED: return "RUNTIME_POLICY_KILLED";
        case ErrorType::NONZERO_EXIT: return "NONZERO_EXIT";
        case ErrorType::MISSING_RESULT: return "MISSING_RESULT";
        case ErrorType::MALFORMED_RESULT: return "MALFORMED_RESULT";
        case ErrorType::INFRASTRUCTURE_ERROR: return "INFRASTRUCTURE_ERROR";
        case ErrorType::SUCCESS: return "SUCCESS";
        default: return "UNKNOWN";
    }
}

const char* GetKillReasonName(KillReason reason) {
    switch (reason) {
        case KillReason::CPU: return "cpu";
        case KillReason::MEMORY: return "memory";
        case KillReason::FORK_BOMB: return "fork_bomb";
        case KillReason::COMBINED_ANOMALY: return "combined_anomaly";
        default: return "unknown";
    }
}

const char* GetEnvironmentStatusName(EnvironmentStatus status) {
    switch (status) {
        case EnvironmentStatus::Created: return "created";
        case EnvironmentStatus::Running: return "running";
        case EnvironmentStatus::Exited: return "exited";
        case EnvironmentStatus::Killed: return "killed";
        case EnvironmentStatus::Reaped: return "reaped";
        default: return "unknown";
    }
}

ExecutionRequest::ExecutionRequest(std::string code,
                                   SecurityPolicy policy,
                                   std::chrono::milliseconds timeout,
                                   std::set<std::string> injected_capabilities)
    : code_(std::move(code)),
      policy_(std::move(policy)),
      timeout_(timeout),
      capabilities_(std::move(injected_capabilities)) {
    if (timeout_ <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("ExecutionRequest timeout must be positive");
    }
}

nlohmann::json ExecutionResultToJson(const ExecutionResult& result) {
    nlohmann::json j;
    j["success"] = result.success;
    j["error_type"] = GetErrorTypeName(result.error_type);
    j["metrics"] = result.metrics ? nlohmann::json(*result.metrics) : nlohmann::json(nullptr);
    j["execution_time_ms"] = result.execution_time.count();
    j["resource_usage"] = {
        {"peak_cpu_percent", result.resource_usage.peak_cpu_percent},
        {"peak_memory_percent", result.resource_usage.peak_memory_percent},
        {"peak_pids", result.resource_usage.peak_pids}
    };
    j["killed_reason"] = result.killed_reason ? nlohmann::json(*result.killed_reason) : nlohmann::json(nullptr);
    j["exit_code"] = result.exit_code ? nlohmann::json(*result.exit_code) : nlohmann::json(nullptr);
    j["environment_id"] = result.environment_id;

    if (!result.validation_errors.empty()) {
        nlohmann::json errors = nlohmann::json::array();
        for (const auto& error : result.validation_errors) {
            nlohmann::json e = {
                {"rule_kind", security::GetRuleKindName(error.rule_kind)},
                {"message", error.message}
            };
            if (error.line) e["line"] = *error.line;
            if (error.column) e["column"] = *error.column;
            errors.push_back(e);
        }
        j["validation_errors"] = errors;
    }
    return j;
}

EnvironmentHandle::EnvironmentHandle(std::string id, std::string name,
                                     int64_t created_at, int owner_process_id)
    : id_(std::move(id)),
      name_(std::move(name)),
      created_at_(created_at),
      owner_process_id_(owner_process_id) {}

bool EnvironmentHandle::IsTerminal() const {
    auto status = status_.load();
    return status == EnvironmentStatus::Exited ||
           status == EnvironmentStatus::Killed ||
           status == EnvironmentStatus::Reaped;
}

namespace {

bool IsLegalTransition(EnvironmentStatus from, EnvironmentStatus to) {
    switch (from) {
        case EnvironmentStatus::Created:
            return to == EnvironmentStatus::Running ||
                   to == EnvironmentStatus::Killed ||
                   to == EnvironmentStatus::Reaped;
        case EnvironmentStatus::Running:
            return to == EnvironmentStatus::Exited ||
                   to == EnvironmentStatus::Killed ||
                   to == EnvironmentStatus::Reaped;
        default:
            return false;
    }
}

} // namespace

void EnvironmentHandle::TransitionTo(EnvironmentStatus next) {
    auto current = status_.load();
    do {
        if (!IsLegalTransition(current, next)) {
            throw std::logic_error(std::string("Illegal environment transition ") +
                                   GetEnvironmentStatusName(current) + " -> " +
                                   GetEnvironmentStatusName(next) + " for " + id_);
        }
    } while (!status_.compare_exchange_weak(current, next));
}

} // namespace sandcell::node::sandbox
