// execution_types.h - Request, result and environment handle types
#pragma once

#include "sandbox/security_policy.h"
#include "security/validation_types.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace sandcell::node::sandbox {

// Outcome classification returned to the caller (exhaustive)
enum class ErrorType {
    VALIDATION_REJECTED,
    TIMEOUT,
    RUNTIME_POLICY_KILLED,
    NONZERO_EXIT,
    MISSING_RESULT,
    MALFORMED_RESULT,
    INFRASTRUCTURE_ERROR,
    SUCCESS
};

const char* GetErrorTypeName(ErrorType type);

// Signal that caused a policy kill
enum class KillReason {
    CPU,
    MEMORY,
    FORK_BOMB,
    COMBINED_ANOMALY
};

// "cpu", "memory", "fork_bomb", "combined_anomaly"
const char* GetKillReasonName(KillReason reason);

struct ResourceUsage {
    double peak_cpu_percent = 0.0;
    double peak_memory_percent = 0.0;
    int peak_pids = 0;
};

class ExecutionRequest {
public:
    ExecutionRequest(std::string code,
                     SecurityPolicy policy,
                     std::chrono::milliseconds timeout,
                     std::set<std::string> injected_capabilities = {});

    const std::string& GetCode() const { return code_; }
    const SecurityPolicy& GetPolicy() const { return policy_; }
    std::chrono::milliseconds GetTimeout() const { return timeout_; }
    const std::set<std::string>& GetCapabilities() const { return capabilities_; }

private:
    std::string code_;
    SecurityPolicy policy_;
    std::chrono::milliseconds timeout_;
    std::set<std::string> capabilities_;
};

struct ExecutionResult {
    bool success = false;
    ErrorType error_type = ErrorType::INFRASTRUCTURE_ERROR;
    std::optional<std::map<std::string, double>> metrics;
    std::chrono::milliseconds execution_time{0};
    ResourceUsage resource_usage;
    std::optional<std::string> killed_reason;

    std::optional<int> exit_code;
    std::string diagnostics;          // Captured stdout/stderr, never parsed
    std::string environment_id;
    std::vector<security::ValidationError> validation_errors;
};

nlohmann::json ExecutionResultToJson(const ExecutionResult& result);

// Environment lifecycle: Created -> Running -> Exited | Killed | Reaped.
// Created may also go straight to Killed or Reaped when start never happened.
enum class EnvironmentStatus {
    Created,
    Running,
    Exited,
    Killed,
    Reaped
};

const char* GetEnvironmentStatusName(EnvironmentStatus status);

class EnvironmentHandle {
public:
    EnvironmentHandle(std::string id, std::string name, int64_t created_at, int owner_process_id);

    EnvironmentHandle(const EnvironmentHandle&) = delete;
    EnvironmentHandle& operator=(const EnvironmentHandle&) = delete;

    const std::string& GetId() const { return id_; }
    const std::string& GetName() const { return name_; }
    int64_t GetCreatedAt() const { return created_at_; }
    int GetOwnerProcessId() const { return owner_process_id_; }

    EnvironmentStatus GetStatus() const { return status_.load(); }
    bool IsTerminal() const;

    // Throws std::logic_error on an illegal transition, including any attempt
    // to leave (or re-enter) a terminal state
    void TransitionTo(EnvironmentStatus next);

private:
    std::string id_;
    std::string name_;
    int64_t created_at_;
    int owner_process_id_;
    std::atomic<EnvironmentStatus> status_{EnvironmentStatus::Created};
};

} // namespace sandcell::node::sandbox
