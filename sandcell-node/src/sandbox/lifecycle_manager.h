// lifecycle_manager.h - One isolated environment per request, always torn down
#pragma once

#include "sandbox/container_runtime.h"
#include "sandbox/execution_types.h"
#include "sandbox/heartbeat_registry.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <future>
#include <mutex>
#include <optional>
#include <string>

namespace sandcell::node::security { class AuditLogger; }
namespace sandcell::node::core { class MetricsCollector; }

namespace sandcell::node::sandbox {

struct LifecycleOptions {
    std::string image = "python:3.10-slim";
    std::string python_binary = "python";
    std::string memory_limit = "2g";
    double cpu_limit = 0.5;
    int pids_limit = 100;
    std::string user = "1000:1000";
    std::string scratch_size = "64m";
    std::string tmp_size = "64m";
    std::string seccomp_profile;
    std::string work_dir = "/tmp/sandcell";   // Host staging area for injected code
    int max_concurrent = 4;
    size_t max_diagnostics_bytes = 64 * 1024;
};

// How the wait for an environment resolved
enum class WaitOutcome {
    Exited,       // Process ended on its own
    TimedOut,
    PolicyKill,
    Failed        // The runtime failed while waiting
};

struct WaitResolution {
    WaitOutcome outcome = WaitOutcome::Failed;
    int exit_code = -1;
    std::optional<KillReason> reason;
    std::exception_ptr error;
};

// Single-assignment hand-off between the waiter, the monitor and the
// deadline. The first Offer wins; later offers are refused.
class OutcomeLatch {
public:
    OutcomeLatch();

    bool Offer(WaitResolution resolution);
    std::shared_future<WaitResolution> Future() const { return future_; }

private:
    std::atomic<bool> claimed_{false};
    std::promise<WaitResolution> promise_;
    std::shared_future<WaitResolution> future_;
};

// Bounds the number of simultaneously allocated environments
class ConcurrencyLimiter {
public:
    explicit ConcurrencyLimiter(int max_concurrent);

    void Acquire();
    void Release();
    int GetActive() const;
    int GetLimit() const { return limit_; }

private:
    const int limit_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    int active_ = 0;
};

class IsolationLifecycleManager {
public:
    IsolationLifecycleManager(ContainerRuntime& runtime,
                              HeartbeatRegistry& heartbeats,
                              LifecycleOptions options = {},
                              security::AuditLogger* audit = nullptr,
                              core::MetricsCollector* metrics = nullptr);

    // Blocking. Candidate failures come back as data; InfrastructureError is
    // thrown. The environment is gone from the runtime before this returns,
    // whichever way it ends.
    ExecutionResult Execute(const ExecutionRequest& request);

    // Map an exited process and its result file onto an outcome
    static void ClassifyExit(int exit_code, const std::optional<std::string>& result_content,
                             ExecutionResult& result);

    int GetActiveCount() const { return limiter_.GetActive(); }
    uint64_t GetCleanupFailureCount() const { return cleanup_failures_.load(); }
    const LifecycleOptions& GetOptions() const { return options_; }

private:
    ExecutionResult RunInEnvironment(const ExecutionRequest& request);
    std::string PrepareCodeDirectory(const std::string& name, const ExecutionRequest& request);
    void ReportCleanupFailure(const std::string& name, const std::string& what);

    static std::string GenerateEnvironmentName();
    static std::string OwnerTag();

    ContainerRuntime& runtime_;
    HeartbeatRegistry& heartbeats_;
    LifecycleOptions options_;
    security::AuditLogger* audit_;
    core::MetricsCollector* metrics_;

    ConcurrencyLimiter limiter_;
    std::atomic<uint64_t> cleanup_failures_{0};
};

} // namespace sandcell::node::sandbox
