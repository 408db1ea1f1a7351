// lifecycle_manager.cpp - Environment allocation, wait race and guaranteed teardown
#include "sandbox/lifecycle_manager.h"
#include "sandbox/result_schema.h"
#include "sandbox/runtime_monitor.h"
#include "security/audit_logger.h"
#include "core/metrics_collector.h"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <memory>
#include <random>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace sandcell::node::sandbox {

namespace {

using Clock = std::chrono::steady_clock;

// Everything allocated for one request. Teardown runs exactly once, either
// explicitly on the normal path or from the destructor while unwinding.
struct ExecutionScope {
    using FailureReporter = std::function<void(const std::string&, const std::string&)>;

    ExecutionScope(ContainerRuntime& rt, HeartbeatRegistry& hb, std::string environment_name,
                   FailureReporter reporter)
        : runtime(rt),
          heartbeats(hb),
          name(std::move(environment_name)),
          report(std::move(reporter)),
          monitor(rt) {}

    ~ExecutionScope() {
        Teardown();
    }

    // Returns false if anything could not be released
    bool Teardown() {
        if (torn_down) return clean;
        torn_down = true;

        monitor.Stop();

        if (!container_id.empty()) {
            bool removed = false;
            try {
                // Still running here means we are unwinding; the waiter is blocked on it
                if (handle && handle->GetStatus() == EnvironmentStatus::Running) {
                    runtime.Kill(container_id);
                }
                removed = runtime.Remove(container_id, true);
            } catch (const std::exception& e) {
                spdlog::error("IsolationLifecycleManager: Removing {} threw: {}", name, e.what());
            }
            if (handle && !handle->IsTerminal()) {
                handle->TransitionTo(EnvironmentStatus::Killed);
            }
            if (!removed) {
                clean = false;
                report(name, "environment removal failed");
            }
        }

        if (waiter.joinable()) {
            waiter.join();
        }

        if (!code_dir.empty()) {
            std::error_code ec;
            fs::remove_all(code_dir, ec);
            if (ec) {
                clean = false;
                report(name, "staging directory removal failed: " + ec.message());
            }
        }

        if (heartbeat_registered) {
            heartbeats.Unregister(name);
        }
        return clean;
    }

    ContainerRuntime& runtime;
    HeartbeatRegistry& heartbeats;
    std::string name;
    FailureReporter report;

    RuntimeMonitor monitor;
    std::thread waiter;
    std::string container_id;
    std::unique_ptr<EnvironmentHandle> handle;
    fs::path code_dir;
    bool heartbeat_registered = false;

    bool torn_down = false;
    bool clean = true;
};

void WriteFile(const fs::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw InfrastructureError("cannot write " + path.string());
    }
    file << content;
    if (!file) {
        throw InfrastructureError("short write to " + path.string());
    }
}

} // namespace

OutcomeLatch::OutcomeLatch()
    : future_(promise_.get_future().share()) {}

bool OutcomeLatch::Offer(WaitResolution resolution) {
    if (claimed_.exchange(true)) {
        return false;
    }
    promise_.set_value(std::move(resolution));
    return true;
}

ConcurrencyLimiter::ConcurrencyLimiter(int max_concurrent)
    : limit_(max_concurrent > 0 ? max_concurrent : 1) {}

void ConcurrencyLimiter::Acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return active_ < limit_; });
    active_++;
}

void ConcurrencyLimiter::Release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_--;
    }
    cv_.notify_one();
}

int ConcurrencyLimiter::GetActive() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

IsolationLifecycleManager::IsolationLifecycleManager(ContainerRuntime& runtime,
                                                     HeartbeatRegistry& heartbeats,
                                                     LifecycleOptions options,
                                                     security::AuditLogger* audit,
                                                     core::MetricsCollector* metrics)
    : runtime_(runtime),
      heartbeats_(heartbeats),
      options_(std::move(options)),
      audit_(audit),
      metrics_(metrics),
      limiter_(options_.max_concurrent) {}

std::string IsolationLifecycleManager::GenerateEnvironmentName() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream name;
    name << "sandcell-" << std::hex << std::setw(12) << std::setfill('0')
         << (rng() & 0xffffffffffffULL);
    return name.str();
}

std::string IsolationLifecycleManager::OwnerTag() {
    char host[256] = {0};
    if (gethostname(host, sizeof(host) - 1) != 0) {
        std::snprintf(host, sizeof(host), "unknown");
    }
    return std::string(host) + ":" + std::to_string(getpid());
}

std::string IsolationLifecycleManager::PrepareCodeDirectory(const std::string& name,
                                                            const ExecutionRequest& request) {
    fs::path dir = fs::path(options_.work_dir) / name;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw InfrastructureError("cannot create staging directory " + dir.string() + ": " + ec.message());
    }

    // The environment runs as an unrelated uid and only needs to read
    fs::permissions(dir,
                    fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                    fs::perms::others_read | fs::perms::others_exec,
                    ec);

    WriteFile(dir / "strategy.py", request.GetCode());

    nlohmann::json capabilities = nlohmann::json::array();
    for (const auto& capability : request.GetCapabilities()) {
        capabilities.push_back(capability);
    }
    WriteFile(dir / "capabilities.json", capabilities.dump());

    return dir.string();
}

void IsolationLifecycleManager::ReportCleanupFailure(const std::string& name, const std::string& what) {
    cleanup_failures_++;
    spdlog::error("IsolationLifecycleManager: Cleanup of {} incomplete: {}", name, what);
    if (audit_) {
        audit_->Log(security::AuditEvent::CLEANUP_FAILED, "lifecycle", name, false, what);
    }
    if (metrics_) metrics_->RecordCleanupFailure();
}

void IsolationLifecycleManager::ClassifyExit(int exit_code, const std::optional<std::string>& result_content,
                                             ExecutionResult& result) {
    result.exit_code = exit_code;

    if (result_content) {
        auto doc = ParseResultDocument(*result_content);
        if (doc.valid) {
            result.error_type = ErrorType::SUCCESS;
            result.metrics = std::move(doc.metrics);
            return;
        }
        if (exit_code == 0) {
            result.error_type = ErrorType::MALFORMED_RESULT;
            if (!result.diagnostics.empty()) result.diagnostics += "\n";
            result.diagnostics += "result file rejected: " + doc.error;
            return;
        }
    }

    result.error_type = exit_code == 0 ? ErrorType::MISSING_RESULT : ErrorType::NONZERO_EXIT;
}

ExecutionResult IsolationLifecycleManager::Execute(const ExecutionRequest& request) {
    limiter_.Acquire();
    struct SlotRelease {
        ConcurrencyLimiter& limiter;
        ~SlotRelease() { limiter.Release(); }
    } release{limiter_};

    try {
        return RunInEnvironment(request);
    } catch (const InfrastructureError& e) {
        spdlog::error("IsolationLifecycleManager: Infrastructure failure: {}", e.what());
        if (audit_) {
            audit_->Log(security::AuditEvent::INFRASTRUCTURE_FAILURE, "lifecycle", "", false, e.what());
        }
        if (metrics_) metrics_->RecordInfrastructureError();
        throw;
    }
}

ExecutionResult IsolationLifecycleManager::RunInEnvironment(const ExecutionRequest& request) {
    const auto started = Clock::now();

    ExecutionScope scope(runtime_, heartbeats_, GenerateEnvironmentName(),
                         [this](const std::string& name, const std::string& what) {
                             ReportCleanupFailure(name, what);
                         });
    const std::string& name = scope.name;

    scope.code_dir = PrepareCodeDirectory(name, request);

    // Without the pump a run longer than the reaper grace period looks abandoned
    if (!heartbeats_.IsPumping()) {
        spdlog::warn("IsolationLifecycleManager: Heartbeat pump not running, starting it");
        heartbeats_.StartPump();
    }

    // Beat before the environment exists so a concurrent sweep never sees it unowned
    heartbeats_.Register(name);
    scope.heartbeat_registered = true;

    EnvironmentSpec spec;
    spec.name = name;
    spec.image = options_.image;
    spec.memory_limit = options_.memory_limit;
    spec.cpu_limit = options_.cpu_limit;
    spec.pids_limit = options_.pids_limit;
    spec.user = options_.user;
    spec.scratch_size = options_.scratch_size;
    spec.tmp_size = options_.tmp_size;
    spec.seccomp_profile = options_.seccomp_profile;
    spec.code_dir = scope.code_dir.string();
    const int64_t created_at = static_cast<int64_t>(std::time(nullptr));
    spec.labels = {
        {kManagedLabel, "true"},
        {kOwnerLabel, OwnerTag()},
        {kCreatedAtLabel, std::to_string(created_at)}
    };

    auto create_begin = Clock::now();
    scope.container_id = runtime_.Create(spec);
    double create_ms = std::chrono::duration<double, std::milli>(Clock::now() - create_begin).count();
    if (metrics_) metrics_->RecordCreateLatency(create_ms);

    scope.handle = std::make_unique<EnvironmentHandle>(scope.container_id, name, created_at,
                                                       static_cast<int>(getpid()));
    if (audit_) {
        audit_->Log(security::AuditEvent::ENVIRONMENT_CREATED, "lifecycle", name, true,
                    "id=" + scope.container_id.substr(0, 12));
    }

    runtime_.Start(scope.container_id);
    scope.handle->TransitionTo(EnvironmentStatus::Running);
    if (audit_) {
        audit_->Log(security::AuditEvent::ENVIRONMENT_STARTED, "lifecycle", name, true);
    }

    // Three racers, one winner: the monitor, the waiter and the deadline
    auto latch = std::make_shared<OutcomeLatch>();

    scope.monitor.Start(*scope.handle, request.GetPolicy(), [latch](KillReason reason) {
        WaitResolution resolution;
        resolution.outcome = WaitOutcome::PolicyKill;
        resolution.reason = reason;
        return latch->Offer(std::move(resolution));
    });

    std::promise<ExecOutcome> exec_promise;
    auto exec_future = exec_promise.get_future();
    std::vector<std::string> command = {options_.python_binary, "-I", "-B", kEntryScript};

    scope.waiter = std::thread([this, id = scope.container_id, command, latch,
                                max_output = options_.max_diagnostics_bytes,
                                promise = std::move(exec_promise)]() mutable {
        WaitResolution resolution;
        try {
            ExecOutcome outcome = runtime_.Exec(id, command, max_output);
            resolution.outcome = WaitOutcome::Exited;
            resolution.exit_code = outcome.exit_code;
            promise.set_value(std::move(outcome));
        } catch (...) {
            // Carried to the waiting side and rethrown there
            resolution.outcome = WaitOutcome::Failed;
            resolution.error = std::current_exception();
            promise.set_exception(resolution.error);
        }
        latch->Offer(std::move(resolution));
    });

    auto outcome_future = latch->Future();
    if (outcome_future.wait_for(request.GetTimeout()) != std::future_status::ready) {
        WaitResolution timed_out;
        timed_out.outcome = WaitOutcome::TimedOut;
        latch->Offer(std::move(timed_out));
    }
    const WaitResolution resolution = outcome_future.get();
    const std::string short_id = scope.container_id.substr(0, 12);

    if (resolution.outcome == WaitOutcome::Exited) {
        scope.handle->TransitionTo(EnvironmentStatus::Exited);
    } else {
        // The candidate is never asked to stop; the boundary is destroyed instead
        if (!runtime_.Kill(scope.container_id)) {
            spdlog::warn("IsolationLifecycleManager: Kill of {} not acknowledged, removal will force it", short_id);
        }
        scope.handle->TransitionTo(EnvironmentStatus::Killed);
    }

    scope.monitor.Stop();
    MonitorDecision decision = scope.monitor.Decision().get();

    // Captured before removal; the scratch mount disappears with the environment
    std::optional<std::string> result_content;
    if (resolution.outcome == WaitOutcome::Exited) {
        result_content = runtime_.ReadFile(scope.container_id, kResultPath, kMaxResultBytes + 1);
    }

    if (scope.Teardown() && audit_) {
        audit_->Log(security::AuditEvent::ENVIRONMENT_REMOVED, "lifecycle", name, true);
    }

    if (resolution.outcome == WaitOutcome::Failed) {
        std::rethrow_exception(resolution.error);
    }

    ExecutionResult result;
    result.environment_id = scope.container_id;
    result.resource_usage = decision.peak;

    try {
        ExecOutcome exec = exec_future.get();
        result.diagnostics = std::move(exec.output);
        if (exec.truncated) {
            result.diagnostics += "\n[output truncated]";
        }
    } catch (const std::exception& e) {
        spdlog::debug("IsolationLifecycleManager: No output captured for {}: {}", short_id, e.what());
    }

    switch (resolution.outcome) {
        case WaitOutcome::TimedOut:
            result.error_type = ErrorType::TIMEOUT;
            spdlog::warn("IsolationLifecycleManager: {} timed out after {}ms", name, request.GetTimeout().count());
            if (audit_) {
                audit_->Log(security::AuditEvent::EXECUTION_TIMEOUT, "lifecycle", name, false,
                            "timeout_ms=" + std::to_string(request.GetTimeout().count()));
            }
            break;

        case WaitOutcome::PolicyKill: {
            result.error_type = ErrorType::RUNTIME_POLICY_KILLED;
            result.killed_reason = GetKillReasonName(*resolution.reason);
            if (audit_) {
                audit_->Log(security::AuditEvent::POLICY_KILL, "monitor", name, false,
                            "reason=" + *result.killed_reason);
            }
            if (metrics_) metrics_->RecordPolicyKill(*result.killed_reason);
            break;
        }

        case WaitOutcome::Exited:
        default:
            ClassifyExit(resolution.exit_code, result_content, result);
            if (audit_) {
                audit_->Log(security::AuditEvent::EXECUTION_COMPLETED, "lifecycle", name, true,
                            std::string("outcome=") + GetErrorTypeName(result.error_type) +
                            " exit=" + std::to_string(resolution.exit_code));
            }
            break;
    }

    result.success = result.error_type == ErrorType::SUCCESS;
    result.execution_time = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);

    if (metrics_) {
        metrics_->RecordExecution(GetErrorTypeName(result.error_type),
                                  std::chrono::duration<double>(result.execution_time).count());
    }

    spdlog::info("IsolationLifecycleManager: {} finished {} in {}ms",
                 name, GetErrorTypeName(result.error_type), result.execution_time.count());
    return result;
}

} // namespace sandcell::node::sandbox
