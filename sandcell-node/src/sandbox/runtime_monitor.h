// runtime_monitor.h - Background policy enforcement for one running environment
#pragma once

#include "sandbox/container_runtime.h"
#include "sandbox/execution_types.h"
#include "sandbox/security_policy.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace sandcell::node::sandbox {

struct MonitorSample {
    double cpu_percent = 0.0;
    double memory_percent = 0.0;
    int pid_count = 0;
    std::chrono::steady_clock::time_point timestamp;
};

// The only thing the monitor hands back across threads
struct MonitorDecision {
    bool killed = false;
    std::optional<KillReason> reason;
    ResourceUsage peak;
    int samples_taken = 0;
};

// Tracks how long one signal has been continuously above its threshold
class SustainedWindow {
public:
    explicit SustainedWindow(std::chrono::milliseconds window);

    // Feed one sample. Returns true once the signal has stayed above
    // threshold for at least the whole window.
    bool Update(bool exceeded, std::chrono::steady_clock::time_point now);
    void Reset();

    bool IsExceeding() const { return exceeded_since_.has_value(); }

private:
    std::chrono::milliseconds window_;
    std::optional<std::chrono::steady_clock::time_point> exceeded_since_;
};

// Applies a SecurityPolicy to a stream of samples.
// Checked in order: fork_bomb, cpu, memory, combined_anomaly.
class PolicyEvaluator {
public:
    explicit PolicyEvaluator(const SecurityPolicy& policy);

    std::optional<KillReason> Evaluate(const MonitorSample& sample);

    // A sample went missing; no window may span time that was not observed
    void Reset();

private:
    SecurityPolicy policy_;
    SustainedWindow pids_;
    SustainedWindow cpu_;
    SustainedWindow memory_;
    SustainedWindow combined_;
};

// Invoked from the monitor thread when a kill decision is reached.
// Returns false if the environment already resolved another way, in which
// case the monitor leaves it alone.
using KillCallback = std::function<bool(KillReason)>;

class RuntimeMonitor {
public:
    explicit RuntimeMonitor(ContainerRuntime& runtime);
    ~RuntimeMonitor();

    RuntimeMonitor(const RuntimeMonitor&) = delete;
    RuntimeMonitor& operator=(const RuntimeMonitor&) = delete;

    // Bind to one environment. Throws std::logic_error if already started.
    void Start(const EnvironmentHandle& handle, const SecurityPolicy& policy,
               KillCallback on_kill = nullptr);

    // Idempotent. Safe after the environment exited or was removed.
    void Stop();
    void Join();

    bool IsRunning() const { return running_.load(); }

    // Ready once the sampling loop has ended
    std::shared_future<MonitorDecision> Decision() const { return decision_; }

    static constexpr size_t MAX_SAMPLE_HISTORY = 32;

private:
    void MonitorLoop(std::string environment_id, SecurityPolicy policy, KillCallback on_kill);
    bool WaitForNextSample(std::chrono::milliseconds interval);

    ContainerRuntime& runtime_;
    const EnvironmentHandle* handle_ = nullptr;

    std::thread monitor_thread_;
    std::atomic<bool> running_{false};
    bool started_ = false;

    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    bool stop_requested_ = false;

    std::promise<MonitorDecision> decision_promise_;
    std::shared_future<MonitorDecision> decision_;
};

} // namespace sandcell::node::sandbox
