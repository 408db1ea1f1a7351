// orphan_reaper.h - Removes environments left behind by a crashed owner
#pragma once

#include "sandbox/container_runtime.h"
#include "sandbox/heartbeat_registry.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace sandcell::node::security { class AuditLogger; }
namespace sandcell::node::core { class MetricsCollector; }

namespace sandcell::node::sandbox {

struct ReaperOptions {
    std::chrono::seconds grace_period{120};
    int alert_threshold = 3;     // Warn when one sweep removes at least this many
};

class OrphanReaper {
public:
    OrphanReaper(ContainerRuntime& runtime,
                 HeartbeatRegistry& heartbeats,
                 ReaperOptions options = {},
                 security::AuditLogger* audit = nullptr,
                 core::MetricsCollector* metrics = nullptr);

    // Remove every managed environment whose liveness signal is stale.
    // Returns the number actually removed. Concurrent calls are serialized.
    int Cleanup();

    // Stale if its heartbeat is older than the grace period or, lacking a
    // heartbeat, if its creation time is older than that or unknown
    bool IsStale(const RuntimeContainer& container, int64_t now) const;

    uint64_t GetTotalRemoved() const { return total_removed_.load(); }

private:
    ContainerRuntime& runtime_;
    HeartbeatRegistry& heartbeats_;
    ReaperOptions options_;
    security::AuditLogger* audit_;
    core::MetricsCollector* metrics_;

    std::mutex sweep_mutex_;
    std::atomic<uint64_t> total_removed_{0};
};

// Runs OrphanReaper::Cleanup on a fixed interval in the background
class ReaperScheduler {
public:
    ReaperScheduler(OrphanReaper& reaper, std::chrono::seconds interval);
    ~ReaperScheduler();

    void Start();
    void Stop();
    bool IsRunning() const { return running_.load(); }
    uint64_t GetSweepCount() const { return sweeps_.load(); }

private:
    void SchedulerLoop();

    OrphanReaper& reaper_;
    std::chrono::seconds interval_;

    std::thread scheduler_thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> sweeps_{0};
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace sandcell::node::sandbox
