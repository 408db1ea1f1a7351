// orphan_reaper.cpp - Orphaned environment sweep
#include "sandbox/orphan_reaper.h"
#include "sandbox/execution_types.h"
#include "security/audit_logger.h"
#include "core/metrics_collector.h"
#include <spdlog/spdlog.h>
#include <ctime>

namespace sandcell::node::sandbox {

OrphanReaper::OrphanReaper(ContainerRuntime& runtime,
                           HeartbeatRegistry& heartbeats,
                           ReaperOptions options,
                           security::AuditLogger* audit,
                           core::MetricsCollector* metrics)
    : runtime_(runtime),
      heartbeats_(heartbeats),
      options_(options),
      audit_(audit),
      metrics_(metrics) {}

bool OrphanReaper::IsStale(const RuntimeContainer& container, int64_t now) const {
    const int64_t grace = options_.grace_period.count();

    if (auto beat = heartbeats_.LastBeat(container.name)) {
        return now - *beat > grace;
    }

    auto it = container.labels.find(kCreatedAtLabel);
    if (it == container.labels.end()) {
        return true;
    }
    try {
        int64_t created_at = std::stoll(it->second);
        return now - created_at > grace;
    } catch (const std::exception&) {
        spdlog::debug("OrphanReaper: Unparseable {} on {}", kCreatedAtLabel, container.name);
        return true;
    }
}

int OrphanReaper::Cleanup() {
    std::lock_guard<std::mutex> lock(sweep_mutex_);

    // The runtime is the source of truth; nothing here is cached between sweeps
    auto containers = runtime_.ListByLabel(kManagedLabel);
    int64_t now = static_cast<int64_t>(std::time(nullptr));
    int removed = 0;

    for (const auto& container : containers) {
        if (!IsStale(container, now)) {
            continue;
        }

        auto owner = container.labels.count(kOwnerLabel) ? container.labels.at(kOwnerLabel) : "unknown";
        spdlog::info("OrphanReaper: Reaping {} (owner={}, state={})",
                     container.name, owner, container.state);

        EnvironmentHandle handle(container.id, container.name, 0, 0);
        if (container.state == "running" || container.state == "paused" || container.state == "restarting") {
            handle.TransitionTo(EnvironmentStatus::Running);
        }

        if (!runtime_.Remove(container.id, true)) {
            spdlog::error("OrphanReaper: Failed to remove {}", container.name);
            if (audit_) {
                audit_->Log(security::AuditEvent::CLEANUP_FAILED, "reaper", container.name, false,
                            "orphan removal failed");
            }
            if (metrics_) metrics_->RecordCleanupFailure();
            continue;
        }

        handle.TransitionTo(EnvironmentStatus::Reaped);
        heartbeats_.Erase(container.name);
        removed++;

        if (audit_) {
            audit_->Log(security::AuditEvent::ORPHAN_REAPED, "reaper", container.name, true,
                        "owner=" + owner);
        }
    }

    total_removed_ += static_cast<uint64_t>(removed);

    if (removed >= options_.alert_threshold && options_.alert_threshold > 0) {
        spdlog::warn("OrphanReaper: {} orphaned environments removed in one sweep", removed);
    } else {
        spdlog::debug("OrphanReaper: Sweep removed {} of {} managed environments", removed, containers.size());
    }

    if (audit_) {
        audit_->Log(security::AuditEvent::ORPHAN_SWEEP, "reaper", "", true,
                    "removed=" + std::to_string(removed));
    }
    if (metrics_) metrics_->RecordOrphanSweep(removed);

    return removed;
}

ReaperScheduler::ReaperScheduler(OrphanReaper& reaper, std::chrono::seconds interval)
    : reaper_(reaper), interval_(interval) {}

ReaperScheduler::~ReaperScheduler() {
    Stop();
}

void ReaperScheduler::Start() {
    if (running_.exchange(true)) {
        spdlog::warn("ReaperScheduler already running");
        return;
    }
    scheduler_thread_ = std::thread(&ReaperScheduler::SchedulerLoop, this);
    spdlog::info("ReaperScheduler: Sweeping every {}s", interval_.count());
}

void ReaperScheduler::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
    }
    cv_.notify_all();
    if (scheduler_thread_.joinable()) {
        scheduler_thread_.join();
    }
    spdlog::info("ReaperScheduler: Stopped after {} sweeps", sweeps_.load());
}

void ReaperScheduler::SchedulerLoop() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_for(lock, interval_, [this] { return !running_; })) {
                break;
            }
        }

        try {
            reaper_.Cleanup();
        } catch (const InfrastructureError& e) {
            spdlog::error("ReaperScheduler: Sweep skipped, runtime unavailable: {}", e.what());
        }
        sweeps_++;
    }
}

} // namespace sandcell::node::sandbox
