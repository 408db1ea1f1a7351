// runtime_monitor.cpp - Sustained-window resource policing
#include "sandbox/runtime_monitor.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace sandcell::node::sandbox {

SustainedWindow::SustainedWindow(std::chrono::milliseconds window)
    : window_(window) {}

bool SustainedWindow::Update(bool exceeded, std::chrono::steady_clock::time_point now) {
    if (!exceeded) {
        exceeded_since_.reset();
        return false;
    }
    if (!exceeded_since_) {
        exceeded_since_ = now;
    }
    return now - *exceeded_since_ >= window_;
}

void SustainedWindow::Reset() {
    exceeded_since_.reset();
}

PolicyEvaluator::PolicyEvaluator(const SecurityPolicy& policy)
    : policy_(policy),
      pids_(policy.GetPidSustainedWindow()),
      cpu_(policy.GetCpuSustainedWindow()),
      memory_(policy.GetMemorySustainedWindow()),
      combined_(policy.GetCombinedSustainedWindow()) {}

std::optional<KillReason> PolicyEvaluator::Evaluate(const MonitorSample& sample) {
    // Every window sees every sample so none of them goes stale
    bool pids_hit = pids_.Update(sample.pid_count >= policy_.GetMaxPids(), sample.timestamp);
    bool cpu_hit = cpu_.Update(sample.cpu_percent >= policy_.GetMaxCpuPercent(), sample.timestamp);
    bool memory_hit = memory_.Update(sample.memory_percent >= policy_.GetMaxMemoryPercent(), sample.timestamp);
    double score = policy_.CombinedScore(sample.cpu_percent, sample.memory_percent);
    bool combined_hit = combined_.Update(score >= policy_.GetCombinedThreshold(), sample.timestamp);

    if (pids_hit) return KillReason::FORK_BOMB;
    if (cpu_hit) return KillReason::CPU;
    if (memory_hit) return KillReason::MEMORY;
    if (combined_hit) return KillReason::COMBINED_ANOMALY;
    return std::nullopt;
}

void PolicyEvaluator::Reset() {
    pids_.Reset();
    cpu_.Reset();
    memory_.Reset();
    combined_.Reset();
}

RuntimeMonitor::RuntimeMonitor(ContainerRuntime& runtime)
    : runtime_(runtime),
      decision_(decision_promise_.get_future().share()) {}

RuntimeMonitor::~RuntimeMonitor() {
    Stop();
}

void RuntimeMonitor::Start(const EnvironmentHandle& handle, const SecurityPolicy& policy,
                           KillCallback on_kill) {
    if (started_) {
        throw std::logic_error("RuntimeMonitor already bound to " + handle_->GetId());
    }
    started_ = true;
    handle_ = &handle;
    running_ = true;

    monitor_thread_ = std::thread(&RuntimeMonitor::MonitorLoop, this,
                                  handle.GetId(), policy, std::move(on_kill));
    spdlog::debug("RuntimeMonitor: Watching {} every {}ms",
                  handle.GetId().substr(0, 12), policy.GetSampleInterval().count());
}

void RuntimeMonitor::Stop() {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_ = true;
    }
    stop_cv_.notify_all();
    Join();
}

void RuntimeMonitor::Join() {
    if (monitor_thread_.joinable()) {
        monitor_thread_.join();
    }
}

bool RuntimeMonitor::WaitForNextSample(std::chrono::milliseconds interval) {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    return !stop_cv_.wait_for(lock, interval, [this] { return stop_requested_; });
}

void RuntimeMonitor::MonitorLoop(std::string environment_id, SecurityPolicy policy, KillCallback on_kill) {
    PolicyEvaluator evaluator(policy);
    std::deque<MonitorSample> history;
    MonitorDecision decision;
    std::string short_id = environment_id.substr(0, 12);

    do {
        std::optional<RuntimeStats> stats;
        try {
            stats = runtime_.GetStats(environment_id);
        } catch (const std::exception& e) {
            spdlog::debug("RuntimeMonitor: Stats unavailable for {}: {}", short_id, e.what());
        }
        if (!stats) {
            // Breaches must be seen continuously, so a gap starts every window over
            evaluator.Reset();
            continue;
        }

        MonitorSample sample;
        sample.cpu_percent = stats->cpu_percent;
        sample.memory_percent = stats->memory_percent;
        sample.pid_count = stats->pid_count;
        sample.timestamp = std::chrono::steady_clock::now();

        decision.samples_taken++;
        decision.peak.peak_cpu_percent = std::max(decision.peak.peak_cpu_percent, sample.cpu_percent);
        decision.peak.peak_memory_percent = std::max(decision.peak.peak_memory_percent, sample.memory_percent);
        decision.peak.peak_pids = std::max(decision.peak.peak_pids, sample.pid_count);

        history.push_back(sample);
        if (history.size() > MAX_SAMPLE_HISTORY) {
            history.pop_front();
        }

        auto reason = evaluator.Evaluate(sample);
        if (!reason) {
            continue;
        }

        // Claim the outcome before touching the environment, so a kill can
        // never be mistaken for a normal exit by the waiting side
        bool accepted = on_kill ? on_kill(*reason) : true;
        if (!accepted) {
            spdlog::debug("RuntimeMonitor: {} already resolved, {} decision dropped",
                          short_id, GetKillReasonName(*reason));
            break;
        }

        decision.killed = true;
        decision.reason = reason;

        spdlog::warn("RuntimeMonitor: Killing {} (reason={})", short_id, GetKillReasonName(*reason));
        size_t shown = std::min<size_t>(history.size(), 5);
        for (size_t i = history.size() - shown; i < history.size(); ++i) {
            spdlog::warn("RuntimeMonitor:   sample cpu={:.1f}% mem={:.1f}% pids={}",
                         history[i].cpu_percent, history[i].memory_percent, history[i].pid_count);
        }

        try {
            if (!runtime_.Kill(environment_id)) {
                spdlog::warn("RuntimeMonitor: Kill request for {} was not acknowledged", short_id);
            }
        } catch (const std::exception& e) {
            spdlog::error("RuntimeMonitor: Kill request for {} failed: {}", short_id, e.what());
        }
        break;
    } while (WaitForNextSample(policy.GetSampleInterval()));

    running_ = false;
    decision_promise_.set_value(decision);
}

} // namespace sandcell::node::sandbox
