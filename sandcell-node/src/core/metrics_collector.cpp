// metrics_collector.cpp - Sandbox counters implementation
#include "core/metrics_collector.h"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <numeric>

namespace sandcell::node::core {

void MetricsCollector::RecordValidation(bool rejected) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.validations_total++;
        if (rejected) counters_.validations_rejected++;
    }
    if (rejected) {
        Emit({"sandbox.validation_rejected", 1.0, {}});
    }
}

void MetricsCollector::RecordExecution(const std::string& error_type, double execution_seconds) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.executions_total++;
        counters_.outcomes[error_type]++;
    }
    Emit({"sandbox.execution", execution_seconds, {{"error_type", error_type}}});
}

void MetricsCollector::RecordPolicyKill(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.kills_by_reason[reason]++;
    }
    Emit({"sandbox.policy_kill", 1.0, {{"reason", reason}}});
}

void MetricsCollector::RecordOrphanSweep(int removed) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.orphan_sweeps++;
        counters_.orphans_removed += static_cast<uint64_t>(std::max(removed, 0));
    }
    Emit({"sandbox.orphan_sweep", static_cast<double>(removed), {}});
}

void MetricsCollector::RecordCreateLatency(double milliseconds) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        create_latency_history_.push_back(milliseconds);
        while (create_latency_history_.size() > MAX_HISTORY_SIZE) {
            create_latency_history_.pop_front();
        }
    }
    Emit({"sandbox.environment_create_latency_ms", milliseconds, {}});
}

void MetricsCollector::RecordCleanupFailure() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.cleanup_failures++;
    }
    Emit({"sandbox.cleanup_failure", 1.0, {}});
}

void MetricsCollector::RecordInfrastructureError() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.infrastructure_errors++;
    }
    Emit({"sandbox.infrastructure_error", 1.0, {}});
}

void MetricsCollector::SetSink(MetricsSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void MetricsCollector::Emit(const MetricEvent& event) {
    MetricsSink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sink = sink_;
    }
    if (!sink) return;

    try {
        sink(event);
    } catch (const std::exception& e) {
        spdlog::warn("MetricsCollector: Sink rejected {}: {}", event.name, e.what());
    }
}

MetricsSnapshot MetricsCollector::GetSnapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    MetricsSnapshot snapshot = counters_;
    snapshot.latency_samples = create_latency_history_.size();
    if (!create_latency_history_.empty()) {
        double total = std::accumulate(create_latency_history_.begin(), create_latency_history_.end(), 0.0);
        snapshot.avg_create_latency_ms = total / static_cast<double>(create_latency_history_.size());
        snapshot.max_create_latency_ms = *std::max_element(create_latency_history_.begin(),
                                                           create_latency_history_.end());
    }
    return snapshot;
}

std::string MetricsCollector::ExportAsJSON() const {
    auto s = GetSnapshot();
    nlohmann::json j = {
        {"validations_total", s.validations_total},
        {"validations_rejected", s.validations_rejected},
        {"executions_total", s.executions_total},
        {"outcomes", s.outcomes},
        {"kills_by_reason", s.kills_by_reason},
        {"orphan_sweeps", s.orphan_sweeps},
        {"orphans_removed", s.orphans_removed},
        {"cleanup_failures", s.cleanup_failures},
        {"infrastructure_errors", s.infrastructure_errors},
        {"environment_create_latency_ms", {
            {"avg", s.avg_create_latency_ms},
            {"max", s.max_create_latency_ms},
            {"samples", s.latency_samples}
        }}
    };
    return j.dump(2);
}

} // namespace sandcell::node::core
