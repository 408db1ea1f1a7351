// metrics_collector.h - Sandbox counters and events for an external collector
#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace sandcell::node::core {

// One observation handed to the external collector
struct MetricEvent {
    std::string name;                            // e.g. "sandbox.policy_kill"
    double value = 1.0;
    std::map<std::string, std::string> labels;   // e.g. {"reason": "cpu"}
};

using MetricsSink = std::function<void(const MetricEvent&)>;

struct MetricsSnapshot {
    uint64_t validations_total = 0;
    uint64_t validations_rejected = 0;
    uint64_t executions_total = 0;
    std::map<std::string, uint64_t> outcomes;          // error_type -> count
    std::map<std::string, uint64_t> kills_by_reason;   // killed_reason -> count
    uint64_t orphan_sweeps = 0;
    uint64_t orphans_removed = 0;
    uint64_t cleanup_failures = 0;
    uint64_t infrastructure_errors = 0;
    double avg_create_latency_ms = 0.0;
    double max_create_latency_ms = 0.0;
    size_t latency_samples = 0;
};

class MetricsCollector {
public:
    MetricsCollector() = default;

    void RecordValidation(bool rejected);
    void RecordExecution(const std::string& error_type, double execution_seconds);
    void RecordPolicyKill(const std::string& reason);
    void RecordOrphanSweep(int removed);
    void RecordCreateLatency(double milliseconds);
    void RecordCleanupFailure();
    void RecordInfrastructureError();

    void SetSink(MetricsSink sink);

    MetricsSnapshot GetSnapshot() const;
    std::string ExportAsJSON() const;

    static constexpr size_t MAX_HISTORY_SIZE = 300;

private:
    void Emit(const MetricEvent& event);

    mutable std::mutex mutex_;
    MetricsSnapshot counters_;
    std::deque<double> create_latency_history_;
    MetricsSink sink_;
};

} // namespace sandcell::node::core
