// security_policy.h - Resource thresholds enforced by RuntimeMonitor
#pragma once

#include <chrono>

namespace sandcell::node::sandbox {

// Raw thresholds, typically filled from configuration or a request override
struct PolicyThresholds {
    double max_cpu_percent = 95.0;        // Percent of the environment's CPU share
    double max_memory_percent = 95.0;     // Percent of the environment's memory ceiling
    int max_pids = 90;

    std::chrono::milliseconds cpu_sustained_window{15000};
    std::chrono::milliseconds memory_sustained_window{10000};
    std::chrono::milliseconds pid_sustained_window{0};   // 0 = act on the first sample

    // Combined anomaly score = cpu * cpu_weight + memory * memory_weight
    double combined_cpu_weight = 0.5;
    double combined_memory_weight = 0.5;
    double combined_threshold = 80.0;
    std::chrono::milliseconds combined_sustained_window{10000};

    std::chrono::milliseconds sample_interval{5000};
};

// Validated, immutable view of PolicyThresholds.
// Throws std::invalid_argument on construction if any threshold is out of range
// or if sample_interval does not fit several times into the cpu/memory windows.
class SecurityPolicy {
public:
    SecurityPolicy();
    explicit SecurityPolicy(const PolicyThresholds& thresholds);

    double GetMaxCpuPercent() const { return thresholds_.max_cpu_percent; }
    double GetMaxMemoryPercent() const { return thresholds_.max_memory_percent; }
    int GetMaxPids() const { return thresholds_.max_pids; }

    std::chrono::milliseconds GetCpuSustainedWindow() const { return thresholds_.cpu_sustained_window; }
    std::chrono::milliseconds GetMemorySustainedWindow() const { return thresholds_.memory_sustained_window; }
    std::chrono::milliseconds GetPidSustainedWindow() const { return thresholds_.pid_sustained_window; }
    std::chrono::milliseconds GetCombinedSustainedWindow() const { return thresholds_.combined_sustained_window; }
    std::chrono::milliseconds GetSampleInterval() const { return thresholds_.sample_interval; }

    double GetCombinedThreshold() const { return thresholds_.combined_threshold; }
    double CombinedScore(double cpu_percent, double memory_percent) const;

    const PolicyThresholds& GetThresholds() const { return thresholds_; }

private:
    static void Validate(const PolicyThresholds& thresholds);

    PolicyThresholds thresholds_;
};

} // namespace sandcell::node::sandbox
