// security_policy.cpp - Policy validation
#include "sandbox/security_policy.h"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace sandcell::node::sandbox {

SecurityPolicy::SecurityPolicy() : SecurityPolicy(PolicyThresholds{}) {}

SecurityPolicy::SecurityPolicy(const PolicyThresholds& thresholds)
    : thresholds_(thresholds) {
    Validate(thresholds_);
}

double SecurityPolicy::CombinedScore(double cpu_percent, double memory_percent) const {
    return cpu_percent * thresholds_.combined_cpu_weight +
           memory_percent * thresholds_.combined_memory_weight;
}

void SecurityPolicy::Validate(const PolicyThresholds& t) {
    using std::chrono::milliseconds;

    if (!(t.max_cpu_percent > 0.0)) {
        throw std::invalid_argument("max_cpu_percent must be positive");
    }
    if (!(t.max_memory_percent > 0.0)) {
        throw std::invalid_argument("max_memory_percent must be positive");
    }
    if (t.max_pids <= 0) {
        throw std::invalid_argument("max_pids must be positive");
    }
    if (t.cpu_sustained_window <= milliseconds::zero()) {
        throw std::invalid_argument("cpu_sustained_window must be positive");
    }
    if (t.memory_sustained_window <= milliseconds::zero()) {
        throw std::invalid_argument("memory_sustained_window must be positive");
    }
    if (t.pid_sustained_window < milliseconds::zero()) {
        throw std::invalid_argument("pid_sustained_window must not be negative");
    }
    if (t.combined_sustained_window <= milliseconds::zero()) {
        throw std::invalid_argument("combined_sustained_window must be positive");
    }
    if (t.sample_interval <= milliseconds::zero()) {
        throw std::invalid_argument("sample_interval must be positive");
    }
    if (!(t.combined_threshold > 0.0)) {
        throw std::invalid_argument("combined_threshold must be positive");
    }
    if (t.combined_cpu_weight < 0.0 || t.combined_memory_weight < 0.0 ||
        !(t.combined_cpu_weight + t.combined_memory_weight > 0.0)) {
        throw std::invalid_argument("combined weights must be non-negative and not both zero");
    }

    auto shortest = std::min(t.cpu_sustained_window, t.memory_sustained_window);
    if (t.sample_interval >= shortest) {
        throw std::invalid_argument(
            "sample_interval (" + std::to_string(t.sample_interval.count()) +
            "ms) must be shorter than the shortest sustained window (" +
            std::to_string(shortest.count()) + "ms)");
    }
}

} // namespace sandcell::node::sandbox
