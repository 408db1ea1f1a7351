// sandbox_config.cpp - Mapping configuration onto component options
#include "core/sandbox_config.h"

namespace sandcell::node::core {

sandbox::PolicyThresholds ToPolicyThresholds(const SandboxConfig& config) {
    using std::chrono::milliseconds;

    sandbox::PolicyThresholds t;
    t.max_cpu_percent = config.max_cpu_percent;
    t.max_memory_percent = config.max_memory_percent;
    t.max_pids = config.max_pids;
    t.cpu_sustained_window = milliseconds(config.cpu_sustained_window_ms);
    t.memory_sustained_window = milliseconds(config.memory_sustained_window_ms);
    t.pid_sustained_window = milliseconds(config.pid_sustained_window_ms);
    t.combined_threshold = config.combined_threshold;
    t.combined_cpu_weight = config.combined_cpu_weight;
    t.combined_memory_weight = config.combined_memory_weight;
    t.combined_sustained_window = milliseconds(config.combined_sustained_window_ms);
    t.sample_interval = milliseconds(config.sample_interval_ms);
    return t;
}

sandbox::LifecycleOptions ToLifecycleOptions(const SandboxConfig& config) {
    sandbox::LifecycleOptions options;
    options.image = config.image;
    options.python_binary = config.python_binary;
    options.memory_limit = config.memory_limit;
    options.cpu_limit = config.cpu_limit;
    options.pids_limit = config.pids_limit;
    options.user = config.user;
    options.scratch_size = config.scratch_size;
    options.tmp_size = config.tmp_size;
    options.seccomp_profile = config.seccomp_profile;
    options.work_dir = config.work_dir;
    options.max_concurrent = config.max_concurrent;
    return options;
}

sandbox::ReaperOptions ToReaperOptions(const SandboxConfig& config) {
    sandbox::ReaperOptions options;
    options.grace_period = std::chrono::seconds(config.grace_period_seconds);
    options.alert_threshold = config.alert_threshold;
    return options;
}

} // namespace sandcell::node::core
