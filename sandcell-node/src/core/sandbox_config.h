// sandbox_config.h - Daemon configuration with defaults
#pragma once

#include "sandbox/lifecycle_manager.h"
#include "sandbox/orphan_reaper.h"
#include "sandbox/security_policy.h"
#include <string>

namespace sandcell::node::core {

struct SandboxConfig {
    // Runtime
    std::string docker_binary = "docker";
    std::string image = "python:3.10-slim";
    std::string python_binary = "python";
    std::string memory_limit = "2g";
    double cpu_limit = 0.5;
    int pids_limit = 100;
    std::string user = "1000:1000";
    std::string network_mode = "none";
    std::string scratch_size = "64m";
    std::string tmp_size = "64m";
    std::string seccomp_profile;           // Empty keeps the runtime default profile

    // Execution
    int default_timeout_seconds = 600;
    int max_concurrent = 4;
    std::string work_dir = "/tmp/sandcell";
    size_t max_code_bytes = 256 * 1024;

    // Default policy (milliseconds for windows)
    double max_cpu_percent = 95.0;
    double max_memory_percent = 95.0;
    int max_pids = 90;
    int cpu_sustained_window_ms = 15000;
    int memory_sustained_window_ms = 10000;
    int pid_sustained_window_ms = 0;
    double combined_threshold = 80.0;
    double combined_cpu_weight = 0.5;
    double combined_memory_weight = 0.5;
    int combined_sustained_window_ms = 10000;
    int sample_interval_ms = 5000;

    // Orphan reaper
    bool reaper_enabled = true;
    int reaper_interval_seconds = 300;
    std::string heartbeat_dir = "/tmp/sandcell/heartbeats";
    int heartbeat_interval_seconds = 10;
    int grace_period_seconds = 120;
    int alert_threshold = 3;

    // Server
    std::string listen_address = "0.0.0.0:50071";

    // Logging
    std::string log_level = "info";
    std::string log_file;
    std::string audit_file;
};

constexpr int kMaxTimeoutSeconds = 3600;

sandbox::PolicyThresholds ToPolicyThresholds(const SandboxConfig& config);
sandbox::LifecycleOptions ToLifecycleOptions(const SandboxConfig& config);
sandbox::ReaperOptions ToReaperOptions(const SandboxConfig& config);

} // namespace sandcell::node::core
