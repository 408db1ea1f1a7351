// config_manager.cpp - YAML configuration implementation
#include "core/config_manager.h"
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <vector>

namespace sandcell::node::core {

ConfigManager::ConfigManager() {
    cached_config_ = GetDefaultConfig();
    spdlog::debug("ConfigManager created");
}

bool ConfigManager::Load(const std::string& path) {
    return LoadConfig(path, cached_config_);
}

bool ConfigManager::LoadConfig(const std::string& path, SandboxConfig& config) {
    try {
        if (!std::filesystem::exists(path)) {
            spdlog::warn("Config file not found: {}, using defaults", path);
            config = GetDefaultConfig();
            return true;
        }

        YAML::Node yaml = YAML::LoadFile(path);
        last_loaded_path_ = path;

        if (yaml["runtime"]) {
            auto runtime = yaml["runtime"];
            if (runtime["docker_binary"]) config.docker_binary = runtime["docker_binary"].as<std::string>();
            if (runtime["image"]) config.image = runtime["image"].as<std::string>();
            if (runtime["python_binary"]) config.python_binary = runtime["python_binary"].as<std::string>();
            if (runtime["memory_limit"]) config.memory_limit = runtime["memory_limit"].as<std::string>();
            if (runtime["cpu_limit"]) config.cpu_limit = runtime["cpu_limit"].as<double>();
            if (runtime["pids_limit"]) config.pids_limit = runtime["pids_limit"].as<int>();
            if (runtime["user"]) config.user = runtime["user"].as<std::string>();
            if (runtime["network_mode"]) config.network_mode = runtime["network_mode"].as<std::string>();
            if (runtime["scratch_size"]) config.scratch_size = runtime["scratch_size"].as<std::string>();
            if (runtime["tmp_size"]) config.tmp_size = runtime["tmp_size"].as<std::string>();
            if (runtime["seccomp_profile"]) config.seccomp_profile = runtime["seccomp_profile"].as<std::string>();
        }

        if (yaml["execution"]) {
            auto execution = yaml["execution"];
            if (execution["default_timeout_seconds"]) config.default_timeout_seconds = execution["default_timeout_seconds"].as<int>();
            if (execution["max_concurrent"]) config.max_concurrent = execution["max_concurrent"].as<int>();
            if (execution["work_dir"]) config.work_dir = execution["work_dir"].as<std::string>();
            if (execution["max_code_bytes"]) config.max_code_bytes = execution["max_code_bytes"].as<size_t>();
        }

        if (yaml["policy"]) {
            auto policy = yaml["policy"];
            if (policy["max_cpu_percent"]) config.max_cpu_percent = policy["max_cpu_percent"].as<double>();
            if (policy["max_memory_percent"]) config.max_memory_percent = policy["max_memory_percent"].as<double>();
            if (policy["max_pids"]) config.max_pids = policy["max_pids"].as<int>();
            if (policy["cpu_sustained_window_ms"]) config.cpu_sustained_window_ms = policy["cpu_sustained_window_ms"].as<int>();
            if (policy["memory_sustained_window_ms"]) config.memory_sustained_window_ms = policy["memory_sustained_window_ms"].as<int>();
            if (policy["pid_sustained_window_ms"]) config.pid_sustained_window_ms = policy["pid_sustained_window_ms"].as<int>();
            if (policy["combined_threshold"]) config.combined_threshold = policy["combined_threshold"].as<double>();
            if (policy["combined_cpu_weight"]) config.combined_cpu_weight = policy["combined_cpu_weight"].as<double>();
            if (policy["combined_memory_weight"]) config.combined_memory_weight = policy["combined_memory_weight"].as<double>();
            if (policy["combined_sustained_window_ms"]) config.combined_sustained_window_ms = policy["combined_sustained_window_ms"].as<int>();
            if (policy["sample_interval_ms"]) config.sample_interval_ms = policy["sample_interval_ms"].as<int>();
        }

        if (yaml["reaper"]) {
            auto reaper = yaml["reaper"];
            if (reaper["enabled"]) config.reaper_enabled = reaper["enabled"].as<bool>();
            if (reaper["interval_seconds"]) config.reaper_interval_seconds = reaper["interval_seconds"].as<int>();
            if (reaper["heartbeat_dir"]) config.heartbeat_dir = reaper["heartbeat_dir"].as<std::string>();
            if (reaper["heartbeat_interval_seconds"]) config.heartbeat_interval_seconds = reaper["heartbeat_interval_seconds"].as<int>();
            if (reaper["grace_period_seconds"]) config.grace_period_seconds = reaper["grace_period_seconds"].as<int>();
            if (reaper["alert_threshold"]) config.alert_threshold = reaper["alert_threshold"].as<int>();
        }

        if (yaml["server"]) {
            auto server = yaml["server"];
            if (server["listen_address"]) config.listen_address = server["listen_address"].as<std::string>();
        }

        if (yaml["logging"]) {
            auto logging = yaml["logging"];
            if (logging["level"]) config.log_level = logging["level"].as<std::string>();
            if (logging["file"]) config.log_file = logging["file"].as<std::string>();
            if (logging["audit_file"]) config.audit_file = logging["audit_file"].as<std::string>();
        }

        Sanitize(config);
        spdlog::info("Config loaded from: {}", path);
        return true;

    } catch (const YAML::Exception& e) {
        spdlog::error("Failed to parse config file: {}", e.what());
        config = GetDefaultConfig();
        return false;
    }
}

void ConfigManager::Sanitize(SandboxConfig& config) {
    if (config.network_mode != "none") {
        spdlog::warn("Config: network_mode '{}' is not supported, forcing 'none'", config.network_mode);
        config.network_mode = "none";
    }
    if (config.default_timeout_seconds <= 0 || config.default_timeout_seconds > kMaxTimeoutSeconds) {
        spdlog::warn("Config: default_timeout_seconds {} out of range (1..{}), using 600",
                     config.default_timeout_seconds, kMaxTimeoutSeconds);
        config.default_timeout_seconds = 600;
    }
    if (config.max_concurrent <= 0) {
        spdlog::warn("Config: max_concurrent must be positive, using 1");
        config.max_concurrent = 1;
    }
    if (config.heartbeat_interval_seconds <= 0) {
        spdlog::warn("Config: heartbeat_interval_seconds must be positive, using 10");
        config.heartbeat_interval_seconds = 10;
    }
    // A live owner must get several beats in before the reaper gives up on it
    if (config.grace_period_seconds < 3 * config.heartbeat_interval_seconds) {
        spdlog::warn("Config: grace_period_seconds {} too short for heartbeat interval {}s, using {}",
                     config.grace_period_seconds, config.heartbeat_interval_seconds,
                     3 * config.heartbeat_interval_seconds);
        config.grace_period_seconds = 3 * config.heartbeat_interval_seconds;
    }
    if (config.reaper_interval_seconds <= 0) {
        spdlog::warn("Config: reaper interval must be positive, using 300");
        config.reaper_interval_seconds = 300;
    }
}

bool ConfigManager::SaveConfig(const SandboxConfig& config, const std::string& path) {
    try {
        std::filesystem::path file_path(path);
        if (file_path.has_parent_path()) {
            std::filesystem::create_directories(file_path.parent_path());
        }

        YAML::Emitter out;
        out << YAML::BeginMap;

        out << YAML::Key << "runtime" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "docker_binary" << YAML::Value << config.docker_binary;
        out << YAML::Key << "image" << YAML::Value << config.image;
        out << YAML::Key << "python_binary" << YAML::Value << config.python_binary;
        out << YAML::Key << "memory_limit" << YAML::Value << config.memory_limit;
        out << YAML::Key << "cpu_limit" << YAML::Value << config.cpu_limit;
        out << YAML::Key << "pids_limit" << YAML::Value << config.pids_limit;
        out << YAML::Key << "user" << YAML::Value << config.user;
        out << YAML::Key << "network_mode" << YAML::Value << config.network_mode;
        out << YAML::Key << "scratch_size" << YAML::Value << config.scratch_size;
        out << YAML::Key << "tmp_size" << YAML::Value << config.tmp_size;
        out << YAML::Key << "seccomp_profile" << YAML::Value << config.seccomp_profile;
        out << YAML::EndMap;

        out << YAML::Key << "execution" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "default_timeout_seconds" << YAML::Value << config.default_timeout_seconds;
        out << YAML::Key << "max_concurrent" << YAML::Value << config.max_concurrent;
        out << YAML::Key << "work_dir" << YAML::Value << config.work_dir;
        out << YAML::Key << "max_code_bytes" << YAML::Value << config.max_code_bytes;
        out << YAML::EndMap;

        out << YAML::Key << "policy" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "max_cpu_percent" << YAML::Value << config.max_cpu_percent;
        out << YAML::Key << "max_memory_percent" << YAML::Value << config.max_memory_percent;
        out << YAML::Key << "max_pids" << YAML::Value << config.max_pids;
        out << YAML::Key << "cpu_sustained_window_ms" << YAML::Value << config.cpu_sustained_window_ms;
        out << YAML::Key << "memory_sustained_window_ms" << YAML::Value << config.memory_sustained_window_ms;
        out << YAML::Key << "pid_sustained_window_ms" << YAML::Value << config.pid_sustained_window_ms;
        out << YAML::Key << "combined_threshold" << YAML::Value << config.combined_threshold;
        out << YAML::Key << "combined_cpu_weight" << YAML::Value << config.combined_cpu_weight;
        out << YAML::Key << "combined_memory_weight" << YAML::Value << config.combined_memory_weight;
        out << YAML::Key << "combined_sustained_window_ms" << YAML::Value << config.combined_sustained_window_ms;
        out << YAML::Key << "sample_interval_ms" << YAML::Value << config.sample_interval_ms;
        out << YAML::EndMap;

        out << YAML::Key << "reaper" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "enabled" << YAML::Value << config.reaper_enabled;
        out << YAML::Key << "interval_seconds" << YAML::Value << config.reaper_interval_seconds;
        out << YAML::Key << "heartbeat_dir" << YAML::Value << config.heartbeat_dir;
        out << YAML::Key << "heartbeat_interval_seconds" << YAML::Value << config.heartbeat_interval_seconds;
        out << YAML::Key << "grace_period_seconds" << YAML::Value << config.grace_period_seconds;
        out << YAML::Key << "alert_threshold" << YAML::Value << config.alert_threshold;
        out << YAML::EndMap;

        out << YAML::Key << "server" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "listen_address" << YAML::Value << config.listen_address;
        out << YAML::EndMap;

        out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "level" << YAML::Value << config.log_level;
        out << YAML::Key << "file" << YAML::Value << config.log_file;
        out << YAML::Key << "audit_file" << YAML::Value << config.audit_file;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream file(path);
        if (!file) {
            spdlog::error("Failed to open {} for writing", path);
            return false;
        }
        file << out.c_str();

        spdlog::info("Config saved to: {}", path);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

SandboxConfig ConfigManager::GetDefaultConfig() {
    return SandboxConfig{};
}

std::string ConfigManager::FindConfigFile() {
    const char* home = std::getenv("HOME");
    std::vector<std::string> paths = {
        "./config/sandcell.yaml",
        "./sandcell.yaml",
        std::string(home ? home : "") + "/.config/sandcell/sandcell.yaml",
    };

    for (const auto& path : paths) {
        if (!path.empty() && std::filesystem::exists(path)) {
            return path;
        }
    }

    return "./config/sandcell.yaml";
}

} // namespace sandcell::node::core
