// heartbeat_registry.cpp - Heartbeat files implementation
#include "sandbox/heartbeat_registry.h"
#include <spdlog/spdlog.h>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace sandcell::node::sandbox {

HeartbeatRegistry::HeartbeatRegistry(std::string directory, std::chrono::seconds interval)
    : directory_(std::move(directory)), interval_(interval) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        spdlog::error("HeartbeatRegistry: Cannot create {}: {}", directory_, ec.message());
    }
}

HeartbeatRegistry::~HeartbeatRegistry() {
    StopPump();
}

std::string HeartbeatRegistry::PathFor(const std::string& name) const {
    return (fs::path(directory_) / name).string();
}

bool HeartbeatRegistry::Beat(const std::string& name) {
    // Write then rename so a reader never sees a half-written file
    std::string path = PathFor(name);
    std::string tmp = path + ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file) {
            spdlog::warn("HeartbeatRegistry: Cannot write {}", tmp);
            return false;
        }
        file << std::time(nullptr) << " " << getpid() << "\n";
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        spdlog::warn("HeartbeatRegistry: Cannot publish {}: {}", path, ec.message());
        return false;
    }
    return true;
}

void HeartbeatRegistry::Register(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    registered_.insert(name);
    Beat(name);
}

void HeartbeatRegistry::Unregister(const std::string& name) {
    // Under the lock so the pump cannot resurrect the file afterwards
    std::lock_guard<std::mutex> lock(mutex_);
    registered_.erase(name);
    Erase(name);
}

void HeartbeatRegistry::Erase(const std::string& name) {
    std::error_code ec;
    fs::remove(PathFor(name), ec);
    if (ec) {
        spdlog::warn("HeartbeatRegistry: Cannot remove heartbeat {}: {}", name, ec.message());
    }
}

std::optional<int64_t> HeartbeatRegistry::LastBeat(const std::string& name) const {
    std::ifstream file(PathFor(name));
    if (!file) {
        return std::nullopt;
    }
    int64_t timestamp = 0;
    if (!(file >> timestamp)) {
        return std::nullopt;
    }
    return timestamp;
}

size_t HeartbeatRegistry::GetRegisteredCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registered_.size();
}

void HeartbeatRegistry::StartPump() {
    if (running_.exchange(true)) {
        return;
    }
    pump_thread_ = std::thread(&HeartbeatRegistry::PumpLoop, this);
    spdlog::debug("HeartbeatRegistry: Pump started ({}s interval, dir {})", interval_.count(), directory_);
}

void HeartbeatRegistry::StopPump() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(pump_mutex_);
    }
    pump_cv_.notify_all();
    if (pump_thread_.joinable()) {
        pump_thread_.join();
    }
}

void HeartbeatRegistry::PumpLoop() {
    while (running_) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& name : registered_) {
                Beat(name);
            }
        }

        std::unique_lock<std::mutex> lock(pump_mutex_);
        pump_cv_.wait_for(lock, interval_, [this] { return !running_; });
    }
}

} // namespace sandcell::node::sandbox
