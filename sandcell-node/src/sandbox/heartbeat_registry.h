// heartbeat_registry.h - Liveness files refreshed by the owner of live environments
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

namespace sandcell::node::sandbox {

// One file per live environment: <directory>/<environment name>, holding the
// unix time of the last beat. A pump thread rewrites every registered file on
// a fixed interval; files of a crashed owner simply stop advancing.
class HeartbeatRegistry {
public:
    HeartbeatRegistry(std::string directory, std::chrono::seconds interval);
    ~HeartbeatRegistry();

    HeartbeatRegistry(const HeartbeatRegistry&) = delete;
    HeartbeatRegistry& operator=(const HeartbeatRegistry&) = delete;

    void Register(const std::string& name);
    void Unregister(const std::string& name);

    // Delete a heartbeat file regardless of who wrote it
    void Erase(const std::string& name);

    // Unix seconds of the last beat, or nullopt if no heartbeat exists
    std::optional<int64_t> LastBeat(const std::string& name) const;

    void StartPump();
    void StopPump();
    bool IsPumping() const { return running_; }

    size_t GetRegisteredCount() const;
    const std::string& GetDirectory() const { return directory_; }

private:
    std::string PathFor(const std::string& name) const;
    bool Beat(const std::string& name);   // mutex_ held
    void PumpLoop();

    std::string directory_;
    std::chrono::seconds interval_;

    mutable std::mutex mutex_;
    std::set<std::string> registered_;

    std::thread pump_thread_;
    std::atomic<bool> running_{false};
    std::mutex pump_mutex_;
    std::condition_variable pump_cv_;
};

} // namespace sandcell::node::sandbox
