// audit_logger.cpp - Security event trail implementation
#include "security/audit_logger.h"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <fstream>

namespace sandcell::node::security {

namespace {

nlohmann::json EntryToJson(const AuditEntry& entry) {
    return {
        {"timestamp", entry.timestamp},
        {"event", GetAuditEventName(entry.event)},
        {"actor", entry.actor},
        {"resource", entry.resource},
        {"success", entry.success},
        {"details", entry.details}
    };
}

} // namespace

const char* GetAuditEventName(AuditEvent event) {
    switch (event) {
        case AuditEvent::VALIDATION_REJECTED: return "VALIDATION_REJECTED";
        case AuditEvent::ENVIRONMENT_CREATED: return "ENVIRONMENT_CREATED";
        case AuditEvent::ENVIRONMENT_STARTED: return "ENVIRONMENT_STARTED";
        case AuditEvent::ENVIRONMENT_REMOVED: return "ENVIRONMENT_REMOVED";
        case AuditEvent::EXECUTION_COMPLETED: return "EXECUTION_COMPLETED";
        case AuditEvent::EXECUTION_TIMEOUT: return "EXECUTION_TIMEOUT";
        case AuditEvent::POLICY_KILL: return "POLICY_KILL";
        case AuditEvent::CLEANUP_FAILED: return "CLEANUP_FAILED";
        case AuditEvent::ORPHAN_SWEEP: return "ORPHAN_SWEEP";
        case AuditEvent::ORPHAN_REAPED: return "ORPHAN_REAPED";
        case AuditEvent::INFRASTRUCTURE_FAILURE: return "INFRASTRUCTURE_FAILURE";
        case AuditEvent::DAEMON_STARTED: return "DAEMON_STARTED";
        case AuditEvent::DAEMON_STOPPED: return "DAEMON_STOPPED";
        default: return "UNKNOWN";
    }
}

AuditLogger::AuditLogger() = default;

void AuditLogger::Log(AuditEvent event,
                      const std::string& actor,
                      const std::string& resource,
                      bool success,
                      const std::string& details) {
    AuditEntry entry;
    entry.timestamp = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    entry.event = event;
    entry.actor = actor;
    entry.resource = resource;
    entry.success = success;
    entry.details = details;

    std::string log_file;
    AuditCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(entry);
        TrimMemoryEntries();
        log_file = log_file_;
        callback = callback_;
    }

    if (!log_file.empty()) {
        WriteToFile(entry, log_file);
    }

    if (callback) {
        callback(entry);
    }

    if (success) {
        spdlog::info("AUDIT: {} actor={} resource={} {}",
                     GetAuditEventName(event), actor, resource, details);
    } else {
        spdlog::warn("AUDIT: {} FAILED actor={} resource={} details={}",
                     GetAuditEventName(event), actor, resource, details);
    }
}

std::vector<AuditEntry> AuditLogger::GetEntries(const AuditQuery& query) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<AuditEntry> results;
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        const auto& entry = *it;

        if (query.since > 0 && entry.timestamp < query.since) continue;
        if (!query.resource.empty() && entry.resource != query.resource) continue;
        if (query.filter_event && entry.event != query.event_type) continue;

        results.push_back(entry);
        if (static_cast<int>(results.size()) >= query.limit) {
            break;
        }
    }
    return results;
}

std::vector<AuditEntry> AuditLogger::GetRecentEntries(int limit) const {
    AuditQuery query;
    query.limit = limit;
    return GetEntries(query);
}

size_t AuditLogger::CountEvents(AuditEvent event) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& entry : entries_) {
        if (entry.event == event) count++;
    }
    return count;
}

void AuditLogger::SetLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    log_file_ = path;
    spdlog::info("AuditLogger: Log file set to {}", path);
}

void AuditLogger::SetMaxMemoryEntries(size_t max) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_memory_entries_ = max;
    TrimMemoryEntries();
}

void AuditLogger::SetCallback(AuditCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

size_t AuditLogger::GetEntryCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::string AuditLogger::ExportAsJSON(const AuditQuery& query) const {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& entry : GetEntries(query)) {
        j.push_back(EntryToJson(entry));
    }
    return j.dump(2);
}

void AuditLogger::WriteToFile(const AuditEntry& entry, const std::string& path) {
    std::lock_guard<std::mutex> lock(file_mutex_);
    std::ofstream file(path, std::ios::app);
    if (!file) {
        spdlog::warn("AuditLogger: Failed to open log file: {}", path);
        return;
    }
    // JSON Lines
    file << EntryToJson(entry).dump() << "\n";
}

void AuditLogger::TrimMemoryEntries() {
    // Must be called with mutex held
    while (entries_.size() > max_memory_entries_) {
        entries_.pop_front();
    }
}

} // namespace sandcell::node::security
