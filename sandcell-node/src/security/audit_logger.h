// audit_logger.h - Security event trail for sandbox activity
#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace sandcell::node::security {

enum class AuditEvent {
    // Static analysis
    VALIDATION_REJECTED,

    // Environment lifecycle
    ENVIRONMENT_CREATED,
    ENVIRONMENT_STARTED,
    ENVIRONMENT_REMOVED,
    EXECUTION_COMPLETED,
    EXECUTION_TIMEOUT,
    POLICY_KILL,
    CLEANUP_FAILED,

    // Orphan handling
    ORPHAN_SWEEP,
    ORPHAN_REAPED,

    // System events
    INFRASTRUCTURE_FAILURE,
    DAEMON_STARTED,
    DAEMON_STOPPED
};

const char* GetAuditEventName(AuditEvent event);

struct AuditEntry {
    int64_t timestamp = 0;       // Unix timestamp
    AuditEvent event = AuditEvent::DAEMON_STARTED;
    std::string actor;           // "validator", "lifecycle", "monitor", "reaper", "daemon"
    std::string resource;        // Container name/id, or empty
    std::string details;
    bool success = true;
};

struct AuditQuery {
    int64_t since = 0;           // 0 = no filter
    std::string resource;        // Empty = all
    AuditEvent event_type = AuditEvent::DAEMON_STARTED;
    bool filter_event = false;
    int limit = 100;
};

using AuditCallback = std::function<void(const AuditEntry&)>;

class AuditLogger {
public:
    AuditLogger();

    void Log(AuditEvent event,
             const std::string& actor,
             const std::string& resource,
             bool success,
             const std::string& details = "");

    std::vector<AuditEntry> GetEntries(const AuditQuery& query) const;
    std::vector<AuditEntry> GetRecentEntries(int limit = 100) const;
    size_t CountEvents(AuditEvent event) const;

    // Append every entry as a JSON line to path
    void SetLogFile(const std::string& path);
    void SetMaxMemoryEntries(size_t max);
    void SetCallback(AuditCallback callback);

    size_t GetEntryCount() const;

    std::string ExportAsJSON(const AuditQuery& query) const;

private:
    void WriteToFile(const AuditEntry& entry, const std::string& path);
    void TrimMemoryEntries();

    mutable std::mutex mutex_;
    std::mutex file_mutex_;
    std::deque<AuditEntry> entries_;
    std::string log_file_;
    size_t max_memory_entries_ = 10000;
    AuditCallback callback_;
};

} // namespace sandcell::node::security
