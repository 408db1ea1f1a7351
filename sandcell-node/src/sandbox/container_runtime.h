// container_runtime.h - Abstract isolation runtime used by the sandbox
#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace sandcell::node::sandbox {

// Labels attached to every environment this subsystem creates
constexpr const char* kManagedLabel = "sandcell.managed";
constexpr const char* kOwnerLabel = "sandcell.owner";
constexpr const char* kCreatedAtLabel = "sandcell.created_at";

// Fixed paths inside an environment
constexpr const char* kCodeMount = "/code";
constexpr const char* kScratchMount = "/scratch";
constexpr const char* kEntryScript = "/code/strategy.py";
constexpr const char* kResultPath = "/scratch/result.json";

// The isolation runtime itself is unusable (daemon unreachable, image missing,
// cannot allocate). Never a verdict about candidate code.
class InfrastructureError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Everything needed to allocate one isolated environment
struct EnvironmentSpec {
    std::string name;
    std::string image = "python:3.10-slim";
    std::string memory_limit = "2g";
    double cpu_limit = 0.5;
    int pids_limit = 100;
    std::string user = "1000:1000";
    std::string scratch_size = "64m";
    std::string tmp_size = "64m";
    std::string code_dir;                        // Host directory mounted read-only at kCodeMount
    std::string seccomp_profile;                 // Host JSON profile; empty keeps the runtime default
    std::map<std::string, std::string> labels;
};

struct ExecOutcome {
    int exit_code = -1;
    std::string output;       // Combined stdout/stderr, possibly truncated
    bool truncated = false;
};

// Normalized resource signals for one environment
struct RuntimeStats {
    double cpu_percent = 0.0;      // Percent of the environment's CPU share
    double memory_percent = 0.0;   // Percent of the environment's memory ceiling
    int pid_count = 0;
};

struct RuntimeContainer {
    std::string id;
    std::string name;
    std::string state;
    std::map<std::string, std::string> labels;
};

class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    // True if the runtime answers
    virtual bool Ping() = 0;

    // Allocate an environment. Returns its id. Throws InfrastructureError.
    virtual std::string Create(const EnvironmentSpec& spec) = 0;

    // Throws InfrastructureError
    virtual void Start(const std::string& id) = 0;

    // Run a command inside a started environment and block until it exits
    // or the environment is destroyed. Throws InfrastructureError if the
    // runtime itself fails.
    virtual ExecOutcome Exec(const std::string& id, const std::vector<std::string>& command,
                             size_t max_output_bytes) = 0;

    // Read at most max_bytes of a file. std::nullopt if the file is absent or unreadable.
    virtual std::optional<std::string> ReadFile(const std::string& id, const std::string& path,
                                                size_t max_bytes) = 0;

    virtual bool Kill(const std::string& id) = 0;

    // Returns true if the environment no longer exists afterwards
    virtual bool Remove(const std::string& id, bool force) = 0;

    virtual bool Exists(const std::string& id) = 0;

    virtual std::optional<RuntimeStats> GetStats(const std::string& id) = 0;

    // Queried from the runtime every time, never cached
    virtual std::vector<RuntimeContainer> ListByLabel(const std::string& label) = 0;
};

} // namespace sandcell::node::sandbox
