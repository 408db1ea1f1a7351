// docker_runtime.h - ContainerRuntime backed by the docker CLI
#pragma once

#include "sandbox/container_runtime.h"
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace sandcell::node::sandbox {

struct DockerRuntimeConfig {
    std::string docker_binary = "docker";
};

class DockerRuntime : public ContainerRuntime {
public:
    explicit DockerRuntime(DockerRuntimeConfig config = {});
    ~DockerRuntime() override = default;

    bool Ping() override;
    std::string Create(const EnvironmentSpec& spec) override;
    void Start(const std::string& id) override;
    ExecOutcome Exec(const std::string& id, const std::vector<std::string>& command,
                     size_t max_output_bytes) override;
    std::optional<std::string> ReadFile(const std::string& id, const std::string& path,
                                        size_t max_bytes) override;
    bool Kill(const std::string& id) override;
    bool Remove(const std::string& id, bool force) override;
    bool Exists(const std::string& id) override;
    std::optional<RuntimeStats> GetStats(const std::string& id) override;
    std::vector<RuntimeContainer> ListByLabel(const std::string& label) override;

    // Empty until a Ping succeeds
    std::string GetServerVersion() const;

    // Argument list for `docker create`, exposed for tests. Throws
    // InfrastructureError if the seccomp profile is missing.
    static std::vector<std::string> BuildCreateArgs(const EnvironmentSpec& spec);

    // Quote one argument for /bin/sh
    static std::string ShellQuote(const std::string& arg);

    // Parse "k=v,k2=v2" as printed by `docker ps --format {{json .}}`
    static std::map<std::string, std::string> ParseLabels(const std::string& labels);

    // Parse one line of `docker stats --format {{json .}}`; cpu is divided by cpu_limit
    static std::optional<RuntimeStats> ParseStatsLine(const std::string& line, double cpu_limit);

private:
    struct CommandResult {
        int exit_code = -1;
        std::string output;
        bool truncated = false;
    };

    CommandResult ExecuteDockerCommand(const std::vector<std::string>& args,
                                       size_t max_output_bytes = 1024 * 1024);

    bool ImageExists(const std::string& image);
    [[noreturn]] void ThrowInfrastructure(const std::string& action, const CommandResult& result);

    DockerRuntimeConfig config_;

    // Ping runs from service handlers and waiter threads at once
    mutable std::mutex version_mutex_;
    std::string server_version_;

    std::mutex limits_mutex_;
    std::map<std::string, double> cpu_limits_;   // Container id -> --cpus value
};

} // namespace sandcell::node::sandbox
