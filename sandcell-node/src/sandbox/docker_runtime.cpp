// docker_runtime.cpp - docker CLI implementation of ContainerRuntime
#include "sandbox/docker_runtime.h"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <array>
#include <cstdio>
#include <filesystem>
#include <sstream>
#include <sys/wait.h>

namespace sandcell::node::sandbox {

namespace {

std::string ShortId(const std::string& id) {
    return id.substr(0, 12);
}

void TrimTrailingNewlines(std::string& s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
        s.pop_back();
    }
}

bool MentionsDaemonFailure(const std::string& output) {
    return output.find("Cannot connect to the Docker daemon") != std::string::npos ||
           output.find("error during connect") != std::string::npos ||
           output.find("permission denied while trying to connect") != std::string::npos;
}

double ParsePercent(std::string value) {
    auto pos = value.find('%');
    if (pos != std::string::npos) value.erase(pos);
    return std::stod(value);
}

} // namespace

DockerRuntime::DockerRuntime(DockerRuntimeConfig config)
    : config_(std::move(config)) {}

std::string DockerRuntime::ShellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

DockerRuntime::CommandResult DockerRuntime::ExecuteDockerCommand(const std::vector<std::string>& args,
                                                                 size_t max_output_bytes) {
    CommandResult result;

    std::ostringstream cmd;
    cmd << ShellQuote(config_.docker_binary);
    for (const auto& arg : args) {
        cmd << " " << ShellQuote(arg);
    }
    cmd << " 2>&1";

    std::string command = cmd.str();
    spdlog::debug("DockerRuntime: Executing: {}", command);

    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        spdlog::error("DockerRuntime: Failed to spawn docker CLI");
        return result;
    }

    // Keep draining past the cap so the child never blocks on a full pipe
    std::array<char, 4096> buffer;
    size_t n;
    while ((n = fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        size_t room = max_output_bytes > result.output.size() ? max_output_bytes - result.output.size() : 0;
        if (n > room) result.truncated = true;
        result.output.append(buffer.data(), std::min(n, room));
    }

    int status = pclose(pipe);
    if (status != -1 && WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (status != -1 && WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

void DockerRuntime::ThrowInfrastructure(const std::string& action, const CommandResult& result) {
    std::string detail = result.output;
    TrimTrailingNewlines(detail);

    std::string message;
    if (result.exit_code == 127) {
        message = "docker binary '" + config_.docker_binary + "' not found";
    } else if (MentionsDaemonFailure(result.output)) {
        message = "docker daemon unreachable: " + detail;
    } else {
        message = action + " failed (exit " + std::to_string(result.exit_code) + "): " + detail;
    }
    spdlog::error("DockerRuntime: {}", message);
    throw InfrastructureError(message);
}

bool DockerRuntime::Ping() {
    auto result = ExecuteDockerCommand({"version", "--format", "{{.Server.Version}}"});
    if (result.exit_code != 0 || result.output.empty()) {
        spdlog::warn("DockerRuntime: Docker daemon not available");
        return false;
    }
    std::string version = result.output;
    TrimTrailingNewlines(version);
    spdlog::debug("DockerRuntime: Docker {} available", version);

    std::lock_guard<std::mutex> lock(version_mutex_);
    server_version_ = std::move(version);
    return true;
}

std::string DockerRuntime::GetServerVersion() const {
    std::lock_guard<std::mutex> lock(version_mutex_);
    return server_version_;
}

bool DockerRuntime::ImageExists(const std::string& image) {
    auto result = ExecuteDockerCommand({"image", "inspect", "--format", "{{.Id}}", image});
    if (result.exit_code != 0 && (result.exit_code == 127 || MentionsDaemonFailure(result.output))) {
        ThrowInfrastructure("image inspect", result);
    }
    return result.exit_code == 0;
}

std::vector<std::string> DockerRuntime::BuildCreateArgs(const EnvironmentSpec& spec) {
    std::vector<std::string> args = {"create"};

    if (!spec.name.empty()) {
        args.push_back("--name");
        args.push_back(spec.name);
    }

    for (const auto& [key, value] : spec.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }

    // Resource ceilings
    args.push_back("--memory");
    args.push_back(spec.memory_limit);
    args.push_back("--memory-swap");
    args.push_back(spec.memory_limit);
    if (spec.cpu_limit > 0.0) {
        std::ostringstream cpus;
        cpus << spec.cpu_limit;
        args.push_back("--cpus");
        args.push_back(cpus.str());
    }
    args.push_back("--pids-limit");
    args.push_back(std::to_string(spec.pids_limit));

    // No network at all
    args.push_back("--network");
    args.push_back("none");

    // Unprivileged identity, no privilege escalation, no capabilities
    args.push_back("--user");
    args.push_back(spec.user);
    args.push_back("--cap-drop");
    args.push_back("ALL");
    args.push_back("--security-opt");
    args.push_back("no-new-privileges:true");
    if (!spec.seccomp_profile.empty()) {
        // The CLI reads the profile on this host
        std::error_code ec;
        if (!std::filesystem::is_regular_file(spec.seccomp_profile, ec)) {
            throw InfrastructureError("seccomp profile '" + spec.seccomp_profile + "' not found");
        }
        args.push_back("--security-opt");
        args.push_back("seccomp=" + spec.seccomp_profile);
    }

    // Read-only root; the only writable areas are size-capped noexec tmpfs mounts
    args.push_back("--read-only");
    std::string uid = spec.user.substr(0, spec.user.find(':'));
    std::string gid = spec.user.find(':') != std::string::npos ? spec.user.substr(spec.user.find(':') + 1) : uid;
    args.push_back("--tmpfs");
    args.push_back(std::string(kScratchMount) + ":rw,noexec,nosuid,nodev,size=" + spec.scratch_size +
                   ",uid=" + uid + ",gid=" + gid + ",mode=0700");
    args.push_back("--tmpfs");
    args.push_back("/tmp:rw,noexec,nosuid,nodev,size=" + spec.tmp_size);

    if (!spec.code_dir.empty()) {
        args.push_back("-v");
        args.push_back(spec.code_dir + ":" + kCodeMount + ":ro");
    }

    args.push_back("-w");
    args.push_back(kScratchMount);
    args.push_back("-e");
    args.push_back(std::string("HOME=") + kScratchMount);
    args.push_back("-e");
    args.push_back("PYTHONDONTWRITEBYTECODE=1");

    // Keep the environment alive; candidate code is run through Exec
    args.push_back(spec.image);
    args.push_back("sleep");
    args.push_back("infinity");

    return args;
}

std::string DockerRuntime::Create(const EnvironmentSpec& spec) {
    if (!ImageExists(spec.image)) {
        std::string message = "image '" + spec.image + "' not present on host";
        spdlog::error("DockerRuntime: {}", message);
        throw InfrastructureError(message);
    }

    auto result = ExecuteDockerCommand(BuildCreateArgs(spec));
    if (result.exit_code != 0) {
        ThrowInfrastructure("docker create " + spec.name, result);
    }

    std::string id = result.output;
    TrimTrailingNewlines(id);
    // Warnings may precede the id on earlier lines
    auto last_line = id.rfind('\n');
    if (last_line != std::string::npos) {
        id = id.substr(last_line + 1);
    }
    if (id.empty()) {
        throw InfrastructureError("docker create returned no container id");
    }

    {
        std::lock_guard<std::mutex> lock(limits_mutex_);
        cpu_limits_[id] = spec.cpu_limit;
    }

    spdlog::info("DockerRuntime: Created container {} ({})", ShortId(id), spec.name);
    return id;
}

void DockerRuntime::Start(const std::string& id) {
    auto result = ExecuteDockerCommand({"start", id});
    if (result.exit_code != 0) {
        ThrowInfrastructure("docker start " + ShortId(id), result);
    }
    spdlog::info("DockerRuntime: Started container {}", ShortId(id));
}

ExecOutcome DockerRuntime::Exec(const std::string& id, const std::vector<std::string>& command,
                                size_t max_output_bytes) {
    std::vector<std::string> args = {"exec", id};
    args.insert(args.end(), command.begin(), command.end());

    auto result = ExecuteDockerCommand(args, max_output_bytes);

    // A non-zero exit is normally the candidate's own; only blame the runtime
    // when the daemon itself stopped answering
    if (result.exit_code != 0 && (result.exit_code == 127 || MentionsDaemonFailure(result.output)) && !Ping()) {
        ThrowInfrastructure("docker exec " + ShortId(id), result);
    }

    ExecOutcome outcome;
    outcome.exit_code = result.exit_code;
    outcome.output = std::move(result.output);
    outcome.truncated = result.truncated;
    return outcome;
}

std::optional<std::string> DockerRuntime::ReadFile(const std::string& id, const std::string& path,
                                                   size_t max_bytes) {
    auto result = ExecuteDockerCommand({"exec", id, "head", "-c", std::to_string(max_bytes), path},
                                       max_bytes);
    if (result.exit_code != 0) {
        spdlog::debug("DockerRuntime: {} not readable in {}: {}", path, ShortId(id), result.output);
        return std::nullopt;
    }
    return result.output;
}

bool DockerRuntime::Kill(const std::string& id) {
    auto result = ExecuteDockerCommand({"kill", "--signal", "KILL", id});
    if (result.exit_code == 0) {
        spdlog::info("DockerRuntime: Killed container {}", ShortId(id));
        return true;
    }
    spdlog::debug("DockerRuntime: kill {} failed: {}", ShortId(id), result.output);
    return false;
}

bool DockerRuntime::Remove(const std::string& id, bool force) {
    std::vector<std::string> args = {"rm", "-v"};
    if (force) args.push_back("-f");
    args.push_back(id);

    auto result = ExecuteDockerCommand(args);
    bool gone = result.exit_code == 0 || result.output.find("No such container") != std::string::npos;

    if (gone) {
        std::lock_guard<std::mutex> lock(limits_mutex_);
        cpu_limits_.erase(id);
        spdlog::info("DockerRuntime: Removed container {}", ShortId(id));
    } else {
        spdlog::error("DockerRuntime: Failed to remove container {}: {}", ShortId(id), result.output);
    }
    return gone;
}

bool DockerRuntime::Exists(const std::string& id) {
    auto result = ExecuteDockerCommand({"inspect", "--format", "{{.Id}}", id});
    return result.exit_code == 0;
}

std::optional<RuntimeStats> DockerRuntime::ParseStatsLine(const std::string& line, double cpu_limit) {
    auto j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    try {
        RuntimeStats stats;
        double cpu = ParsePercent(j.value("CPUPerc", "0%"));
        stats.cpu_percent = cpu_limit > 0.0 ? cpu / cpu_limit : cpu;
        stats.memory_percent = ParsePercent(j.value("MemPerc", "0%"));
        stats.pid_count = std::stoi(j.value("PIDs", "0"));
        return stats;
    } catch (const std::exception& e) {
        spdlog::debug("DockerRuntime: Unparseable stats line '{}': {}", line, e.what());
        return std::nullopt;
    }
}

std::optional<RuntimeStats> DockerRuntime::GetStats(const std::string& id) {
    auto result = ExecuteDockerCommand({"stats", "--no-stream", "--format", "{{json .}}", id});
    if (result.exit_code != 0) {
        return std::nullopt;
    }

    double cpu_limit = 0.0;
    {
        std::lock_guard<std::mutex> lock(limits_mutex_);
        auto it = cpu_limits_.find(id);
        if (it != cpu_limits_.end()) cpu_limit = it->second;
    }

    std::string line = result.output;
    TrimTrailingNewlines(line);
    return ParseStatsLine(line, cpu_limit);
}

std::map<std::string, std::string> DockerRuntime::ParseLabels(const std::string& labels) {
    std::map<std::string, std::string> parsed;
    std::istringstream iss(labels);
    std::string pair;
    while (std::getline(iss, pair, ',')) {
        auto eq = pair.find('=');
        if (eq == std::string::npos) {
            if (!pair.empty()) parsed[pair] = "";
            continue;
        }
        parsed[pair.substr(0, eq)] = pair.substr(eq + 1);
    }
    return parsed;
}

std::vector<RuntimeContainer> DockerRuntime::ListByLabel(const std::string& label) {
    std::vector<RuntimeContainer> containers;

    auto result = ExecuteDockerCommand({"ps", "-a", "--no-trunc", "--filter", "label=" + label,
                                        "--format", "{{json .}}"});
    if (result.exit_code != 0) {
        ThrowInfrastructure("docker ps", result);
    }

    std::istringstream iss(result.output);
    std::string line;
    while (std::getline(iss, line)) {
        if (line.empty()) continue;
        auto j = nlohmann::json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            spdlog::warn("DockerRuntime: Skipping unparseable ps line: {}", line);
            continue;
        }

        RuntimeContainer container;
        container.id = j.value("ID", "");
        container.name = j.value("Names", "");
        container.state = j.value("State", "");
        container.labels = ParseLabels(j.value("Labels", ""));
        if (!container.id.empty()) {
            containers.push_back(std::move(container));
        }
    }
    return containers;
}

} // namespace sandcell::node::sandbox
