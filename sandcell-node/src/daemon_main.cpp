// daemon_main.cpp - Entry point for sandcell-daemon
// Serves validation and isolated execution over gRPC, or runs a single file from the command line

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <fstream>
#include <sstream>
#include <memory>
#include <thread>
#include <csignal>
#include <atomic>
#include <cstring>
#include <cstdlib>
#include <filesystem>

#include "common/version.h"
#include "core/config_manager.h"
#include "core/metrics_collector.h"
#include "sandbox/docker_runtime.h"
#include "sandbox/heartbeat_registry.h"
#include "sandbox/lifecycle_manager.h"
#include "sandbox/orphan_reaper.h"
#include "sandbox/sandbox_executor.h"
#include "security/audit_logger.h"
#include "security/python_interpreter.h"
#include "security/security_validator.h"
#include "sandbox_service.h"

namespace core = sandcell::node::core;
namespace sandbox = sandcell::node::sandbox;
namespace security = sandcell::node::security;

// Exit codes for one-shot modes
constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
constexpr int kExitInfrastructure = 3;

// Global flag for shutdown
std::atomic<bool> g_shutdown{false};

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown = true;
    }
}

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  --config=PATH        Path to config file (default: ./config/sandcell.yaml)\n"
              << "  --listen=ADDR        gRPC listen address (default: 0.0.0.0:50071)\n"
              << "  --log-level=LEVEL    trace, debug, info, warn, error\n"
              << "  --validate=FILE      Validate FILE, print the report as JSON and exit\n"
              << "  --run=FILE           Validate and execute FILE, print the result as JSON and exit\n"
              << "  --timeout=SECONDS    Timeout for --run (default from config)\n"
              << "  --reap               Remove stale environments once and exit\n"
              << "  --no-server          Run the reaper only, without the gRPC service\n"
              << "  --help               Show this help message\n"
              << "\nExit codes: 0 ok, 1 rejected or failed, 2 usage error, 3 runtime unavailable\n"
              << std::endl;
}

// Command-line overrides; empty fields keep the config file value
struct DaemonArgs {
    std::string config_path;
    std::string listen_address;
    std::string log_level;
    std::string validate_file;
    std::string run_file;
    int timeout_seconds = 0;
    bool reap_only = false;
    bool no_server = false;
    bool bad_arg = false;
};

DaemonArgs ParseArgs(int argc, char** argv) {
    DaemonArgs args;

    for (int i = 1; i < argc; ++i) {
        if (std::strncmp(argv[i], "--config=", 9) == 0) {
            args.config_path = argv[i] + 9;
        } else if (std::strncmp(argv[i], "--listen=", 9) == 0) {
            args.listen_address = argv[i] + 9;
        } else if (std::strncmp(argv[i], "--log-level=", 12) == 0) {
            args.log_level = argv[i] + 12;
        } else if (std::strncmp(argv[i], "--validate=", 11) == 0) {
            args.validate_file = argv[i] + 11;
        } else if (std::strncmp(argv[i], "--run=", 6) == 0) {
            args.run_file = argv[i] + 6;
        } else if (std::strncmp(argv[i], "--timeout=", 10) == 0) {
            args.timeout_seconds = std::atoi(argv[i] + 10);
            if (args.timeout_seconds <= 0) {
                std::cerr << "Invalid --timeout value: " << (argv[i] + 10) << std::endl;
                args.bad_arg = true;
            }
        } else if (std::strcmp(argv[i], "--reap") == 0) {
            args.reap_only = true;
        } else if (std::strcmp(argv[i], "--no-server") == 0) {
            args.no_server = true;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            PrintUsage(argv[0]);
            std::exit(kExitOk);
        } else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            args.bad_arg = true;
        }
    }

    return args;
}

void SetupLogging(const core::SandboxConfig& config) {
    if (!config.log_file.empty()) {
        try {
            auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file);
            auto logger = std::make_shared<spdlog::logger>(
                "sandcell", spdlog::sinks_init_list{console, file});
            spdlog::set_default_logger(logger);
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "Failed to open log file " << config.log_file << ": " << e.what() << std::endl;
        }
    } else {
        // Keep stdout clean for JSON output in one-shot modes
        spdlog::set_default_logger(spdlog::stderr_color_mt("sandcell"));
    }
    spdlog::set_level(spdlog::level::from_str(config.log_level));
    spdlog::flush_on(spdlog::level::warn);
}

bool ReadSourceFile(const std::string& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        spdlog::error("Cannot open {}", path);
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

nlohmann::json ReportToJson(const security::ValidationReport& report) {
    nlohmann::json j;
    j["is_valid"] = report.is_valid;
    j["errors"] = nlohmann::json::array();
    for (const auto& error : report.errors) {
        nlohmann::json e;
        e["rule_kind"] = security::GetRuleKindName(error.rule_kind);
        e["message"] = error.message;
        e["line"] = error.line ? nlohmann::json(*error.line) : nlohmann::json(nullptr);
        e["column"] = error.column ? nlohmann::json(*error.column) : nlohmann::json(nullptr);
        j["errors"].push_back(e);
    }
    return j;
}

int main(int argc, char** argv) {
    DaemonArgs args = ParseArgs(argc, argv);
    if (args.bad_arg) {
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    // Load config file first, command line overrides it
    core::ConfigManager config_manager;
    std::string config_path = args.config_path.empty() ? core::ConfigManager::FindConfigFile()
                                                       : args.config_path;
    bool config_ok = config_manager.Load(config_path);
    core::SandboxConfig config = config_manager.GetConfig();

    if (!args.listen_address.empty()) config.listen_address = args.listen_address;
    if (!args.log_level.empty()) config.log_level = args.log_level;
    if (args.timeout_seconds > 0) config.default_timeout_seconds = args.timeout_seconds;
    core::ConfigManager::Sanitize(config);

    SetupLogging(config);
    spdlog::info("Sandcell Daemon v{}", sandcell::protocol::GetVersionString());
    spdlog::info("========================================");
    if (!config_ok) {
        spdlog::warn("Config {} could not be parsed, using defaults", config_path);
    } else {
        spdlog::info("Config loaded from: {}", config_path);
    }

    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    security::PythonInterpreter interpreter;
    if (!security::PythonInterpreter::IsAvailable()) {
        spdlog::error("Embedded Python is not available; validation cannot run");
        return kExitFailure;
    }

    security::AuditLogger audit;
    if (!config.audit_file.empty()) {
        audit.SetLogFile(config.audit_file);
    }
    core::MetricsCollector metrics;

    security::ValidatorConfig validator_config;
    validator_config.max_code_bytes = config.max_code_bytes;
    security::SecurityValidator validator(validator_config);

    // --validate needs neither the runtime nor the heartbeat directory
    if (!args.validate_file.empty()) {
        std::string code;
        if (!ReadSourceFile(args.validate_file, code)) {
            return kExitUsage;
        }
        auto report = validator.Validate(code);
        std::cout << ReportToJson(report).dump(2) << std::endl;
        return report.is_valid ? kExitOk : kExitFailure;
    }

    sandbox::DockerRuntimeConfig runtime_config;
    runtime_config.docker_binary = config.docker_binary;
    sandbox::DockerRuntime runtime(runtime_config);

    if (!runtime.Ping()) {
        spdlog::error("Container runtime is not reachable via '{}'", config.docker_binary);
        audit.Log(security::AuditEvent::INFRASTRUCTURE_FAILURE, "system", "runtime", false,
                  "ping failed at startup");
        return kExitInfrastructure;
    }
    spdlog::info("Container runtime reachable (server {})", runtime.GetServerVersion());

    if (!config.seccomp_profile.empty()) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(config.seccomp_profile, ec)) {
            spdlog::error("Seccomp profile not found: {}", config.seccomp_profile);
            audit.Log(security::AuditEvent::INFRASTRUCTURE_FAILURE, "system", "runtime", false,
                      "missing seccomp profile " + config.seccomp_profile);
            return kExitInfrastructure;
        }
        spdlog::info("Seccomp profile: {}", config.seccomp_profile);
    }

    sandbox::HeartbeatRegistry heartbeats(config.heartbeat_dir,
                                          std::chrono::seconds(config.heartbeat_interval_seconds));
    sandbox::OrphanReaper reaper(runtime, heartbeats, core::ToReaperOptions(config), &audit, &metrics);

    // Sweep leftovers from a previous crash before accepting work
    int removed = 0;
    try {
        removed = reaper.Cleanup();
    } catch (const sandbox::InfrastructureError& e) {
        spdlog::error("Startup sweep failed: {}", e.what());
        return kExitInfrastructure;
    }

    if (args.reap_only) {
        std::cout << nlohmann::json{{"removed", removed}}.dump() << std::endl;
        return kExitOk;
    }

    heartbeats.StartPump();
    sandbox::IsolationLifecycleManager lifecycle(runtime, heartbeats, core::ToLifecycleOptions(config),
                                                 &audit, &metrics);
    sandbox::SandboxExecutor executor(validator, lifecycle, &audit, &metrics);

    if (!args.run_file.empty()) {
        std::string code;
        if (!ReadSourceFile(args.run_file, code)) {
            heartbeats.StopPump();
            return kExitUsage;
        }

        int exit_code = kExitOk;
        try {
            sandbox::SecurityPolicy policy(core::ToPolicyThresholds(config));
            sandbox::ExecutionRequest request(code, policy,
                                              std::chrono::seconds(config.default_timeout_seconds));
            auto result = executor.Run(request);
            std::cout << sandbox::ExecutionResultToJson(result).dump(2) << std::endl;
            exit_code = result.success ? kExitOk : kExitFailure;
        } catch (const sandbox::InfrastructureError& e) {
            spdlog::error("Execution aborted: {}", e.what());
            exit_code = kExitInfrastructure;
        } catch (const std::invalid_argument& e) {
            spdlog::error("Invalid policy: {}", e.what());
            exit_code = kExitUsage;
        }
        heartbeats.StopPump();
        return exit_code;
    }

    std::unique_ptr<sandbox::ReaperScheduler> scheduler;
    if (config.reaper_enabled) {
        scheduler = std::make_unique<sandbox::ReaperScheduler>(
            reaper, std::chrono::seconds(config.reaper_interval_seconds));
        scheduler->Start();
    }

    std::unique_ptr<sandcell::node::SandboxServiceImpl> service;
    if (!args.no_server) {
        sandcell::node::SandboxServiceDeps deps;
        deps.validator = &validator;
        deps.executor = &executor;
        deps.lifecycle = &lifecycle;
        deps.reaper = &reaper;
        deps.runtime = &runtime;
        deps.metrics = &metrics;

        service = std::make_unique<sandcell::node::SandboxServiceImpl>(deps, config);
        if (!service->StartServer(config.listen_address)) {
            spdlog::error("Failed to start SandboxService on {}", config.listen_address);
            if (scheduler) scheduler->Stop();
            heartbeats.StopPump();
            return kExitFailure;
        }
    }

    audit.Log(security::AuditEvent::DAEMON_STARTED, "system", "daemon", true,
              args.no_server ? "reaper only" : config.listen_address);
    spdlog::info("Daemon running. Press Ctrl+C to stop.");

    while (!g_shutdown) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    spdlog::info("Shutting down...");
    if (service) {
        service->StopServer();
    }
    if (scheduler) {
        scheduler->Stop();
    }
    heartbeats.StopPump();

    audit.Log(security::AuditEvent::DAEMON_STOPPED, "system", "daemon", true);
    spdlog::info("Environments reaped this session: {}", reaper.GetTotalRemoved());
    spdlog::info("Daemon stopped");
    // Locals such as the interpreter still log while they unwind
    spdlog::default_logger()->flush();
    return kExitOk;
}
