// test_docker_runtime.cpp - Docker CLI argument building and output parsing
// These never invoke docker; the isolation flags are checked on the generated command line

#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include "../src/sandbox/docker_runtime.h"

using namespace sandcell::node::sandbox;

namespace {

// Value following flag, or empty if the flag is absent
std::string FlagValue(const std::vector<std::string>& args, const std::string& flag) {
    auto it = std::find(args.begin(), args.end(), flag);
    if (it == args.end() || ++it == args.end()) return "";
    return *it;
}

bool Contains(const std::vector<std::string>& args, const std::string& value) {
    return std::find(args.begin(), args.end(), value) != args.end();
}

} // namespace

TEST_CASE("DockerRuntime - Create arguments enforce isolation", "[sandbox][docker]") {
    EnvironmentSpec spec;
    spec.name = "sandcell-0123456789ab";
    spec.image = "python:3.10-slim";
    spec.memory_limit = "1g";
    spec.cpu_limit = 0.5;
    spec.pids_limit = 100;
    spec.user = "1000:1000";
    spec.code_dir = "/tmp/sandcell/sandcell-0123456789ab";
    spec.labels = {{kManagedLabel, "true"}, {kCreatedAtLabel, "1700000000"}};

    auto args = DockerRuntime::BuildCreateArgs(spec);

    REQUIRE(args.front() == "create");
    REQUIRE(FlagValue(args, "--name") == spec.name);
    REQUIRE(FlagValue(args, "--network") == "none");
    REQUIRE(FlagValue(args, "--memory") == "1g");
    REQUIRE(FlagValue(args, "--memory-swap") == "1g");
    REQUIRE(FlagValue(args, "--cpus") == "0.5");
    REQUIRE(FlagValue(args, "--pids-limit") == "100");
    REQUIRE(FlagValue(args, "--user") == "1000:1000");
    REQUIRE(FlagValue(args, "--cap-drop") == "ALL");
    REQUIRE(FlagValue(args, "--security-opt") == "no-new-privileges:true");
    REQUIRE(Contains(args, "--read-only"));
    REQUIRE(Contains(args, "sandcell.managed=true"));
    REQUIRE(Contains(args, spec.code_dir + ":/code:ro"));

    auto scratch = std::find_if(args.begin(), args.end(), [](const std::string& a) {
        return a.rfind("/scratch:", 0) == 0;
    });
    REQUIRE(scratch != args.end());
    REQUIRE(scratch->find("noexec") != std::string::npos);
    REQUIRE(scratch->find("mode=0700") != std::string::npos);

    REQUIRE(Contains(args, spec.image));
}

TEST_CASE("DockerRuntime - Seccomp profile", "[sandbox][docker]") {
    EnvironmentSpec spec;
    spec.name = "sandcell-0123456789ab";

    SECTION("No profile keeps the runtime default") {
        auto args = DockerRuntime::BuildCreateArgs(spec);
        REQUIRE(std::none_of(args.begin(), args.end(), [](const std::string& a) {
            return a.rfind("seccomp=", 0) == 0;
        }));
    }

    SECTION("A configured profile is passed to the runtime") {
        auto path = std::filesystem::temp_directory_path() / "sandcell_test_seccomp.json";
        {
            std::ofstream out(path);
            out << R"({"defaultAction": "SCMP_ACT_ERRNO", "syscalls": []})";
        }
        spec.seccomp_profile = path.string();

        auto args = DockerRuntime::BuildCreateArgs(spec);
        REQUIRE(Contains(args, "seccomp=" + path.string()));
        REQUIRE(Contains(args, "no-new-privileges:true"));

        std::filesystem::remove(path);
    }

    SECTION("A missing profile is an infrastructure failure") {
        spec.seccomp_profile = "/nonexistent/sandcell/seccomp.json";
        REQUIRE_THROWS_AS(DockerRuntime::BuildCreateArgs(spec), InfrastructureError);
    }
}

TEST_CASE("DockerRuntime - Server version is safe to read while pinging", "[sandbox][docker]") {
    // echo stands in for the CLI and prints its arguments as the "version"
    DockerRuntimeConfig config;
    config.docker_binary = "echo";
    DockerRuntime runtime(config);

    REQUIRE(runtime.GetServerVersion().empty());

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&runtime]() {
            for (int j = 0; j < 5; ++j) {
                runtime.Ping();
                (void)runtime.GetServerVersion();
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(runtime.Ping());
    REQUIRE(runtime.GetServerVersion() == "version --format {{.Server.Version}}");
}

TEST_CASE("DockerRuntime - Shell quoting", "[sandbox][docker]") {
    REQUIRE(DockerRuntime::ShellQuote("plain") == "'plain'");
    REQUIRE(DockerRuntime::ShellQuote("a b; rm -rf /") == "'a b; rm -rf /'");
    REQUIRE(DockerRuntime::ShellQuote("it's") == "'it'\\''s'");
}

TEST_CASE("DockerRuntime - Label parsing", "[sandbox][docker]") {
    auto labels = DockerRuntime::ParseLabels("sandcell.managed=true,sandcell.owner=host:42,flag");
    REQUIRE(labels.size() == 3);
    REQUIRE(labels.at("sandcell.managed") == "true");
    REQUIRE(labels.at("sandcell.owner") == "host:42");
    REQUIRE(labels.at("flag").empty());

    REQUIRE(DockerRuntime::ParseLabels("").empty());
}

TEST_CASE("DockerRuntime - Stats parsing", "[sandbox][docker]") {
    SECTION("CPU is relative to the CPU share") {
        auto stats = DockerRuntime::ParseStatsLine(
            R"({"CPUPerc":"45.00%","MemPerc":"12.50%","PIDs":"7"})", 0.5);
        REQUIRE(stats.has_value());
        REQUIRE(stats->cpu_percent == 90.0);
        REQUIRE(stats->memory_percent == 12.5);
        REQUIRE(stats->pid_count == 7);
    }

    SECTION("Garbage is no sample") {
        REQUIRE_FALSE(DockerRuntime::ParseStatsLine("Error: No such container", 0.5).has_value());
        REQUIRE_FALSE(DockerRuntime::ParseStatsLine(R"({"PIDs":"many"})", 0.5).has_value());
    }
}
