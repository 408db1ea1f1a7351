// test_runtime_monitor.cpp - Policy thresholds, sustained windows and the sampling thread

#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "../src/sandbox/runtime_monitor.h"
#include "../src/sandbox/security_policy.h"
#include "fake_container_runtime.h"

using namespace sandcell::node::sandbox;
using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;

namespace {

PolicyThresholds FastThresholds() {
    PolicyThresholds t;
    t.max_pids = 10;
    t.cpu_sustained_window = 300ms;
    t.memory_sustained_window = 300ms;
    t.pid_sustained_window = 0ms;
    t.combined_sustained_window = 300ms;
    t.sample_interval = 20ms;
    return t;
}

MonitorSample Sample(Clock::time_point at, double cpu, double mem, int pids) {
    MonitorSample s;
    s.timestamp = at;
    s.cpu_percent = cpu;
    s.memory_percent = mem;
    s.pid_count = pids;
    return s;
}

} // namespace

TEST_CASE("SecurityPolicy - Validation", "[sandbox][policy]") {
    SECTION("Defaults are valid") {
        SecurityPolicy policy;
        REQUIRE(policy.GetMaxCpuPercent() == 95.0);
        REQUIRE(policy.GetMaxPids() == 90);
        REQUIRE(policy.GetSampleInterval() == 5000ms);
    }

    SECTION("Non-positive thresholds are rejected") {
        PolicyThresholds t;
        t.max_cpu_percent = 0.0;
        REQUIRE_THROWS_AS(SecurityPolicy(t), std::invalid_argument);

        t = PolicyThresholds{};
        t.max_pids = -1;
        REQUIRE_THROWS_AS(SecurityPolicy(t), std::invalid_argument);

        t = PolicyThresholds{};
        t.memory_sustained_window = 0ms;
        REQUIRE_THROWS_AS(SecurityPolicy(t), std::invalid_argument);
    }

    SECTION("Sample interval must fit inside the shortest window") {
        PolicyThresholds t;
        t.sample_interval = 10000ms;   // memory window is 10000ms
        REQUIRE_THROWS_AS(SecurityPolicy(t), std::invalid_argument);

        t.sample_interval = 9999ms;
        REQUIRE_NOTHROW(SecurityPolicy(t));
    }

    SECTION("Combined score weights cpu and memory") {
        SecurityPolicy policy;
        REQUIRE(policy.CombinedScore(80.0, 100.0) == 90.0);
    }
}

TEST_CASE("SustainedWindow - Fires only after continuous breach", "[sandbox][monitor]") {
    SustainedWindow window(100ms);
    auto t0 = Clock::now();

    REQUIRE_FALSE(window.Update(true, t0));
    REQUIRE(window.IsExceeding());
    REQUIRE_FALSE(window.Update(true, t0 + 50ms));

    SECTION("A dip resets the window") {
        REQUIRE_FALSE(window.Update(false, t0 + 60ms));
        REQUIRE_FALSE(window.IsExceeding());
        REQUIRE_FALSE(window.Update(true, t0 + 120ms));
        REQUIRE(window.Update(true, t0 + 220ms));
    }

    SECTION("Breach for the whole window fires") {
        REQUIRE(window.Update(true, t0 + 100ms));
    }

    SECTION("A zero window fires on the first breach") {
        SustainedWindow immediate(0ms);
        REQUIRE(immediate.Update(true, t0));
    }
}

TEST_CASE("PolicyEvaluator - Reason order", "[sandbox][monitor]") {
    PolicyEvaluator evaluator{SecurityPolicy(FastThresholds())};
    auto t0 = Clock::now();

    SECTION("A single CPU spike is not a kill") {
        REQUIRE_FALSE(evaluator.Evaluate(Sample(t0, 100.0, 10.0, 2)));
        REQUIRE_FALSE(evaluator.Evaluate(Sample(t0 + 100ms, 10.0, 10.0, 2)));
        REQUIRE_FALSE(evaluator.Evaluate(Sample(t0 + 400ms, 10.0, 10.0, 2)));
    }

    SECTION("Sustained CPU is a kill") {
        REQUIRE_FALSE(evaluator.Evaluate(Sample(t0, 99.0, 10.0, 2)));
        auto reason = evaluator.Evaluate(Sample(t0 + 300ms, 99.0, 10.0, 2));
        REQUIRE(reason == KillReason::CPU);
    }

    SECTION("Fork bomb wins over everything else") {
        REQUIRE_FALSE(evaluator.Evaluate(Sample(t0, 99.0, 99.0, 2)));
        auto reason = evaluator.Evaluate(Sample(t0 + 300ms, 99.0, 99.0, 50));
        REQUIRE(reason == KillReason::FORK_BOMB);
    }

    SECTION("Memory before combined") {
        REQUIRE_FALSE(evaluator.Evaluate(Sample(t0, 70.0, 99.0, 2)));
        auto reason = evaluator.Evaluate(Sample(t0 + 300ms, 70.0, 99.0, 2));
        REQUIRE(reason == KillReason::MEMORY);
    }

    SECTION("A missing sample restarts every window") {
        REQUIRE_FALSE(evaluator.Evaluate(Sample(t0, 99.0, 10.0, 2)));
        evaluator.Reset();
        REQUIRE_FALSE(evaluator.Evaluate(Sample(t0 + 300ms, 99.0, 10.0, 2)));
        REQUIRE_FALSE(evaluator.Evaluate(Sample(t0 + 500ms, 99.0, 10.0, 2)));
        REQUIRE(evaluator.Evaluate(Sample(t0 + 600ms, 99.0, 10.0, 2)) == KillReason::CPU);
    }

    SECTION("Combined anomaly with no single signal over its limit") {
        REQUIRE_FALSE(evaluator.Evaluate(Sample(t0, 85.0, 85.0, 2)));
        auto reason = evaluator.Evaluate(Sample(t0 + 300ms, 85.0, 85.0, 2));
        REQUIRE(reason == KillReason::COMBINED_ANOMALY);
    }
}

TEST_CASE("EnvironmentHandle - Status transitions", "[sandbox][handle]") {
    EnvironmentHandle handle("abc", "sandcell-000000000001", 0, 1);
    REQUIRE(handle.GetStatus() == EnvironmentStatus::Created);

    handle.TransitionTo(EnvironmentStatus::Running);
    handle.TransitionTo(EnvironmentStatus::Exited);
    REQUIRE(handle.IsTerminal());

    REQUIRE_THROWS_AS(handle.TransitionTo(EnvironmentStatus::Running), std::logic_error);
    REQUIRE_THROWS_AS(handle.TransitionTo(EnvironmentStatus::Killed), std::logic_error);
}

TEST_CASE("RuntimeMonitor - Enforces policy against a live environment", "[sandbox][monitor]") {
    testing::FakeContainerRuntime runtime;

    SECTION("Fork bomb is killed on the first sample") {
        testing::FakeScript script;
        script.duration = 10s;
        script.stats = [](std::chrono::milliseconds) { return RuntimeStats{5.0, 5.0, 50}; };
        runtime.SetScript(script);

        std::string id = runtime.Create(EnvironmentSpec{});
        runtime.Start(id);
        EnvironmentHandle handle(id, "env", 0, 1);
        handle.TransitionTo(EnvironmentStatus::Running);

        std::atomic<int> callbacks{0};
        RuntimeMonitor monitor(runtime);
        monitor.Start(handle, SecurityPolicy(FastThresholds()), [&](KillReason reason) {
            callbacks++;
            return reason == KillReason::FORK_BOMB;
        });

        auto decision = monitor.Decision();
        REQUIRE(decision.wait_for(5s) == std::future_status::ready);
        REQUIRE(decision.get().killed);
        REQUIRE(decision.get().reason == KillReason::FORK_BOMB);
        REQUIRE(decision.get().peak.peak_pids == 50);
        REQUIRE(callbacks.load() == 1);
        REQUIRE(runtime.kill_calls.load() == 1);

        monitor.Stop();
        REQUIRE_FALSE(monitor.IsRunning());
    }

    SECTION("Declined decision leaves the environment alone") {
        testing::FakeScript script;
        script.duration = 10s;
        script.stats = [](std::chrono::milliseconds) { return RuntimeStats{5.0, 5.0, 50}; };
        runtime.SetScript(script);

        std::string id = runtime.Create(EnvironmentSpec{});
        runtime.Start(id);
        EnvironmentHandle handle(id, "env", 0, 1);

        RuntimeMonitor monitor(runtime);
        monitor.Start(handle, SecurityPolicy(FastThresholds()), [](KillReason) { return false; });

        auto decision = monitor.Decision().get();
        REQUIRE_FALSE(decision.killed);
        REQUIRE(runtime.kill_calls.load() == 0);
    }

    SECTION("Quiet environment runs until stopped") {
        testing::FakeScript script;
        script.duration = 10s;
        script.stats = [](std::chrono::milliseconds) { return RuntimeStats{20.0, 30.0, 3}; };
        runtime.SetScript(script);

        std::string id = runtime.Create(EnvironmentSpec{});
        runtime.Start(id);
        EnvironmentHandle handle(id, "env", 0, 1);

        RuntimeMonitor monitor(runtime);
        monitor.Start(handle, SecurityPolicy(FastThresholds()));
        std::this_thread::sleep_for(150ms);
        REQUIRE(monitor.IsRunning());

        monitor.Stop();
        monitor.Stop();

        auto decision = monitor.Decision().get();
        REQUIRE_FALSE(decision.killed);
        REQUIRE(decision.samples_taken >= 1);
        REQUIRE(decision.peak.peak_memory_percent == 30.0);
        REQUIRE(runtime.kill_calls.load() == 0);

        REQUIRE_THROWS_AS(monitor.Start(handle, SecurityPolicy(FastThresholds())), std::logic_error);
    }

    SECTION("Missing stats never trigger a kill") {
        std::string id = runtime.Create(EnvironmentSpec{});
        runtime.Start(id);
        EnvironmentHandle handle(id, "env", 0, 1);

        RuntimeMonitor monitor(runtime);
        monitor.Start(handle, SecurityPolicy(FastThresholds()));
        std::this_thread::sleep_for(100ms);
        monitor.Stop();

        auto decision = monitor.Decision().get();
        REQUIRE_FALSE(decision.killed);
        REQUIRE(decision.samples_taken == 0);
    }
}
