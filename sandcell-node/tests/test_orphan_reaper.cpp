// test_orphan_reaper.cpp - Heartbeats and the orphan sweep

#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>

#include "../src/sandbox/heartbeat_registry.h"
#include "../src/sandbox/orphan_reaper.h"
#include "../src/security/audit_logger.h"
#include "../src/core/metrics_collector.h"
#include "fake_container_runtime.h"

using namespace sandcell::node::sandbox;
using namespace sandcell::node;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

namespace {

std::string TestDirectory(const std::string& tag) {
    return (fs::temp_directory_path() / ("sandcell-reaper-" + tag + "-" + std::to_string(::getpid()))).string();
}

std::map<std::string, std::string> Labels(int64_t created_at) {
    return {{kManagedLabel, "true"}, {kOwnerLabel, "host:1"}, {kCreatedAtLabel, std::to_string(created_at)}};
}

int64_t Now() {
    return static_cast<int64_t>(std::time(nullptr));
}

} // namespace

TEST_CASE("HeartbeatRegistry - Files follow registration", "[sandbox][heartbeat]") {
    std::string dir = TestDirectory("hb");
    {
        HeartbeatRegistry heartbeats(dir, 1s);

        REQUIRE_FALSE(heartbeats.LastBeat("sandcell-aaaaaaaaaaaa").has_value());

        heartbeats.Register("sandcell-aaaaaaaaaaaa");
        REQUIRE(heartbeats.GetRegisteredCount() == 1);
        auto beat = heartbeats.LastBeat("sandcell-aaaaaaaaaaaa");
        REQUIRE(beat.has_value());
        REQUIRE(*beat <= Now());
        REQUIRE(*beat >= Now() - 2);

        SECTION("Unregister removes the file") {
            heartbeats.Unregister("sandcell-aaaaaaaaaaaa");
            REQUIRE(heartbeats.GetRegisteredCount() == 0);
            REQUIRE_FALSE(heartbeats.LastBeat("sandcell-aaaaaaaaaaaa").has_value());
        }

        SECTION("The pump never resurrects an unregistered file") {
            heartbeats.StartPump();
            heartbeats.Unregister("sandcell-aaaaaaaaaaaa");
            std::this_thread::sleep_for(50ms);
            heartbeats.StopPump();
            REQUIRE_FALSE(fs::exists(fs::path(dir) / "sandcell-aaaaaaaaaaaa"));
        }

        SECTION("Garbage in a heartbeat file reads as no heartbeat") {
            std::ofstream(fs::path(dir) / "sandcell-bbbbbbbbbbbb") << "not-a-time";
            REQUIRE_FALSE(heartbeats.LastBeat("sandcell-bbbbbbbbbbbb").has_value());
        }
    }
    fs::remove_all(dir);
}

TEST_CASE("OrphanReaper - Staleness", "[sandbox][reaper]") {
    std::string dir = TestDirectory("stale");
    testing::FakeContainerRuntime runtime;
    HeartbeatRegistry heartbeats(dir, 1s);
    ReaperOptions options;
    options.grace_period = 60s;
    OrphanReaper reaper(runtime, heartbeats, options);

    RuntimeContainer container;
    container.name = "sandcell-cccccccccccc";

    SECTION("Fresh creation time without heartbeat is live") {
        container.labels = Labels(Now() - 10);
        REQUIRE_FALSE(reaper.IsStale(container, Now()));
    }

    SECTION("Old creation time without heartbeat is stale") {
        container.labels = Labels(Now() - 600);
        REQUIRE(reaper.IsStale(container, Now()));
    }

    SECTION("A fresh heartbeat outranks an old creation time") {
        container.labels = Labels(Now() - 600);
        heartbeats.Register(container.name);
        REQUIRE_FALSE(reaper.IsStale(container, Now()));
        heartbeats.Unregister(container.name);
    }

    SECTION("An old heartbeat is stale") {
        container.labels = Labels(Now());
        heartbeats.Register(container.name);
        REQUIRE(reaper.IsStale(container, Now() + 120));
        heartbeats.Unregister(container.name);
    }

    SECTION("Unknown age is stale") {
        container.labels = {{kManagedLabel, "true"}};
        REQUIRE(reaper.IsStale(container, Now()));

        container.labels[kCreatedAtLabel] = "yesterday";
        REQUIRE(reaper.IsStale(container, Now()));
    }

    fs::remove_all(dir);
}

TEST_CASE("OrphanReaper - Cleanup", "[sandbox][reaper]") {
    std::string dir = TestDirectory("sweep");
    testing::FakeContainerRuntime runtime;
    HeartbeatRegistry heartbeats(dir, 1s);
    security::AuditLogger audit;
    core::MetricsCollector metrics;
    ReaperOptions options;
    options.grace_period = 60s;
    options.alert_threshold = 2;
    OrphanReaper reaper(runtime, heartbeats, options, &audit, &metrics);

    runtime.AddExisting("sandcell-000000000001", "running", Labels(Now() - 3600));
    runtime.AddExisting("sandcell-000000000002", "exited", Labels(Now() - 3600));
    runtime.AddExisting("sandcell-000000000003", "running", Labels(Now()));
    runtime.AddExisting("unmanaged", "running", {{"other", "x"}});

    SECTION("Removes only stale managed environments") {
        REQUIRE(reaper.Cleanup() == 2);
        REQUIRE(runtime.LiveCount() == 2);
        REQUIRE(reaper.GetTotalRemoved() == 2);

        REQUIRE(audit.CountEvents(security::AuditEvent::ORPHAN_REAPED) == 2);
        REQUIRE(audit.CountEvents(security::AuditEvent::ORPHAN_SWEEP) == 1);
        auto snapshot = metrics.GetSnapshot();
        REQUIRE(snapshot.orphan_sweeps == 1);
        REQUIRE(snapshot.orphans_removed == 2);
    }

    SECTION("A second sweep finds nothing to do") {
        REQUIRE(reaper.Cleanup() == 2);
        REQUIRE(reaper.Cleanup() == 0);
        REQUIRE(runtime.LiveCount() == 2);
    }

    SECTION("Failed removal is counted, not fatal") {
        runtime.fail_remove = true;
        REQUIRE(reaper.Cleanup() == 0);
        REQUIRE(audit.CountEvents(security::AuditEvent::CLEANUP_FAILED) == 2);
        REQUIRE(metrics.GetSnapshot().cleanup_failures == 2);

        runtime.fail_remove = false;
        REQUIRE(reaper.Cleanup() == 2);
    }

    SECTION("Unreachable runtime propagates") {
        runtime.reachable = false;
        REQUIRE_THROWS_AS(reaper.Cleanup(), InfrastructureError);
    }

    SECTION("Concurrent sweeps never double-remove") {
        int first = 0;
        int second = 0;
        std::thread a([&] { first = reaper.Cleanup(); });
        std::thread b([&] { second = reaper.Cleanup(); });
        a.join();
        b.join();
        REQUIRE(first + second == 2);
        REQUIRE(runtime.remove_calls.load() == 2);
    }

    fs::remove_all(dir);
}

TEST_CASE("ReaperScheduler - Sweeps on its interval and stops promptly", "[sandbox][reaper]") {
    std::string dir = TestDirectory("sched");
    testing::FakeContainerRuntime runtime;
    HeartbeatRegistry heartbeats(dir, 1s);
    OrphanReaper reaper(runtime, heartbeats);

    runtime.AddExisting("sandcell-000000000009", "exited", Labels(Now() - 3600));

    ReaperScheduler scheduler(reaper, 1s);
    scheduler.Start();
    REQUIRE(scheduler.IsRunning());

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (scheduler.GetSweepCount() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(20ms);
    }
    REQUIRE(scheduler.GetSweepCount() >= 1);
    REQUIRE(runtime.LiveCount() == 0);

    auto before_stop = std::chrono::steady_clock::now();
    scheduler.Stop();
    REQUIRE(std::chrono::steady_clock::now() - before_stop < 1s);
    REQUIRE_FALSE(scheduler.IsRunning());

    fs::remove_all(dir);
}
