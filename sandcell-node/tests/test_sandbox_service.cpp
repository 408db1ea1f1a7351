// test_sandbox_service.cpp - gRPC handlers against a scripted runtime
// Handlers are called directly; one case brings the server up on an ephemeral port

#include <catch2/catch_test_macros.hpp>
#include <grpcpp/grpcpp.h>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <nlohmann/json.hpp>

#include "../src/sandbox_service.h"
#include "../src/sandbox/heartbeat_registry.h"
#include "../src/sandbox/lifecycle_manager.h"
#include "../src/sandbox/orphan_reaper.h"
#include "../src/sandbox/sandbox_executor.h"
#include "../src/security/security_validator.h"
#include "../src/core/metrics_collector.h"
#include "common/version.h"
#include "fake_container_runtime.h"

using namespace sandcell::node;
using namespace sandcell::protocol;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

namespace {

const char* kStrategy =
    "import json\n"
    "with open('/scratch/result.json', 'w') as f:\n"
    "    json.dump({'sharpe_ratio': 1.5}, f)\n";

// Everything the daemon would wire up, backed by the fake runtime
class SandboxServiceFixture {
public:
    SandboxServiceFixture()
        : root_(fs::temp_directory_path() /
                ("sandcell-service-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()))),
          heartbeats_((root_ / "heartbeats").string(), 1s),
          lifecycle_(runtime, heartbeats_, Options(root_), nullptr, &metrics),
          executor_(validator_, lifecycle_, nullptr, &metrics),
          reaper_(runtime, heartbeats_, sandbox::ReaperOptions{}, nullptr, &metrics) {
        SandboxServiceDeps deps;
        deps.validator = &validator_;
        deps.executor = &executor_;
        deps.lifecycle = &lifecycle_;
        deps.reaper = &reaper_;
        deps.runtime = &runtime;
        deps.metrics = &metrics;
        service = std::make_unique<SandboxServiceImpl>(deps, core::SandboxConfig{});

        sandbox::testing::FakeScript script;
        script.duration = 10ms;
        script.output = "computed\n";
        script.result_content = R"({"sharpe_ratio": 1.5})";
        runtime.SetScript(script);
    }

    ~SandboxServiceFixture() {
        service.reset();
        heartbeats_.StopPump();
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    sandbox::testing::FakeContainerRuntime runtime;
    core::MetricsCollector metrics;
    std::unique_ptr<SandboxServiceImpl> service;

private:
    static sandbox::LifecycleOptions Options(const fs::path& root) {
        sandbox::LifecycleOptions options;
        options.work_dir = (root / "staging").string();
        options.max_concurrent = 2;
        return options;
    }

    fs::path root_;
    sandbox::HeartbeatRegistry heartbeats_;
    security::SecurityValidator validator_;
    sandbox::IsolationLifecycleManager lifecycle_;
    sandbox::SandboxExecutor executor_;
    sandbox::OrphanReaper reaper_;
};

} // namespace

TEST_CASE("SandboxService - Server startup", "[service]") {
    SandboxServiceFixture fixture;

    SECTION("Server starts and stops") {
        REQUIRE(fixture.service->StartServer("127.0.0.1:0"));
        REQUIRE(fixture.service->IsRunning());
        fixture.service->StopServer();
        REQUIRE_FALSE(fixture.service->IsRunning());
    }

    SECTION("Server rejects duplicate start") {
        REQUIRE(fixture.service->StartServer("127.0.0.1:0"));
        REQUIRE_FALSE(fixture.service->StartServer("127.0.0.1:0"));
        fixture.service->StopServer();
    }
}

TEST_CASE("SandboxService - Validate", "[service]") {
    SandboxServiceFixture fixture;
    grpc::ServerContext context;
    ValidateRequest request;
    ValidateResponse response;

    SECTION("Violations carry kind and position") {
        request.set_code("import os\n");
        REQUIRE(fixture.service->Validate(&context, &request, &response).ok());
        REQUIRE_FALSE(response.is_valid());
        REQUIRE(response.errors_size() == 1);
        REQUIRE(response.errors(0).rule_kind() == "BlockedImport");
        REQUIRE(response.errors(0).line() == 1);
        REQUIRE(fixture.metrics.GetSnapshot().validations_rejected == 1);
    }

    SECTION("Capabilities extend the allow-list") {
        request.set_code("import sklearn\n");
        request.add_capabilities("sklearn");
        REQUIRE(fixture.service->Validate(&context, &request, &response).ok());
        REQUIRE(response.is_valid());
        REQUIRE(response.errors_size() == 0);
    }
}

TEST_CASE("SandboxService - Execute maps outcomes onto the wire", "[service]") {
    SandboxServiceFixture fixture;
    grpc::ServerContext context;
    ExecuteRequest request;
    ExecuteResponse response;
    request.set_code(kStrategy);
    request.set_timeout_seconds(5);

    SECTION("Success carries the metrics") {
        auto status = fixture.service->Execute(&context, &request, &response);
        REQUIRE(status.ok());
        REQUIRE(response.success());
        REQUIRE(response.error_type() == SUCCESS);
        REQUIRE(response.has_metrics());
        REQUIRE(response.metrics().at("sharpe_ratio") == 1.5);
        REQUIRE(response.exit_code() == 0);
        REQUIRE(response.diagnostics().find("computed") != std::string::npos);
        REQUIRE_FALSE(response.environment_id().empty());
    }

    SECTION("Rejected code") {
        request.set_code("import os\neval('1')\n");
        REQUIRE(fixture.service->Execute(&context, &request, &response).ok());
        REQUIRE_FALSE(response.success());
        REQUIRE(response.error_type() == VALIDATION_REJECTED);
        REQUIRE(response.validation_errors_size() == 2);
        REQUIRE(fixture.runtime.create_calls.load() == 0);
    }

    SECTION("Clean exit without a result") {
        sandbox::testing::FakeScript script;
        script.duration = 10ms;
        fixture.runtime.SetScript(script);
        REQUIRE(fixture.service->Execute(&context, &request, &response).ok());
        REQUIRE(response.error_type() == MISSING_RESULT);
        REQUIRE_FALSE(response.has_metrics());
    }

    SECTION("Crash") {
        sandbox::testing::FakeScript script;
        script.duration = 10ms;
        script.exit_code = 1;
        script.output = "Traceback (most recent call last):\n";
        fixture.runtime.SetScript(script);
        REQUIRE(fixture.service->Execute(&context, &request, &response).ok());
        REQUIRE(response.error_type() == NONZERO_EXIT);
        REQUIRE(response.exit_code() == 1);
    }

    SECTION("Timeout") {
        sandbox::testing::FakeScript script;
        script.duration = 30s;
        fixture.runtime.SetScript(script);
        request.set_timeout_seconds(1);
        REQUIRE(fixture.service->Execute(&context, &request, &response).ok());
        REQUIRE(response.error_type() == TIMEOUT);
        REQUIRE_FALSE(response.success());
        REQUIRE(fixture.runtime.LiveCount() == 0);
    }
}

TEST_CASE("SandboxService - Execute rejects bad requests before allocating", "[service]") {
    SandboxServiceFixture fixture;
    grpc::ServerContext context;
    ExecuteRequest request;
    ExecuteResponse response;
    request.set_code(kStrategy);

    SECTION("Timeout above the ceiling") {
        request.set_timeout_seconds(core::kMaxTimeoutSeconds + 1);
        auto status = fixture.service->Execute(&context, &request, &response);
        REQUIRE(status.error_code() == grpc::StatusCode::INVALID_ARGUMENT);
    }

    SECTION("Invalid policy override") {
        request.set_timeout_seconds(5);
        request.mutable_policy()->set_max_pids(0);
        auto status = fixture.service->Execute(&context, &request, &response);
        REQUIRE(status.error_code() == grpc::StatusCode::INVALID_ARGUMENT);
    }

    SECTION("Sample interval longer than a window") {
        request.set_timeout_seconds(5);
        request.mutable_policy()->set_cpu_sustained_window_ms(100);
        request.mutable_policy()->set_sample_interval_ms(1000);
        auto status = fixture.service->Execute(&context, &request, &response);
        REQUIRE(status.error_code() == grpc::StatusCode::INVALID_ARGUMENT);
    }

    REQUIRE(fixture.runtime.create_calls.load() == 0);
}

TEST_CASE("SandboxService - Runtime failures are UNAVAILABLE", "[service]") {
    SandboxServiceFixture fixture;
    grpc::ServerContext context;

    SECTION("Execute with the runtime unreachable") {
        fixture.runtime.reachable = false;
        ExecuteRequest request;
        ExecuteResponse response;
        request.set_code(kStrategy);
        request.set_timeout_seconds(5);

        auto status = fixture.service->Execute(&context, &request, &response);
        REQUIRE(status.error_code() == grpc::StatusCode::UNAVAILABLE);
        REQUIRE(fixture.metrics.GetSnapshot().infrastructure_errors == 1);
    }

    SECTION("Reap when listing fails") {
        fixture.runtime.fail_list = true;
        ReapRequest request;
        ReapResponse response;
        auto status = fixture.service->Reap(&context, &request, &response);
        REQUIRE(status.error_code() == grpc::StatusCode::UNAVAILABLE);
    }
}

TEST_CASE("SandboxService - Reap and status", "[service]") {
    SandboxServiceFixture fixture;
    grpc::ServerContext context;

    SECTION("Reap removes stale environments") {
        int64_t stale = static_cast<int64_t>(std::time(nullptr)) - 3600;
        fixture.runtime.AddExisting("sandcell-00000000000a", "exited",
                                    {{sandbox::kManagedLabel, "true"},
                                     {sandbox::kCreatedAtLabel, std::to_string(stale)}});
        ReapRequest request;
        ReapResponse response;
        REQUIRE(fixture.service->Reap(&context, &request, &response).ok());
        REQUIRE(response.removed() == 1);
        REQUIRE(fixture.runtime.LiveCount() == 0);
    }

    SECTION("Status reports version, reachability and load") {
        StatusRequest request;
        StatusResponse response;
        REQUIRE(fixture.service->GetStatus(&context, &request, &response).ok());
        REQUIRE(response.version().major() == kVersionMajor);
        REQUIRE(response.version().minor() == kVersionMinor);
        REQUIRE(response.runtime_reachable());
        REQUIRE(response.active_environments() == 0);
        REQUIRE(nlohmann::json::parse(response.metrics_json()).is_object());

        fixture.runtime.reachable = false;
        StatusResponse unreachable;
        REQUIRE(fixture.service->GetStatus(&context, &request, &unreachable).ok());
        REQUIRE_FALSE(unreachable.runtime_reachable());
    }
}
