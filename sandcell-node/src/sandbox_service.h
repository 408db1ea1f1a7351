// sandbox_service.h - gRPC front end for validation, execution and reaping
#pragma once

#include <grpcpp/grpcpp.h>
#include <atomic>
#include <memory>
#include <string>

#include "sandbox.grpc.pb.h"
#include "core/sandbox_config.h"

namespace sandcell::node {

namespace security { class SecurityValidator; }
namespace core { class MetricsCollector; }
namespace sandbox {
class ContainerRuntime;
class IsolationLifecycleManager;
class OrphanReaper;
class SandboxExecutor;
}

// Dependencies are owned by the daemon and must outlive the service
struct SandboxServiceDeps {
    security::SecurityValidator* validator = nullptr;
    sandbox::SandboxExecutor* executor = nullptr;
    sandbox::IsolationLifecycleManager* lifecycle = nullptr;
    sandbox::OrphanReaper* reaper = nullptr;
    sandbox::ContainerRuntime* runtime = nullptr;
    core::MetricsCollector* metrics = nullptr;
};

class SandboxServiceImpl final : public sandcell::protocol::SandboxService::Service {
public:
    SandboxServiceImpl(SandboxServiceDeps deps, core::SandboxConfig defaults);
    ~SandboxServiceImpl() override;

    bool StartServer(const std::string& listen_address);
    void StopServer();
    bool IsRunning() const { return is_running_.load(); }

    // Blocks until StopServer is called from another thread
    void Wait();

    grpc::Status Validate(grpc::ServerContext* context,
                          const sandcell::protocol::ValidateRequest* request,
                          sandcell::protocol::ValidateResponse* response) override;

    grpc::Status Execute(grpc::ServerContext* context,
                         const sandcell::protocol::ExecuteRequest* request,
                         sandcell::protocol::ExecuteResponse* response) override;

    grpc::Status Reap(grpc::ServerContext* context,
                      const sandcell::protocol::ReapRequest* request,
                      sandcell::protocol::ReapResponse* response) override;

    grpc::Status GetStatus(grpc::ServerContext* context,
                           const sandcell::protocol::StatusRequest* request,
                           sandcell::protocol::StatusResponse* response) override;

private:
    SandboxServiceDeps deps_;
    core::SandboxConfig defaults_;

    std::unique_ptr<grpc::Server> server_;
    std::atomic<bool> is_running_{false};
};

} // namespace sandcell::node
