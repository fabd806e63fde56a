#pragma once

#include "worker/protocol.hh"
#include "core/status.hh"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>

namespace coanneal {

class WorkerNode;

// ============================================================================
// Worker Transport - fire-and-continue remote invocation
// ============================================================================
//
// invoke() returns once the worker has accepted the request. It says nothing
// about the evaluation itself; the result travels back through the ledger.

class WorkerTransport {
public:
    virtual ~WorkerTransport() = default;

    virtual Status invoke(const std::string& address, const ComputeCostRequest& request) = 0;
};

// In-process address table
class LocalTransport : public WorkerTransport {
public:
    void bind(const std::string& address, std::shared_ptr<WorkerNode> node);
    void unbind(const std::string& address);

    Status invoke(const std::string& address, const ComputeCostRequest& request) override;

private:
    std::map<std::string, std::shared_ptr<WorkerNode>> nodes_;
    std::mutex mutex_;
};

// ============================================================================
// Worker Trigger - bounded retries over a transport
// ============================================================================

struct TriggerConfig {
    std::uint32_t max_attempts = 3;
    std::chrono::milliseconds retry_backoff{20};
};

class WorkerTrigger {
public:
    explicit WorkerTrigger(WorkerTransport& transport, TriggerConfig config = {});

    // Retries WORKER_UNREACHABLE only; every other status is returned as is
    Status trigger(const WorkerEndpoint& worker, const ComputeCostRequest& request);

    [[nodiscard]] const TriggerConfig& config() const { return config_; }

private:
    WorkerTransport& transport_;
    TriggerConfig config_;
};

}  // namespace coanneal
