#include "transport.hh"
#include "worker/worker_node.hh"
#include "core/logging.hh"
#include <algorithm>
#include <thread>

namespace coanneal {

// ============================================================================
// LocalTransport Implementation
// ============================================================================

void LocalTransport::bind(const std::string& address, std::shared_ptr<WorkerNode> node) {
    std::lock_guard<std::mutex> lock(mutex_);
    nodes_[address] = std::move(node);
}

void LocalTransport::unbind(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    nodes_.erase(address);
}

Status LocalTransport::invoke(const std::string& address, const ComputeCostRequest& request) {
    std::shared_ptr<WorkerNode> node;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = nodes_.find(address);
        if (it != nodes_.end()) {
            node = it->second;
        }
    }
    if (!node) {
        return Status::WORKER_UNREACHABLE;
    }
    return node->enqueue(request);
}

// ============================================================================
// WorkerTrigger Implementation
// ============================================================================

WorkerTrigger::WorkerTrigger(WorkerTransport& transport, TriggerConfig config)
    : transport_(transport)
    , config_(config) {}

Status WorkerTrigger::trigger(const WorkerEndpoint& worker, const ComputeCostRequest& request) {
    const std::uint32_t attempts = std::max<std::uint32_t>(config_.max_attempts, 1);

    Status status = Status::WORKER_UNREACHABLE;
    for (std::uint32_t attempt = 1; attempt <= attempts; ++attempt) {
        status = transport_.invoke(worker.address, request);
        if (status != Status::WORKER_UNREACHABLE) {
            break;
        }
        COANNEAL_LOG_DEBUG(log::trigger) << worker.account.to_string() << " at "
                                         << worker.address << " unreachable (attempt "
                                         << attempt << "/" << attempts << ")";
        if (attempt < attempts) {
            std::this_thread::sleep_for(config_.retry_backoff);
        }
    }

    if (status != Status::OK) {
        log::trigger.warn() << "Trigger of " << worker.account.to_string() << " for round "
                            << request.round << " failed: " << status_string(status);
    }
    return status;
}

}  // namespace coanneal
