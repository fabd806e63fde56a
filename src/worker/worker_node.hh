#pragma once

#include "worker/protocol.hh"
#include "channel/detail_channel.hh"
#include "identity/identity.hh"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <queue>
#include <span>
#include <thread>

namespace coanneal {

// Private-data cost function; may throw to report a failed evaluation
using CostFunction = std::function<double(std::span<const double> beta)>;

struct WorkerConfig {
    std::chrono::milliseconds parameter_timeout{5000};
    std::chrono::milliseconds poll_interval{10};
    std::string network_location;       // Empty accepts any requester location
    std::size_t max_queue_size = 64;
};

// ============================================================================
// Worker Node - evaluates cost requests in the background
// ============================================================================
//
// Requests are queued by a transport and processed one at a time on the
// node's own thread: read parameters for the request round from the node's
// account, evaluate the objective, publish "<round>;<cost>" (or a failure
// marker) into the requester's account under "cost". The requester must have
// granted this node can_set_my_account_detail beforehand.

class WorkerNode {
public:
    WorkerNode(Identity identity, LedgerClient& client, WorkerConfig config = {});
    ~WorkerNode();

    WorkerNode(const WorkerNode&) = delete;
    WorkerNode& operator=(const WorkerNode&) = delete;

    void register_objective(const std::string& name, CostFunction fn);

    void start();
    void stop();
    [[nodiscard]] bool is_running() const { return running_.load(); }

    // Queue a request; WORKER_UNREACHABLE when stopped or saturated
    [[nodiscard]] Status enqueue(ComputeCostRequest request);

    // Process one request on the calling thread
    Status handle(const ComputeCostRequest& request);

    // Block until the queue is empty and nothing is being processed
    void wait_idle();

    [[nodiscard]] const Identity& identity() const { return identity_; }
    [[nodiscard]] const WorkerConfig& config() const { return config_; }
    [[nodiscard]] std::uint64_t completed() const { return completed_.load(); }
    [[nodiscard]] std::uint64_t failed() const { return failed_.load(); }

private:
    Identity identity_;
    DetailChannel channel_;
    WorkerConfig config_;

    std::map<std::string, CostFunction> objectives_;
    mutable std::mutex objectives_mutex_;

    std::queue<ComputeCostRequest> queue_;
    std::size_t in_flight_ = 0;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::thread worker_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};

    std::atomic<std::uint64_t> completed_{0};
    std::atomic<std::uint64_t> failed_{0};

    void worker_loop();
    [[nodiscard]] std::optional<CostFunction> objective(const std::string& name) const;
    Status report_failure(const AccountId& writer, round_t round, std::string_view why);
};

}  // namespace coanneal
