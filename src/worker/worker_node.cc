#include "worker_node.hh"
#include "core/logging.hh"
#include <cmath>
#include <exception>

namespace coanneal {

WorkerNode::WorkerNode(Identity identity, LedgerClient& client, WorkerConfig config)
    : identity_(std::move(identity))
    , channel_(client)
    , config_(std::move(config)) {}

WorkerNode::~WorkerNode() {
    stop();
}

void WorkerNode::register_objective(const std::string& name, CostFunction fn) {
    std::lock_guard<std::mutex> lock(objectives_mutex_);
    objectives_[name] = std::move(fn);
}

std::optional<CostFunction> WorkerNode::objective(const std::string& name) const {
    std::lock_guard<std::mutex> lock(objectives_mutex_);
    auto it = objectives_.find(name);
    if (it == objectives_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void WorkerNode::start() {
    if (running_.exchange(true)) {
        return;
    }
    stopping_.store(false);
    worker_thread_ = std::thread(&WorkerNode::worker_loop, this);
    log::worker.info() << identity_.account_id() << " started";
}

void WorkerNode::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load()) {
            return;
        }
        stopping_.store(true);
        running_.store(false);
    }
    cv_.notify_all();

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!queue_.empty()) {
        log::worker.warn() << identity_.account_id() << " dropped " << queue_.size()
                           << " queued requests on stop";
    }
    std::queue<ComputeCostRequest>().swap(queue_);
    idle_cv_.notify_all();
}

Status WorkerNode::enqueue(ComputeCostRequest request) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load()) {
            return Status::WORKER_UNREACHABLE;
        }
        if (queue_.size() >= config_.max_queue_size) {
            log::worker.warn() << identity_.account_id() << " queue full, refusing round "
                               << request.round;
            return Status::WORKER_UNREACHABLE;
        }
        queue_.push(std::move(request));
    }
    cv_.notify_one();
    return Status::OK;
}

void WorkerNode::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]() {
        return (queue_.empty() && in_flight_ == 0) || !running_.load();
    });
}

void WorkerNode::worker_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load()) {
        cv_.wait(lock, [this]() {
            return !queue_.empty() || !running_.load();
        });

        while (!queue_.empty() && running_.load()) {
            ComputeCostRequest request = std::move(queue_.front());
            queue_.pop();
            ++in_flight_;
            lock.unlock();

            (void)handle(request);

            lock.lock();
            --in_flight_;
        }
        idle_cv_.notify_all();
    }
}

Status WorkerNode::handle(const ComputeCostRequest& request) {
    if (request.procedure != COMPUTE_COST_PROCEDURE) {
        log::worker.warn() << "Unknown procedure '" << request.procedure << "'";
        failed_.fetch_add(1);
        return Status::INVALID_ARGUMENT;
    }
    if (!config_.network_location.empty() &&
        request.network_location != config_.network_location) {
        log::worker.warn() << identity_.account_id() << " ignoring request from network "
                           << request.network_location;
        failed_.fetch_add(1);
        return Status::INVALID_ARGUMENT;
    }

    const auto writer = request.writer();
    if (!writer.is_valid()) {
        log::worker.warn() << "Malformed requester " << writer.to_string();
        failed_.fetch_add(1);
        return Status::INVALID_ARGUMENT;
    }

    COANNEAL_LOG_DEBUG(log::worker) << identity_.account_id() << " round " << request.round
                                    << " for " << writer.to_string();

    const auto round = request.round;
    auto polled = channel_.poll(
        identity_, writer, std::string(PARAMETER_KEY),
        [round](const std::string& value) { return peek_round(value) == round; },
        PollOptions{config_.parameter_timeout, config_.poll_interval},
        [this]() { return stopping_.load(); });

    if (polled.status == Status::CANCELLED) {
        failed_.fetch_add(1);
        return Status::CANCELLED;
    }
    if (!polled.ok()) {
        return report_failure(writer, round, "parameters unavailable");
    }

    auto params = decode_parameters(polled.value);
    if (!params) {
        return report_failure(writer, round, "unreadable parameters");
    }

    auto fn = objective(request.objective);
    if (!fn) {
        return report_failure(writer, round, "unknown objective '" + request.objective + "'");
    }

    double cost = 0.0;
    try {
        cost = (*fn)(params->beta);
    } catch (const std::exception& e) {
        return report_failure(writer, round, std::string("objective threw: ") + e.what());
    } catch (...) {
        return report_failure(writer, round, "objective threw a non-standard exception");
    }
    if (!std::isfinite(cost)) {
        return report_failure(writer, round, "objective returned a non-finite cost");
    }

    auto published = channel_.publish_to(identity_, writer, std::string(COST_KEY),
                                         encode_cost(round, cost));
    if (!published.ok()) {
        failed_.fetch_add(1);
        return Status::WORKER_FAILED;
    }

    completed_.fetch_add(1);
    COANNEAL_LOG_DEBUG(log::worker) << identity_.account_id() << " round " << round
                                    << " cost " << format_double(cost);
    return Status::OK;
}

Status WorkerNode::report_failure(const AccountId& writer, round_t round, std::string_view why) {
    failed_.fetch_add(1);
    log::worker.warn() << identity_.account_id() << " round " << round << ": " << why;

    auto published = channel_.publish_to(identity_, writer, std::string(COST_KEY),
                                         encode_failure(round));
    if (!published.ok()) {
        log::worker.error() << identity_.account_id() << " could not report failure to "
                            << writer.to_string() << ": " << status_string(published.status);
    }
    return Status::WORKER_FAILED;
}

}  // namespace coanneal
