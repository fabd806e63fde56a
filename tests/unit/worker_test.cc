#include "unit/fixtures.hh"
#include "worker/worker_node.hh"
#include "worker/transport.hh"
#include "channel/permission_registry.hh"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace coanneal {
namespace {

double sum(std::span<const double> beta) {
    return std::accumulate(beta.begin(), beta.end(), 0.0);
}

class WorkerNodeTest : public test::LedgerFixture {
protected:
    void SetUp() override {
        LedgerFixture::SetUp();
        master.emplace(add_account("master"));
        channel = std::make_unique<DetailChannel>(*client);
        permissions = std::make_unique<PermissionRegistry>(*client);

        auto worker_identity = add_account("worker");
        ASSERT_TRUE(permissions->grant(worker_identity, master->account()).ok());
        ASSERT_TRUE(permissions->grant(*master, worker_identity.account()).ok());

        WorkerConfig config;
        config.parameter_timeout = std::chrono::milliseconds(100);
        config.poll_interval = std::chrono::milliseconds(2);
        config.network_location = "lab";
        node = std::make_shared<WorkerNode>(std::move(worker_identity), *client, config);
        node->register_objective("sum", sum);
    }

    ComputeCostRequest request(round_t round, std::string objective = "sum") const {
        ComputeCostRequest r;
        r.writer_name = master->name();
        r.domain = master->domain();
        r.network_location = "lab";
        r.objective = std::move(objective);
        r.round = round;
        return r;
    }

    void publish_params(round_t round, std::vector<double> beta) {
        ASSERT_TRUE(channel->publish_to(*master, node->identity().account(),
                                        std::string(PARAMETER_KEY),
                                        encode_parameters(round, beta)).ok());
    }

    std::optional<std::string> cost_in_master() {
        return channel->read(*master, std::string(COST_KEY))
            .value(node->identity().account_id(), std::string(COST_KEY));
    }

    std::optional<Identity> master;
    std::unique_ptr<DetailChannel> channel;
    std::unique_ptr<PermissionRegistry> permissions;
    std::shared_ptr<WorkerNode> node;
};

// ============================================================================
// WorkerNode::handle
// ============================================================================

TEST_F(WorkerNodeTest, EvaluatesAndPublishesCost) {
    publish_params(11, {0.1, 0.2, 0.3});

    EXPECT_EQ(node->handle(request(11)), Status::OK);

    auto cost = cost_in_master();
    ASSERT_TRUE(cost.has_value());
    auto decoded = decode_cost(*cost);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->round, 11);
    ASSERT_FALSE(decoded->failed());
    EXPECT_NEAR(*decoded->cost, 0.6, 1e-12);
    EXPECT_EQ(node->completed(), 1);
}

TEST_F(WorkerNodeTest, StaleParametersAreIgnored) {
    publish_params(4, {1.0});

    // Round 5 never arrives
    EXPECT_EQ(node->handle(request(5)), Status::WORKER_FAILED);
    EXPECT_EQ(cost_in_master(), encode_failure(5));
}

TEST_F(WorkerNodeTest, UnknownObjectiveReportsFailure) {
    publish_params(2, {1.0});
    EXPECT_EQ(node->handle(request(2, "missing")), Status::WORKER_FAILED);
    EXPECT_EQ(cost_in_master(), "2;error");
    EXPECT_EQ(node->failed(), 1);
}

TEST_F(WorkerNodeTest, ThrowingObjectiveReportsFailure) {
    node->register_objective("broken", [](std::span<const double>) -> double {
        throw std::runtime_error("private data unavailable");
    });
    publish_params(3, {1.0});

    EXPECT_EQ(node->handle(request(3, "broken")), Status::WORKER_FAILED);
    EXPECT_EQ(cost_in_master(), "3;error");
}

TEST_F(WorkerNodeTest, NonStandardExceptionReportsFailure) {
    node->register_objective("int_thrower", [](std::span<const double>) -> double {
        throw 42;
    });
    publish_params(12, {1.0});

    EXPECT_EQ(node->handle(request(12, "int_thrower")), Status::WORKER_FAILED);
    EXPECT_EQ(cost_in_master(), "12;error");
    EXPECT_EQ(node->failed(), 1);
}

TEST_F(WorkerNodeTest, NonStandardExceptionKeepsWorkerRunning) {
    node->register_objective("int_thrower", [](std::span<const double>) -> double {
        throw 42;
    });
    node->start();

    publish_params(13, {1.0});
    ASSERT_EQ(node->enqueue(request(13, "int_thrower")), Status::OK);
    node->wait_idle();
    EXPECT_EQ(cost_in_master(), "13;error");
    EXPECT_TRUE(node->is_running());

    publish_params(14, {2.0});
    ASSERT_EQ(node->enqueue(request(14)), Status::OK);
    node->wait_idle();
    EXPECT_EQ(cost_in_master(), encode_cost(14, 2.0));
    node->stop();
}

TEST_F(WorkerNodeTest, NonFiniteCostReportsFailure) {
    node->register_objective("log", [](std::span<const double> b) { return std::log(b[0]); });
    publish_params(6, {-1.0});

    EXPECT_EQ(node->handle(request(6, "log")), Status::WORKER_FAILED);
    EXPECT_EQ(cost_in_master(), "6;error");
}

TEST_F(WorkerNodeTest, NetworkMismatchRefusedWithoutPublishing) {
    publish_params(7, {1.0});
    auto r = request(7);
    r.network_location = "elsewhere";

    EXPECT_EQ(node->handle(r), Status::INVALID_ARGUMENT);
    EXPECT_FALSE(cost_in_master().has_value());
}

TEST_F(WorkerNodeTest, UnknownProcedureRefused) {
    auto r = request(8);
    r.procedure = "drop_tables";
    EXPECT_EQ(node->handle(r), Status::INVALID_ARGUMENT);
    EXPECT_FALSE(cost_in_master().has_value());
}

TEST_F(WorkerNodeTest, MissingGrantMeansNoCost) {
    ASSERT_TRUE(permissions->revoke(*master, node->identity().account()).ok());
    publish_params(9, {1.0});

    EXPECT_EQ(node->handle(request(9)), Status::WORKER_FAILED);
    EXPECT_FALSE(cost_in_master().has_value());
}

// ============================================================================
// Background processing
// ============================================================================

TEST_F(WorkerNodeTest, EnqueueRequiresRunning) {
    EXPECT_EQ(node->enqueue(request(1)), Status::WORKER_UNREACHABLE);
}

TEST_F(WorkerNodeTest, ProcessesQueuedRequests) {
    node->start();
    EXPECT_TRUE(node->is_running());

    publish_params(21, {1.0, 2.0});
    ASSERT_EQ(node->enqueue(request(21)), Status::OK);
    node->wait_idle();

    EXPECT_EQ(cost_in_master(), encode_cost(21, 3.0));
    node->stop();
    EXPECT_FALSE(node->is_running());
}

TEST_F(WorkerNodeTest, StopCancelsParameterWait) {
    node->start();
    ASSERT_EQ(node->enqueue(request(30)), Status::OK);

    auto started = std::chrono::steady_clock::now();
    node->stop();
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(2000));
    EXPECT_EQ(node->enqueue(request(31)), Status::WORKER_UNREACHABLE);
}

// ============================================================================
// Transport and Trigger
// ============================================================================

TEST_F(WorkerNodeTest, LocalTransportRoutesByAddress) {
    LocalTransport transport;
    EXPECT_EQ(transport.invoke("inproc://worker", request(1)), Status::WORKER_UNREACHABLE);

    node->start();
    transport.bind("inproc://worker", node);
    publish_params(40, {0.5});
    EXPECT_EQ(transport.invoke("inproc://worker", request(40)), Status::OK);
    node->wait_idle();
    EXPECT_EQ(cost_in_master(), encode_cost(40, 0.5));

    transport.unbind("inproc://worker");
    EXPECT_EQ(transport.invoke("inproc://worker", request(41)), Status::WORKER_UNREACHABLE);
}

class ScriptedTransport : public WorkerTransport {
public:
    explicit ScriptedTransport(std::vector<Status> replies) : replies_(std::move(replies)) {}

    Status invoke(const std::string&, const ComputeCostRequest&) override {
        auto i = std::min(calls++, replies_.size() - 1);
        return replies_[i];
    }

    std::size_t calls = 0;

private:
    std::vector<Status> replies_;
};

WorkerEndpoint endpoint() {
    return WorkerEndpoint{AccountId{"worker", "test"}, "inproc://worker"};
}

TEST(WorkerTriggerTest, RetriesUnreachable) {
    ScriptedTransport transport({Status::WORKER_UNREACHABLE, Status::WORKER_UNREACHABLE,
                                 Status::OK});
    WorkerTrigger trigger(transport, TriggerConfig{5, std::chrono::milliseconds(1)});

    EXPECT_EQ(trigger.trigger(endpoint(), ComputeCostRequest{}), Status::OK);
    EXPECT_EQ(transport.calls, 3);
}

TEST(WorkerTriggerTest, GivesUpAfterMaxAttempts) {
    ScriptedTransport transport({Status::WORKER_UNREACHABLE});
    WorkerTrigger trigger(transport, TriggerConfig{3, std::chrono::milliseconds(1)});

    EXPECT_EQ(trigger.trigger(endpoint(), ComputeCostRequest{}), Status::WORKER_UNREACHABLE);
    EXPECT_EQ(transport.calls, 3);
}

TEST(WorkerTriggerTest, OtherErrorsAreNotRetried) {
    ScriptedTransport transport({Status::INVALID_ARGUMENT, Status::OK});
    WorkerTrigger trigger(transport, TriggerConfig{3, std::chrono::milliseconds(1)});

    EXPECT_EQ(trigger.trigger(endpoint(), ComputeCostRequest{}), Status::INVALID_ARGUMENT);
    EXPECT_EQ(transport.calls, 1);
}

}  // namespace
}  // namespace coanneal
