#pragma once

#include "anneal/config.hh"
#include "anneal/state.hh"
#include "anneal/trajectory.hh"
#include "channel/detail_channel.hh"
#include "worker/transport.hh"
#include <atomic>
#include <memory>
#include <optional>
#include <random>

namespace coanneal {

// ============================================================================
// Round and Run Results
// ============================================================================

enum class RoundOutcome : std::uint8_t {
    ACCEPTED,
    REJECTED,
    INCOMPLETE,    // Some cost missing; nothing changed
};

[[nodiscard]] inline std::string_view round_outcome_string(RoundOutcome outcome) {
    switch (outcome) {
        case RoundOutcome::ACCEPTED: return "accepted";
        case RoundOutcome::REJECTED: return "rejected";
        case RoundOutcome::INCOMPLETE: return "incomplete";
    }
    return "unknown";
}

struct RoundReport {
    RoundOutcome outcome = RoundOutcome::INCOMPLETE;
    round_t round = 0;
    std::vector<double> proposal;
    double aggregate_cost = 0.0;
    double probability = 0.0;
    Status error = Status::OK;              // Cause of an incomplete round
    std::string reason;
    std::vector<std::string> missing;       // Workers without a usable cost
};

struct RunResult {
    Status status = Status::OK;
    std::string reason;
    std::vector<double> beta;
    double cost = 0.0;
    double baseline_cost = 0.0;
    double temperature = 0.0;
    std::vector<HistoryEntry> history;
    AnnealCounters counters;

    [[nodiscard]] bool ok() const { return status == Status::OK; }
};

// ============================================================================
// Annealing Controller - master side of the optimization loop
// ============================================================================
//
// One round: publish "<round>;beta" into every worker's account, trigger the
// workers, then collect "<round>;cost" from the master's own account. Each
// evaluation uses a new round id so a cost left over from an earlier round is
// never mistaken for the current one. The master needs a grant from every
// worker, and every worker a grant from the master.
//
// Not thread-safe apart from stop().

class AnnealingController {
public:
    AnnealingController(const Identity& master, LedgerClient& client,
                        WorkerTrigger& trigger, AnnealConfig config);

    void add_sink(std::shared_ptr<TrajectorySink> sink);

    // INIT: measure the baseline cost of the initial beta. Retries incomplete
    // rounds up to max_consecutive_incomplete_rounds times.
    Status initialize();

    // Evaluate one proposal: the pending retry if the previous round was
    // incomplete, otherwise a fresh perturbation of the current beta.
    RoundReport step();

    // Evaluate and decide a caller-supplied proposal
    RoundReport try_proposal(std::vector<double> proposal);

    // Loop until the temperature drops below the minimum, a fatal error, too
    // many consecutive incomplete rounds, or stop()
    RunResult run();

    // Ends run() and every polling loop as soon as possible
    void stop();

    [[nodiscard]] AnnealPhase phase() const { return phase_.load(); }
    [[nodiscard]] const AnnealState& state() const { return state_; }
    [[nodiscard]] const AnnealCounters& counters() const { return counters_; }
    [[nodiscard]] const AnnealConfig& config() const { return config_; }
    [[nodiscard]] double baseline_cost() const { return baseline_cost_; }
    [[nodiscard]] const std::optional<std::vector<double>>& pending_proposal() const {
        return pending_proposal_;
    }
    [[nodiscard]] std::uint32_t consecutive_incomplete() const { return consecutive_incomplete_; }

    // First configuration problem, including a domain other than the master's
    [[nodiscard]] std::optional<std::string> check_config() const;

private:
    struct Evaluation {
        Status status = Status::OK;
        std::string reason;
        round_t round = 0;
        double aggregate = 0.0;
        std::vector<std::string> missing;
    };

    struct WorkerOutcome {
        Status status = Status::OK;
        std::string reason;
        double cost = 0.0;
    };

    const Identity& master_;
    DetailChannel channel_;
    WorkerTrigger& trigger_;
    AnnealConfig config_;

    AnnealState state_;
    AnnealCounters counters_;
    double baseline_cost_ = 0.0;
    bool initialized_ = false;
    std::uint32_t iterations_at_temperature_ = 0;
    std::uint32_t consecutive_incomplete_ = 0;
    std::optional<std::vector<double>> pending_proposal_;

    round_t next_round_;
    std::mt19937_64 rng_;
    std::atomic<AnnealPhase> phase_{AnnealPhase::INIT};
    std::atomic<bool> stop_requested_{false};
    std::vector<std::shared_ptr<TrajectorySink>> sinks_;

    // DISTRIBUTE + COLLECT for one fresh round
    Evaluation evaluate(const std::vector<double>& beta);
    WorkerOutcome distribute_to(const WorkerEndpoint& worker, const std::string& payload);
    WorkerOutcome trigger_worker(const WorkerEndpoint& worker, round_t round);
    WorkerOutcome collect_from(const WorkerEndpoint& worker, round_t round,
                               steady_time_t deadline);

    // Runs fn for every worker, concurrently when parallel_fanout is set
    template <typename Fn>
    std::vector<WorkerOutcome> for_each_worker(Fn&& fn);

    void cool();
    void emit(const TrajectoryRecord& record);
    [[nodiscard]] bool is_fatal(Status status) const;
};

}  // namespace coanneal
