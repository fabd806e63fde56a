#include "controller.hh"
#include "core/logging.hh"
#include <sstream>
#include <system_error>
#include <thread>

namespace coanneal {

namespace {

std::string describe(const std::vector<double>& beta) {
    std::ostringstream oss;
    oss << "(";
    for (std::size_t i = 0; i < beta.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << format_double(beta[i]);
    }
    oss << ")";
    return oss.str();
}

std::uint64_t make_seed(const std::optional<std::uint64_t>& seed) {
    if (seed) {
        return *seed;
    }
    std::random_device rd;
    return (static_cast<std::uint64_t>(rd()) << 32) | rd();
}

}  // namespace

AnnealingController::AnnealingController(const Identity& master, LedgerClient& client,
                                         WorkerTrigger& trigger, AnnealConfig config)
    : master_(master)
    , channel_(client)
    , trigger_(trigger)
    , config_(std::move(config))
    , next_round_(static_cast<round_t>(now_ms()) << 20)
    , rng_(make_seed(config_.seed)) {
    state_.beta = config_.initial_beta;
    state_.temperature = config_.schedule.initial_temperature;
}

void AnnealingController::add_sink(std::shared_ptr<TrajectorySink> sink) {
    sinks_.push_back(std::move(sink));
}

void AnnealingController::stop() {
    stop_requested_.store(true);
}

std::optional<std::string> AnnealingController::check_config() const {
    if (auto problem = validate(config_)) {
        return problem;
    }
    // Workers address their costs to master name @ configured domain
    if (config_.domain != master_.domain()) {
        return "domain '" + config_.domain + "' does not match master " + master_.account_id();
    }
    return std::nullopt;
}

bool AnnealingController::is_fatal(Status status) const {
    return status == Status::INVALID_SIGNATURE || status == Status::VALUE_TOO_LARGE;
}

// ============================================================================
// INIT
// ============================================================================

Status AnnealingController::initialize() {
    phase_.store(AnnealPhase::INIT);

    if (auto problem = check_config()) {
        log::anneal.error() << "Invalid configuration: " << *problem;
        return Status::INVALID_ARGUMENT;
    }

    state_.beta = config_.initial_beta;
    state_.temperature = config_.schedule.initial_temperature;

    for (std::uint32_t attempt = 1; attempt <= config_.max_consecutive_incomplete_rounds;
         ++attempt) {
        if (stop_requested_.load()) {
            return Status::CANCELLED;
        }

        auto eval = evaluate(state_.beta);
        if (eval.status == Status::OK) {
            baseline_cost_ = eval.aggregate;
            state_.current_cost = eval.aggregate;
            initialized_ = true;
            consecutive_incomplete_ = 0;
            phase_.store(config_.schedule.finished(state_.temperature)
                             ? AnnealPhase::TERMINATED
                             : AnnealPhase::DISTRIBUTE);
            log::anneal.info() << "Baseline cost " << format_double(baseline_cost_)
                               << " for " << describe(state_.beta) << " with "
                               << config_.workers.size() << " workers";
            return Status::OK;
        }

        ++counters_.incomplete;
        if (is_fatal(eval.status) || eval.status == Status::CANCELLED) {
            return eval.status;
        }
        log::anneal.warn() << "Baseline round " << eval.round << " incomplete (attempt "
                           << attempt << "): " << eval.reason;
    }
    return Status::INCOMPLETE_ROUND;
}

// ============================================================================
// DISTRIBUTE / COLLECT
// ============================================================================

template <typename Fn>
std::vector<AnnealingController::WorkerOutcome> AnnealingController::for_each_worker(Fn&& fn) {
    const auto& workers = config_.workers;
    std::vector<WorkerOutcome> outcomes(workers.size());

    if (!config_.parallel_fanout || workers.size() < 2) {
        for (std::size_t i = 0; i < workers.size(); ++i) {
            outcomes[i] = fn(workers[i]);
        }
        return outcomes;
    }

    std::vector<std::thread> threads;
    threads.reserve(workers.size());
    for (std::size_t i = 0; i < workers.size(); ++i) {
        try {
            threads.emplace_back([&fn, &workers, &outcomes, i]() {
                outcomes[i] = fn(workers[i]);
            });
        } catch (const std::system_error& e) {
            // Out of threads: finish the rest here, then join what was started
            log::anneal.warn() << "Cannot start fan-out thread (" << e.what()
                               << "), continuing sequentially";
            for (std::size_t j = i; j < workers.size(); ++j) {
                outcomes[j] = fn(workers[j]);
            }
            break;
        }
    }
    for (auto& thread : threads) {
        thread.join();
    }
    return outcomes;
}

AnnealingController::WorkerOutcome AnnealingController::distribute_to(
    const WorkerEndpoint& worker, const std::string& payload) {
    auto result = channel_.publish_to(master_, worker.account, std::string(PARAMETER_KEY),
                                      payload);
    return WorkerOutcome{result.status, std::move(result.reason), 0.0};
}

AnnealingController::WorkerOutcome AnnealingController::trigger_worker(
    const WorkerEndpoint& worker, round_t round) {
    ComputeCostRequest request;
    request.writer_name = master_.name();
    request.domain = master_.domain();
    request.network_location = config_.network_location;
    request.objective = config_.objective;
    request.round = round;

    auto status = trigger_.trigger(worker, request);
    return WorkerOutcome{status, status == Status::OK ? std::string() : "trigger failed", 0.0};
}

AnnealingController::WorkerOutcome AnnealingController::collect_from(
    const WorkerEndpoint& worker, round_t round, steady_time_t deadline) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() < 0) {
        remaining = std::chrono::milliseconds(0);
    }

    auto polled = channel_.poll(
        master_, worker.account, std::string(COST_KEY),
        [round](const std::string& value) { return peek_round(value) == round; },
        PollOptions{remaining, config_.timeouts.poll_interval},
        [this]() { return stop_requested_.load(); });
    if (!polled.ok()) {
        return WorkerOutcome{polled.status, std::move(polled.reason), 0.0};
    }

    auto message = decode_cost(polled.value);
    if (!message) {
        return WorkerOutcome{Status::WORKER_FAILED, "unreadable cost '" + polled.value + "'", 0.0};
    }
    if (message->failed()) {
        return WorkerOutcome{Status::WORKER_FAILED, "worker reported a failed evaluation", 0.0};
    }
    return WorkerOutcome{Status::OK, {}, *message->cost};
}

AnnealingController::Evaluation AnnealingController::evaluate(const std::vector<double>& beta) {
    Evaluation eval;
    eval.round = next_round_++;
    ++counters_.rounds;

    // Folds per-worker failures into the evaluation; false if any worker failed
    auto absorb = [this, &eval](const std::vector<WorkerOutcome>& outcomes, const char* stage) {
        bool complete = true;
        for (std::size_t i = 0; i < outcomes.size(); ++i) {
            const auto& outcome = outcomes[i];
            if (outcome.status == Status::OK) {
                continue;
            }
            complete = false;
            const auto worker_id = config_.workers[i].account.to_string();
            eval.missing.push_back(worker_id);
            if (eval.reason.empty()) {
                eval.reason = std::string(stage) + " " + worker_id + ": " +
                              std::string(status_string(outcome.status)) +
                              (outcome.reason.empty() ? "" : " (" + outcome.reason + ")");
            }
            if (is_fatal(outcome.status)) {
                eval.status = outcome.status;
            } else if (outcome.status == Status::CANCELLED && !is_fatal(eval.status)) {
                eval.status = Status::CANCELLED;
            } else if (eval.status == Status::OK) {
                eval.status = Status::INCOMPLETE_ROUND;
            }
        }
        return complete;
    };

    phase_.store(AnnealPhase::DISTRIBUTE);
    const auto payload = encode_parameters(eval.round, beta);

    // Every publish must be committed before any worker is triggered
    auto published = for_each_worker([this, &payload](const WorkerEndpoint& worker) {
        return distribute_to(worker, payload);
    });
    if (!absorb(published, "publish to")) {
        return eval;
    }

    const auto round = eval.round;
    auto triggered = for_each_worker([this, round](const WorkerEndpoint& worker) {
        return trigger_worker(worker, round);
    });
    if (!absorb(triggered, "trigger")) {
        return eval;
    }

    phase_.store(AnnealPhase::COLLECT);
    const auto deadline = std::chrono::steady_clock::now() + config_.timeouts.collect;
    auto collected = for_each_worker([this, round, deadline](const WorkerEndpoint& worker) {
        return collect_from(worker, round, deadline);
    });
    if (!absorb(collected, "collect from")) {
        return eval;
    }

    for (const auto& outcome : collected) {
        eval.aggregate += outcome.cost;
    }
    COANNEAL_LOG_DEBUG(log::anneal) << "Round " << eval.round << " aggregate "
                                    << format_double(eval.aggregate);
    return eval;
}

// ============================================================================
// DECIDE / COOL
// ============================================================================

RoundReport AnnealingController::step() {
    auto proposal = pending_proposal_
        ? *pending_proposal_
        : perturb(state_.beta, config_.perturbation, rng_);
    return try_proposal(std::move(proposal));
}

RoundReport AnnealingController::try_proposal(std::vector<double> proposal) {
    RoundReport report;
    report.proposal = proposal;

    if (!initialized_) {
        auto status = initialize();
        if (status != Status::OK) {
            report.error = status;
            report.reason = "baseline cost unavailable";
            return report;
        }
    }
    if (phase_.load() == AnnealPhase::TERMINATED) {
        report.error = Status::INVALID_ARGUMENT;
        report.reason = "annealing already terminated";
        return report;
    }
    if (proposal.size() != state_.beta.size()) {
        report.error = Status::INVALID_ARGUMENT;
        report.reason = "proposal has " + std::to_string(proposal.size()) +
                        " coordinates, expected " + std::to_string(state_.beta.size());
        return report;
    }

    auto eval = evaluate(proposal);
    report.round = eval.round;

    if (eval.status != Status::OK) {
        ++counters_.incomplete;
        ++consecutive_incomplete_;
        pending_proposal_ = std::move(proposal);
        phase_.store(AnnealPhase::DISTRIBUTE);

        report.error = eval.status;
        report.reason = std::move(eval.reason);
        report.missing = std::move(eval.missing);
        log::anneal.warn() << "Round " << report.round << " incomplete ("
                           << consecutive_incomplete_ << " in a row): " << report.reason;
        return report;
    }

    consecutive_incomplete_ = 0;
    pending_proposal_.reset();

    phase_.store(AnnealPhase::DECIDE);
    const double probability = acceptance_probability(state_.current_cost, eval.aggregate,
                                                      state_.temperature);
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    const bool accepted = probability > uniform(rng_);

    ++state_.iteration;
    ++counters_.evaluated;

    if (accepted) {
        ++counters_.accepted;
        state_.beta = proposal;
        state_.current_cost = eval.aggregate;
        state_.history.push_back(HistoryEntry{state_.iteration, eval.round, proposal,
                                              eval.aggregate, state_.temperature});
        COANNEAL_LOG_DEBUG(log::anneal) << "Accepted " << describe(proposal) << " cost "
                                        << format_double(eval.aggregate);
    } else {
        ++counters_.rejected;
    }

    emit(TrajectoryRecord{state_.iteration, eval.round, proposal, eval.aggregate,
                          state_.temperature, accepted});

    report.outcome = accepted ? RoundOutcome::ACCEPTED : RoundOutcome::REJECTED;
    report.aggregate_cost = eval.aggregate;
    report.probability = probability;
    report.proposal = std::move(proposal);

    cool();
    return report;
}

void AnnealingController::cool() {
    phase_.store(AnnealPhase::COOL);

    if (++iterations_at_temperature_ >= config_.schedule.iterations_per_temperature) {
        iterations_at_temperature_ = 0;
        state_.temperature = config_.schedule.next(state_.temperature);
        ++counters_.temperature_steps;
        log::anneal.info() << "Temperature " << format_double(state_.temperature)
                           << ", cost " << format_double(state_.current_cost)
                           << ", accepted " << counters_.accepted << "/" << counters_.evaluated;
    }

    phase_.store(config_.schedule.finished(state_.temperature)
                     ? AnnealPhase::TERMINATED
                     : AnnealPhase::DISTRIBUTE);
}

void AnnealingController::emit(const TrajectoryRecord& record) {
    for (const auto& sink : sinks_) {
        sink->record(record);
    }
}

// ============================================================================
// Run Loop
// ============================================================================

RunResult AnnealingController::run() {
    RunResult result;

    if (auto problem = check_config()) {
        log::anneal.error() << "Invalid configuration: " << *problem;
        result.status = Status::INVALID_ARGUMENT;
        result.reason = *problem;
    } else if (!initialized_) {
        auto status = initialize();
        if (status != Status::OK) {
            result.status = status;
            result.reason = "baseline round failed";
        }
    }

    while (result.ok() && phase_.load() != AnnealPhase::TERMINATED) {
        if (stop_requested_.load()) {
            result.status = Status::CANCELLED;
            result.reason = "stopped";
            break;
        }

        auto report = step();
        if (report.outcome != RoundOutcome::INCOMPLETE) {
            continue;
        }
        if (report.error != Status::INCOMPLETE_ROUND) {
            // Fatal write errors, cancellation or a misuse of the controller
            result.status = report.error;
            result.reason = report.reason;
            break;
        }
        if (consecutive_incomplete_ >= config_.max_consecutive_incomplete_rounds) {
            result.status = Status::INCOMPLETE_ROUND;
            result.reason = std::to_string(consecutive_incomplete_) +
                            " consecutive incomplete rounds, last: " + report.reason;
            break;
        }
    }

    for (const auto& sink : sinks_) {
        sink->flush();
    }

    result.beta = state_.beta;
    result.cost = state_.current_cost;
    result.baseline_cost = baseline_cost_;
    result.temperature = state_.temperature;
    result.history = state_.history;
    result.counters = counters_;

    if (result.ok()) {
        log::anneal.info() << "Annealing finished: cost " << format_double(result.cost)
                           << " (baseline " << format_double(result.baseline_cost) << "), "
                           << counters_.accepted << " accepted of " << counters_.evaluated;
    } else {
        log::anneal.error() << "Annealing stopped: " << status_string(result.status) << " "
                            << result.reason;
    }
    return result;
}

}  // namespace coanneal
