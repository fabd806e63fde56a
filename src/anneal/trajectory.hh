#pragma once

#include "anneal/codec.hh"
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

namespace coanneal {

// ============================================================================
// Trajectory Records
// ============================================================================

// One evaluated proposal, accepted or not
struct TrajectoryRecord {
    std::uint64_t iteration = 0;
    round_t round = 0;
    std::vector<double> beta;     // The proposal
    double cost = 0.0;            // Its aggregate cost
    double temperature = 0.0;
    bool accepted = false;
};

// "iteration,round,temperature,cost,accepted,b1;b2;..."
[[nodiscard]] std::string format_trajectory_csv(const TrajectoryRecord& record);

// ============================================================================
// Trajectory Sinks
// ============================================================================

class TrajectorySink {
public:
    virtual ~TrajectorySink() = default;
    virtual void record(const TrajectoryRecord& record) = 0;
    virtual void flush() {}
};

// Writes through the anneal.trajectory component logger at DEBUG
class LogTrajectorySink : public TrajectorySink {
public:
    void record(const TrajectoryRecord& record) override;
};

// Appends CSV lines; the header is written when the file is empty
class FileTrajectorySink : public TrajectorySink {
public:
    explicit FileTrajectorySink(const std::string& path);
    ~FileTrajectorySink() override;

    FileTrajectorySink(const FileTrajectorySink&) = delete;
    FileTrajectorySink& operator=(const FileTrajectorySink&) = delete;

    void record(const TrajectoryRecord& record) override;
    void flush() override;

    [[nodiscard]] bool is_open() const { return file_ != nullptr; }

    // True once a write or flush came up short
    [[nodiscard]] bool write_failed() const;

private:
    std::string path_;
    std::FILE* file_ = nullptr;
    bool write_failed_ = false;    // Reported once
    mutable std::mutex mutex_;
};

// Keeps records in memory (tests, post-run inspection)
class MemoryTrajectorySink : public TrajectorySink {
public:
    void record(const TrajectoryRecord& record) override;

    [[nodiscard]] std::vector<TrajectoryRecord> records() const;
    [[nodiscard]] std::size_t size() const;

private:
    std::vector<TrajectoryRecord> records_;
    mutable std::mutex mutex_;
};

}  // namespace coanneal
