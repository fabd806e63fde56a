#include "trajectory.hh"
#include "core/logging.hh"

namespace coanneal {

namespace {

constexpr const char* CSV_HEADER = "iteration,round,temperature,cost,accepted,beta\n";

}  // namespace

std::string format_trajectory_csv(const TrajectoryRecord& record) {
    std::string line = std::to_string(record.iteration);
    line += ',';
    line += std::to_string(record.round);
    line += ',';
    line += format_double(record.temperature);
    line += ',';
    line += format_double(record.cost);
    line += ',';
    line += record.accepted ? '1' : '0';
    line += ',';
    for (std::size_t i = 0; i < record.beta.size(); ++i) {
        if (i > 0) {
            line += ';';
        }
        line += format_double(record.beta[i]);
    }
    return line;
}

// ============================================================================
// LogTrajectorySink Implementation
// ============================================================================

void LogTrajectorySink::record(const TrajectoryRecord& record) {
    COANNEAL_LOG_DEBUG(log::trajectory) << "iter=" << record.iteration
                                        << " T=" << format_double(record.temperature)
                                        << " cost=" << format_double(record.cost)
                                        << (record.accepted ? " accepted" : " rejected");
}

// ============================================================================
// FileTrajectorySink Implementation
// ============================================================================

FileTrajectorySink::FileTrajectorySink(const std::string& path)
    : path_(path) {
    file_ = std::fopen(path.c_str(), "a");
    if (!file_) {
        log::trajectory.error() << "Cannot open trajectory file " << path;
        return;
    }
    std::fseek(file_, 0, SEEK_END);
    if (std::ftell(file_) == 0) {
        std::fputs(CSV_HEADER, file_);
    }
}

FileTrajectorySink::~FileTrajectorySink() {
    if (file_) {
        std::fclose(file_);
    }
}

void FileTrajectorySink::record(const TrajectoryRecord& record) {
    std::string line = format_trajectory_csv(record);
    line += '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_) {
        return;
    }
    if (std::fwrite(line.c_str(), 1, line.size(), file_) != line.size() && !write_failed_) {
        write_failed_ = true;
        log::trajectory.error() << "Short write to trajectory file " << path_;
    }
}

void FileTrajectorySink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_ && std::fflush(file_) != 0 && !write_failed_) {
        write_failed_ = true;
        log::trajectory.error() << "Cannot flush trajectory file " << path_;
    }
}

bool FileTrajectorySink::write_failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return write_failed_;
}

// ============================================================================
// MemoryTrajectorySink Implementation
// ============================================================================

void MemoryTrajectorySink::record(const TrajectoryRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(record);
}

std::vector<TrajectoryRecord> MemoryTrajectorySink::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

std::size_t MemoryTrajectorySink::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

}  // namespace coanneal
