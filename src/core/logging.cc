#include "logging.hh"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <iomanip>
#include <ctime>
#include <filesystem>

namespace coanneal {

namespace {

void format_timestamp(std::ostringstream& oss, std::chrono::system_clock::time_point ts) {
    auto time_t = std::chrono::system_clock::to_time_t(ts);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()) % 1000;

    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t);
#else
    localtime_r(&time_t, &tm_buf);
#endif

    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << std::setfill(' ');
}

}  // namespace

std::optional<LogLevel> parse_log_level(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "fatal") return LogLevel::FATAL;
    if (lower == "off") return LogLevel::OFF;
    return std::nullopt;
}

// ============================================================================
// ConsoleSink Implementation
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors)
    : use_colors_(use_colors) {}

void ConsoleSink::write(const LogEntry& entry) {
    std::ostringstream oss;
    format_timestamp(oss, entry.timestamp);

    if (show_thread_id_) {
        oss << " [" << entry.thread_id << "]";
    }

    if (use_colors_) {
        oss << " " << log_level_color(entry.level);
    }
    oss << " [" << std::setw(5) << log_level_name(entry.level) << "]";
    if (use_colors_) {
        oss << "\033[0m";
    }

    if (!entry.component.empty()) {
        oss << " [" << entry.component << "]";
    }

    oss << " " << entry.message;

    if (show_source_location_ && !entry.file.empty()) {
        oss << " (" << entry.file << ":" << entry.line << ")";
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << oss.str() << '\n';
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr.flush();
}

// ============================================================================
// FileSink Implementation
// ============================================================================

FileSink::FileSink(const std::string& filename)
    : filename_(filename) {
    file_ = std::fopen(filename.c_str(), "a");
    if (file_) {
        std::fseek(file_, 0, SEEK_END);
        current_size_ = static_cast<std::size_t>(std::ftell(file_));
    }
}

FileSink::~FileSink() {
    if (file_) {
        std::fclose(file_);
    }
}

void FileSink::write(const LogEntry& entry) {
    std::ostringstream oss;
    format_timestamp(oss, entry.timestamp);
    oss << " [" << entry.thread_id << "]";
    oss << " [" << std::setw(5) << log_level_name(entry.level) << "]";
    if (!entry.component.empty()) {
        oss << " [" << entry.component << "]";
    }
    oss << " " << entry.message;
    if (!entry.file.empty()) {
        oss << " (" << entry.file << ":" << entry.line << " " << entry.function << ")";
    }
    oss << "\n";
    std::string line = oss.str();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_) {
        return;
    }
    if (current_size_ >= max_file_size_) {
        rotate();
        if (!file_) {
            return;
        }
    }
    std::fwrite(line.c_str(), 1, line.size(), file_);
    current_size_ += line.size();
}

void FileSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_) {
        std::fflush(file_);
    }
}

void FileSink::rotate() {
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }

    namespace fs = std::filesystem;
    std::error_code ec;

    if (max_files_ > 0) {
        fs::remove(filename_ + "." + std::to_string(max_files_), ec);
        for (std::size_t i = max_files_ - 1; i >= 1; --i) {
            std::string src = filename_ + "." + std::to_string(i);
            if (fs::exists(src, ec)) {
                fs::rename(src, filename_ + "." + std::to_string(i + 1), ec);
            }
        }
        if (fs::exists(filename_, ec)) {
            fs::rename(filename_, filename_ + ".1", ec);
        }
    }

    file_ = std::fopen(filename_.c_str(), "w");
    current_size_ = 0;
}

// ============================================================================
// MemorySink Implementation
// ============================================================================

MemorySink::MemorySink(std::size_t capacity)
    : capacity_(capacity) {}

void MemorySink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (capacity_ == 0) {
        return;
    }
    if (entries_.size() >= capacity_) {
        entries_.erase(entries_.begin());
    }
    entries_.push_back(entry);
}

std::vector<LogEntry> MemorySink::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

std::size_t MemorySink::count(LogLevel level, std::string_view component) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(
        entries_.begin(), entries_.end(), [&](const LogEntry& e) {
            return e.level == level && e.component == component;
        }));
}

void MemorySink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

// ============================================================================
// AsyncSink Implementation
// ============================================================================

AsyncSink::AsyncSink(std::shared_ptr<LogSink> inner_sink, std::size_t queue_size)
    : inner_sink_(std::move(inner_sink))
    , max_queue_size_(queue_size) {}

AsyncSink::~AsyncSink() {
    stop();
}

void AsyncSink::write(const LogEntry& entry) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.size() >= max_queue_size_) {
            // Drop oldest entry
            queue_.pop();
        }
        queue_.push(entry);
    }
    cv_.notify_one();
}

void AsyncSink::flush() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        drained_cv_.wait(lock, [this]() {
            return (queue_.empty() && in_flight_ == 0) || !running_.load();
        });
    }
    if (inner_sink_) {
        inner_sink_->flush();
    }
}

void AsyncSink::start() {
    if (running_.exchange(true)) {
        return;
    }
    worker_thread_ = std::thread(&AsyncSink::worker_loop, this);
}

void AsyncSink::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.store(false);
    }
    cv_.notify_all();
    drained_cv_.notify_all();

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    while (!queue_.empty()) {
        inner_sink_->write(queue_.front());
        queue_.pop();
    }
    inner_sink_->flush();
}

void AsyncSink::worker_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load()) {
        cv_.wait(lock, [this]() {
            return !queue_.empty() || !running_.load();
        });

        while (!queue_.empty()) {
            LogEntry entry = std::move(queue_.front());
            queue_.pop();
            ++in_flight_;
            lock.unlock();

            inner_sink_->write(entry);

            lock.lock();
            --in_flight_;
        }
        drained_cv_.notify_all();
    }
}

// ============================================================================
// Logger Implementation
// ============================================================================

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() {
    add_sink(std::make_shared<ConsoleSink>(true));
}

Logger::~Logger() {
    flush();
}

void Logger::set_level(LogLevel level) {
    level_.store(level);
}

void Logger::set_component_level(const std::string& component, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    component_levels_[component] = level;
}

void Logger::clear_component_levels() {
    std::lock_guard<std::mutex> lock(mutex_);
    component_levels_.clear();
}

void Logger::add_sink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::remove_sink(const std::shared_ptr<LogSink>& sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

bool Logger::is_enabled(LogLevel level, const std::string& component) const {
    if (!component.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = component_levels_.find(component);
        if (it != component_levels_.end()) {
            return level >= it->second;
        }

        // Walk up dotted parents ("channel" for "channel.detail")
        std::string parent = component;
        while (true) {
            auto pos = parent.rfind('.');
            if (pos == std::string::npos) {
                break;
            }
            parent.resize(pos);
            it = component_levels_.find(parent);
            if (it != component_levels_.end()) {
                return level >= it->second;
            }
        }
    }

    return level >= level_.load();
}

void Logger::log(LogLevel level,
                 std::string_view component,
                 std::string_view message,
                 const std::source_location& loc) {

    if (!is_enabled(level, std::string(component))) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.timestamp = std::chrono::system_clock::now();
    entry.thread_id = std::this_thread::get_id();
    entry.component = std::string(component);
    entry.message = std::string(message);
    entry.file = loc.file_name();
    entry.line = loc.line();
    entry.function = loc.function_name();

    std::vector<std::shared_ptr<LogSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks = sinks_;
    }
    for (const auto& sink : sinks) {
        sink->write(entry);
    }
}

void Logger::flush() {
    std::vector<std::shared_ptr<LogSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks = sinks_;
    }
    for (const auto& sink : sinks) {
        sink->flush();
    }
}

// ============================================================================
// LogStream Implementation
// ============================================================================

LogStream::LogStream(LogLevel level,
                     std::string_view component,
                     const std::source_location& loc)
    : level_(level)
    , component_(component)
    , loc_(loc)
    , enabled_(Logger::instance().is_enabled(level, std::string(component))) {}

LogStream::~LogStream() {
    if (enabled_ && !stream_.str().empty()) {
        Logger::instance().log(level_, component_, stream_.str(), loc_);
    }
}

// ============================================================================
// ComponentLogger Implementation
// ============================================================================

ComponentLogger::ComponentLogger(std::string component)
    : component_(std::move(component)) {}

bool ComponentLogger::is_trace_enabled() const {
    return Logger::instance().is_enabled(LogLevel::TRACE, component_);
}

bool ComponentLogger::is_debug_enabled() const {
    return Logger::instance().is_enabled(LogLevel::DEBUG, component_);
}

bool ComponentLogger::is_info_enabled() const {
    return Logger::instance().is_enabled(LogLevel::INFO, component_);
}

LogStream ComponentLogger::trace(const std::source_location& loc) const {
    return LogStream(LogLevel::TRACE, component_, loc);
}

LogStream ComponentLogger::debug(const std::source_location& loc) const {
    return LogStream(LogLevel::DEBUG, component_, loc);
}

LogStream ComponentLogger::info(const std::source_location& loc) const {
    return LogStream(LogLevel::INFO, component_, loc);
}

LogStream ComponentLogger::warn(const std::source_location& loc) const {
    return LogStream(LogLevel::WARN, component_, loc);
}

LogStream ComponentLogger::error(const std::source_location& loc) const {
    return LogStream(LogLevel::ERROR, component_, loc);
}

LogStream ComponentLogger::fatal(const std::source_location& loc) const {
    return LogStream(LogLevel::FATAL, component_, loc);
}

void ComponentLogger::trace(std::string_view msg, const std::source_location& loc) const {
    Logger::instance().log(LogLevel::TRACE, component_, msg, loc);
}

void ComponentLogger::debug(std::string_view msg, const std::source_location& loc) const {
    Logger::instance().log(LogLevel::DEBUG, component_, msg, loc);
}

void ComponentLogger::info(std::string_view msg, const std::source_location& loc) const {
    Logger::instance().log(LogLevel::INFO, component_, msg, loc);
}

void ComponentLogger::warn(std::string_view msg, const std::source_location& loc) const {
    Logger::instance().log(LogLevel::WARN, component_, msg, loc);
}

void ComponentLogger::error(std::string_view msg, const std::source_location& loc) const {
    Logger::instance().log(LogLevel::ERROR, component_, msg, loc);
}

void ComponentLogger::fatal(std::string_view msg, const std::source_location& loc) const {
    Logger::instance().log(LogLevel::FATAL, component_, msg, loc);
}

// ============================================================================
// Initialization
// ============================================================================

void init_logging(const LogConfig& config) {
    Logger& logger = Logger::instance();
    logger.clear_sinks();
    logger.clear_component_levels();
    logger.set_level(config.default_level);
    for (const auto& [component, level] : config.component_levels) {
        logger.set_component_level(component, level);
    }

    auto install = [&](std::shared_ptr<LogSink> sink) {
        if (config.async_logging) {
            auto async = std::make_shared<AsyncSink>(std::move(sink));
            async->start();
            logger.add_sink(async);
        } else {
            logger.add_sink(std::move(sink));
        }
    };

    if (config.console_enabled) {
        auto console = std::make_shared<ConsoleSink>(config.console_colors);
        console->set_show_thread_id(config.console_thread_id);
        console->set_show_source_location(config.console_source_location);
        install(console);
    }

    if (config.file_enabled) {
        auto file = std::make_shared<FileSink>(config.file_path);
        if (!file->is_open()) {
            log::core.error() << "Cannot open log file " << config.file_path;
        } else {
            file->set_max_file_size(config.file_max_size);
            file->set_max_files(config.file_max_count);
            install(file);
        }
    }

    log::core.info("Logging initialized");
}

void shutdown_logging() {
    log::core.info("Logging shutting down");
    Logger::instance().flush();
}

}  // namespace coanneal
