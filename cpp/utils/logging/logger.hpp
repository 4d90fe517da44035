#pragma once
#include <string>
#include <map>
#include <memory>
#include <chrono>
#include <atomic>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <fstream>

namespace logging {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

std::string level_to_string(LogLevel level);

// Accepts DEBUG/INFO/WARN/WARNING/ERROR in any case; unknown names map to INFO.
LogLevel parse_level(const std::string& name);

struct LogEntry {
    LogLevel level;
    std::string message;
    std::string component;
    std::string thread_id;
    uint64_t timestamp_us;
    std::map<std::string, std::string> metadata;

    LogEntry(LogLevel lvl, const std::string& msg, const std::string& comp = "");
};

/**
 * Process-wide log sink.
 *
 * Before initialize() every entry is written synchronously to stderr, so library code
 * used from tests or tools without a logging setup still reports. After initialize()
 * entries are queued and written by a background worker to the console and/or a file.
 */
class LogManager {
public:
    static LogManager& get_instance();

    void initialize(const std::string& log_file = "", LogLevel min_level = LogLevel::INFO,
                    bool console = true);
    void shutdown();

    void log(const LogEntry& entry);

    void set_level(LogLevel level) { min_level_.store(level); }
    LogLevel get_level() const { return min_level_.load(); }
    bool is_running() const { return running_.load(); }

private:
    LogManager() = default;
    ~LogManager();
    LogManager(const LogManager&) = delete;
    LogManager& operator=(const LogManager&) = delete;

    void log_worker();
    void write_log(const LogEntry& entry);
    std::string format_log_entry(const LogEntry& entry) const;

    std::atomic<LogLevel> min_level_{LogLevel::INFO};
    std::string log_file_;
    std::ofstream file_stream_;
    bool console_{true};

    std::atomic<bool> running_{false};
    std::thread log_thread_;
    std::queue<LogEntry> log_queue_;
    std::mutex queue_mutex_;
    std::mutex write_mutex_;
    std::condition_variable cv_;
};

class Logger {
public:
    explicit Logger(const std::string& component) : component_(component) {}

    void debug(const std::string& message, const std::map<std::string, std::string>& metadata = {}) {
        log(LogLevel::DEBUG, message, metadata);
    }

    void info(const std::string& message, const std::map<std::string, std::string>& metadata = {}) {
        log(LogLevel::INFO, message, metadata);
    }

    void warn(const std::string& message, const std::map<std::string, std::string>& metadata = {}) {
        log(LogLevel::WARN, message, metadata);
    }

    void error(const std::string& message, const std::map<std::string, std::string>& metadata = {}) {
        log(LogLevel::ERROR, message, metadata);
    }

    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& metadata = {});

private:
    std::string component_;
};

// Initialize logging system
void initialize_logging(const std::string& log_file = "", LogLevel min_level = LogLevel::INFO,
                        bool console = true);

// Flushes the queue and stops the worker
void cleanup_logging();

} // namespace logging
