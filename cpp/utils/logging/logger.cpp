#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace logging {

std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

LogLevel parse_level(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

LogEntry::LogEntry(LogLevel lvl, const std::string& msg, const std::string& comp)
    : level(lvl), message(msg), component(comp), timestamp_us(0) {
    timestamp_us = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::stringstream ss;
    ss << std::this_thread::get_id();
    thread_id = ss.str();
}

LogManager& LogManager::get_instance() {
    static LogManager instance;
    return instance;
}

LogManager::~LogManager() {
    shutdown();
}

void LogManager::initialize(const std::string& log_file, LogLevel min_level, bool console) {
    if (running_.load()) {
        set_level(min_level);
        return;
    }

    min_level_.store(min_level);
    console_ = console;

    if (!log_file.empty()) {
        log_file_ = log_file;
        file_stream_.open(log_file, std::ios::app);
        if (!file_stream_.is_open()) {
            std::cerr << "[LOG_MANAGER] Failed to open log file: " << log_file << std::endl;
        }
    }

    running_.store(true);
    log_thread_ = std::thread(&LogManager::log_worker, this);
}

void LogManager::shutdown() {
    if (!running_.exchange(false)) {
        return;
    }
    cv_.notify_all();

    if (log_thread_.joinable()) {
        log_thread_.join();
    }

    // Anything queued after the worker left is written inline
    std::queue<LogEntry> remaining;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        std::swap(remaining, log_queue_);
    }
    while (!remaining.empty()) {
        write_log(remaining.front());
        remaining.pop();
    }

    if (file_stream_.is_open()) {
        file_stream_.close();
    }
}

void LogManager::log(const LogEntry& entry) {
    if (entry.level < min_level_.load()) {
        return;
    }

    if (!running_.load()) {
        write_log(entry);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        log_queue_.push(entry);
    }

    cv_.notify_one();
}

void LogManager::log_worker() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    while (running_.load() || !log_queue_.empty()) {
        cv_.wait(lock, [this] { return !log_queue_.empty() || !running_.load(); });

        while (!log_queue_.empty()) {
            LogEntry entry = log_queue_.front();
            log_queue_.pop();
            lock.unlock();

            write_log(entry);

            lock.lock();
        }
    }
}

void LogManager::write_log(const LogEntry& entry) {
    std::string formatted = format_log_entry(entry);
    std::lock_guard<std::mutex> lock(write_mutex_);

    if (!running_.load() && !file_stream_.is_open()) {
        std::cerr << formatted << std::endl;
        return;
    }

    if (console_) {
        if (entry.level >= LogLevel::ERROR) {
            std::cerr << formatted << std::endl;
        } else {
            std::cout << formatted << std::endl;
        }
    }

    if (file_stream_.is_open()) {
        file_stream_ << formatted << std::endl;
        file_stream_.flush();
    }
}

std::string LogManager::format_log_entry(const LogEntry& entry) const {
    std::stringstream ss;

    auto time_t = std::chrono::system_clock::to_time_t(
        std::chrono::system_clock::time_point(std::chrono::microseconds(entry.timestamp_us)));
    std::tm tm{};
    localtime_r(&time_t, &tm);

    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(6) << (entry.timestamp_us % 1000000);
    ss << " [" << level_to_string(entry.level) << "]";

    if (!entry.component.empty()) {
        ss << " [" << entry.component << "]";
    }

    ss << " [T" << entry.thread_id << "]";
    ss << " " << entry.message;

    if (!entry.metadata.empty()) {
        ss << " {";
        bool first = true;
        for (const auto& [key, value] : entry.metadata) {
            if (!first) ss << ", ";
            ss << key << "=" << value;
            first = false;
        }
        ss << "}";
    }

    return ss.str();
}

void Logger::log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& metadata) {
    LogEntry entry(level, message, component_);
    entry.metadata = metadata;

    LogManager::get_instance().log(entry);
}

void initialize_logging(const std::string& log_file, LogLevel min_level, bool console) {
    LogManager::get_instance().initialize(log_file, min_level, console);
    Logger("LOGGING").info("Logging initialized at level " + level_to_string(min_level) +
                           (log_file.empty() ? "" : " (file: " + log_file + ")"));
}

void cleanup_logging() {
    LogManager::get_instance().shutdown();
}

} // namespace logging
