#pragma once

#include "core/time_utils.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

namespace augur::audit {

enum class LogLevel { DEBUG, INFO, WARN, ERR, AUDIT };

inline const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "[DEBUG] ";
        case LogLevel::INFO: return "[INFO] ";
        case LogLevel::WARN: return "[WARN] ";
        case LogLevel::ERR: return "[ERROR] ";
        case LogLevel::AUDIT: return "[AUDIT] ";
        default: return "[LOG] ";
    }
}

/**
 * @brief Parse "debug", "info", "warn", "error" or "audit" (any case).
 * @return false and leaves `out` untouched for anything else.
 */
inline bool parse_log_level(const std::string& text, LogLevel* out) {
    if (!out) return false;
    std::string lowered;
    lowered.reserve(text.size());
    for (char c : text) {
        lowered.push_back((c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c);
    }
    if (lowered == "debug") { *out = LogLevel::DEBUG; return true; }
    if (lowered == "info") { *out = LogLevel::INFO; return true; }
    if (lowered == "warn" || lowered == "warning") { *out = LogLevel::WARN; return true; }
    if (lowered == "error" || lowered == "err") { *out = LogLevel::ERR; return true; }
    if (lowered == "audit") { *out = LogLevel::AUDIT; return true; }
    return false;
}

/**
 * @class Logger
 * @brief Thread-safe audit logger.
 * Entries are queued and written by one background thread so signal code never blocks on I/O.
 * AUDIT entries bypass the level filter.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    void log(LogLevel level, const std::string& message) {
        if (level != LogLevel::AUDIT &&
            static_cast<int>(level) < min_level_.load(std::memory_order_relaxed)) {
            return;
        }

        LogEntry entry;
        entry.level = level;
        entry.timestamp_ns = augur::core::unix_now_ns();
        entry.message = message;

        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (queue_.size() >= queue_capacity_) {
                dropped_.fetch_add(1, std::memory_order_relaxed);
                return;
            }
            queue_.push_back(std::move(entry));
        }
        cv_.notify_one();
    }

    void set_min_level(LogLevel level) {
        min_level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel min_level() const {
        return static_cast<LogLevel>(min_level_.load(std::memory_order_relaxed));
    }

    /**
     * @brief Redirect the file sink. An empty path disables it.
     * @return false if the file could not be opened; console output continues.
     */
    bool set_file_path(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (file_.is_open()) file_.close();
        if (path.empty()) return true;
        file_.open(path, std::ios::app);
        return file_.is_open();
    }

    void set_console(bool enabled) {
        console_.store(enabled, std::memory_order_relaxed);
    }

    void set_queue_capacity(size_t capacity) {
        std::lock_guard<std::mutex> lock(mtx_);
        queue_capacity_ = capacity;
    }

    // Blocks until every entry queued so far has been written.
    void flush() {
        std::unique_lock<std::mutex> lock(mtx_);
        drained_cv_.wait(lock, [&] { return queue_.empty() && !writing_; });
        if (file_.is_open()) file_.flush();
    }

    uint64_t dropped_count() const {
        return dropped_.load(std::memory_order_relaxed);
    }

private:
    struct LogEntry {
        LogLevel level;
        uint64_t timestamp_ns;
        std::string message;
    };

    Logger() {
        worker_ = std::thread(&Logger::worker_loop, this);
    }

    ~Logger() {
        running_.store(false, std::memory_order_relaxed);
        cv_.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }
        if (file_.is_open()) file_.close();
    }

    void worker_loop() {
        for (;;) {
            LogEntry entry;
            {
                std::unique_lock<std::mutex> lock(mtx_);
                cv_.wait(lock, [&] {
                    return !running_.load(std::memory_order_relaxed) || !queue_.empty();
                });
                if (!running_.load(std::memory_order_relaxed) && queue_.empty()) {
                    break;
                }
                entry = std::move(queue_.front());
                queue_.pop_front();
                writing_ = true;
            }

            char ts_buf[64];
            augur::core::format_utc(entry.timestamp_ns, ts_buf, sizeof(ts_buf));
            std::string line = std::string(ts_buf) + " " + level_tag(entry.level) + entry.message;

            if (console_.load(std::memory_order_relaxed)) {
                std::cout << line << std::endl;
            }

            {
                std::lock_guard<std::mutex> lock(mtx_);
                if (file_.is_open()) {
                    file_ << line << "\n";
                }
                writing_ = false;
            }
            drained_cv_.notify_all();
        }
    }

    std::ofstream file_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::condition_variable drained_cv_;
    std::deque<LogEntry> queue_;
    size_t queue_capacity_ = 4096;
    bool writing_ = false;
    std::atomic<int> min_level_{static_cast<int>(LogLevel::INFO)};
    std::atomic<bool> console_{true};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<bool> running_{true};
    std::thread worker_;
};

} // namespace augur::audit
