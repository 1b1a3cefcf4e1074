#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <functional>
#include <thread>

namespace p2p {
namespace logging {

enum class LogLevel : uint8_t { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Fatal = 5 };

inline const char* level_to_string(LogLevel level) {
    static constexpr const char* names[] = {"TRACE", "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL"};
    auto idx = static_cast<uint8_t>(level);
    return idx < 6 ? names[idx] : "?????";
}

// Engine component that produced a record
namespace LogCategory {
constexpr uint8_t System = 0;
constexpr uint8_t Profile = 1;
constexpr uint8_t Balance = 2;
constexpr uint8_t Offer = 3;
constexpr uint8_t Escrow = 4;
constexpr uint8_t Dispute = 5;
constexpr uint8_t Ledger = 6;
} // namespace LogCategory

inline const char* category_to_string(uint8_t category) {
    static constexpr const char* names[] = {"system", "profile", "balance", "offer", "escrow", "dispute", "ledger"};
    return category < 7 ? names[category] : "?";
}

/**
 * LogRecord - fixed size so the queue never allocates
 *
 * Text longer than the message field is cut, not wrapped.
 */
struct alignas(64) LogRecord {
    uint64_t wall_ns;
    LogLevel level;
    uint8_t category;
    char message[54];

    void assign(const char* text) {
        std::strncpy(message, text, sizeof(message) - 1);
        message[sizeof(message) - 1] = '\0';
    }
};
static_assert(sizeof(LogRecord) == 64, "LogRecord must fill one cache line");

/**
 * Bounded single-producer / single-consumer queue of log records.
 *
 * Positions are free-running sequence numbers; the slot is the sequence
 * modulo Capacity, so all Capacity slots are usable.
 */
template <size_t Capacity = 4096>
class LogQueue {
    static_assert(Capacity > 0 && (Capacity & (Capacity - 1)) == 0, "Capacity must be power of 2");

public:
    bool push(const LogRecord& rec) {
        uint64_t w = write_seq_.load(std::memory_order_relaxed);
        if (w - read_seq_.load(std::memory_order_acquire) == Capacity) {
            return false;
        }
        slots_[w & (Capacity - 1)] = rec;
        write_seq_.store(w + 1, std::memory_order_release);
        return true;
    }

    bool pop(LogRecord& rec) {
        uint64_t r = read_seq_.load(std::memory_order_relaxed);
        if (r == write_seq_.load(std::memory_order_acquire)) {
            return false;
        }
        rec = slots_[r & (Capacity - 1)];
        read_seq_.store(r + 1, std::memory_order_release);
        return true;
    }

    size_t depth() const {
        return static_cast<size_t>(write_seq_.load(std::memory_order_acquire) -
                                   read_seq_.load(std::memory_order_acquire));
    }

private:
    alignas(64) std::atomic<uint64_t> write_seq_{0};
    alignas(64) std::atomic<uint64_t> read_seq_{0};
    std::array<LogRecord, Capacity> slots_{};
};

/**
 * Async Logger
 *
 * The engine formats a record under its own mutex and hands it to the
 * queue; a drain thread writes records to the sink (stderr by default).
 * A full queue drops the record and bumps dropped_count().
 *
 * flush() drains on the caller's thread and must not race the drain
 * thread: call it before start() or after stop().
 *
 * Usage:
 *   AsyncLogger logger;
 *   logger.start();
 *   P2P_LOGF_INFO(&logger, Escrow, "escrow %llu opened", id);
 *   logger.stop();
 */
class AsyncLogger {
public:
    using OutputCallback = std::function<void(const LogRecord&)>;

    AsyncLogger() = default;
    ~AsyncLogger() { stop(); }

    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    void start() {
        if (running_.exchange(true)) return;
        drain_thread_ = std::thread([this] { drain_loop(); });
    }

    // Joins the drain thread, then writes whatever is still queued
    void stop() {
        if (!running_.exchange(false)) return;
        if (drain_thread_.joinable()) drain_thread_.join();
        flush();
    }

    void flush() {
        LogRecord rec;
        while (queue_.pop(rec)) write(rec);
    }

    void log(LogLevel level, uint8_t category, const char* message) {
        if (!enabled(level)) return;

        LogRecord rec;
        rec.wall_ns = wall_ns();
        rec.level = level;
        rec.category = category;
        rec.assign(message);

        if (queue_.push(rec)) {
            total_logged_.fetch_add(1, std::memory_order_relaxed);
        } else {
            dropped_count_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    template <typename... Args>
    void logf(LogLevel level, uint8_t category, const char* fmt, Args... args) {
        if (!enabled(level)) return;

        char text[sizeof(LogRecord::message)];
        std::snprintf(text, sizeof(text), fmt, args...);
        log(level, category, text);
    }

    bool enabled(LogLevel level) const { return level >= min_level_; }

    void set_min_level(LogLevel level) { min_level_ = level; }
    void set_output_callback(OutputCallback cb) { sink_ = std::move(cb); }

    uint64_t dropped_count() const { return dropped_count_.load(); }
    uint64_t total_logged() const { return total_logged_.load(); }
    size_t pending_count() const { return queue_.depth(); }

private:
    LogQueue<4096> queue_;
    std::atomic<bool> running_{false};
    std::thread drain_thread_;
    LogLevel min_level_ = LogLevel::Info;
    OutputCallback sink_;

    std::atomic<uint64_t> dropped_count_{0};
    std::atomic<uint64_t> total_logged_{0};

    void drain_loop() {
        LogRecord rec;
        while (running_.load(std::memory_order_relaxed)) {
            bool idle = true;
            while (queue_.pop(rec)) {
                write(rec);
                idle = false;
            }
            if (idle) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    void write(const LogRecord& rec) {
        if (sink_) {
            sink_(rec);
            return;
        }
        auto ms = static_cast<unsigned long long>(rec.wall_ns / 1000000);
        std::fprintf(stderr, "[%llu.%03llu] %s %-7s %s\n", ms / 1000, ms % 1000, level_to_string(rec.level),
                     category_to_string(rec.category), rec.message);
    }

    static uint64_t wall_ns() {
        using namespace std::chrono;
        return static_cast<uint64_t>(duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count());
    }
};

// Logger pointer may be null; the macros do nothing then
#define P2P_LOG(logger, level, cat, msg)                                                                               \
    do {                                                                                                               \
        if (logger)                                                                                                    \
            (logger)->log(p2p::logging::LogLevel::level, p2p::logging::LogCategory::cat, msg);                         \
    } while (0)

#define P2P_LOGF(logger, level, cat, fmt, ...)                                                                         \
    do {                                                                                                               \
        if (logger)                                                                                                    \
            (logger)->logf(p2p::logging::LogLevel::level, p2p::logging::LogCategory::cat, fmt, ##__VA_ARGS__);         \
    } while (0)

#define P2P_LOGF_DEBUG(logger, cat, fmt, ...) P2P_LOGF(logger, Debug, cat, fmt, ##__VA_ARGS__)
#define P2P_LOGF_INFO(logger, cat, fmt, ...) P2P_LOGF(logger, Info, cat, fmt, ##__VA_ARGS__)
#define P2P_LOGF_WARN(logger, cat, fmt, ...) P2P_LOGF(logger, Warn, cat, fmt, ##__VA_ARGS__)

} // namespace logging
} // namespace p2p
