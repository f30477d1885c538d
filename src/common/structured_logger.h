#ifndef STEPCOACH_STRUCTURED_LOGGER_H
#define STEPCOACH_STRUCTURED_LOGGER_H

#include <string>
#include <memory>
#include <chrono>
#include <atomic>
#include <unordered_map>
#include <thread>
#include <mutex>
#include <shared_mutex>
#include <vector>
#include <fstream>
#include <nlohmann/json.hpp>
#include "thread_safe_queue.h"

namespace stepcoach {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR_LEVEL,
    CRITICAL
};

std::string logLevelToString(LogLevel level);
LogLevel parseLogLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

/**
 * @brief Log entry with structured context
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string message;
    std::string file;
    int line;
    std::thread::id thread_id;
    nlohmann::json context;

    std::chrono::nanoseconds duration;
    std::string operation_name;

    LogEntry() : level(LogLevel::INFO), line(0), duration(0) {}
};

/**
 * @brief Log formatter interface
 */
class ILogFormatter {
public:
    virtual ~ILogFormatter() = default;
    virtual std::string format(const LogEntry& entry) = 0;
};

/**
 * @brief One JSON object per line
 */
class JsonLogFormatter : public ILogFormatter {
public:
    std::string format(const LogEntry& entry) override;
};

/**
 * @brief Human-readable single line format
 */
class TextLogFormatter : public ILogFormatter {
public:
    std::string format(const LogEntry& entry) override;
};

/**
 * @brief Log sink interface
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() = 0;
};

/**
 * @brief Console sink; errors and above go to stderr
 */
class ConsoleLogSink : public ILogSink {
public:
    explicit ConsoleLogSink(std::shared_ptr<ILogFormatter> formatter);
    void write(const LogEntry& entry) override;
    void flush() override;

private:
    std::shared_ptr<ILogFormatter> m_formatter;
    std::mutex m_mutex;
};

/**
 * @brief File sink with size based rotation
 */
class RotatingFileLogSink : public ILogSink {
public:
    struct Config {
        std::string base_path;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t max_files = 5;
    };

    RotatingFileLogSink(const Config& config, std::shared_ptr<ILogFormatter> formatter);
    ~RotatingFileLogSink();

    void write(const LogEntry& entry) override;
    void flush() override;

private:
    Config m_config;
    std::shared_ptr<ILogFormatter> m_formatter;
    std::unique_ptr<std::ofstream> m_file;
    std::mutex m_mutex;
    size_t m_current_size;

    void rotateIfNeeded();
    void openNewFile();
    std::string generateFileName(int index = 0) const;
};

/**
 * @brief Aggregated timing of named operations (oracle calls, captures)
 */
class PerformanceTracker {
public:
    struct MetricsSnapshot {
        uint64_t count = 0;
        uint64_t total_duration_ns = 0;
        uint64_t min_duration_ns = UINT64_MAX;
        uint64_t max_duration_ns = 0;
        uint64_t errors = 0;

        double getAverageDurationMs() const;
        nlohmann::json toJson() const;
    };

    void recordOperation(const std::string& operation,
                         std::chrono::nanoseconds duration,
                         bool success = true);

    MetricsSnapshot getMetrics(const std::string& operation) const;
    std::unordered_map<std::string, MetricsSnapshot> getAllMetrics() const;
    nlohmann::json toJson() const;
    void reset();

private:
    struct Metrics {
        std::atomic<uint64_t> count{0};
        std::atomic<uint64_t> total_duration_ns{0};
        std::atomic<uint64_t> min_duration_ns{UINT64_MAX};
        std::atomic<uint64_t> max_duration_ns{0};
        std::atomic<uint64_t> errors{0};
    };

    mutable std::shared_mutex m_mutex;
    std::unordered_map<std::string, std::unique_ptr<Metrics>> m_metrics;

    static MetricsSnapshot snapshotOf(const Metrics& metrics);
};

/**
 * @brief RAII timer feeding the PerformanceTracker
 */
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& operation_name);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    void markFailed() { m_success = false; }
    void cancel() { m_cancelled = true; }

private:
    std::string m_operation_name;
    std::chrono::steady_clock::time_point m_start;
    bool m_success;
    bool m_cancelled;
};

/**
 * @brief Adds a context field to every entry logged from this thread while alive
 *
 * Scopes nest; an inner scope with the same key shadows the outer one until it ends.
 */
class ScopedLogContext {
public:
    ScopedLogContext(const std::string& key, const nlohmann::json& value);
    ~ScopedLogContext();

    ScopedLogContext(const ScopedLogContext&) = delete;
    ScopedLogContext& operator=(const ScopedLogContext&) = delete;

    /**
     * @brief Fields of every scope open on the calling thread
     */
    static const nlohmann::json& current();

private:
    std::string m_key;
    bool m_hadPrevious;
    nlohmann::json m_previous;
};

/**
 * @brief Process-wide structured logger
 */
class StructuredLogger {
public:
    static StructuredLogger& getInstance();

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;
    void addSink(std::shared_ptr<ILogSink> sink);
    void clearSinks();
    void setAsyncLogging(bool async);
    void setSlowOperationThreshold(std::chrono::milliseconds threshold);

    void log(const LogEntry& entry);

    void logPerformance(const std::string& operation,
                        std::chrono::nanoseconds duration,
                        bool success = true);

    class LogBuilder {
    public:
        LogBuilder(StructuredLogger* logger, LogLevel level);

        LogBuilder& message(const std::string& msg);
        LogBuilder& context(const std::string& key, const nlohmann::json& value);
        LogBuilder& file(const char* file, int line);

        ~LogBuilder();

    private:
        StructuredLogger* m_logger;
        LogEntry m_entry;
    };

    LogBuilder debug() { return LogBuilder(this, LogLevel::DEBUG); }
    LogBuilder info() { return LogBuilder(this, LogLevel::INFO); }
    LogBuilder warning() { return LogBuilder(this, LogLevel::WARNING); }
    LogBuilder error() { return LogBuilder(this, LogLevel::ERROR_LEVEL); }
    LogBuilder critical() { return LogBuilder(this, LogLevel::CRITICAL); }

    PerformanceTracker& getPerformanceTracker() { return m_performance_tracker; }

    void shutdown();
    void flush();

private:
    StructuredLogger();
    ~StructuredLogger();

    std::atomic<LogLevel> m_min_level;
    std::vector<std::shared_ptr<ILogSink>> m_sinks;
    mutable std::mutex m_config_mutex;
    std::chrono::milliseconds m_slow_threshold;

    std::atomic<bool> m_async_enabled;
    ThreadSafeQueue<LogEntry> m_log_queue;
    std::thread m_logging_thread;
    std::atomic<bool> m_shutdown{false};

    PerformanceTracker m_performance_tracker;

    void asyncLoggingLoop();
    void processLogEntry(const LogEntry& entry);
};

#define SLOG_DEBUG() stepcoach::StructuredLogger::getInstance().debug().file(__FILE__, __LINE__)
#define SLOG_INFO() stepcoach::StructuredLogger::getInstance().info().file(__FILE__, __LINE__)
#define SLOG_WARNING() stepcoach::StructuredLogger::getInstance().warning().file(__FILE__, __LINE__)
#define SLOG_ERROR() stepcoach::StructuredLogger::getInstance().error().file(__FILE__, __LINE__)
#define SLOG_CRITICAL() stepcoach::StructuredLogger::getInstance().critical().file(__FILE__, __LINE__)

#define SCOPED_TIMER(operation) stepcoach::ScopedTimer _scoped_timer(operation)

} // namespace stepcoach

#endif // STEPCOACH_STRUCTURED_LOGGER_H
