#include "structured_logger.h"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <filesystem>
#include <algorithm>
#include <ctime>

namespace stepcoach {

namespace fs = std::filesystem;

namespace {
    std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
        auto time_t = std::chrono::system_clock::to_time_t(tp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            tp.time_since_epoch()) % 1000;

        std::tm local_tm{};
        localtime_r(&time_t, &local_tm);

        std::stringstream ss;
        ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    std::string threadIdToString(std::thread::id id) {
        std::stringstream ss;
        ss << id;
        return ss.str();
    }
}

// ScopedLogContext
namespace {
    nlohmann::json& threadLogContext() {
        thread_local nlohmann::json context = nlohmann::json::object();
        return context;
    }
}

ScopedLogContext::ScopedLogContext(const std::string& key, const nlohmann::json& value)
    : m_key(key), m_hadPrevious(false) {
    nlohmann::json& context = threadLogContext();
    auto it = context.find(key);
    if (it != context.end()) {
        m_hadPrevious = true;
        m_previous = *it;
    }
    context[key] = value;
}

ScopedLogContext::~ScopedLogContext() {
    nlohmann::json& context = threadLogContext();
    if (m_hadPrevious) {
        context[m_key] = m_previous;
    } else {
        context.erase(m_key);
    }
}

const nlohmann::json& ScopedLogContext::current() {
    return threadLogContext();
}

std::string logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR_LEVEL: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

LogLevel parseLogLevel(const std::string& name, LogLevel fallback) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
    if (upper == "ERROR") return LogLevel::ERROR_LEVEL;
    if (upper == "CRITICAL") return LogLevel::CRITICAL;
    return fallback;
}

// JsonLogFormatter
std::string JsonLogFormatter::format(const LogEntry& entry) {
    nlohmann::json log_json;

    log_json["timestamp"] = formatTimestamp(entry.timestamp);
    log_json["level"] = logLevelToString(entry.level);
    log_json["message"] = entry.message;
    log_json["thread"] = threadIdToString(entry.thread_id);

    if (!entry.file.empty()) {
        log_json["source"]["file"] = fs::path(entry.file).filename().string();
        log_json["source"]["line"] = entry.line;
    }

    if (!entry.operation_name.empty()) {
        log_json["operation"] = entry.operation_name;
        log_json["duration_ms"] = entry.duration.count() / 1000000.0;
    }

    if (!entry.context.empty()) {
        log_json["context"] = entry.context;
    }

    return log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

// TextLogFormatter
std::string TextLogFormatter::format(const LogEntry& entry) {
    std::stringstream ss;

    ss << "[" << formatTimestamp(entry.timestamp) << "] ";
    ss << "[" << std::setw(8) << logLevelToString(entry.level) << "] ";

    ss << entry.message;

    if (!entry.file.empty() && entry.level >= LogLevel::ERROR_LEVEL) {
        ss << " (" << fs::path(entry.file).filename().string() << ":" << entry.line << ")";
    }

    if (!entry.operation_name.empty()) {
        ss << " [" << entry.operation_name << ": "
           << std::fixed << std::setprecision(2)
           << (entry.duration.count() / 1000000.0) << "ms]";
    }

    if (!entry.context.empty()) {
        ss << " " << entry.context.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    ss << "\n";
    return ss.str();
}

// ConsoleLogSink
ConsoleLogSink::ConsoleLogSink(std::shared_ptr<ILogFormatter> formatter)
    : m_formatter(std::move(formatter)) {}

void ConsoleLogSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::string formatted = m_formatter->format(entry);
    if (entry.level >= LogLevel::ERROR_LEVEL) {
        std::cerr << formatted;
    } else {
        std::cout << formatted;
    }
}

void ConsoleLogSink::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::cout.flush();
    std::cerr.flush();
}

// RotatingFileLogSink
RotatingFileLogSink::RotatingFileLogSink(const Config& config,
                                         std::shared_ptr<ILogFormatter> formatter)
    : m_config(config), m_formatter(std::move(formatter)), m_current_size(0) {
    fs::path parent = fs::path(m_config.base_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
    }
    openNewFile();
}

RotatingFileLogSink::~RotatingFileLogSink() {
    if (m_file && m_file->is_open()) {
        m_file->close();
    }
}

void RotatingFileLogSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_file || !m_file->is_open()) {
        openNewFile();
    }

    std::string formatted = m_formatter->format(entry);
    *m_file << formatted;
    m_current_size += formatted.size();

    rotateIfNeeded();
}

void RotatingFileLogSink::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file && m_file->is_open()) {
        m_file->flush();
    }
}

void RotatingFileLogSink::rotateIfNeeded() {
    if (m_current_size < m_config.max_file_size) {
        return;
    }

    m_file->close();

    std::error_code ec;
    for (int i = static_cast<int>(m_config.max_files) - 1; i >= 1; --i) {
        std::string older = generateFileName(i);
        if (!fs::exists(older, ec)) {
            continue;
        }
        if (i == static_cast<int>(m_config.max_files) - 1) {
            fs::remove(older, ec);
        } else {
            fs::rename(older, generateFileName(i + 1), ec);
        }
    }

    if (m_config.max_files > 1) {
        fs::rename(m_config.base_path, generateFileName(1), ec);
    } else {
        fs::remove(m_config.base_path, ec);
    }

    openNewFile();
}

void RotatingFileLogSink::openNewFile() {
    m_file = std::make_unique<std::ofstream>(m_config.base_path, std::ios::app);
    std::error_code ec;
    auto size = fs::file_size(m_config.base_path, ec);
    m_current_size = ec ? 0 : static_cast<size_t>(size);
}

std::string RotatingFileLogSink::generateFileName(int index) const {
    if (index == 0) {
        return m_config.base_path;
    }

    fs::path p(m_config.base_path);
    std::string stem = p.stem().string();
    std::string ext = p.extension().string();

    return (p.parent_path() / (stem + "." + std::to_string(index) + ext)).string();
}

// PerformanceTracker
double PerformanceTracker::MetricsSnapshot::getAverageDurationMs() const {
    if (count == 0) return 0.0;
    return (static_cast<double>(total_duration_ns) / count) / 1000000.0;
}

nlohmann::json PerformanceTracker::MetricsSnapshot::toJson() const {
    nlohmann::json j;
    j["count"] = count;
    j["errors"] = errors;
    j["average_ms"] = getAverageDurationMs();
    j["min_ms"] = count == 0 ? 0.0 : min_duration_ns / 1000000.0;
    j["max_ms"] = max_duration_ns / 1000000.0;
    j["total_ms"] = total_duration_ns / 1000000.0;
    return j;
}

PerformanceTracker::MetricsSnapshot PerformanceTracker::snapshotOf(const Metrics& metrics) {
    MetricsSnapshot snapshot;
    snapshot.count = metrics.count.load();
    snapshot.total_duration_ns = metrics.total_duration_ns.load();
    snapshot.min_duration_ns = metrics.min_duration_ns.load();
    snapshot.max_duration_ns = metrics.max_duration_ns.load();
    snapshot.errors = metrics.errors.load();
    return snapshot;
}

void PerformanceTracker::recordOperation(const std::string& operation,
                                         std::chrono::nanoseconds duration,
                                         bool success) {
    Metrics* metrics = nullptr;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto& slot = m_metrics[operation];
        if (!slot) {
            slot = std::make_unique<Metrics>();
        }
        metrics = slot.get();
    }

    uint64_t dur = static_cast<uint64_t>(duration.count());
    metrics->count++;
    metrics->total_duration_ns += dur;

    uint64_t current_min = metrics->min_duration_ns.load();
    while (dur < current_min &&
           !metrics->min_duration_ns.compare_exchange_weak(current_min, dur)) {}

    uint64_t current_max = metrics->max_duration_ns.load();
    while (dur > current_max &&
           !metrics->max_duration_ns.compare_exchange_weak(current_max, dur)) {}

    if (!success) {
        metrics->errors++;
    }
}

PerformanceTracker::MetricsSnapshot PerformanceTracker::getMetrics(const std::string& operation) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);

    auto it = m_metrics.find(operation);
    if (it != m_metrics.end() && it->second) {
        return snapshotOf(*it->second);
    }
    return MetricsSnapshot{};
}

std::unordered_map<std::string, PerformanceTracker::MetricsSnapshot>
PerformanceTracker::getAllMetrics() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);

    std::unordered_map<std::string, MetricsSnapshot> result;
    for (const auto& [op, metrics] : m_metrics) {
        if (metrics) {
            result[op] = snapshotOf(*metrics);
        }
    }
    return result;
}

nlohmann::json PerformanceTracker::toJson() const {
    nlohmann::json report = nlohmann::json::object();
    for (const auto& [op, snapshot] : getAllMetrics()) {
        report[op] = snapshot.toJson();
    }
    return report;
}

void PerformanceTracker::reset() {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_metrics.clear();
}

// ScopedTimer
ScopedTimer::ScopedTimer(const std::string& operation_name)
    : m_operation_name(operation_name)
    , m_start(std::chrono::steady_clock::now())
    , m_success(true)
    , m_cancelled(false) {}

ScopedTimer::~ScopedTimer() {
    if (m_cancelled || m_operation_name.empty()) {
        return;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - m_start);
    StructuredLogger::getInstance().logPerformance(m_operation_name, elapsed, m_success);
}

// StructuredLogger
StructuredLogger& StructuredLogger::getInstance() {
    static StructuredLogger instance;
    return instance;
}

StructuredLogger::StructuredLogger()
    : m_min_level(LogLevel::INFO)
    , m_slow_threshold(std::chrono::milliseconds(5000))
    , m_async_enabled(false) {
    addSink(std::make_shared<ConsoleLogSink>(std::make_shared<TextLogFormatter>()));
}

StructuredLogger::~StructuredLogger() {
    shutdown();
}

void StructuredLogger::setLogLevel(LogLevel level) {
    m_min_level = level;
}

LogLevel StructuredLogger::getLogLevel() const {
    return m_min_level.load();
}

void StructuredLogger::addSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    m_sinks.push_back(std::move(sink));
}

void StructuredLogger::clearSinks() {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    m_sinks.clear();
}

void StructuredLogger::setAsyncLogging(bool async) {
    if (m_async_enabled == async) return;

    if (async) {
        m_async_enabled = true;
        m_logging_thread = std::thread(&StructuredLogger::asyncLoggingLoop, this);
    } else {
        m_async_enabled = false;
        m_log_queue.notifyAll();
        if (m_logging_thread.joinable()) {
            m_logging_thread.join();
        }
    }
}

void StructuredLogger::setSlowOperationThreshold(std::chrono::milliseconds threshold) {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    m_slow_threshold = threshold;
}

void StructuredLogger::log(const LogEntry& entry) {
    if (m_shutdown) return;
    if (entry.level < m_min_level.load()) return;

    if (m_async_enabled) {
        m_log_queue.push(entry);
    } else {
        processLogEntry(entry);
    }
}

void StructuredLogger::logPerformance(const std::string& operation,
                                      std::chrono::nanoseconds duration,
                                      bool success) {
    m_performance_tracker.recordOperation(operation, duration, success);

    std::chrono::milliseconds threshold;
    {
        std::lock_guard<std::mutex> lock(m_config_mutex);
        threshold = m_slow_threshold;
    }

    if (duration > threshold) {
        LogEntry entry;
        entry.timestamp = std::chrono::system_clock::now();
        entry.level = LogLevel::WARNING;
        entry.message = "Slow operation detected";
        entry.operation_name = operation;
        entry.duration = duration;
        entry.thread_id = std::this_thread::get_id();
        log(entry);
    }
}

void StructuredLogger::shutdown() {
    if (m_async_enabled) {
        m_async_enabled = false;
        m_log_queue.close();
        if (m_logging_thread.joinable()) {
            m_logging_thread.join();
        }
    }

    m_shutdown = true;

    std::lock_guard<std::mutex> lock(m_config_mutex);
    for (auto& sink : m_sinks) {
        sink->flush();
    }
}

void StructuredLogger::flush() {
    if (m_async_enabled) {
        while (!m_log_queue.empty()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    std::lock_guard<std::mutex> lock(m_config_mutex);
    for (auto& sink : m_sinks) {
        sink->flush();
    }
}

void StructuredLogger::asyncLoggingLoop() {
    while (m_async_enabled) {
        auto entry = m_log_queue.popWithTimeout(100);
        if (entry) {
            processLogEntry(*entry);
        }
    }

    while (auto entry = m_log_queue.tryPop()) {
        processLogEntry(*entry);
    }
}

void StructuredLogger::processLogEntry(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    for (auto& sink : m_sinks) {
        sink->write(entry);
    }
}

// LogBuilder
StructuredLogger::LogBuilder::LogBuilder(StructuredLogger* logger, LogLevel level)
    : m_logger(logger) {
    m_entry.level = level;
    m_entry.timestamp = std::chrono::system_clock::now();
    m_entry.thread_id = std::this_thread::get_id();
    const nlohmann::json& scoped = ScopedLogContext::current();
    if (!scoped.empty()) {
        m_entry.context = scoped;
    }
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::message(const std::string& msg) {
    m_entry.message = msg;
    return *this;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::context(const std::string& key, const nlohmann::json& value) {
    m_entry.context[key] = value;
    return *this;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::file(const char* file, int line) {
    m_entry.file = file;
    m_entry.line = line;
    return *this;
}

StructuredLogger::LogBuilder::~LogBuilder() {
    if (m_logger) {
        m_logger->log(m_entry);
    }
}

} // namespace stepcoach
