#ifndef STEPCOACH_ERROR_HANDLER_H
#define STEPCOACH_ERROR_HANDLER_H

#include <string>
#include <exception>
#include <map>
#include <mutex>
#include <chrono>

namespace stepcoach {

enum class ErrorType {
    // Run taxonomy
    GRAMMAR_REJECTION,
    PLAN_EMPTY,
    ENVIRONMENT_ERROR,
    NO_OP_STEP,
    GOAL_UNREACHABLE,
    CANCELLED,
    // Infrastructure
    ORACLE_CONNECTION_ERROR,
    ORACLE_RESPONSE_ERROR,
    ORACLE_RATE_LIMIT_ERROR,
    PERCEPTION_ERROR,
    CONFIGURATION_ERROR,
    VALIDATION_ERROR,
    TIMEOUT_ERROR,
    UNKNOWN_ERROR
};

enum class ErrorSeverity {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

struct ErrorInfo {
    ErrorType type;
    ErrorSeverity severity;
    std::string message;
    std::string details;
    std::string context;
    std::chrono::system_clock::time_point timestamp;

    ErrorInfo(ErrorType t, ErrorSeverity s, const std::string& msg,
              const std::string& det = "", const std::string& ctx = "")
        : type(t), severity(s), message(msg), details(det), context(ctx),
          timestamp(std::chrono::system_clock::now()) {}
};

class StepCoachException : public std::exception {
public:
    explicit StepCoachException(const ErrorInfo& error) : m_errorInfo(error) {}

    const char* what() const noexcept override {
        return m_errorInfo.message.c_str();
    }

    const ErrorInfo& getErrorInfo() const { return m_errorInfo; }

private:
    ErrorInfo m_errorInfo;
};

/**
 * @brief Central error sink: logs every error and counts them per type
 *
 * CRITICAL errors are rethrown as StepCoachException after being recorded.
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();

    void handleError(const ErrorInfo& error);
    void handleException(const std::exception& e, const std::string& context = "");

    size_t getErrorCount(ErrorType type) const;

    static std::string errorTypeToString(ErrorType type);
    static std::string errorSeverityToString(ErrorSeverity severity);

private:
    ErrorHandler() = default;
    ~ErrorHandler() = default;
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    mutable std::mutex m_mutex;
    std::map<ErrorType, size_t> m_errorCounts;

    void logError(const ErrorInfo& error);
};

#define STEPCOACH_THROW(type, severity, message, details, context) \
    throw stepcoach::StepCoachException(stepcoach::ErrorInfo(type, severity, message, details, context))

#define STEPCOACH_HANDLE_ERROR(type, severity, message, details, context) \
    stepcoach::ErrorHandler::getInstance().handleError(stepcoach::ErrorInfo(type, severity, message, details, context))

} // namespace stepcoach

#endif // STEPCOACH_ERROR_HANDLER_H
