#include "error_handler.h"
#include "structured_logger.h"
#include <sstream>

namespace stepcoach {

ErrorHandler& ErrorHandler::getInstance() {
    static ErrorHandler instance;
    return instance;
}

void ErrorHandler::handleError(const ErrorInfo& error) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_errorCounts[error.type]++;
    }

    logError(error);

    if (error.severity == ErrorSeverity::CRITICAL) {
        throw StepCoachException(error);
    }
}

void ErrorHandler::handleException(const std::exception& e, const std::string& context) {
    const auto* known = dynamic_cast<const StepCoachException*>(&e);
    if (known) {
        ErrorInfo info = known->getErrorInfo();
        if (info.context.empty()) {
            info.context = context;
        }
        // Already thrown once; record without rethrowing
        if (info.severity == ErrorSeverity::CRITICAL) {
            info.severity = ErrorSeverity::HIGH;
        }
        handleError(info);
    } else {
        handleError(ErrorInfo(ErrorType::UNKNOWN_ERROR, ErrorSeverity::HIGH,
                              e.what(), "", context));
    }
}

size_t ErrorHandler::getErrorCount(ErrorType type) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_errorCounts.find(type);
    return it == m_errorCounts.end() ? 0 : it->second;
}

void ErrorHandler::logError(const ErrorInfo& error) {
    std::ostringstream logMessage;
    logMessage << "[" << errorTypeToString(error.type) << "] " << error.message;
    if (!error.details.empty()) {
        logMessage << " - Details: " << error.details;
    }
    if (!error.context.empty()) {
        logMessage << " - Context: " << error.context;
    }

    const std::string typeName = errorTypeToString(error.type);
    const std::string severityName = errorSeverityToString(error.severity);

    switch (error.severity) {
        case ErrorSeverity::LOW:
            SLOG_DEBUG().message(logMessage.str()).context("error_type", typeName).context("severity", severityName);
            break;
        case ErrorSeverity::MEDIUM:
            SLOG_WARNING().message(logMessage.str()).context("error_type", typeName).context("severity", severityName);
            break;
        case ErrorSeverity::HIGH:
            SLOG_ERROR().message(logMessage.str()).context("error_type", typeName).context("severity", severityName);
            break;
        case ErrorSeverity::CRITICAL:
            SLOG_CRITICAL().message(logMessage.str()).context("error_type", typeName).context("severity", severityName);
            break;
    }
}

std::string ErrorHandler::errorTypeToString(ErrorType type) {
    switch (type) {
        case ErrorType::GRAMMAR_REJECTION: return "GRAMMAR_REJECTION";
        case ErrorType::PLAN_EMPTY: return "PLAN_EMPTY";
        case ErrorType::ENVIRONMENT_ERROR: return "ENVIRONMENT_ERROR";
        case ErrorType::NO_OP_STEP: return "NO_OP_STEP";
        case ErrorType::GOAL_UNREACHABLE: return "GOAL_UNREACHABLE";
        case ErrorType::CANCELLED: return "CANCELLED";
        case ErrorType::ORACLE_CONNECTION_ERROR: return "ORACLE_CONNECTION";
        case ErrorType::ORACLE_RESPONSE_ERROR: return "ORACLE_RESPONSE";
        case ErrorType::ORACLE_RATE_LIMIT_ERROR: return "ORACLE_RATE_LIMIT";
        case ErrorType::PERCEPTION_ERROR: return "PERCEPTION";
        case ErrorType::CONFIGURATION_ERROR: return "CONFIGURATION";
        case ErrorType::VALIDATION_ERROR: return "VALIDATION";
        case ErrorType::TIMEOUT_ERROR: return "TIMEOUT";
        case ErrorType::UNKNOWN_ERROR: return "UNKNOWN";
    }
    return "UNKNOWN";
}

std::string ErrorHandler::errorSeverityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::LOW: return "LOW";
        case ErrorSeverity::MEDIUM: return "MEDIUM";
        case ErrorSeverity::HIGH: return "HIGH";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

} // namespace stepcoach
