#ifndef STEPCOACH_ORACLE_H
#define STEPCOACH_ORACLE_H

#include "../common/result.h"
#include "../common/error_handler.h"
#include <string>
#include <vector>
#include <cstdint>

namespace stepcoach {

struct OracleImage {
    std::vector<uint8_t> data;
    std::string format;   // "png", "jpeg"
};

struct OracleRequest {
    std::string systemPrompt;
    std::string prompt;
    std::vector<OracleImage> images;
    int maxTokens;
    std::string purpose;  // log label: "plan", "replan", "screen", "verify", ...

    OracleRequest() : maxTokens(0) {}
    bool hasImages() const { return !images.empty(); }
};

struct OracleError {
    enum class Code {
        NOT_CONFIGURED,
        TRANSPORT,
        HTTP_STATUS,
        RATE_LIMITED,
        MALFORMED_RESPONSE
    };

    Code code;
    std::string message;
    int httpStatus;
    bool retryable;

    OracleError() : code(Code::TRANSPORT), httpStatus(0), retryable(false) {}
    OracleError(Code c, const std::string& msg, int status = 0, bool canRetry = false)
        : code(c), message(msg), httpStatus(status), retryable(canRetry) {}
};

inline std::string oracleErrorCodeToString(OracleError::Code code) {
    switch (code) {
        case OracleError::Code::NOT_CONFIGURED: return "NOT_CONFIGURED";
        case OracleError::Code::TRANSPORT: return "TRANSPORT";
        case OracleError::Code::HTTP_STATUS: return "HTTP_STATUS";
        case OracleError::Code::RATE_LIMITED: return "RATE_LIMITED";
        case OracleError::Code::MALFORMED_RESPONSE: return "MALFORMED_RESPONSE";
    }
    return "UNKNOWN";
}

inline ErrorType oracleErrorType(OracleError::Code code) {
    switch (code) {
        case OracleError::Code::NOT_CONFIGURED: return ErrorType::CONFIGURATION_ERROR;
        case OracleError::Code::TRANSPORT: return ErrorType::ORACLE_CONNECTION_ERROR;
        case OracleError::Code::HTTP_STATUS: return ErrorType::ORACLE_RESPONSE_ERROR;
        case OracleError::Code::RATE_LIMITED: return ErrorType::ORACLE_RATE_LIMIT_ERROR;
        case OracleError::Code::MALFORMED_RESPONSE: return ErrorType::ORACLE_RESPONSE_ERROR;
    }
    return ErrorType::UNKNOWN_ERROR;
}

/**
 * @brief A language/vision model behind a prompt-in, text-out boundary
 *
 * Implementations never throw for remote failures; they return an OracleError.
 * The answer may be wrong; callers only rely on it being some text.
 */
class IOracle {
public:
    virtual ~IOracle() = default;
    virtual Result<std::string, OracleError> ask(const OracleRequest& request) = 0;
};

} // namespace stepcoach

#endif // STEPCOACH_ORACLE_H
