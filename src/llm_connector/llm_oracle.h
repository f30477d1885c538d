#ifndef STEPCOACH_LLM_ORACLE_H
#define STEPCOACH_LLM_ORACLE_H

#include "../oracle/oracle.h"
#include "../common/config_manager.h"
#include "http_client.h"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <chrono>
#include <nlohmann/json.hpp>

namespace stepcoach {

/**
 * @brief IOracle over an OpenAI-compatible /chat/completions endpoint
 *
 * Requests that carry images go to the vision model as base64 data URLs.
 */
class LlmOracle : public IOracle {
public:
    explicit LlmOracle(const LlmConfig& config);
    ~LlmOracle() override;

    Result<std::string, OracleError> ask(const OracleRequest& request) override;

    bool isConfigured() const;
    void setCustomHeaders(const std::map<std::string, std::string>& headers);

    // Usage statistics
    int getTotalRequests() const;
    int getTotalTokensUsed() const;

    static std::string encodeBase64(const std::vector<uint8_t>& data);
    static std::string imageMimeType(const std::string& format);

    /**
     * @brief Build the chat-completions payload for a request
     */
    nlohmann::json createRequestPayload(const OracleRequest& request) const;

    /**
     * @brief Pull choices[0].message.content out of a response body
     */
    static Result<std::string, OracleError> extractContent(const std::string& responseBody);

private:
    LlmConfig m_config;
    std::unique_ptr<HttpClient> m_httpClient;
    std::map<std::string, std::string> m_customHeaders;

    mutable std::mutex m_mutex;
    std::vector<std::chrono::steady_clock::time_point> m_requestTimes;
    int m_totalRequests;
    int m_totalTokensUsed;

    bool checkRateLimit();
    void cleanupOldRequests();
    void addRequestTime();
    void updateUsageStats(const std::string& responseBody);

    std::string getApiEndpoint() const;
    std::map<std::string, std::string> getRequestHeaders() const;
    OracleError mapHttpError(const HttpResponse& response) const;
};

} // namespace stepcoach

#endif // STEPCOACH_LLM_ORACLE_H
