#include "llm_oracle.h"
#include "../common/structured_logger.h"
#include "../common/string_utils.h"
#include <algorithm>

namespace stepcoach {

LlmOracle::LlmOracle(const LlmConfig& config)
    : m_config(config)
    , m_httpClient(std::make_unique<HttpClient>())
    , m_totalRequests(0)
    , m_totalTokensUsed(0) {

    m_httpClient->setTimeout(m_config.timeoutMs);
    m_httpClient->setMaxRetries(m_config.maxRetries);
    m_httpClient->setRetryDelay(m_config.retryDelayMs);
    m_httpClient->setVerifySSL(m_config.verifySsl);
    if (!m_config.proxyUrl.empty()) {
        m_httpClient->setProxy(m_config.proxyUrl);
    }

    SLOG_INFO().message("LlmOracle initialized")
        .context("base_url", m_config.baseUrl)
        .context("model", m_config.modelName)
        .context("vision_model", m_config.visionModelName);
}

LlmOracle::~LlmOracle() = default;

bool LlmOracle::isConfigured() const {
    return !m_config.baseUrl.empty() && !m_config.modelName.empty() && !m_config.apiKey.empty();
}

void LlmOracle::setCustomHeaders(const std::map<std::string, std::string>& headers) {
    m_customHeaders = headers;
}

Result<std::string, OracleError> LlmOracle::ask(const OracleRequest& request) {
    SCOPED_TIMER("oracle." + (request.purpose.empty() ? std::string("ask") : request.purpose));

    if (!isConfigured()) {
        _scoped_timer.markFailed();
        return Result<std::string, OracleError>::failure(
            OracleError(OracleError::Code::NOT_CONFIGURED, "LLM endpoint, model or API key not configured"));
    }

    if (!checkRateLimit()) {
        _scoped_timer.markFailed();
        SLOG_WARNING().message("Local rate limit reached").context("requests_per_minute", m_config.requestsPerMinute);
        return Result<std::string, OracleError>::failure(
            OracleError(OracleError::Code::RATE_LIMITED, "Rate limit exceeded", 429, true));
    }
    addRequestTime();

    nlohmann::json payload = createRequestPayload(request);
    HttpResponse response = m_httpClient->post(getApiEndpoint(), payload.dump(), getRequestHeaders());

    if (!response.success) {
        _scoped_timer.markFailed();
        OracleError error = mapHttpError(response);
        SLOG_ERROR().message("Oracle request failed")
            .context("purpose", request.purpose)
            .context("code", oracleErrorCodeToString(error.code))
            .context("http_status", error.httpStatus)
            .context("error", error.message);
        return Result<std::string, OracleError>::failure(error);
    }

    auto content = extractContent(response.body);
    if (!content.ok()) {
        _scoped_timer.markFailed();
        SLOG_ERROR().message("Malformed oracle response")
            .context("purpose", request.purpose)
            .context("error", content.error().message);
        return content;
    }

    updateUsageStats(response.body);
    SLOG_DEBUG().message("Oracle response received")
        .context("purpose", request.purpose)
        .context("content_length", content.value().size());
    return content;
}

nlohmann::json LlmOracle::createRequestPayload(const OracleRequest& request) const {
    nlohmann::json messages = nlohmann::json::array();

    if (!request.systemPrompt.empty()) {
        messages.push_back({{"role", "system"}, {"content", request.systemPrompt}});
    }

    if (request.hasImages()) {
        nlohmann::json parts = nlohmann::json::array();
        parts.push_back({{"type", "text"}, {"text", request.prompt}});
        for (const auto& image : request.images) {
            std::string dataUrl = "data:" + imageMimeType(image.format) + ";base64," + encodeBase64(image.data);
            parts.push_back({{"type", "image_url"}, {"image_url", {{"url", dataUrl}}}});
        }
        messages.push_back({{"role", "user"}, {"content", parts}});
    } else {
        messages.push_back({{"role", "user"}, {"content", request.prompt}});
    }

    nlohmann::json payload;
    payload["model"] = request.hasImages() ? m_config.visionModelName : m_config.modelName;
    payload["messages"] = messages;
    payload["temperature"] = m_config.temperature;
    payload["max_tokens"] = request.maxTokens > 0 ? request.maxTokens : m_config.maxTokens;
    return payload;
}

Result<std::string, OracleError> LlmOracle::extractContent(const std::string& responseBody) {
    nlohmann::json response = nlohmann::json::parse(responseBody, nullptr, false);
    if (response.is_discarded() || !response.is_object()) {
        return Result<std::string, OracleError>::failure(
            OracleError(OracleError::Code::MALFORMED_RESPONSE, "Response body is not a JSON object"));
    }

    if (!response.contains("choices") || !response["choices"].is_array() || response["choices"].empty()) {
        return Result<std::string, OracleError>::failure(
            OracleError(OracleError::Code::MALFORMED_RESPONSE, "Response has no choices"));
    }

    const auto& choice = response["choices"][0];
    if (!choice.contains("message") || !choice["message"].is_object() ||
        !choice["message"].contains("content") || !choice["message"]["content"].is_string()) {
        return Result<std::string, OracleError>::failure(
            OracleError(OracleError::Code::MALFORMED_RESPONSE, "Response choice has no text content"));
    }

    return Result<std::string, OracleError>::success(choice["message"]["content"].get<std::string>());
}

std::string LlmOracle::encodeBase64(const std::vector<uint8_t>& data) {
    static const char* chars = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        uint32_t triple = (static_cast<uint32_t>(data[i]) << 16) |
                          (static_cast<uint32_t>(data[i + 1]) << 8) |
                          static_cast<uint32_t>(data[i + 2]);
        result += chars[(triple >> 18) & 0x3f];
        result += chars[(triple >> 12) & 0x3f];
        result += chars[(triple >> 6) & 0x3f];
        result += chars[triple & 0x3f];
    }

    size_t remaining = data.size() - i;
    if (remaining == 1) {
        uint32_t triple = static_cast<uint32_t>(data[i]) << 16;
        result += chars[(triple >> 18) & 0x3f];
        result += chars[(triple >> 12) & 0x3f];
        result += "==";
    } else if (remaining == 2) {
        uint32_t triple = (static_cast<uint32_t>(data[i]) << 16) |
                          (static_cast<uint32_t>(data[i + 1]) << 8);
        result += chars[(triple >> 18) & 0x3f];
        result += chars[(triple >> 12) & 0x3f];
        result += chars[(triple >> 6) & 0x3f];
        result += '=';
    }
    return result;
}

std::string LlmOracle::imageMimeType(const std::string& format) {
    std::string lowered = utils::StringUtils::toLowerCase(format);
    if (lowered == "jpg" || lowered == "jpeg") {
        return "image/jpeg";
    }
    if (lowered == "webp") {
        return "image/webp";
    }
    if (lowered == "gif") {
        return "image/gif";
    }
    return "image/png";
}

int LlmOracle::getTotalRequests() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_totalRequests;
}

int LlmOracle::getTotalTokensUsed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_totalTokensUsed;
}

bool LlmOracle::checkRateLimit() {
    if (m_config.requestsPerMinute <= 0) {
        return true;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    cleanupOldRequests();
    return m_requestTimes.size() < static_cast<size_t>(m_config.requestsPerMinute);
}

void LlmOracle::cleanupOldRequests() {
    auto oneMinuteAgo = std::chrono::steady_clock::now() - std::chrono::minutes(1);
    m_requestTimes.erase(
        std::remove_if(m_requestTimes.begin(), m_requestTimes.end(),
                       [oneMinuteAgo](const auto& time) { return time < oneMinuteAgo; }),
        m_requestTimes.end());
}

void LlmOracle::addRequestTime() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_requestTimes.push_back(std::chrono::steady_clock::now());
    ++m_totalRequests;
}

void LlmOracle::updateUsageStats(const std::string& responseBody) {
    nlohmann::json response = nlohmann::json::parse(responseBody, nullptr, false);
    if (response.is_discarded() || !response.is_object()) {
        return;
    }
    if (response.contains("usage") && response["usage"].is_object() &&
        response["usage"].contains("total_tokens") && response["usage"]["total_tokens"].is_number_integer()) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_totalTokensUsed += response["usage"]["total_tokens"].get<int>();
    }
}

std::string LlmOracle::getApiEndpoint() const {
    std::string base = m_config.baseUrl;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/chat/completions";
}

std::map<std::string, std::string> LlmOracle::getRequestHeaders() const {
    std::map<std::string, std::string> headers = {
        {"Content-Type", "application/json"},
        {"Authorization", "Bearer " + m_config.apiKey}
    };
    for (const auto& header : m_customHeaders) {
        headers[header.first] = header.second;
    }
    return headers;
}

OracleError LlmOracle::mapHttpError(const HttpResponse& response) const {
    if (response.transportError) {
        return OracleError(OracleError::Code::TRANSPORT, response.errorMessage, 0, true);
    }
    if (response.statusCode == 429) {
        return OracleError(OracleError::Code::RATE_LIMITED, "Rate limited by provider", 429, true);
    }

    std::string message = "HTTP " + std::to_string(response.statusCode);
    nlohmann::json body = nlohmann::json::parse(response.body, nullptr, false);
    if (!body.is_discarded() && body.is_object() && body.contains("error")) {
        const auto& error = body["error"];
        if (error.is_object() && error.contains("message") && error["message"].is_string()) {
            message += ": " + error["message"].get<std::string>();
        } else if (error.is_string()) {
            message += ": " + error.get<std::string>();
        }
    }
    return OracleError(OracleError::Code::HTTP_STATUS, message, response.statusCode, response.statusCode >= 500);
}

} // namespace stepcoach
