#include "http_client.h"
#include "../common/structured_logger.h"
#include "../common/error_handler.h"
#include "../common/string_utils.h"
#include <curl/curl.h>
#include <thread>
#include <chrono>
#include <mutex>

namespace stepcoach {

namespace {

size_t writeBodyCallback(char* data, size_t size, size_t count, void* userData) {
    auto* body = static_cast<std::string*>(userData);
    body->append(data, size * count);
    return size * count;
}

size_t writeHeaderCallback(char* data, size_t size, size_t count, void* userData) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userData);
    std::string line(data, size * count);
    size_t colonPos = line.find(':');
    if (colonPos != std::string::npos) {
        std::string key = utils::StringUtils::toLowerCase(utils::StringUtils::trim(line.substr(0, colonPos)));
        (*headers)[key] = utils::StringUtils::trim(line.substr(colonPos + 1));
    }
    return size * count;
}

} // anonymous namespace

struct HttpClient::HttpClientImpl {
    CURL* handle;

    HttpClientImpl() : handle(nullptr) {
        static std::once_flag globalInit;
        std::call_once(globalInit, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

        handle = curl_easy_init();
        if (!handle) {
            STEPCOACH_HANDLE_ERROR(ErrorType::ORACLE_CONNECTION_ERROR, ErrorSeverity::HIGH,
                                   "Failed to initialize libcurl", "", "HttpClient::HttpClientImpl");
        }
    }

    ~HttpClientImpl() {
        if (handle) {
            curl_easy_cleanup(handle);
        }
    }

    HttpClientImpl(const HttpClientImpl&) = delete;
    HttpClientImpl& operator=(const HttpClientImpl&) = delete;
};

HttpClient::HttpClient()
    : m_impl(std::make_unique<HttpClientImpl>())
    , m_timeoutMs(30000)
    , m_userAgent("StepCoach/1.0")
    , m_maxRetries(2)
    , m_retryDelay(1000)
    , m_verifySSL(true) {

    SLOG_DEBUG().message("HttpClient initialized");
}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::post(const std::string& url, const std::string& body, const std::map<std::string, std::string>& headers) {
    HttpRequest request;
    request.url = url;
    request.method = "POST";
    request.body = body;
    request.headers = headers;
    request.timeoutMs = m_timeoutMs;

    return retryRequest(request);
}

HttpResponse HttpClient::performRequest(const HttpRequest& request) {
    HttpResponse response;
    logRequest(request);

    if (!m_impl->handle) {
        response.transportError = true;
        response.errorMessage = "libcurl not initialized";
        return response;
    }

    CURL* curl = m_impl->handle;
    curl_easy_reset(curl);

    struct curl_slist* headerList = nullptr;
    for (const auto& header : request.headers) {
        std::string line = header.first + ": " + header.second;
        headerList = curl_slist_append(headerList, line.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, m_userAgent.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeoutMs));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.timeoutMs));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, m_verifySSL ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, m_verifySSL ? 2L : 0L);
    if (!m_proxyUrl.empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, m_proxyUrl.c_str());
    }
    if (headerList) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList);
    }

    if (request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else if (request.method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        if (!request.body.empty()) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        }
    }

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeBodyCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, writeHeaderCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

    CURLcode result = curl_easy_perform(curl);
    curl_slist_free_all(headerList);

    if (result != CURLE_OK) {
        response.transportError = true;
        response.errorMessage = curl_easy_strerror(result);
        SLOG_WARNING().message("HTTP transport failure")
            .context("url", request.url)
            .context("error", response.errorMessage);
        return response;
    }

    long statusCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &statusCode);
    response.statusCode = static_cast<int>(statusCode);
    response.success = statusCode >= 200 && statusCode < 300;
    if (!response.success) {
        response.errorMessage = "HTTP status " + std::to_string(statusCode);
    }

    logResponse(response);

    return response;
}

bool HttpClient::isRetryable(const HttpResponse& response) {
    return response.transportError || response.statusCode == 429 || response.statusCode >= 500;
}

HttpResponse HttpClient::retryRequest(const HttpRequest& request) {
    HttpResponse response;

    for (int attempt = 0; attempt <= m_maxRetries; ++attempt) {
        response = performRequest(request);

        if (response.success || !isRetryable(response)) {
            break;
        }

        if (attempt < m_maxRetries) {
            SLOG_WARNING().message("HTTP request failed, retrying")
                .context("attempt", std::to_string(attempt + 1) + "/" + std::to_string(m_maxRetries + 1))
                .context("error", response.errorMessage);
            std::this_thread::sleep_for(std::chrono::milliseconds(m_retryDelay));
        }
    }

    if (!response.success) {
        STEPCOACH_HANDLE_ERROR(response.statusCode == 429 ? ErrorType::ORACLE_RATE_LIMIT_ERROR
                               : response.transportError ? ErrorType::ORACLE_CONNECTION_ERROR
                                                         : ErrorType::ORACLE_RESPONSE_ERROR,
                               ErrorSeverity::MEDIUM, "HTTP request failed", response.errorMessage,
                               "HttpClient::retryRequest");
    }

    return response;
}

void HttpClient::logRequest(const HttpRequest& request) {
    SLOG_DEBUG().message("HTTP request").context("method", request.method).context("url", request.url);
    if (!request.body.empty() && request.body.length() < 500) {
        SLOG_DEBUG().message("Request body").context("body", request.body);
    }
}

void HttpClient::logResponse(const HttpResponse& response) {
    SLOG_DEBUG().message("HTTP response").context("status_code", response.statusCode);
    if (!response.body.empty() && response.body.length() < 500) {
        SLOG_DEBUG().message("Response body").context("body", response.body);
    }
}

void HttpClient::setTimeout(int timeoutMs) { m_timeoutMs = timeoutMs; }
void HttpClient::setMaxRetries(int maxRetries) { m_maxRetries = maxRetries; }
void HttpClient::setRetryDelay(int delayMs) { m_retryDelay = delayMs; }
void HttpClient::setVerifySSL(bool verify) { m_verifySSL = verify; }
void HttpClient::setProxy(const std::string& proxyUrl) { m_proxyUrl = proxyUrl; }

} // namespace stepcoach
