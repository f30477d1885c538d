#ifndef STEPCOACH_HTTP_CLIENT_H
#define STEPCOACH_HTTP_CLIENT_H

#include <string>
#include <map>
#include <memory>

namespace stepcoach {

struct HttpResponse {
    int statusCode;
    std::string body;
    std::map<std::string, std::string> headers;
    bool success;
    bool transportError;
    std::string errorMessage;

    HttpResponse() : statusCode(0), success(false), transportError(false) {}
};

struct HttpRequest {
    std::string url;
    std::string method;
    std::string body;
    std::map<std::string, std::string> headers;
    int timeoutMs;

    HttpRequest() : method("GET"), timeoutMs(30000) {}
};

/**
 * @brief Blocking HTTP client on libcurl with a simple retry loop
 *
 * Transport failures, 429 and 5xx responses are retried; other statuses are
 * returned to the caller on the first attempt.
 */
class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    HttpResponse post(const std::string& url, const std::string& body, const std::map<std::string, std::string>& headers = {});

    // Configuration
    void setTimeout(int timeoutMs);
    void setMaxRetries(int maxRetries);
    void setRetryDelay(int delayMs);
    void setVerifySSL(bool verify);
    void setProxy(const std::string& proxyUrl);

private:
    struct HttpClientImpl;
    std::unique_ptr<HttpClientImpl> m_impl;

    int m_timeoutMs;
    std::string m_userAgent;
    int m_maxRetries;
    int m_retryDelay;
    bool m_verifySSL;
    std::string m_proxyUrl;

    HttpResponse performRequest(const HttpRequest& request);
    HttpResponse retryRequest(const HttpRequest& request);
    static bool isRetryable(const HttpResponse& response);
    void logRequest(const HttpRequest& request);
    void logResponse(const HttpResponse& response);
};

} // namespace stepcoach

#endif // STEPCOACH_HTTP_CLIENT_H
