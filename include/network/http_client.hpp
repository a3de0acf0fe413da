#pragma once

#include <cstdint>
#include <string>
#include <map>
#include <vector>
#include <mutex>
#include <memory>
#include <stdexcept>

namespace dlnacast {
namespace network {

/**
 * @brief Raised for failures below HTTP (DNS, refused connection, timeout)
 */
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message)
        : std::runtime_error(message) {}
};

struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

struct HttpResponse {
    long status = 0;
    HeaderMap headers;
    std::string body;
    std::string effectiveUrl;
    long redirectCount = 0;

    // Empty when the header is absent
    std::string header(const std::string& name) const;
    bool ok() const { return status == 200; }
};

/**
 * @brief Outbound HTTP transport shared by discovery, control and detection
 *
 * Implementations raise TransportError when no HTTP response was obtained.
 * A non-2xx status is not an error at this level.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse get(const std::string& url, double timeoutSeconds,
                             const HeaderMap& headers = HeaderMap()) = 0;
    virtual HttpResponse head(const std::string& url, double timeoutSeconds,
                              bool followRedirects = true) = 0;
    virtual HttpResponse post(const std::string& url, const std::string& body,
                              const HeaderMap& headers, double timeoutSeconds) = 0;
};

struct HttpClientConfig {
    uint32_t poolConnections = 10;
    uint32_t poolMaxSize = 20;
    uint32_t maxRetries = 3;
    double backoffFactor = 0.3;
    long maxRedirects = 10;
    std::string userAgent = "dlnacast/1.0";
};

/**
 * @brief libcurl transport with a pool of reusable easy handles
 *
 * Handles share one DNS cache and TLS session cache through a curl share
 * object. Each handle keeps its own connections. GET and HEAD
 * are retried on 429/500/502/503/504 with exponential backoff; POST never is.
 */
class CurlHttpClient : public HttpTransport {
public:
    explicit CurlHttpClient(const HttpClientConfig& config = HttpClientConfig());
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse get(const std::string& url, double timeoutSeconds,
                     const HeaderMap& headers = HeaderMap()) override;
    HttpResponse head(const std::string& url, double timeoutSeconds,
                      bool followRedirects = true) override;
    HttpResponse post(const std::string& url, const std::string& body,
                      const HeaderMap& headers, double timeoutSeconds) override;

    // Re-sizes the handle pool; idle handles above the new limit are released
    void configure(uint32_t poolConnections, uint32_t poolMaxSize);

    HttpClientConfig getConfig() const;
    size_t idleHandles() const;

    static bool isRetryableStatus(long status);

private:
    enum class Method { GET, HEAD, POST };

    struct Request {
        Method method = Method::GET;
        std::string url;
        std::string body;
        HeaderMap headers;
        double timeoutSeconds = 10.0;
        bool followRedirects = true;
    };

    HttpResponse execute(const Request& request);
    HttpResponse performOnce(const Request& request);

    void* acquireHandle();
    void releaseHandle(void* handle);

    HttpClientConfig config_;
    mutable std::mutex poolMutex_;
    std::vector<void*> idleHandles_;

    void* share_ = nullptr;
    std::unique_ptr<std::mutex[]> shareLocks_;
};

} // namespace network
} // namespace dlnacast
