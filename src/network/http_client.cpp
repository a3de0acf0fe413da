#include "network/http_client.hpp"
#include "../utils/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <strings.h>
#include <thread>
#include <chrono>

#include <curl/curl.h>

namespace dlnacast {
namespace network {

namespace {

constexpr int SHARE_LOCK_COUNT = CURL_LOCK_DATA_LAST;

std::once_flag g_curlInitFlag;

void ensureCurlInitialized() {
    std::call_once(g_curlInitFlag, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

void lockShared(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
    auto* locks = static_cast<std::mutex*>(userptr);
    locks[data].lock();
}

void unlockShared(CURL*, curl_lock_data data, void* userptr) {
    auto* locks = static_cast<std::mutex*>(userptr);
    locks[data].unlock();
}

size_t writeBody(char* contents, size_t size, size_t nmemb, void* userp) {
    size_t realsize = size * nmemb;
    static_cast<std::string*>(userp)->append(contents, realsize);
    return realsize;
}

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

// Headers of the final response only; a new status line resets the map
size_t collectHeader(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t length = size * nitems;
    auto* headers = static_cast<HeaderMap*>(userdata);
    std::string line(buffer, length);

    if (line.compare(0, 5, "HTTP/") == 0) {
        headers->clear();
        return length;
    }

    auto colon = line.find(':');
    if (colon != std::string::npos) {
        (*headers)[trim(line.substr(0, colon))] = trim(line.substr(colon + 1));
    }
    return length;
}

const char* methodName(int method) {
    switch (method) {
        case 0: return "GET";
        case 1: return "HEAD";
        default: return "POST";
    }
}

} // namespace

bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
    return strcasecmp(a.c_str(), b.c_str()) < 0;
}

std::string HttpResponse::header(const std::string& name) const {
    auto it = headers.find(name);
    return it != headers.end() ? it->second : std::string();
}

CurlHttpClient::CurlHttpClient(const HttpClientConfig& config)
    : config_(config)
    , shareLocks_(std::make_unique<std::mutex[]>(SHARE_LOCK_COUNT)) {
    ensureCurlInitialized();

    CURLSH* share = curl_share_init();
    if (share != nullptr) {
        curl_share_setopt(share, CURLSHOPT_LOCKFUNC, lockShared);
        curl_share_setopt(share, CURLSHOPT_UNLOCKFUNC, unlockShared);
        curl_share_setopt(share, CURLSHOPT_USERDATA, shareLocks_.get());
        // Connection caches stay with each pooled handle
        curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
        curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
        share_ = share;
    } else {
        Logger::warning("CurlHttpClient: curl_share_init failed, DNS cache will not be shared");
    }

    Logger::info("CurlHttpClient: HTTP client initialized with connection pooling ({} / {})",
                 config_.poolConnections, config_.poolMaxSize);
}

CurlHttpClient::~CurlHttpClient() {
    {
        std::lock_guard<std::mutex> lock(poolMutex_);
        for (void* handle : idleHandles_) {
            curl_easy_cleanup(static_cast<CURL*>(handle));
        }
        idleHandles_.clear();
    }
    if (share_ != nullptr) {
        curl_share_cleanup(static_cast<CURLSH*>(share_));
        share_ = nullptr;
    }
}

HttpResponse CurlHttpClient::get(const std::string& url, double timeoutSeconds,
                                 const HeaderMap& headers) {
    Request request;
    request.method = Method::GET;
    request.url = url;
    request.headers = headers;
    request.timeoutSeconds = timeoutSeconds;
    return execute(request);
}

HttpResponse CurlHttpClient::head(const std::string& url, double timeoutSeconds,
                                  bool followRedirects) {
    Request request;
    request.method = Method::HEAD;
    request.url = url;
    request.timeoutSeconds = timeoutSeconds;
    request.followRedirects = followRedirects;
    return execute(request);
}

HttpResponse CurlHttpClient::post(const std::string& url, const std::string& body,
                                  const HeaderMap& headers, double timeoutSeconds) {
    Request request;
    request.method = Method::POST;
    request.url = url;
    request.body = body;
    request.headers = headers;
    request.timeoutSeconds = timeoutSeconds;
    return execute(request);
}

void CurlHttpClient::configure(uint32_t poolConnections, uint32_t poolMaxSize) {
    std::lock_guard<std::mutex> lock(poolMutex_);
    config_.poolConnections = std::max<uint32_t>(1, poolConnections);
    config_.poolMaxSize = std::max<uint32_t>(1, poolMaxSize);

    while (idleHandles_.size() > config_.poolMaxSize) {
        curl_easy_cleanup(static_cast<CURL*>(idleHandles_.back()));
        idleHandles_.pop_back();
    }

    Logger::info("CurlHttpClient: HTTP client reconfigured: pool_connections={}, pool_maxsize={}",
                 config_.poolConnections, config_.poolMaxSize);
}

HttpClientConfig CurlHttpClient::getConfig() const {
    std::lock_guard<std::mutex> lock(poolMutex_);
    return config_;
}

size_t CurlHttpClient::idleHandles() const {
    std::lock_guard<std::mutex> lock(poolMutex_);
    return idleHandles_.size();
}

bool CurlHttpClient::isRetryableStatus(long status) {
    return status == 429 || status == 500 || status == 502 || status == 503 || status == 504;
}

HttpResponse CurlHttpClient::execute(const Request& request) {
    const bool idempotent = request.method != Method::POST;
    const uint32_t maxRetries = idempotent ? getConfig().maxRetries : 0;

    HttpResponse response;
    for (uint32_t attempt = 0;; ++attempt) {
        response = performOnce(request);

        if (attempt >= maxRetries || !isRetryableStatus(response.status)) {
            return response;
        }

        double backoff = getConfig().backoffFactor * std::pow(2.0, attempt);
        Logger::debug("CurlHttpClient: {} {} returned {}, retry {} in {}s",
                      methodName(static_cast<int>(request.method)), request.url,
                      response.status, attempt + 1, backoff);
        std::this_thread::sleep_for(std::chrono::duration<double>(backoff));
    }
}

HttpResponse CurlHttpClient::performOnce(const Request& request) {
    CURL* curl = static_cast<CURL*>(acquireHandle());
    if (curl == nullptr) {
        throw TransportError("curl_easy_init failed");
    }

    HttpResponse response;
    curl_slist* headerList = nullptr;
    char errorBuffer[CURL_ERROR_SIZE] = {0};

    const long timeoutMs = static_cast<long>(std::max(0.001, request.timeoutSeconds) * 1000.0);

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeoutMs);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeoutMs);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.userAgent.c_str());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeBody);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, collectHeader);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, request.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, config_.maxRedirects);
    if (share_ != nullptr) {
        curl_easy_setopt(curl, CURLOPT_SHARE, static_cast<CURLSH*>(share_));
    }

    switch (request.method) {
        case Method::GET:
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
            break;
        case Method::HEAD:
            curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
            break;
        case Method::POST:
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
            break;
    }

    for (const auto& header : request.headers) {
        std::string line = header.first + ": " + header.second;
        headerList = curl_slist_append(headerList, line.c_str());
    }
    if (request.method == Method::POST) {
        // libcurl would otherwise send "Expect: 100-continue" for large bodies
        headerList = curl_slist_append(headerList, "Expect:");
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList);

    CURLcode res = curl_easy_perform(curl);

    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
        curl_easy_getinfo(curl, CURLINFO_REDIRECT_COUNT, &response.redirectCount);
        char* effective = nullptr;
        if (curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective) {
            response.effectiveUrl = effective;
        }
    }

    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, nullptr);
    curl_slist_free_all(headerList);
    releaseHandle(curl);

    if (res != CURLE_OK) {
        std::string detail = errorBuffer[0] != '\0' ? errorBuffer : curl_easy_strerror(res);
        throw TransportError(std::string(methodName(static_cast<int>(request.method))) + " " +
                             request.url + ": " + detail);
    }

    return response;
}

void* CurlHttpClient::acquireHandle() {
    {
        std::lock_guard<std::mutex> lock(poolMutex_);
        if (!idleHandles_.empty()) {
            void* handle = idleHandles_.back();
            idleHandles_.pop_back();
            return handle;
        }
    }
    return curl_easy_init();
}

void CurlHttpClient::releaseHandle(void* handle) {
    CURL* curl = static_cast<CURL*>(handle);
    curl_easy_reset(curl);

    std::lock_guard<std::mutex> lock(poolMutex_);
    if (idleHandles_.size() < config_.poolMaxSize) {
        idleHandles_.push_back(curl);
    } else {
        curl_easy_cleanup(curl);
    }
}

} // namespace network
} // namespace dlnacast
