#include "api_server.hpp"
#include "../utils/logger.hpp"

#include <asio/post.hpp>
#include <asio/thread_pool.hpp>

#include <algorithm>
#include <cctype>

namespace dlnacast {
namespace network {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string stripMappedPrefix(const std::string& address) {
    static const std::string prefix = "::ffff:";
    if (address.compare(0, prefix.size(), prefix) == 0) {
        return address.substr(prefix.size());
    }
    return address;
}

} // namespace

ApiServer::ApiServer(ApiRouter& router, const std::string& host, uint16_t port, uint32_t workerThreads)
    : router_(router)
    , host_(host)
    , port_(port)
    , workerThreads_(std::max<uint32_t>(1, workerThreads)) {
}

ApiServer::~ApiServer() {
    stop();
}

bool ApiServer::start() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (running_) {
        return true;
    }

    try {
        server_ = std::make_unique<WebServer>();
        server_->clear_access_channels(websocketpp::log::alevel::all);
        server_->clear_error_channels(websocketpp::log::elevel::all);
        server_->init_asio();
        server_->set_reuse_addr(true);
        server_->set_http_handler([this](ConnectionHdl hdl) { onHttp(hdl); });

        server_->listen(host_, std::to_string(port_));
        server_->start_accept();
    } catch (const std::exception& e) {
        Logger::error("ApiServer: Failed to listen on {}:{}: {}", host_, port_, e.what());
        server_.reset();
        return false;
    }

    workers_ = std::make_unique<asio::thread_pool>(workerThreads_);
    serverThread_ = std::thread([this]() {
        try {
            server_->run();
        } catch (const std::exception& e) {
            Logger::error("ApiServer: Event loop terminated: {}", e.what());
        }
    });

    running_ = true;
    Logger::info("ApiServer: Listening on http://{}:{} ({} workers)", host_, port_, workerThreads_);
    return true;
}

void ApiServer::stop() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (!running_) {
        return;
    }
    running_ = false;

    Logger::info("ApiServer: Stopping");

    websocketpp::lib::error_code ec;
    server_->stop_listening(ec);
    if (ec) {
        Logger::warning("ApiServer: stop_listening failed: {}", ec.message());
    }

    // Let in-flight requests finish before the event loop goes away
    workers_->join();
    server_->stop();

    if (serverThread_.joinable()) {
        serverThread_.join();
    }
    workers_.reset();
    server_.reset();
    Logger::info("ApiServer: Stopped");
}

void ApiServer::onHttp(ConnectionHdl hdl) {
    WebServer::connection_ptr con = server_->get_con_from_hdl(hdl);
    HTTPRequest request = buildRequest(con);

    websocketpp::lib::error_code ec = con->defer_http_response();
    if (ec) {
        Logger::error("ApiServer: Could not defer response: {}", ec.message());
        return;
    }

    asio::post(*workers_, [this, con, request]() {
        HTTPResponse response = router_.handle(request);

        con->set_status(static_cast<websocketpp::http::status_code::value>(static_cast<int>(response.status)));
        con->replace_header("Content-Type", response.contentType);
        for (const auto& header : response.headers) {
            con->replace_header(header.first, header.second);
        }
        con->set_body(response.body);

        websocketpp::lib::error_code sendError = con->send_http_response();
        if (sendError) {
            Logger::warning("ApiServer: Failed to send response for {} {}: {}",
                            request.method, request.path, sendError.message());
        }

        Logger::debug("ApiServer: {} {} from {} -> {}", request.method, request.path,
                      request.clientIP, static_cast<int>(response.status));
    });
}

HTTPRequest ApiServer::buildRequest(WebServer::connection_ptr con) const {
    HTTPRequest request;
    request.method = con->get_request().get_method();
    parseTarget(con->get_resource(), request.path, request.queryParameters);

    for (const auto& header : con->get_request().get_headers()) {
        request.headers[header.first] = header.second;
    }
    request.body = con->get_request_body();
    request.userAgent = con->get_request_header("User-Agent");
    request.timestamp = SystemClock::now();

    std::error_code ec;
    auto endpoint = con->get_raw_socket().remote_endpoint(ec);
    if (!ec) {
        request.clientIP = stripMappedPrefix(endpoint.address().to_string());
    }
    return request;
}

void ApiServer::parseTarget(const std::string& resource, std::string& path,
                            std::map<std::string, std::string>& params) {
    const size_t query = resource.find('?');
    path = urlDecode(resource.substr(0, query), false);
    if (path.empty()) {
        path = "/";
    }
    if (query == std::string::npos) {
        return;
    }

    const std::string text = resource.substr(query + 1);
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t end = text.find('&', pos);
        if (end == std::string::npos) {
            end = text.size();
        }
        const std::string pair = text.substr(pos, end - pos);
        if (!pair.empty()) {
            const size_t eq = pair.find('=');
            const std::string key = urlDecode(pair.substr(0, eq));
            const std::string value = eq == std::string::npos ? "" : urlDecode(pair.substr(eq + 1));
            // First occurrence wins
            params.emplace(key, value);
        }
        pos = end + 1;
    }
}

std::string ApiServer::urlDecode(const std::string& text, bool plusAsSpace) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '%' && i + 2 < text.size()) {
            const int hi = hexValue(text[i + 1]);
            const int lo = hexValue(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
            out.push_back(c);
        } else if (c == '+' && plusAsSpace) {
            out.push_back(' ');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace network
} // namespace dlnacast
