#pragma once

#include "api_router.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

namespace asio {
class thread_pool;
}

namespace dlnacast {
namespace network {

using WebServer = websocketpp::server<websocketpp::config::asio>;
using ConnectionHdl = websocketpp::connection_hdl;

/**
 * @brief HTTP front end of the control API
 *
 * websocketpp accepts connections and parses requests on a single asio
 * thread. Each request is deferred and handed to a worker pool where the
 * ApiRouter runs, so a slow discovery or SOAP call never stalls the acceptor.
 */
class ApiServer {
public:
    ApiServer(ApiRouter& router, const std::string& host, uint16_t port, uint32_t workerThreads);
    ~ApiServer();

    ApiServer(const ApiServer&) = delete;
    ApiServer& operator=(const ApiServer&) = delete;

    bool start();
    void stop();
    bool isRunning() const { return running_; }

    uint16_t port() const { return port_; }

    // Splits "/path?a=1&b=x%20y" into the path and decoded parameters
    static void parseTarget(const std::string& resource, std::string& path,
                            std::map<std::string, std::string>& params);
    static std::string urlDecode(const std::string& text, bool plusAsSpace = true);

private:
    void onHttp(ConnectionHdl hdl);
    HTTPRequest buildRequest(WebServer::connection_ptr con) const;

    ApiRouter& router_;
    std::string host_;
    uint16_t port_;
    uint32_t workerThreads_;

    std::unique_ptr<WebServer> server_;
    std::unique_ptr<asio::thread_pool> workers_;
    std::thread serverThread_;
    std::atomic<bool> running_{false};
    std::mutex lifecycleMutex_;
};

} // namespace network
} // namespace dlnacast
