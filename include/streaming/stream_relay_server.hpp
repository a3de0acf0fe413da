#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <thread>
#include <mutex>
#include <atomic>
#include <vector>

#include <asio.hpp>

namespace dlnacast {
namespace streaming {

/**
 * @brief Minimal HTTP server relaying a pipe to clients at /stream.mp3
 *
 * The acceptor runs on its own io_context thread; each client is served by
 * a dedicated thread that copies chunkSize blocks from the source descriptor
 * to the socket until the source reaches EOF, the client goes away, or the
 * server is stopped. A client disconnect never affects the source.
 */
class StreamRelayServer {
public:
    static constexpr const char* STREAM_PATH = "/stream.mp3";

    StreamRelayServer(const std::string& bindAddress, uint16_t port, int sourceFd, size_t chunkSize);
    ~StreamRelayServer();

    StreamRelayServer(const StreamRelayServer&) = delete;
    StreamRelayServer& operator=(const StreamRelayServer&) = delete;

    // Binds with address reuse; false when the port cannot be bound
    bool start();

    // Closes the listener and client sockets and joins every thread
    void stop();

    bool isListening() const { return listening_; }
    uint16_t port() const { return port_; }
    size_t activeClients() const;

private:
    struct Client {
        std::shared_ptr<asio::ip::tcp::socket> socket;
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    void doAccept();
    void serveClient(std::shared_ptr<asio::ip::tcp::socket> socket, std::shared_ptr<std::atomic<bool>> finished);
    void relay(asio::ip::tcp::socket& socket);
    void reapFinishedClients();

    std::string bindAddress_;
    uint16_t port_;
    int sourceFd_;
    size_t chunkSize_;

    std::unique_ptr<asio::io_context> io_context_;
    std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
    std::unique_ptr<std::thread> io_thread_;

    std::atomic<bool> listening_{false};
    std::atomic<bool> stopping_{false};

    mutable std::mutex clients_mutex_;
    std::vector<Client> clients_;
};

} // namespace streaming
} // namespace dlnacast
