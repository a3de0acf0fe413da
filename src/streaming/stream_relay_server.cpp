#include "streaming/stream_relay_server.hpp"
#include "../utils/logger.hpp"

#include <cerrno>
#include <istream>

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace dlnacast {
namespace streaming {

namespace {

constexpr int SOURCE_POLL_MS = 200;
constexpr size_t MAX_REQUEST_HEADER_BYTES = 8192;

const char* STREAM_HEADERS =
    "HTTP/1.1 200 OK\r\n"
    "Content-Type: audio/mpeg\r\n"
    "Connection: close\r\n"
    "Accept-Ranges: none\r\n"
    "Cache-Control: no-cache\r\n"
    "\r\n";

const char* NOT_FOUND_RESPONSE =
    "HTTP/1.1 404 Not Found\r\n"
    "Connection: close\r\n"
    "Content-Length: 0\r\n"
    "\r\n";

const char* NOT_IMPLEMENTED_RESPONSE =
    "HTTP/1.1 501 Not Implemented\r\n"
    "Connection: close\r\n"
    "Content-Length: 0\r\n"
    "\r\n";

} // namespace

StreamRelayServer::StreamRelayServer(const std::string& bindAddress, uint16_t port, int sourceFd, size_t chunkSize)
    : bindAddress_(bindAddress)
    , port_(port)
    , sourceFd_(sourceFd)
    , chunkSize_(chunkSize > 0 ? chunkSize : 8192) {
}

StreamRelayServer::~StreamRelayServer() {
    stop();
}

bool StreamRelayServer::start() {
    if (listening_) {
        return true;
    }

    stopping_ = false;
    io_context_ = std::make_unique<asio::io_context>();
    acceptor_ = std::make_unique<asio::ip::tcp::acceptor>(*io_context_);

    asio::error_code ec;
    asio::ip::address address = asio::ip::make_address(bindAddress_, ec);
    if (ec) {
        Logger::error("StreamRelayServer: Invalid bind address {}: {}", bindAddress_, ec.message());
        acceptor_.reset();
        io_context_.reset();
        return false;
    }

    asio::ip::tcp::endpoint endpoint(address, port_);
    acceptor_->open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor_->set_option(asio::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor_->bind(endpoint, ec);
    }
    if (!ec) {
        acceptor_->listen(asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        Logger::error("StreamRelayServer: Cannot listen on {}:{}: {}", bindAddress_, port_, ec.message());
        asio::error_code closeError;
        acceptor_->close(closeError);
        acceptor_.reset();
        io_context_.reset();
        return false;
    }

    doAccept();
    io_thread_ = std::make_unique<std::thread>([this]() { io_context_->run(); });
    listening_ = true;

    Logger::info("StreamRelayServer: Streaming server started on port {}", port_);
    return true;
}

void StreamRelayServer::stop() {
    if (!io_context_) {
        return;
    }

    stopping_ = true;

    // The acceptor belongs to the io thread; closing it cancels the pending accept
    asio::post(*io_context_, [this]() {
        asio::error_code ec;
        acceptor_->close(ec);
    });
    if (io_thread_ && io_thread_->joinable()) {
        io_thread_->join();
    }
    io_thread_.reset();

    std::vector<Client> clients;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        clients.swap(clients_);
    }
    for (auto& client : clients) {
        // Unblocks a relay thread stuck writing to a slow client
        ::shutdown(client.socket->native_handle(), SHUT_RDWR);
    }
    for (auto& client : clients) {
        if (client.thread.joinable()) {
            client.thread.join();
        }
    }

    acceptor_.reset();
    io_context_.reset();
    listening_ = false;
    Logger::debug("StreamRelayServer: Stopped listening on port {}", port_);
}

size_t StreamRelayServer::activeClients() const {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    size_t count = 0;
    for (const auto& client : clients_) {
        if (!*client.finished) {
            ++count;
        }
    }
    return count;
}

void StreamRelayServer::reapFinishedClients() {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    for (auto it = clients_.begin(); it != clients_.end();) {
        if (*it->finished) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = clients_.erase(it);
        } else {
            ++it;
        }
    }
}

void StreamRelayServer::doAccept() {
    auto socket = std::make_shared<asio::ip::tcp::socket>(*io_context_);
    acceptor_->async_accept(*socket, [this, socket](const asio::error_code& ec) {
        if (stopping_ || ec == asio::error::operation_aborted) {
            return;
        }

        if (ec) {
            Logger::warning("StreamRelayServer: Accept failed: {}", ec.message());
        } else {
            reapFinishedClients();

            auto finished = std::make_shared<std::atomic<bool>>(false);
            std::lock_guard<std::mutex> lock(clients_mutex_);
            Client client;
            client.socket = socket;
            client.finished = finished;
            client.thread = std::thread(&StreamRelayServer::serveClient, this, socket, finished);
            clients_.push_back(std::move(client));
        }

        doAccept();
    });
}

void StreamRelayServer::serveClient(std::shared_ptr<asio::ip::tcp::socket> socket,
                                    std::shared_ptr<std::atomic<bool>> finished) {
    asio::error_code ec;
    std::string remote = "unknown";
    auto endpoint = socket->remote_endpoint(ec);
    if (!ec) {
        remote = endpoint.address().to_string();
    }

    asio::streambuf request(MAX_REQUEST_HEADER_BYTES);
    asio::read_until(*socket, request, "\r\n\r\n", ec);
    if (ec) {
        Logger::debug("StreamRelayServer: Failed to read request from {}: {}", remote, ec.message());
    } else {
        std::istream stream(&request);
        std::string method;
        std::string target;
        stream >> method >> target;

        std::string path = target.substr(0, target.find('?'));
        Logger::debug("StreamRelayServer: {} - {} {}", remote, method, target);

        if (method != "GET" && method != "HEAD") {
            asio::write(*socket, asio::buffer(std::string(NOT_IMPLEMENTED_RESPONSE)), ec);
        } else if (path != STREAM_PATH) {
            asio::write(*socket, asio::buffer(std::string(NOT_FOUND_RESPONSE)), ec);
        } else {
            asio::write(*socket, asio::buffer(std::string(STREAM_HEADERS)), ec);
            if (!ec && method == "GET") {
                Logger::info("StreamRelayServer: Client {} connected to stream", remote);
                relay(*socket);
            }
        }
    }

    asio::error_code ignored;
    socket->shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket->close(ignored);
    *finished = true;
}

void StreamRelayServer::relay(asio::ip::tcp::socket& socket) {
    std::vector<char> buffer(chunkSize_);

    while (!stopping_) {
        struct pollfd pfd;
        pfd.fd = sourceFd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = ::poll(&pfd, 1, SOURCE_POLL_MS);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            Logger::error("StreamRelayServer: Error polling transcoder output");
            return;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t n = ::read(sourceFd_, buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            Logger::error("StreamRelayServer: Error reading transcoder output");
            return;
        }
        if (n == 0) {
            Logger::debug("StreamRelayServer: Transcoder output ended");
            return;
        }

        asio::error_code ec;
        asio::write(socket, asio::buffer(buffer.data(), static_cast<size_t>(n)), ec);
        if (ec) {
            Logger::info("StreamRelayServer: Client disconnected from stream");
            return;
        }
    }
}

} // namespace streaming
} // namespace dlnacast
