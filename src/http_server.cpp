#include "http_server.hpp"
#include "connection.hpp"
#include <spdlog/spdlog.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>

namespace httpd {

// ─── ConnectionRegistry ──────────────────────────────────────────────────────

void ConnectionRegistry::add(int fd) {
    std::lock_guard<std::mutex> lock(mutex_);
    fds_.insert(fd);
}

void ConnectionRegistry::release(Socket& client) {
    {
        // Closed under the lock so shutdown_all() never sees a reused descriptor
        std::lock_guard<std::mutex> lock(mutex_);
        fds_.erase(client.fd());
        client.close();
    }
    idle_cv_.notify_all();
}

size_t ConnectionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fds_.size();
}

bool ConnectionRegistry::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return fds_.empty(); });
}

size_t ConnectionRegistry::shutdown_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (int fd : fds_) {
        if (::shutdown(fd, SHUT_RDWR) < 0) {
            spdlog::debug("shutdown({}) failed: {}", fd, std::strerror(errno));
        }
    }
    return fds_.size();
}

// ─── HttpServer ──────────────────────────────────────────────────────────────

static std::string peer_name(const sockaddr_in& addr) {
    char ip[INET_ADDRSTRLEN] = "?";
    inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
    return std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
}

HttpServer::HttpServer(ServerConfig config)
    : config_(std::move(config))
    , connections_(std::make_shared<ConnectionRegistry>())
{
}

HttpServer::~HttpServer() {
    if (running_.load() || thread_.joinable()) {
        stop();
    }
}

bool HttpServer::start() {
    if (running_.load()) {
        spdlog::warn("HTTP server already running");
        return true;
    }

    Socket listener(socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
    if (!listener) {
        spdlog::error("HTTP: Failed to create socket: {}", std::strerror(errno));
        return false;
    }

    int opt = 1;
    if (setsockopt(listener.fd(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        spdlog::warn("HTTP: Failed to set SO_REUSEADDR: {}", std::strerror(errno));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(config_.port);

    if (bind(listener.fd(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        spdlog::error("HTTP: Failed to bind to port {}: {}", config_.port, std::strerror(errno));
        return false;
    }

    if (listen(listener.fd(), config_.backlog) < 0) {
        spdlog::error("HTTP: Failed to listen: {}", std::strerror(errno));
        return false;
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (getsockname(listener.fd(), reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        bound_port_.store(ntohs(bound.sin_port));
    } else {
        bound_port_.store(config_.port);
    }

    running_.store(true);
    try {
        thread_ = std::thread(&HttpServer::server_thread, this, std::move(listener));
    } catch (const std::system_error& e) {
        running_.store(false);
        spdlog::error("HTTP: Failed to start accept thread: {}", e.what());
        return false;
    }

    spdlog::info("HTTP server listening on http://0.0.0.0:{} (root: {})",
                 bound_port_.load(), config_.base_directory.string());
    return true;
}

bool HttpServer::stop() {
    bool was_running = running_.exchange(false);
    if (thread_.joinable()) {
        thread_.join();
    }

    if (connections_->wait_idle(config_.shutdown_grace)) {
        if (was_running) {
            spdlog::info("HTTP server stopped");
        }
        return true;
    }

    size_t forced = connections_->shutdown_all();
    spdlog::warn("HTTP: {} connection(s) still active after {} ms, forcing them closed",
                 forced, config_.shutdown_grace.count());

    if (connections_->wait_idle(config_.shutdown_grace)) {
        spdlog::info("HTTP server stopped");
        return true;
    }

    spdlog::error("HTTP: Shutdown incomplete, {} connection(s) did not terminate",
                  connections_->size());
    return false;
}

void HttpServer::server_thread(Socket listener) {
    pollfd pfd{};
    pfd.fd = listener.fd();
    pfd.events = POLLIN;

    try {
        while (running_.load()) {
            int rc = poll(&pfd, 1, static_cast<int>(config_.accept_poll.count()));
            if (rc == 0) {
                continue;
            }
            if (rc < 0) {
                if (errno != EINTR) {
                    spdlog::warn("HTTP: poll failed: {}", std::strerror(errno));
                }
                continue;
            }

            sockaddr_in client_addr{};
            socklen_t client_len = sizeof(client_addr);
            int client_fd = accept4(listener.fd(), reinterpret_cast<sockaddr*>(&client_addr),
                                    &client_len, SOCK_CLOEXEC);
            if (client_fd < 0) {
                int err = errno;
                if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR || err == ECONNABORTED) {
                    continue;
                }
                spdlog::warn("HTTP: Accept failed: {}", std::strerror(err));
                // Out of descriptors: back off instead of spinning on poll()
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                continue;
            }

            Socket client(client_fd);
            if (!set_io_timeout(client.fd(), config_.read_timeout)) {
                spdlog::warn("HTTP: Failed to set socket timeout: {}", std::strerror(errno));
            }
            dispatch(std::move(client), peer_name(client_addr));
        }
    } catch (const std::exception& e) {
        spdlog::error("HTTP: Accept loop terminated: {}", e.what());
    }

    listener.close();
    spdlog::debug("HTTP: Listening socket closed");
}

void HttpServer::dispatch(Socket client, std::string peer) {
    auto registry = connections_;
    auto socket = std::make_shared<Socket>(std::move(client));
    registry->add(socket->fd());

    try {
        std::thread([registry, socket, peer, config = config_]() {
            try {
                ConnectionHandler handler(config, peer);
                handler.handle(socket->fd());
            } catch (const std::exception& e) {
                spdlog::error("[{}] Connection failed: {}", peer, e.what());
            }
            registry->release(*socket);
        }).detach();
    } catch (const std::system_error& e) {
        spdlog::warn("[{}] Failed to start worker thread: {}", peer, e.what());
        registry->release(*socket);
    }
}

} // namespace httpd
