#pragma once

#include "config.hpp"
#include "socket_stream.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

namespace httpd {

// Client sockets currently owned by worker threads. Shared with the workers
// so it outlives the server if a shutdown gives up on them.
class ConnectionRegistry {
public:
    void add(int fd);

    // Close the socket and forget it
    void release(Socket& client);

    size_t size() const;

    // Wait until no connection is left, false on timeout
    bool wait_idle(std::chrono::milliseconds timeout);

    // shutdown(2) every tracked socket so blocked reads and writes fail
    size_t shutdown_all();

private:
    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::unordered_set<int> fds_;
};

// Static file server: one accept thread, one detached worker per connection
class HttpServer {
public:
    explicit HttpServer(ServerConfig config);
    ~HttpServer();

    // Non-copyable
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Bind, listen and launch the accept loop. False if the port cannot be bound.
    bool start();

    // Stop accepting, then wait for in-flight connections: one grace period,
    // force close, a second grace period. False if workers are still running.
    bool stop();

    bool is_running() const { return running_.load(); }

    // Port actually bound by the last start(), useful when configured with 0
    uint16_t port() const { return bound_port_.load(); }

    size_t active_connections() const { return connections_->size(); }

    const ServerConfig& config() const { return config_; }

private:
    void server_thread(Socket listener);
    void dispatch(Socket client, std::string peer);

    const ServerConfig config_;
    std::atomic<bool> running_{false};
    std::atomic<uint16_t> bound_port_{0};
    std::thread thread_;
    std::shared_ptr<ConnectionRegistry> connections_;
};

} // namespace httpd
