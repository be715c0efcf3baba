#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace httpd {

// Owns a socket (or any) file descriptor, closes it on destruction
class Socket {
public:
    Socket() = default;
    explicit Socket(int fd) : fd_(fd) {}
    ~Socket() { close(); }

    // Non-copyable
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    Socket(Socket&& other) noexcept : fd_(other.release()) {}
    Socket& operator=(Socket&& other) noexcept;

    int fd() const { return fd_; }
    explicit operator bool() const { return fd_ >= 0; }

    int release();

    // Returns false when ::close reported an error; the descriptor is gone either way
    bool close();

private:
    int fd_ = -1;
};

// Apply SO_RCVTIMEO and SO_SNDTIMEO
bool set_io_timeout(int fd, std::chrono::milliseconds timeout);

enum class IoStatus {
    Ok,
    Timeout,
    Closed,
    TooLong,
    Error,
};

const char* to_string(IoStatus status);

// Buffered line reader and blocking writer over a connected socket.
// Does not own the descriptor.
class SocketStream {
public:
    explicit SocketStream(int fd) : fd_(fd) {}

    SocketStream(const SocketStream&) = delete;
    SocketStream& operator=(const SocketStream&) = delete;

    // Read up to the next LF. The terminator and a preceding CR are removed.
    IoStatus read_line(std::string& line, size_t max_length);

    IoStatus write_all(const char* data, size_t size);
    IoStatus write_all(const std::string& data) { return write_all(data.data(), data.size()); }

    // True once at least one byte arrived from the peer
    bool received_any() const { return received_any_; }
    size_t bytes_written() const { return bytes_written_; }

    // errno of the last failed read or write
    int last_errno() const { return last_errno_; }
    std::string last_error() const;

private:
    IoStatus fill();
    IoStatus classify_errno(int err, bool writing);

    int fd_;
    char buf_[4096];
    size_t pos_ = 0;
    size_t len_ = 0;
    bool received_any_ = false;
    size_t bytes_written_ = 0;
    int last_errno_ = 0;
    bool last_was_write_ = false;
};

} // namespace httpd
