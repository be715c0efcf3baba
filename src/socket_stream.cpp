#include "socket_stream.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace httpd {

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.release();
    }
    return *this;
}

int Socket::release() {
    int fd = fd_;
    fd_ = -1;
    return fd;
}

bool Socket::close() {
    if (fd_ < 0) {
        return true;
    }
    int rc = ::close(fd_);
    if (rc < 0) {
        spdlog::debug("close({}) failed: {}", fd_, std::strerror(errno));
    }
    fd_ = -1;
    return rc == 0;
}

bool set_io_timeout(int fd, std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);

    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        return false;
    }
    return setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

const char* to_string(IoStatus status) {
    switch (status) {
        case IoStatus::Ok: return "ok";
        case IoStatus::Timeout: return "timeout";
        case IoStatus::Closed: return "closed";
        case IoStatus::TooLong: return "line too long";
        case IoStatus::Error: return "error";
    }
    return "unknown";
}

IoStatus SocketStream::read_line(std::string& line, size_t max_length) {
    line.clear();
    for (;;) {
        if (pos_ < len_) {
            const char* begin = buf_ + pos_;
            const void* nl = std::memchr(begin, '\n', len_ - pos_);
            size_t take = nl ? static_cast<size_t>(static_cast<const char*>(nl) - begin) : len_ - pos_;

            if (line.size() + take > max_length) {
                return IoStatus::TooLong;
            }
            line.append(begin, take);

            if (nl) {
                pos_ += take + 1;
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                return IoStatus::Ok;
            }
            pos_ = len_;
        }

        IoStatus st = fill();
        if (st != IoStatus::Ok) {
            return st;
        }
    }
}

IoStatus SocketStream::fill() {
    for (;;) {
        ssize_t n = recv(fd_, buf_, sizeof(buf_), 0);
        if (n > 0) {
            pos_ = 0;
            len_ = static_cast<size_t>(n);
            received_any_ = true;
            return IoStatus::Ok;
        }
        if (n == 0) {
            return IoStatus::Closed;
        }
        if (errno == EINTR) {
            continue;
        }
        return classify_errno(errno, false);
    }
}

IoStatus SocketStream::write_all(const char* data, size_t size) {
    while (size > 0) {
        ssize_t n = send(fd_, data, size, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return classify_errno(errno, true);
        }
        data += n;
        size -= static_cast<size_t>(n);
        bytes_written_ += static_cast<size_t>(n);
    }
    return IoStatus::Ok;
}

IoStatus SocketStream::classify_errno(int err, bool writing) {
    last_errno_ = err;
    last_was_write_ = writing;
    if (err == EAGAIN || err == EWOULDBLOCK) {
        return IoStatus::Timeout;
    }
    return IoStatus::Error;
}

std::string SocketStream::last_error() const {
    if (last_errno_ == EAGAIN || last_errno_ == EWOULDBLOCK) {
        return last_was_write_ ? "Write timed out" : "Read timed out";
    }
    return last_errno_ == 0 ? std::string() : std::string(std::strerror(last_errno_));
}

} // namespace httpd
