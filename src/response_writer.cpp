#include "response_writer.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <sstream>

namespace httpd {

static const char* const kHttpVersion = "HTTP/1.0";
static const char* const kCommonHeaders =
    "Cache-Control: private, max-age=0\r\n"
    "Connection: close\r\n"
    "Server: httpd\r\n";

std::string success_head(uint64_t content_length) {
    std::ostringstream oss;
    oss << kHttpVersion << " 200 OK\r\n"
        << "Content-Length: " << content_length << "\r\n"
        << kCommonHeaders
        << "\r\n";
    return oss.str();
}

std::string error_response(const HttpStatus& status, const std::string& body) {
    std::ostringstream oss;
    oss << kHttpVersion << " " << status.code << " " << status.reason << "\r\n"
        << "Content-Length: " << body.size() << "\r\n"
        << "Content-Type: text/plain; charset=ISO-8859-1\r\n"
        << kCommonHeaders
        << "\r\n"
        << body;
    return oss.str();
}

bool write_success(SocketStream& out, std::istream& file, uint64_t content_length) {
    IoStatus st = out.write_all(success_head(content_length));
    if (st != IoStatus::Ok) {
        spdlog::debug("Failed to send response head: {} ({})", to_string(st), out.last_error());
        return false;
    }

    char chunk[kFileChunkSize];
    uint64_t remaining = content_length;
    while (remaining > 0) {
        auto want = static_cast<std::streamsize>(std::min<uint64_t>(remaining, sizeof(chunk)));
        file.read(chunk, want);
        std::streamsize got = file.gcount();
        if (got <= 0) {
            spdlog::warn("File ended with {} bytes left to send", remaining);
            return false;
        }

        st = out.write_all(chunk, static_cast<size_t>(got));
        if (st != IoStatus::Ok) {
            spdlog::debug("Failed to send file body: {} ({})", to_string(st), out.last_error());
            return false;
        }
        remaining -= static_cast<uint64_t>(got);
    }
    return true;
}

bool write_error(SocketStream& out, const HttpStatus& status, const std::string& body) {
    IoStatus st = out.write_all(error_response(status, body));
    if (st != IoStatus::Ok) {
        spdlog::debug("Failed to send {} response: {} ({})", status.code, to_string(st), out.last_error());
        return false;
    }
    return true;
}

} // namespace httpd
