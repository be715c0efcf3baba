#pragma once

#include "http_error.hpp"
#include "socket_stream.hpp"
#include <cstddef>
#include <string>

namespace httpd {

struct ParsedRequest {
    std::string method;
    std::string raw_path;  // as received, still percent-encoded
    std::string version;
};

// The peer closed the connection before sending anything
struct NoRequest {};

using ParseOutcome = std::variant<ParsedRequest, HttpError, NoRequest>;

constexpr size_t kMaxLineLength = 8192;

// Validate a request line: exactly three space separated tokens, an HTTP/1.0
// or HTTP/1.1 version and the GET method.
Outcome<ParsedRequest> parse_request_line(const std::string& line);

// Read the request line and drain the header block from `in`, then validate.
// The request line is kept in `request_line` for logging.
ParseOutcome parse_request(SocketStream& in, std::string& request_line);

} // namespace httpd
