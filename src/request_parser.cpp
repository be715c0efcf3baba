#include "request_parser.hpp"
#include <spdlog/spdlog.h>
#include <vector>

namespace httpd {

static std::vector<std::string> split_spaces(const std::string& line) {
    std::vector<std::string> tokens;
    size_t start = 0;
    for (;;) {
        size_t end = line.find(' ', start);
        tokens.push_back(line.substr(start, end - start));
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return tokens;
}

static HttpError read_failure(IoStatus st, const SocketStream& in, const char* what) {
    switch (st) {
        case IoStatus::Timeout:
            return request_timeout(in.last_error());
        case IoStatus::TooLong:
            return bad_request();
        case IoStatus::Closed:
            return internal_error(std::string("Connection closed before end of ") + what);
        default:
            return internal_error(in.last_error());
    }
}

Outcome<ParsedRequest> parse_request_line(const std::string& line) {
    auto tokens = split_spaces(line);
    if (tokens.size() != 3) {
        return bad_request();
    }

    ParsedRequest req{tokens[0], tokens[1], tokens[2]};
    if (req.version != "HTTP/1.0" && req.version != "HTTP/1.1") {
        return bad_request();
    }
    if (req.method != "GET") {
        return method_not_allowed();
    }
    if (req.raw_path.empty()) {
        return bad_request();
    }
    return req;
}

ParseOutcome parse_request(SocketStream& in, std::string& request_line) {
    IoStatus st = in.read_line(request_line, kMaxLineLength);
    if (st != IoStatus::Ok) {
        if (st == IoStatus::Closed && !in.received_any()) {
            return NoRequest{};
        }
        return read_failure(st, in, "request line");
    }

    // Headers are drained unparsed, the request is complete at the blank line
    std::string header;
    for (;;) {
        st = in.read_line(header, kMaxLineLength);
        if (st != IoStatus::Ok) {
            return read_failure(st, in, "headers");
        }
        if (header.empty()) {
            break;
        }
        spdlog::trace("Discarding header: {}", header);
    }

    auto parsed = parse_request_line(request_line);
    if (failed(parsed)) {
        return std::get<HttpError>(std::move(parsed));
    }
    return std::get<ParsedRequest>(std::move(parsed));
}

} // namespace httpd
