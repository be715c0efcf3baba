#pragma once

#include "config.hpp"
#include "http_error.hpp"
#include "request_parser.hpp"
#include "socket_stream.hpp"
#include <string>

namespace httpd {

// Serves exactly one request on an accepted socket: parse, resolve, respond.
// The caller keeps ownership of the socket and closes it afterwards.
class ConnectionHandler {
public:
    ConnectionHandler(const ServerConfig& config, std::string peer);

    // Non-copyable
    ConnectionHandler(const ConnectionHandler&) = delete;
    ConnectionHandler& operator=(const ConnectionHandler&) = delete;

    // Returns the status code sent, or 0 if the peer never sent a request
    int handle(int client_fd);

private:
    int serve_file(SocketStream& out, const ParsedRequest& request);
    int respond_error(SocketStream& out, const HttpError& error);

    const ServerConfig& config_;
    std::string peer_;
};

} // namespace httpd
