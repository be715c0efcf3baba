#pragma once

#include "http_error.hpp"
#include "socket_stream.hpp"
#include <cstdint>
#include <istream>
#include <string>

namespace httpd {

constexpr size_t kFileChunkSize = 8192;

// Status line and headers of a successful file response
std::string success_head(uint64_t content_length);

// Complete error response: head plus text/plain body
std::string error_response(const HttpStatus& status, const std::string& body);

// Stream `content_length` bytes of `file` after the 200 head.
// Returns false if the peer or the file failed before everything was sent.
bool write_success(SocketStream& out, std::istream& file, uint64_t content_length);

// Best effort, returns false when the response could not be written
bool write_error(SocketStream& out, const HttpStatus& status, const std::string& body);

} // namespace httpd
