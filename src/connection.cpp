#include "connection.hpp"
#include "path_resolver.hpp"
#include "response_writer.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <utility>

namespace httpd {

ConnectionHandler::ConnectionHandler(const ServerConfig& config, std::string peer)
    : config_(config)
    , peer_(std::move(peer))
{
}

int ConnectionHandler::handle(int client_fd) {
    SocketStream stream(client_fd);
    std::string request_line;

    ParseOutcome parsed = parse_request(stream, request_line);
    if (std::holds_alternative<NoRequest>(parsed)) {
        spdlog::debug("[{}] Closed without a request", peer_);
        return 0;
    }

    int status = 0;
    if (const auto* error = std::get_if<HttpError>(&parsed)) {
        status = respond_error(stream, *error);
    } else {
        status = serve_file(stream, std::get<ParsedRequest>(parsed));
    }

    spdlog::info("{} \"{}\" {} {}", peer_, request_line, status, stream.bytes_written());
    return status;
}

int ConnectionHandler::serve_file(SocketStream& out, const ParsedRequest& request) {
    Outcome<ResolvedTarget> resolved = resolve_path(config_.base_directory, request.raw_path);
    if (const auto* error = std::get_if<HttpError>(&resolved)) {
        return respond_error(out, *error);
    }
    const auto& target = std::get<ResolvedTarget>(resolved);

    std::ifstream file(target.absolute_file_path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        int err = errno;
        spdlog::warn("[{}] Cannot open {}: {}", peer_, target.absolute_file_path.string(), std::strerror(err));
        return respond_error(out, internal_error(err != 0 ? std::strerror(err) : "Cannot read file"));
    }

    std::streamoff size = file.tellg();
    file.seekg(0, std::ios::beg);
    if (size < 0 || !file) {
        return respond_error(out, internal_error("Cannot read file"));
    }

    if (!write_success(out, file, static_cast<uint64_t>(size))) {
        spdlog::debug("[{}] Transfer of {} aborted after {} bytes",
                      peer_, target.absolute_file_path.string(), out.bytes_written());
    }
    return status::kOk.code;
}

int ConnectionHandler::respond_error(SocketStream& out, const HttpError& error) {
    if (!write_error(out, error.status, error.body())) {
        spdlog::debug("[{}] Could not deliver {} response", peer_, error.status.code);
    }
    return error.status.code;
}

} // namespace httpd
