#pragma once

#include <string>
#include <utility>
#include <variant>

namespace httpd {

struct HttpStatus {
    int code;
    const char* reason;
};

namespace status {
constexpr HttpStatus kOk{200, "OK"};
constexpr HttpStatus kBadRequest{400, "Bad Request"};
constexpr HttpStatus kNotFound{404, "Not Found"};
constexpr HttpStatus kMethodNotAllowed{405, "Method Not Allowed"};
constexpr HttpStatus kRequestTimeout{408, "Request Timeout"};
constexpr HttpStatus kInternalError{500, "Internal Server Error"};
} // namespace status

// A failed step of request handling. `message` becomes the response body;
// when empty the reason phrase is used instead.
struct HttpError {
    HttpStatus status;
    std::string message;

    std::string body() const { return message.empty() ? std::string(status.reason) : message; }
};

inline HttpError bad_request() { return {status::kBadRequest, {}}; }
inline HttpError not_found() { return {status::kNotFound, {}}; }
inline HttpError method_not_allowed() { return {status::kMethodNotAllowed, {}}; }
inline HttpError request_timeout(std::string message = {}) { return {status::kRequestTimeout, std::move(message)}; }
inline HttpError internal_error(std::string message = {}) { return {status::kInternalError, std::move(message)}; }

// Either the value produced by a step or the HTTP error it failed with
template <typename T>
using Outcome = std::variant<T, HttpError>;

template <typename T>
bool failed(const Outcome<T>& outcome) {
    return std::holds_alternative<HttpError>(outcome);
}

} // namespace httpd
