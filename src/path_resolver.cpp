#include "path_resolver.hpp"
#include <spdlog/spdlog.h>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace httpd {

static int hex_value(char ch) {
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
    return -1;
}

std::optional<std::string> percent_decode(const std::string& encoded) {
    std::string out;
    out.reserve(encoded.size());

    for (size_t i = 0; i < encoded.size(); ++i) {
        char ch = encoded[i];
        if (ch == '+') {
            out.push_back(' ');
        } else if (ch == '%') {
            if (i + 2 >= encoded.size()) {
                return std::nullopt;
            }
            int hi = hex_value(encoded[i + 1]);
            int lo = hex_value(encoded[i + 2]);
            if (hi < 0 || lo < 0) {
                return std::nullopt;
            }
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else {
            out.push_back(ch);
        }
    }
    return out;
}

bool is_within(const fs::path& base, const fs::path& path) {
    auto b = base.begin();
    auto p = path.begin();
    for (; b != base.end(); ++b, ++p) {
        // A trailing separator shows up as an empty final element
        if (b->empty() && std::next(b) == base.end()) {
            break;
        }
        if (p == path.end() || *p != *b) {
            return false;
        }
    }
    return true;
}

Outcome<ResolvedTarget> resolve_path(const fs::path& base_directory, const std::string& raw_path) {
    std::string target = raw_path.substr(0, raw_path.find_first_of("?#"));

    auto decoded = percent_decode(target);
    if (!decoded) {
        spdlog::debug("Malformed escape in path: {}", raw_path);
        return bad_request();
    }
    if (decoded->find('\0') != std::string::npos) {
        return bad_request();
    }

    // Always treat the request path as relative to the base directory
    size_t first = decoded->find_first_not_of('/');
    std::string relative = first == std::string::npos ? std::string() : decoded->substr(first);

    // Normalize first so a missing segment followed by ".." cannot hide a
    // symlink from weakly_canonical
    std::error_code ec;
    fs::path joined = (base_directory / relative).lexically_normal();
    fs::path canonical = fs::weakly_canonical(joined, ec);
    if (ec) {
        spdlog::debug("Cannot canonicalize {}: {}", raw_path, ec.message());
        return not_found();
    }

    if (!is_within(base_directory, canonical)) {
        spdlog::warn("Path traversal attempt: {}", raw_path);
        return bad_request();
    }

    ResolvedTarget resolved;
    fs::file_status st = fs::status(canonical, ec);
    resolved.exists = !ec && fs::exists(st);
    resolved.is_directory = resolved.exists && fs::is_directory(st);

    if (!resolved.exists || resolved.is_directory || !fs::is_regular_file(st)) {
        return not_found();
    }

    // The file exists, so every component can now be resolved
    resolved.absolute_file_path = fs::canonical(canonical, ec);
    if (ec) {
        spdlog::debug("Cannot canonicalize {}: {}", raw_path, ec.message());
        return not_found();
    }
    if (!is_within(base_directory, resolved.absolute_file_path)) {
        spdlog::warn("Path traversal attempt: {}", raw_path);
        return bad_request();
    }
    return resolved;
}

} // namespace httpd
