#pragma once

#include "http_error.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace httpd {

// Only returned for a servable file, so a successful resolve always carries
// exists == true and is_directory == false
struct ResolvedTarget {
    // Fully canonical, symlinks included
    std::filesystem::path absolute_file_path;
    bool exists = false;
    bool is_directory = false;
};

// Decode %XX escapes byte by byte and '+' as space.
// Returns nullopt on a truncated or non-hex escape.
std::optional<std::string> percent_decode(const std::string& encoded);

// True if `path` is `base` or lies beneath it, compared per path component
bool is_within(const std::filesystem::path& base, const std::filesystem::path& path);

// Map a request target onto a regular file beneath `base_directory`, which
// must already be canonical. Fails with 400 for malformed or escaping paths
// and 404 for missing files and directories.
Outcome<ResolvedTarget> resolve_path(const std::filesystem::path& base_directory, const std::string& raw_path);

} // namespace httpd
