#pragma once

#include <string>
#include <vector>

namespace jukebox {
namespace string_utils {

// Trim whitespace
std::string trim(const std::string& str);
std::string ltrim(const std::string& str);
std::string rtrim(const std::string& str);

// Case conversion
std::string to_lower(const std::string& str);

// String joining
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// URL encoding
std::string url_encode(const std::string& value);

// Single-quote a value for /bin/sh
std::string shell_quote(const std::string& value);

// Discord text helpers
std::string escape_markdown(const std::string& text);
std::string truncate(const std::string& str, size_t max_length, const std::string& suffix = "...");

// Case-insensitive check for any of the phrases
bool contains_any(const std::string& text, const std::vector<std::string>& phrases);

} // namespace string_utils
} // namespace jukebox
