#include "utils/string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace jukebox {
namespace string_utils {

std::string trim(const std::string& str) {
    return ltrim(rtrim(str));
}

std::string ltrim(const std::string& str) {
    auto it = std::find_if(str.begin(), str.end(), [](unsigned char ch) {
        return !std::isspace(ch);
    });
    return std::string(it, str.end());
}

std::string rtrim(const std::string& str) {
    auto it = std::find_if(str.rbegin(), str.rend(), [](unsigned char ch) {
        return !std::isspace(ch);
    });
    return std::string(str.begin(), it.base());
}

std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += delimiter;
        result += parts[i];
    }
    return result;
}

std::string url_encode(const std::string& value) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;

    for (char c : value) {
        if (isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << std::uppercase;
            escaped << '%' << std::setw(2) << int(static_cast<unsigned char>(c));
            escaped << std::nouppercase;
        }
    }

    return escaped.str();
}

std::string shell_quote(const std::string& value) {
    std::string result = "'";
    for (char c : value) {
        if (c == '\'') {
            result += "'\\''";
        } else {
            result += c;
        }
    }
    result += "'";
    return result;
}

std::string escape_markdown(const std::string& text) {
    std::string result;
    result.reserve(text.size() * 2);
    for (char c : text) {
        if (c == '*' || c == '_' || c == '`' || c == '~' || c == '|' || c == '\\') {
            result += '\\';
        }
        result += c;
    }
    return result;
}

std::string truncate(const std::string& str, size_t max_length, const std::string& suffix) {
    if (str.length() <= max_length) {
        return str;
    }
    if (max_length <= suffix.length()) {
        return suffix.substr(0, max_length);
    }
    return str.substr(0, max_length - suffix.length()) + suffix;
}

bool contains_any(const std::string& text, const std::vector<std::string>& phrases) {
    std::string lower_text = to_lower(text);
    return std::any_of(phrases.begin(), phrases.end(), [&lower_text](const std::string& phrase) {
        return lower_text.find(to_lower(phrase)) != std::string::npos;
    });
}

} // namespace string_utils
} // namespace jukebox
