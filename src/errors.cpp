#include "errors.hpp"
#include "utils/string_utils.hpp"
#include <vector>

namespace jukebox {

std::string error_message(std::exception_ptr error) {
    if (!error) {
        return "";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

bool is_bot_detection_message(const std::string& message) {
    static const std::vector<std::string> phrases = {
        "sign in to confirm",
        "not a bot",
        "captcha",
        "verify",
        "age-restricted",
        "age restricted",
        "inappropriate",
        "429",
        "too many requests",
        "rate limit",
        "rate-limit",
    };

    return string_utils::contains_any(message, phrases);
}

} // namespace jukebox
