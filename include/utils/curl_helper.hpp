#pragma once

#include <string>
#include <map>
#include <curl/curl.h>

namespace jukebox {

class CurlHelper {
public:
    struct Response {
        long status_code = 0;
        std::string body;
        bool success = false;
        std::string error;

        bool ok() const { return success && status_code >= 200 && status_code < 300; }
    };

    // Initialize/cleanup curl globally
    static void global_init();
    static void global_cleanup();

    static Response get(const std::string& url,
                        const std::map<std::string, std::string>& headers = {});

    static Response post(const std::string& url,
                         const std::string& body,
                         const std::map<std::string, std::string>& headers = {});

    static Response post_json(const std::string& url,
                              const std::string& json_body,
                              const std::map<std::string, std::string>& headers = {});

    static Response del(const std::string& url,
                        const std::map<std::string, std::string>& headers = {});

private:
    static Response perform(const std::string& method, const std::string& url, const std::string* body,
                            const std::map<std::string, std::string>& headers);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp);
};

} // namespace jukebox
