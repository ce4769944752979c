#include "utils/curl_helper.hpp"

namespace jukebox {

void CurlHelper::global_init() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void CurlHelper::global_cleanup() {
    curl_global_cleanup();
}

size_t CurlHelper::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

CurlHelper::Response CurlHelper::perform(const std::string& method, const std::string& url, const std::string* body,
                                          const std::map<std::string, std::string>& headers) {
    Response response;

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "Failed to initialize CURL";
        return response;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "jukebox/1.0");
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 15L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    }
    if (body) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& [key, value] : headers) {
        std::string header_str = key + ": " + value;
        header_list = curl_slist_append(header_list, header_str.c_str());
    }
    if (header_list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }

    CURLcode res = curl_easy_perform(curl);

    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
        response.success = true;
    } else {
        response.error = curl_easy_strerror(res);
    }

    if (header_list) {
        curl_slist_free_all(header_list);
    }
    curl_easy_cleanup(curl);

    return response;
}

CurlHelper::Response CurlHelper::get(const std::string& url, const std::map<std::string, std::string>& headers) {
    return perform("GET", url, nullptr, headers);
}

CurlHelper::Response CurlHelper::post(const std::string& url, const std::string& body,
                                       const std::map<std::string, std::string>& headers) {
    return perform("POST", url, &body, headers);
}

CurlHelper::Response CurlHelper::post_json(const std::string& url, const std::string& json_body,
                                            const std::map<std::string, std::string>& headers) {
    auto combined_headers = headers;
    combined_headers["Content-Type"] = "application/json";
    return post(url, json_body, combined_headers);
}

CurlHelper::Response CurlHelper::del(const std::string& url, const std::map<std::string, std::string>& headers) {
    return perform("DELETE", url, nullptr, headers);
}

} // namespace jukebox
