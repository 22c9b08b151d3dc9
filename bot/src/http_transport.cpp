#include "http_transport.hpp"
#include "logger.hpp"
#include <curl/curl.h>

// Curl write callback
static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

CurlTransport::CurlTransport(long timeout_seconds, long connect_timeout_seconds)
    : timeout_seconds_(timeout_seconds)
    , connect_timeout_seconds_(connect_timeout_seconds) {
}

HttpResponse CurlTransport::get(const std::string& url, const HttpHeaders& headers) {
    return perform(url, nullptr, headers);
}

HttpResponse CurlTransport::post(const std::string& url, const std::string& body,
                                 const HttpHeaders& headers) {
    return perform(url, &body, headers);
}

HttpResponse CurlTransport::perform(const std::string& url, const std::string* body,
                                    const HttpHeaders& headers) {
    HttpResponse result;

    CURL* curl = curl_easy_init();
    if (!curl) {
        result.error = "Failed to initialize curl";
        LOG_ERROR(result.error);
        return result;
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& [key, value] : headers) {
        std::string header = key + ": " + value;
        header_list = curl_slist_append(header_list, header.c_str());
    }
    if (body != nullptr) {
        header_list = curl_slist_append(header_list, "Content-Type: application/json");
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    if (body != nullptr) {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }
    if (header_list != nullptr) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &result.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, connect_timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "fxbot/1.0");

    CURLcode res = curl_easy_perform(curl);

    curl_slist_free_all(header_list);

    if (res != CURLE_OK) {
        result.error = "curl_easy_perform() failed: " + std::string(curl_easy_strerror(res));
        curl_easy_cleanup(curl);
        return result;
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.status_code);
    curl_easy_cleanup(curl);

    result.ok = true;
    return result;
}
