// HttpUtils.cpp
#include "http_utils.hpp"
#include <chrono>
#include <thread>
#include <curl/curl.h>
#include <memory>
#include <string>
#include <stdexcept>

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response_string) {
    response_string->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

namespace {

struct CurlHandleDeleter {
    void operator()(CURL* curl_handle) const { curl_easy_cleanup(curl_handle); }
};

struct CurlHeaderListDeleter {
    void operator()(curl_slist* header_list) const { curl_slist_free_all(header_list); }
};

// One curl easy handle per request. Only transport failures are retried; any HTTP status is returned.
HttpResponse perform_request(const std::string& method, const HttpRequest& http_request) {
    std::unique_ptr<CURL, CurlHandleDeleter> curl_handle(curl_easy_init());
    if (!curl_handle) {
        throw std::runtime_error("Failed to initialize CURL for HTTP " + method + " request");
    }

    std::unique_ptr<curl_slist, CurlHeaderListDeleter> header_list;
    for (const std::string& header_line : http_request.headers) {
        curl_slist* extended_list = curl_slist_append(header_list.get(), header_line.c_str());
        if (!extended_list) {
            throw std::runtime_error("Failed to build headers for HTTP " + method + " request");
        }
        header_list.release();
        header_list.reset(extended_list);
    }

    HttpResponse http_response;
    curl_easy_setopt(curl_handle.get(), CURLOPT_URL, http_request.url.c_str());
    curl_easy_setopt(curl_handle.get(), CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl_handle.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle.get(), CURLOPT_WRITEDATA, &http_response.body);
    curl_easy_setopt(curl_handle.get(), CURLOPT_TIMEOUT, static_cast<long>(http_request.timeout_seconds));
    curl_easy_setopt(curl_handle.get(), CURLOPT_SSL_VERIFYPEER, http_request.enable_ssl_verification ? 1L : 0L);
    curl_easy_setopt(curl_handle.get(), CURLOPT_SSL_VERIFYHOST, http_request.enable_ssl_verification ? 2L : 0L);

    if (method == "POST") {
        curl_easy_setopt(curl_handle.get(), CURLOPT_POSTFIELDS, http_request.body.c_str());
    } else if (method == "PUT") {
        curl_easy_setopt(curl_handle.get(), CURLOPT_CUSTOMREQUEST, "PUT");
        curl_easy_setopt(curl_handle.get(), CURLOPT_POSTFIELDS, http_request.body.c_str());
    }

    int attempt_limit = http_request.retries < 1 ? 1 : http_request.retries;
    CURLcode curl_result = CURLE_OK;
    for (int attempt_number = 1; attempt_number <= attempt_limit; ++attempt_number) {
        http_response.body.clear();
        curl_result = curl_easy_perform(curl_handle.get());
        if (curl_result == CURLE_OK) {
            curl_easy_getinfo(curl_handle.get(), CURLINFO_RESPONSE_CODE, &http_response.status_code);
            return http_response;
        }
        if (attempt_number < attempt_limit && http_request.rate_limit_delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(http_request.rate_limit_delay_ms));
        }
    }

    throw std::runtime_error("HTTP " + method + " failed after " + std::to_string(attempt_limit) + " attempt(s). " +
                             "Last error: " + std::string(curl_easy_strerror(curl_result)) + " URL: " + http_request.url);
}

} // anonymous namespace

HttpResponse http_get(const HttpRequest& http_request) {
    return perform_request("GET", http_request);
}

HttpResponse http_post(const HttpRequest& http_request) {
    return perform_request("POST", http_request);
}

HttpResponse http_put(const HttpRequest& http_request) {
    return perform_request("PUT", http_request);
}

std::string url_encode(const std::string& raw_value) {
    char* escaped_pointer = curl_easy_escape(nullptr, raw_value.c_str(), static_cast<int>(raw_value.size()));
    if (!escaped_pointer) {
        throw std::runtime_error("Failed to URL-encode value");
    }
    std::string escaped_value(escaped_pointer);
    curl_free(escaped_pointer);
    return escaped_value;
}

std::string replace_url_placeholder(const std::string& request_url, const std::string& symbol) {
    std::string result_url = request_url;
    size_t placeholder_position = result_url.find("{symbol}");
    if (placeholder_position != std::string::npos) {
        result_url.replace(placeholder_position, 8, symbol);
    }
    return result_url;
}
