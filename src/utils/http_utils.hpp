#ifndef HTTP_UTILS_HPP
#define HTTP_UTILS_HPP

#include <string>
#include <vector>

// HTTP request wrapper to avoid multi-parameter functions
struct HttpRequest {
    std::string url;
    std::vector<std::string> headers;   // "Name: value" lines
    int retries;
    int timeout_seconds;
    bool enable_ssl_verification;
    int rate_limit_delay_ms;
    std::string body;                   // for POST/PUT; leave empty for GET

    HttpRequest(const std::string& u,
                std::vector<std::string> header_lines,
                int r = 3,
                int timeout = 30,
                bool ssl_verify = true,
                int rate_delay = 100,
                std::string b = "")
        : url(u), headers(std::move(header_lines)), retries(r), timeout_seconds(timeout),
          enable_ssl_verification(ssl_verify), rate_limit_delay_ms(rate_delay), body(std::move(b)) {}
};

struct HttpResponse {
    long status_code = 0;
    std::string body;

    bool is_success() const { return status_code >= 200 && status_code < 300; }
};

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* s);

// Transport failures (DNS, TLS, timeout) throw std::runtime_error after req.retries attempts.
// HTTP error statuses are returned to the caller, who owns their interpretation.
HttpResponse http_get(const HttpRequest& req);
HttpResponse http_post(const HttpRequest& req);
HttpResponse http_put(const HttpRequest& req);

std::string url_encode(const std::string& raw_value);
std::string replace_url_placeholder(const std::string& url, const std::string& symbol);

#endif // HTTP_UTILS_HPP
