#ifndef HTTP_UTILS_HPP
#define HTTP_UTILS_HPP

#include <string>

// HTTP request wrapper to avoid multi-parameter functions
struct HttpRequest {
    std::string url;
    int retries;
    int timeout_seconds;
    bool enable_ssl_verification;
    int backoff_milliseconds;

    HttpRequest(const std::string& u,
                int r = 5,
                int timeout = 30,
                bool ssl_verify = true,
                int backoff = 1000)
        : url(u), retries(r), timeout_seconds(timeout), enable_ssl_verification(ssl_verify),
          backoff_milliseconds(backoff) {}
};

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* s);

// GET with linear backoff (backoff * attempt) on transport errors, HTTP 429 and 5xx.
// Throws std::runtime_error once retries are exhausted or on any other non-2xx status.
std::string http_get(const HttpRequest& req);

// Hides the apiKey query value before a URL goes into a log line or exception
std::string redact_api_key(const std::string& url);

#endif // HTTP_UTILS_HPP
