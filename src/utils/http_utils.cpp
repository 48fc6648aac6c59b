// HttpUtils.cpp
#include "http_utils.hpp"
#include "logging/async_logger.hpp"
#include <chrono>
#include <thread>
#include <curl/curl.h>
#include <stdexcept>

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response_string) {
    response_string->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

std::string redact_api_key(const std::string& url) {
    const std::string key_marker = "apiKey=";
    size_t key_position = url.find(key_marker);
    if (key_position == std::string::npos) {
        return url;
    }
    size_t value_start = key_position + key_marker.size();
    size_t value_end = url.find('&', value_start);
    return url.substr(0, value_start) + "***" + (value_end == std::string::npos ? "" : url.substr(value_end));
}

std::string http_get(const HttpRequest& http_request) {
    CURL* curl_handle = curl_easy_init();
    if (!curl_handle) {
        throw std::runtime_error("Failed to initialize CURL for HTTP GET request");
    }

    std::string response;
    long http_response_code = 0;
    CURLcode curl_result = CURLE_OK;

    curl_easy_setopt(curl_handle, CURLOPT_URL, http_request.url.c_str());
    curl_easy_setopt(curl_handle, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl_handle, CURLOPT_TIMEOUT, static_cast<long>(http_request.timeout_seconds));
    curl_easy_setopt(curl_handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYPEER, http_request.enable_ssl_verification ? 1L : 0L);
    curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYHOST, http_request.enable_ssl_verification ? 2L : 0L);

    for (int retry_attempt = 0; retry_attempt < http_request.retries; ++retry_attempt) {
        response.clear();
        curl_result = curl_easy_perform(curl_handle);
        http_response_code = 0;
        curl_easy_getinfo(curl_handle, CURLINFO_RESPONSE_CODE, &http_response_code);

        bool retryable_failure = curl_result != CURLE_OK || http_response_code == 429 || http_response_code >= 500;
        if (!retryable_failure) {
            break;
        }

        FvgScanner::Logging::log_message("HTTP GET retry " + std::to_string(retry_attempt + 1) + "/" + std::to_string(http_request.retries) +
                                         " failed: " + std::string(curl_easy_strerror(curl_result)) +
                                         " (HTTP " + std::to_string(http_response_code) + ")", "");

        if (retry_attempt < http_request.retries - 1) {
            std::this_thread::sleep_for(std::chrono::milliseconds(static_cast<long long>(http_request.backoff_milliseconds) * (retry_attempt + 1)));
        }
    }

    curl_easy_cleanup(curl_handle);

    if (curl_result != CURLE_OK) {
        throw std::runtime_error("HTTP GET failed after " + std::to_string(http_request.retries) + " retries. " +
                                 "Last error: " + std::string(curl_easy_strerror(curl_result)) +
                                 " URL: " + redact_api_key(http_request.url));
    }
    if (http_response_code < 200 || http_response_code >= 300) {
        throw std::runtime_error("HTTP GET returned HTTP " + std::to_string(http_response_code) +
                                 " URL: " + redact_api_key(http_request.url));
    }
    if (response.empty()) {
        throw std::runtime_error("HTTP GET succeeded but returned empty response (HTTP " +
                                 std::to_string(http_response_code) + ") for URL: " + redact_api_key(http_request.url));
    }
    return response;
}
