#include "prober.hpp"
#include "util.hpp"
#include <chrono>
#include <stdexcept>

CurlProber::CurlProber(const ProbeOptions& options, std::shared_ptr<spdlog::logger> logger)
    : options_(options)
    , logger_(std::move(logger))
    , curl_(curl_easy_init())
    , headers_(nullptr)
{
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL for prober");
    }
    
    headers_ = curl_slist_append(headers_, "Connection: close");
    if (!headers_) {
        curl_easy_cleanup(curl_);
        throw std::runtime_error("Failed to allocate CURL header list");
    }
    
    // Set common CURL options
    curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
    curl_easy_setopt(curl_, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl_, CURLOPT_FORBID_REUSE, 1L);
    curl_easy_setopt(curl_, CURLOPT_FRESH_CONNECT, 1L);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, options_.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl_, CURLOPT_MAXREDIRS, options_.max_redirects);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, options_.request_timeout_ms);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, options_.connect_timeout_ms);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, discard_callback);
}

CurlProber::~CurlProber() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
    if (headers_) {
        curl_slist_free_all(headers_);
    }
}

size_t CurlProber::discard_callback(void*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}

std::optional<LatencyRecord> CurlProber::probe(const std::string& address) {
    logger_->info("Testing {}", address);
    
    curl_easy_setopt(curl_, CURLOPT_URL, address.c_str());
    
    auto start = std::chrono::steady_clock::now();
    CURLcode res = curl_easy_perform(curl_);
    auto end = std::chrono::steady_clock::now();
    
    if (res != CURLE_OK) {
        logger_->error("Couldn't retrieve {}: {}", address, curl_easy_strerror(res));
        return std::nullopt;
    }
    
    long status = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
    
    LatencyRecord record{address, util::elapsed_ms(start, end)};
    logger_->debug("{} answered {} in {} ms", address, status, record.latency_ms);
    return record;
}

CurlGlobal::CurlGlobal() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        throw std::runtime_error("Failed to initialize libcurl");
    }
}

CurlGlobal::~CurlGlobal() {
    curl_global_cleanup();
}
