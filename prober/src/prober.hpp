#pragma once

#include "latency.hpp"
#include <string>
#include <optional>
#include <memory>
#include <curl/curl.h>
#include <spdlog/spdlog.h>

inline constexpr const char* kDefaultUserAgent =
    "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_10_5) AppleWebKit/537.36 "
    "(KHTML, like Gecko) Chrome/47.0.2526.106 Safari/537.36";

struct ProbeOptions {
    std::string user_agent = kDefaultUserAgent;
    long request_timeout_ms = 0;   // 0 = block until the transport gives up
    long connect_timeout_ms = 0;
    bool follow_redirects = true;
    long max_redirects = 10;
};

class Prober {
public:
    virtual ~Prober() = default;
    
    // One GET per call. Returns nullopt on any transport failure.
    virtual std::optional<LatencyRecord> probe(const std::string& address) = 0;
};

class CurlProber : public Prober {
public:
    explicit CurlProber(const ProbeOptions& options,
                        std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());
    ~CurlProber() override;
    
    // Disable copy
    CurlProber(const CurlProber&) = delete;
    CurlProber& operator=(const CurlProber&) = delete;
    
    std::optional<LatencyRecord> probe(const std::string& address) override;
    
private:
    ProbeOptions options_;
    std::shared_ptr<spdlog::logger> logger_;
    CURL* curl_;
    curl_slist* headers_;
    
    static size_t discard_callback(void* contents, size_t size, size_t nmemb, void* userp);
};

// Process-wide libcurl setup; create one before any handle and keep it alive
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();
    
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};
