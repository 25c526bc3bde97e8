#pragma once

#include <string>
#include <optional>
#include <memory>
#include <utility>
#include <spdlog/spdlog.h>

// Turns user supplied addresses into fully qualified http(s) URLs.
//
//   www.example.com          -> http://www.example.com
//   www.example.com:443      -> https://www.example.com:443
//   http://www.example.com   -> http://www.example.com/
//   ftp://www.example.com    -> rejected
//
// A missing scheme is inferred from the port: 443 means https, anything
// else (or no port) means http. An explicit scheme other than http/https
// is never coerced.
class AddressCanonicalizer {
public:
    explicit AddressCanonicalizer(
        std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());
    
    std::optional<std::string> canonicalize(const std::string& raw) const;
    
    // True when raw is an absolute URL with an http or https scheme
    bool is_http_url(const std::string& raw) const;
    
private:
    std::shared_ptr<spdlog::logger> logger_;
    
    std::optional<std::string> canonicalize_explicit(const std::string& raw,
                                                     const std::string& scheme) const;
    std::optional<std::string> canonicalize_schemeless(const std::string& raw) const;
    
    static std::optional<std::string> explicit_scheme(const std::string& raw);
    // Port text of the authority and raw with ":port" removed
    static std::optional<std::pair<std::string, std::string>> split_port(const std::string& raw);
    static std::string infer_scheme(const std::string& port);
};
