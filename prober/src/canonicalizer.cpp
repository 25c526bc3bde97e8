#include "canonicalizer.hpp"
#include "curl_url.hpp"
#include "util.hpp"
#include <cctype>
#include <utility>

namespace {

constexpr const char* kPlaceholderScheme = "fake://";
constexpr int kTlsPort = 443;

bool is_scheme_char(unsigned char c) {
    return std::isalnum(c) || c == '+' || c == '-' || c == '.';
}

}

AddressCanonicalizer::AddressCanonicalizer(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {}

std::optional<std::string> AddressCanonicalizer::canonicalize(const std::string& raw) const {
    if (raw.empty()) {
        logger_->warn("Unable to parse URL: empty address");
        return std::nullopt;
    }
    
    if (auto scheme = explicit_scheme(raw)) {
        return canonicalize_explicit(raw, *scheme);
    }
    
    return canonicalize_schemeless(raw);
}

bool AddressCanonicalizer::is_http_url(const std::string& raw) const {
    auto scheme = explicit_scheme(raw);
    if (!scheme || (*scheme != "http" && *scheme != "https")) {
        return false;
    }
    
    CurlUrl url;
    return url.parse(raw) == CURLUE_OK;
}

std::optional<std::string> AddressCanonicalizer::canonicalize_explicit(
    const std::string& raw, const std::string& scheme) const {
    
    if (scheme != "http" && scheme != "https") {
        logger_->warn("URL {} contains invalid scheme", raw);
        return std::nullopt;
    }
    
    CurlUrl url;
    CURLUcode rc = url.parse(raw);
    if (rc != CURLUE_OK) {
        logger_->warn("Unable to parse URL: {} ({})", raw, CurlUrl::error_string(rc));
        return std::nullopt;
    }
    
    auto serialized = url.get(CURLUPART_URL, CURLU_NO_DEFAULT_PORT);
    if (!serialized) {
        logger_->warn("Unable to serialize URL: {}", raw);
        return std::nullopt;
    }
    
    // Scheme is matched case-insensitively but always emitted lower-case
    std::string result = scheme + serialized->substr(scheme.size());
    logger_->debug("Valid url: {}", result);
    return result;
}

std::optional<std::string> AddressCanonicalizer::canonicalize_schemeless(
    const std::string& raw) const {
    
    // The URL parser needs a scheme, so validate the rest under a
    // placeholder one and keep the caller's text once it is known good
    CurlUrl url;
    CURLUcode rc = url.parse(kPlaceholderScheme + raw, CURLU_NON_SUPPORT_SCHEME);
    
    std::string scheme = "http";
    if (rc == CURLUE_OK) {
        if (auto port = url.get(CURLUPART_PORT)) {
            scheme = infer_scheme(*port);
        }
    } else if (rc == CURLUE_BAD_PORT_NUMBER) {
        // Only the port is bad: infer from its text if the rest parses
        auto split = split_port(raw);
        CurlUrl rest;
        if (!split || rest.parse(kPlaceholderScheme + split->second,
                                 CURLU_NON_SUPPORT_SCHEME) != CURLUE_OK) {
            logger_->warn("Unable to parse URL: {} ({})", raw, CurlUrl::error_string(rc));
            return std::nullopt;
        }
        scheme = infer_scheme(split->first);
        logger_->warn("Malformed port in {}, keeping it as is", raw);
    } else {
        logger_->warn("Unable to parse URL: {} ({})", raw, CurlUrl::error_string(rc));
        return std::nullopt;
    }
    
    std::string result = scheme + "://" + raw;
    logger_->debug("Added scheme to {}: {}", raw, result);
    return result;
}

std::optional<std::string> AddressCanonicalizer::explicit_scheme(const std::string& raw) {
    if (raw.empty() || !std::isalpha(static_cast<unsigned char>(raw[0]))) {
        return std::nullopt;
    }
    
    size_t i = 1;
    while (i < raw.size() && is_scheme_char(static_cast<unsigned char>(raw[i]))) {
        ++i;
    }
    
    // "host:443" is a port, not a scheme; an explicit scheme is "name:/"
    if (i + 1 >= raw.size() || raw[i] != ':' || raw[i + 1] != '/') {
        return std::nullopt;
    }
    
    return util::to_lower(raw.substr(0, i));
}

std::optional<std::pair<std::string, std::string>>
AddressCanonicalizer::split_port(const std::string& raw) {
    size_t authority_end = raw.find_first_of("/?#");
    if (authority_end == std::string::npos) {
        authority_end = raw.size();
    }
    
    size_t host_start = 0;
    size_t at = raw.rfind('@', authority_end);
    if (at != std::string::npos && at < authority_end) {
        host_start = at + 1;
    }
    
    size_t search_from = host_start;
    if (host_start < authority_end && raw[host_start] == '[') {
        size_t close = raw.find(']', host_start);
        if (close == std::string::npos || close >= authority_end) return std::nullopt;
        search_from = close;
    }
    
    size_t colon = raw.find(':', search_from);
    if (colon == std::string::npos || colon >= authority_end) {
        return std::nullopt;
    }
    
    return std::make_pair(raw.substr(colon + 1, authority_end - colon - 1),
                          raw.substr(0, colon) + raw.substr(authority_end));
}

std::string AddressCanonicalizer::infer_scheme(const std::string& port) {
    auto number = util::parse_int(port);
    
    // Lenient recovery for a stray trailing character: drop one and retry once
    if (!number && !port.empty()) {
        number = util::parse_int(port.substr(0, port.size() - 1));
    }
    
    if (number && *number == kTlsPort) {
        return "https";
    }
    return "http";
}
