#pragma once

#include <string>
#include <optional>
#include <curl/curl.h>

// Owns a libcurl URL handle (CURLU)
class CurlUrl {
public:
    CurlUrl();
    ~CurlUrl();
    
    // Disable copy
    CurlUrl(const CurlUrl&) = delete;
    CurlUrl& operator=(const CurlUrl&) = delete;
    
    // Parses an absolute URL, replacing any previous content
    CURLUcode parse(const std::string& text, unsigned int flags = 0);
    
    std::optional<std::string> get(CURLUPart part, unsigned int flags = 0) const;
    
    static std::string error_string(CURLUcode code);
    
private:
    CURLU* url_;
};
