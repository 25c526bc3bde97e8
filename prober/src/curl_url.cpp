#include "curl_url.hpp"
#include <stdexcept>

CurlUrl::CurlUrl()
    : url_(curl_url())
{
    if (!url_) {
        throw std::runtime_error("Failed to initialize CURL URL handle");
    }
}

CurlUrl::~CurlUrl() {
    if (url_) {
        curl_url_cleanup(url_);
    }
}

CURLUcode CurlUrl::parse(const std::string& text, unsigned int flags) {
    return curl_url_set(url_, CURLUPART_URL, text.c_str(), flags);
}

std::optional<std::string> CurlUrl::get(CURLUPart part, unsigned int flags) const {
    char* value = nullptr;
    CURLUcode rc = curl_url_get(url_, part, &value, flags);
    if (rc != CURLUE_OK || !value) {
        return std::nullopt;
    }
    
    std::string result(value);
    curl_free(value);
    return result;
}

std::string CurlUrl::error_string(CURLUcode code) {
    return curl_url_strerror(code);
}
