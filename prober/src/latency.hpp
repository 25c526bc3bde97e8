#pragma once

#include <string>
#include <cstdint>

// Result of one successful probe
struct LatencyRecord {
    std::string url;       // canonical address that was fetched
    int64_t latency_ms;    // wall-clock time to the response
};

inline bool operator==(const LatencyRecord& a, const LatencyRecord& b) {
    return a.url == b.url && a.latency_ms == b.latency_ms;
}
