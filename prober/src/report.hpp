#pragma once

#include "latency.hpp"
#include <string>
#include <vector>

// One raw address per line, taken literally (a trailing '\r' is dropped).
// Throws std::runtime_error when the file cannot be read.
std::vector<std::string> read_addresses(const std::string& path);

// Pretty JSON array of {"url", "latency_ms"} objects plus a trailing newline
std::string render_report(const std::vector<LatencyRecord>& records);

// Throws std::runtime_error when the file cannot be written
void write_report(const std::string& path, const std::vector<LatencyRecord>& records);
