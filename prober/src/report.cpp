#include "report.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <stdexcept>

std::vector<std::string> read_addresses(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Unable to open file: " + path);
    }
    
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    
    if (in.bad()) {
        throw std::runtime_error("Error reading file: " + path);
    }
    
    spdlog::debug("Read {} addresses from {}", lines.size(), path);
    return lines;
}

std::string render_report(const std::vector<LatencyRecord>& records) {
    nlohmann::ordered_json doc = nlohmann::ordered_json::array();
    for (const auto& record : records) {
        doc.push_back({
            {"url", record.url},
            {"latency_ms", record.latency_ms}
        });
    }
    return doc.dump(2) + "\n";
}

void write_report(const std::string& path, const std::vector<LatencyRecord>& records) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Unable to create output file: " + path);
    }
    
    spdlog::debug("Writing output to {}", path);
    out << render_report(records);
    out.flush();
    
    if (!out) {
        throw std::runtime_error("Error writing to file: " + path);
    }
}
