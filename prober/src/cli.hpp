#pragma once

#include <string>
#include <vector>
#include <optional>
#include <ostream>

struct CliOptions {
    std::optional<std::string> input_path;
    std::optional<std::string> output_path;
    std::optional<int> request_timeout_ms;
    std::optional<int> connect_timeout_ms;
    std::optional<int> workers;
    std::optional<std::string> log_level;
    bool help = false;
    bool version = false;
};

// args excludes the program name. Throws std::invalid_argument on bad usage.
CliOptions parse_cli(const std::vector<std::string>& args);

void print_usage(std::ostream& os, const std::string& program);
