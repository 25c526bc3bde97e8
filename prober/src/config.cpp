#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace {

constexpr int kMaxWorkers = 64;

}

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    
    auto number = util::parse_int(val);
    if (!number) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
    return *number;
}

Config Config::from_env() {
    Config cfg;
    
    cfg.output_path = get_env("HTTPLATENCY_OUTPUT", "output.json");
    
    cfg.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", 0);
    cfg.connect_timeout_ms = get_env_int("CONNECT_TIMEOUT_MS", 0);
    cfg.user_agent = get_env("USER_AGENT", kDefaultUserAgent);
    cfg.follow_redirects = get_env_int("FOLLOW_REDIRECTS", 1) != 0;
    cfg.max_redirects = get_env_int("MAX_REDIRECTS", 10);
    cfg.workers = get_env_int("PROBE_WORKERS", 1);
    
    cfg.log_level = get_env("LOG_LEVEL", "info");
    
    return cfg;
}

void Config::apply(const CliOptions& cli) {
    if (cli.input_path) input_path = *cli.input_path;
    if (cli.output_path) output_path = *cli.output_path;
    if (cli.request_timeout_ms) request_timeout_ms = *cli.request_timeout_ms;
    if (cli.connect_timeout_ms) connect_timeout_ms = *cli.connect_timeout_ms;
    if (cli.workers) workers = *cli.workers;
    if (cli.log_level) log_level = *cli.log_level;
}

void Config::validate() const {
    if (input_path.empty()) {
        throw std::runtime_error("Input file is required");
    }
    if (output_path.empty()) {
        throw std::runtime_error("Output file name must not be empty");
    }
    if (request_timeout_ms < 0 || connect_timeout_ms < 0) {
        throw std::runtime_error("Timeouts must be >= 0");
    }
    if (max_redirects < 0) {
        throw std::runtime_error("Max redirects must be >= 0");
    }
    if (workers < 1 || workers > kMaxWorkers) {
        throw std::runtime_error("Workers must be between 1 and " + std::to_string(kMaxWorkers));
    }
    if (log_level != "debug" && log_level != "info" &&
        log_level != "warn" && log_level != "error") {
        throw std::runtime_error("Unknown log level: " + log_level);
    }
    
    spdlog::debug("Configuration validated successfully");
    spdlog::debug("  Input: {}, output: {}", input_path, output_path);
    spdlog::debug("  Timeouts: request={}ms, connect={}ms (0 = none)",
                  request_timeout_ms, connect_timeout_ms);
    spdlog::debug("  Workers: {}, follow redirects: {}", workers, follow_redirects);
}

ProbeOptions Config::probe_options() const {
    ProbeOptions opts;
    opts.user_agent = user_agent;
    opts.request_timeout_ms = request_timeout_ms;
    opts.connect_timeout_ms = connect_timeout_ms;
    opts.follow_redirects = follow_redirects;
    opts.max_redirects = max_redirects;
    return opts;
}
