#pragma once

#include "cli.hpp"
#include "prober.hpp"
#include <string>
#include <cstdlib>

struct Config {
    // Files
    std::string input_path;
    std::string output_path;
    
    // HTTP
    int request_timeout_ms;
    int connect_timeout_ms;
    std::string user_agent;
    bool follow_redirects;
    int max_redirects;
    int workers;
    
    // Service
    std::string log_level;
    
    static Config from_env();
    void apply(const CliOptions& cli);
    void validate() const;
    
    ProbeOptions probe_options() const;
    
private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
};
