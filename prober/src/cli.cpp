#include "cli.hpp"
#include "util.hpp"
#include <stdexcept>

namespace {

const std::string& take_value(const std::vector<std::string>& args, size_t& i) {
    if (i + 1 >= args.size()) {
        throw std::invalid_argument("Missing value for " + args[i]);
    }
    return args[++i];
}

int take_int(const std::vector<std::string>& args, size_t& i) {
    const std::string& flag = args[i];
    const std::string& value = take_value(args, i);
    auto number = util::parse_int(value);
    if (!number) {
        throw std::invalid_argument("Invalid integer for " + flag + ": " + value);
    }
    return *number;
}

}

CliOptions parse_cli(const std::vector<std::string>& args) {
    CliOptions opts;
    
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        
        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "--version") {
            opts.version = true;
        } else if (arg == "-o" || arg == "--output") {
            opts.output_path = take_value(args, i);
        } else if (arg == "-t" || arg == "--timeout-ms") {
            opts.request_timeout_ms = take_int(args, i);
        } else if (arg == "--connect-timeout-ms") {
            opts.connect_timeout_ms = take_int(args, i);
        } else if (arg == "-w" || arg == "--workers") {
            opts.workers = take_int(args, i);
        } else if (arg == "-l" || arg == "--log-level") {
            opts.log_level = take_value(args, i);
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw std::invalid_argument("Unknown option: " + arg);
        } else if (!opts.input_path) {
            opts.input_path = arg;
        } else {
            throw std::invalid_argument("Unexpected argument: " + arg);
        }
    }
    
    return opts;
}

void print_usage(std::ostream& os, const std::string& program) {
    os << "Usage: " << program << " FILE [options]\n"
       << "\n"
       << "Measures HTTP(S) latency for every address in FILE (one per line)\n"
       << "and writes the results as JSON.\n"
       << "\n"
       << "Options:\n"
       << "  -o, --output NAME           Output file (default output.json).\n"
       << "  -t, --timeout-ms N          Whole request timeout, 0 = none (default 0).\n"
       << "      --connect-timeout-ms N  Connect timeout, 0 = none (default 0).\n"
       << "  -w, --workers N             Parallel probes, output keeps input order (default 1).\n"
       << "  -l, --log-level LEVEL       debug|info|warn|error (default info).\n"
       << "  -h, --help                  Print this help.\n"
       << "      --version               Print version.\n"
       << "\n"
       << "Environment: HTTPLATENCY_OUTPUT, LOG_LEVEL, REQUEST_TIMEOUT_MS,\n"
       << "CONNECT_TIMEOUT_MS, USER_AGENT, FOLLOW_REDIRECTS, MAX_REDIRECTS,\n"
       << "PROBE_WORKERS.\n";
}
