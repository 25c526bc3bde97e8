#include "config.hpp"
#include "cli.hpp"
#include "canonicalizer.hpp"
#include "prober.hpp"
#include "pipeline.hpp"
#include "report.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <memory>

namespace {

constexpr const char* kVersion = "1.0";

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("httplatency", console_sink);
    
    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }
    
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

}

int main(int argc, char* argv[]) {
    std::string program = argc > 0 ? argv[0] : "httplatency";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);
    
    CliOptions cli;
    try {
        cli = parse_cli(args);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n\n";
        print_usage(std::cerr, program);
        return 1;
    }
    
    if (cli.help) {
        print_usage(std::cout, program);
        return 0;
    }
    if (cli.version) {
        std::cout << "httplatency " << kVersion << "\n";
        return 0;
    }
    if (!cli.input_path) {
        print_usage(std::cerr, program);
        return 1;
    }
    
    try {
        // Load configuration
        auto config = Config::from_env();
        config.apply(cli);
        
        // Setup logging
        setup_logging(config.log_level);
        spdlog::info("HTTP(S) Latency tool v{}", kVersion);
        
        config.validate();
        
        CurlGlobal curl_global;
        
        auto addresses = read_addresses(config.input_path);
        
        auto logger = spdlog::default_logger();
        AddressCanonicalizer canonicalizer(logger);
        ProbeOptions probe_options = config.probe_options();
        LatencyPipeline pipeline(
            canonicalizer,
            [probe_options, logger]() {
                return std::make_unique<CurlProber>(probe_options, logger);
            },
            static_cast<size_t>(config.workers));
        
        auto records = pipeline.run(addresses);
        
        write_report(config.output_path, records);
        spdlog::info("Wrote {} of {} addresses to {}",
                     records.size(), addresses.size(), config.output_path);
        spdlog::info("Exiting..");
        return 0;
        
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
