#include <catch2/catch_test_macros.hpp>
#include "../src/config.hpp"
#include "../src/cli.hpp"
#include <stdexcept>
#include <stdlib.h>

namespace {

void clear_env() {
    for (const char* name : {"HTTPLATENCY_OUTPUT", "LOG_LEVEL", "REQUEST_TIMEOUT_MS",
                             "CONNECT_TIMEOUT_MS", "USER_AGENT", "FOLLOW_REDIRECTS",
                             "MAX_REDIRECTS", "PROBE_WORKERS"}) {
        unsetenv(name);
    }
}

}

TEST_CASE("Command line parsing", "[cli]") {
    SECTION("Positional input and options") {
        auto cli = parse_cli({"urls.txt", "-o", "out.json", "--timeout-ms", "5000", "-w", "4"});
        REQUIRE(cli.input_path == std::string("urls.txt"));
        REQUIRE(cli.output_path == std::string("out.json"));
        REQUIRE(cli.request_timeout_ms == 5000);
        REQUIRE(cli.workers == 4);
        REQUIRE_FALSE(cli.connect_timeout_ms.has_value());
        REQUIRE_FALSE(cli.help);
    }
    
    SECTION("Help flag") {
        REQUIRE(parse_cli({"-h"}).help);
        REQUIRE(parse_cli({"--help"}).help);
        REQUIRE_FALSE(parse_cli({"--help"}).input_path.has_value());
    }
    
    SECTION("Bad usage") {
        REQUIRE_THROWS_AS(parse_cli({"urls.txt", "--bogus"}), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_cli({"urls.txt", "-o"}), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_cli({"urls.txt", "-t", "soon"}), std::invalid_argument);
        REQUIRE_THROWS_AS(parse_cli({"a.txt", "b.txt"}), std::invalid_argument);
    }
}

TEST_CASE("Configuration", "[config]") {
    clear_env();
    
    SECTION("Defaults") {
        auto cfg = Config::from_env();
        REQUIRE(cfg.output_path == "output.json");
        REQUIRE(cfg.log_level == "info");
        REQUIRE(cfg.request_timeout_ms == 0);
        REQUIRE(cfg.connect_timeout_ms == 0);
        REQUIRE(cfg.user_agent == kDefaultUserAgent);
        REQUIRE(cfg.follow_redirects);
        REQUIRE(cfg.max_redirects == 10);
        REQUIRE(cfg.probe_options().max_redirects == 10);
        REQUIRE(cfg.workers == 1);
    }
    
    SECTION("Environment then command line") {
        setenv("REQUEST_TIMEOUT_MS", "3000", 1);
        setenv("PROBE_WORKERS", "2", 1);
        setenv("FOLLOW_REDIRECTS", "0", 1);
        
        auto cfg = Config::from_env();
        REQUIRE(cfg.request_timeout_ms == 3000);
        REQUIRE(cfg.workers == 2);
        REQUIRE_FALSE(cfg.follow_redirects);
        
        cfg.apply(parse_cli({"urls.txt", "-w", "8"}));
        REQUIRE(cfg.input_path == "urls.txt");
        REQUIRE(cfg.workers == 8);
        REQUIRE(cfg.request_timeout_ms == 3000);
        
        auto opts = cfg.probe_options();
        REQUIRE(opts.request_timeout_ms == 3000);
        REQUIRE_FALSE(opts.follow_redirects);
    }
    
    SECTION("Invalid integer falls back to default") {
        setenv("PROBE_WORKERS", "many", 1);
        REQUIRE(Config::from_env().workers == 1);
    }
    
    SECTION("Validation") {
        auto cfg = Config::from_env();
        REQUIRE_THROWS_AS(cfg.validate(), std::runtime_error);
        
        cfg.input_path = "urls.txt";
        REQUIRE_NOTHROW(cfg.validate());
        
        cfg.workers = 0;
        REQUIRE_THROWS_AS(cfg.validate(), std::runtime_error);
        cfg.workers = 1;
        
        cfg.request_timeout_ms = -1;
        REQUIRE_THROWS_AS(cfg.validate(), std::runtime_error);
        cfg.request_timeout_ms = 0;
        
        cfg.max_redirects = -1;
        REQUIRE_THROWS_AS(cfg.validate(), std::runtime_error);
        cfg.max_redirects = 10;
        
        cfg.log_level = "verbose";
        REQUIRE_THROWS_AS(cfg.validate(), std::runtime_error);
    }
    
    clear_env();
}
