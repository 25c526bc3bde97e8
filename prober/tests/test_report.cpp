#include <catch2/catch_test_macros.hpp>
#include "../src/report.hpp"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {

std::string temp_path(const std::string& name) {
    return "httplatency_test_" + name;
}

std::string slurp(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}

TEST_CASE("Report rendering", "[report]") {
    SECTION("No records is an empty array") {
        REQUIRE(render_report({}) == "[]\n");
    }
    
    SECTION("Records keep order and field names") {
        std::vector<LatencyRecord> records = {
            {"http://www.example.com/", 120},
            {"https://www.example.com:443", 87}
        };
        
        auto text = render_report(records);
        REQUIRE(text.back() == '\n');
        REQUIRE(text.find("\"url\"") < text.find("\"latency_ms\""));
        
        auto doc = nlohmann::json::parse(text);
        REQUIRE(doc.is_array());
        REQUIRE(doc.size() == 2);
        REQUIRE(doc[0]["url"] == "http://www.example.com/");
        REQUIRE(doc[0]["latency_ms"] == 120);
        REQUIRE(doc[1]["url"] == "https://www.example.com:443");
        REQUIRE(doc[1]["latency_ms"] == 87);
    }
}

TEST_CASE("Address file reading", "[report]") {
    auto path = temp_path("addresses.txt");
    
    SECTION("Lines are taken literally") {
        {
            std::ofstream out(path);
            out << "www.example.com\r\n"
                << "\n"
                << "  spaced.example \n"
                << "http://last.example";
        }
        
        auto lines = read_addresses(path);
        REQUIRE(lines.size() == 4);
        REQUIRE(lines[0] == "www.example.com");
        REQUIRE(lines[1].empty());
        REQUIRE(lines[2] == "  spaced.example ");
        REQUIRE(lines[3] == "http://last.example");
    }
    
    SECTION("Missing file is fatal") {
        REQUIRE_THROWS_AS(read_addresses("does/not/exist.txt"), std::runtime_error);
    }
    
    std::remove(path.c_str());
}

TEST_CASE("Report writing", "[report]") {
    auto path = temp_path("output.json");
    
    SECTION("File holds the rendered report") {
        std::vector<LatencyRecord> records = {{"http://www.example.com", 3}};
        write_report(path, records);
        REQUIRE(slurp(path) == render_report(records));
    }
    
    SECTION("Existing file is replaced") {
        write_report(path, {{"http://a.example", 1}, {"http://b.example", 2}});
        write_report(path, {});
        REQUIRE(slurp(path) == "[]\n");
    }
    
    SECTION("Unwritable destination is fatal") {
        REQUIRE_THROWS_AS(write_report("does/not/exist/output.json", {}), std::runtime_error);
    }
    
    std::remove(path.c_str());
}
