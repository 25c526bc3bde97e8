#pragma once

#include <string>
#include <optional>
#include <chrono>
#include <cstdint>
#include <thread>
#include <vector>

namespace util {
    std::string to_lower(std::string str);
    // Whole-string base-10 parse; no surrounding whitespace allowed
    std::optional<int> parse_int(const std::string& str);
    int64_t elapsed_ms(std::chrono::steady_clock::time_point start,
                       std::chrono::steady_clock::time_point end);
    
    // Joins every joinable thread in the vector when the scope ends
    class ThreadJoiner {
    public:
        explicit ThreadJoiner(std::vector<std::thread>& threads) : threads_(threads) {}
        ~ThreadJoiner();
        
        ThreadJoiner(const ThreadJoiner&) = delete;
        ThreadJoiner& operator=(const ThreadJoiner&) = delete;
        
    private:
        std::vector<std::thread>& threads_;
    };
}
