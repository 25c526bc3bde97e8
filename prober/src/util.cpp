#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace util {

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::optional<int> parse_int(const std::string& str) {
    if (str.empty()) return std::nullopt;
    
    unsigned char first = static_cast<unsigned char>(str[0]);
    if (!std::isdigit(first) && first != '+' && first != '-') {
        return std::nullopt;
    }
    
    try {
        size_t idx = 0;
        int value = std::stoi(str, &idx, 10);
        if (idx != str.size()) return std::nullopt;
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

int64_t elapsed_ms(std::chrono::steady_clock::time_point start,
                   std::chrono::steady_clock::time_point end) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    return ms < 0 ? 0 : ms;
}

ThreadJoiner::~ThreadJoiner() {
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

} // namespace util
