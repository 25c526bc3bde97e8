#include "pipeline.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <optional>
#include <thread>

LatencyPipeline::LatencyPipeline(const AddressCanonicalizer& canonicalizer,
                                 ProberFactory make_prober,
                                 size_t workers)
    : canonicalizer_(canonicalizer)
    , make_prober_(std::move(make_prober))
    , workers_(workers == 0 ? 1 : workers)
{}

std::vector<LatencyRecord> LatencyPipeline::run(const std::vector<std::string>& raw) const {
    auto addresses = canonicalize_all(raw);
    spdlog::debug("{} of {} addresses accepted", addresses.size(), raw.size());
    
    if (addresses.empty()) {
        return {};
    }
    
    auto records = workers_ > 1 && addresses.size() > 1
        ? probe_parallel(addresses)
        : probe_sequential(addresses);
    
    spdlog::debug("All HTTP requests complete");
    return records;
}

std::vector<std::string> LatencyPipeline::canonicalize_all(
    const std::vector<std::string>& raw) const {
    
    std::vector<std::string> addresses;
    addresses.reserve(raw.size());
    for (const auto& line : raw) {
        auto address = canonicalizer_.canonicalize(line);
        if (!address) continue;
        
        // Leniently kept addresses (bad port text) cannot be fetched
        if (!canonicalizer_.is_http_url(*address)) {
            spdlog::warn("Skipping {}: {} is not a fetchable URL", line, *address);
            continue;
        }
        addresses.push_back(std::move(*address));
    }
    return addresses;
}

std::vector<LatencyRecord> LatencyPipeline::probe_sequential(
    const std::vector<std::string>& addresses) const {
    
    auto prober = make_prober_();
    
    std::vector<LatencyRecord> records;
    for (const auto& address : addresses) {
        if (auto record = prober->probe(address)) {
            records.push_back(std::move(*record));
        }
    }
    return records;
}

std::vector<LatencyRecord> LatencyPipeline::probe_parallel(
    const std::vector<std::string>& addresses) const {
    
    // One slot per address so results can be joined in input order
    std::vector<std::optional<LatencyRecord>> slots(addresses.size());
    std::atomic<size_t> next{0};
    
    // Probers are built up front so a factory failure surfaces here
    size_t count = std::min(workers_, addresses.size());
    std::vector<std::unique_ptr<Prober>> probers;
    probers.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        probers.push_back(make_prober_());
    }
    
    std::vector<std::thread> threads;
    threads.reserve(count);
    {
        // Started workers are joined even if spawning a later one throws
        util::ThreadJoiner joiner(threads);
        for (auto& prober : probers) {
            threads.emplace_back([&addresses, &slots, &next, p = prober.get()]() {
                for (size_t i = next++; i < addresses.size(); i = next++) {
                    slots[i] = p->probe(addresses[i]);
                }
            });
        }
    }
    
    std::vector<LatencyRecord> records;
    for (auto& slot : slots) {
        if (slot) {
            records.push_back(std::move(*slot));
        }
    }
    return records;
}
