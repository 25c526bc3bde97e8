#pragma once

#include "canonicalizer.hpp"
#include "latency.hpp"
#include "prober.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

using ProberFactory = std::function<std::unique_ptr<Prober>()>;

// raw addresses -> canonicalize -> probe -> records, in input order.
// Rejected and failed addresses are dropped.
class LatencyPipeline {
public:
    LatencyPipeline(const AddressCanonicalizer& canonicalizer,
                    ProberFactory make_prober,
                    size_t workers = 1);
    
    std::vector<LatencyRecord> run(const std::vector<std::string>& raw) const;
    
private:
    const AddressCanonicalizer& canonicalizer_;
    ProberFactory make_prober_;
    size_t workers_;
    
    std::vector<std::string> canonicalize_all(const std::vector<std::string>& raw) const;
    std::vector<LatencyRecord> probe_sequential(const std::vector<std::string>& addresses) const;
    std::vector<LatencyRecord> probe_parallel(const std::vector<std::string>& addresses) const;
};
