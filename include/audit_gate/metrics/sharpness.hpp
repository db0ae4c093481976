#pragma once

#include "audit_gate/config/configuration.hpp"
#include <cstddef>
#include <vector>

namespace audit_gate::metrics {

struct SharpnessAggregate {
    bool insufficient = true;  // fewer than min_edge_samples surviving edges
    int score = 0;             // floor(mean(top k)); 0 when insufficient
    size_t sample_count = 0;
    size_t top_k = 0;
};

// Averages the strongest top_fraction of the samples. Takes the samples by
// value: they are sorted in place and dropped afterwards.
SharpnessAggregate aggregate_sharpness(std::vector<float> samples,
                                       const config::GatekeeperConfig& cfg);

} // namespace audit_gate::metrics
