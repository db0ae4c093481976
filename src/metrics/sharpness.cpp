#include "audit_gate/metrics/sharpness.hpp"

#include <algorithm>
#include <cmath>
#include <functional>

namespace audit_gate::metrics {

SharpnessAggregate aggregate_sharpness(std::vector<float> samples,
                                       const config::GatekeeperConfig& cfg) {
    SharpnessAggregate out;
    out.sample_count = samples.size();

    if (samples.size() < static_cast<size_t>(std::max(1, cfg.min_edge_samples))) {
        out.insufficient = true;
        out.score = 0;
        return out;
    }

    std::sort(samples.begin(), samples.end(), std::greater<float>());

    size_t k = static_cast<size_t>(std::floor(static_cast<double>(samples.size()) *
                                              static_cast<double>(cfg.top_fraction)));
    k = std::min(std::max<size_t>(k, 1), samples.size());

    double sum = 0.0;
    for (size_t i = 0; i < k; ++i) {
        sum += static_cast<double>(samples[i]);
    }

    out.insufficient = false;
    out.top_k = k;
    out.score = static_cast<int>(std::floor(sum / static_cast<double>(k)));
    return out;
}

} // namespace audit_gate::metrics
