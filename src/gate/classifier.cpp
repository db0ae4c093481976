#include "audit_gate/gate/classifier.hpp"

namespace audit_gate::gate {

bool is_blurry_score(int score, int threshold) {
    return score < threshold;
}

GateVerdict classify(const metrics::SharpnessAggregate& agg,
                     const config::GatekeeperConfig& cfg) {
    GateVerdict v;
    v.threshold = cfg.blur_threshold;
    v.edge_samples = agg.sample_count;
    v.top_k = agg.top_k;

    if (agg.insufficient) {
        v.is_blurry = true;
        v.score = 0;
        v.reason = VerdictReason::InsufficientContent;
        return v;
    }

    v.score = agg.score;
    v.is_blurry = is_blurry_score(agg.score, cfg.blur_threshold);
    v.reason = v.is_blurry ? VerdictReason::Blurry : VerdictReason::Sharp;
    return v;
}

GateVerdict fail_open_verdict(VerdictReason reason, const config::GatekeeperConfig& cfg) {
    GateVerdict v;
    v.is_blurry = false;
    v.score = cfg.fail_open_score;
    v.reason = reason;
    v.threshold = cfg.blur_threshold;
    return v;
}

} // namespace audit_gate::gate
