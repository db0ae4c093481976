#pragma once

#include "audit_gate/config/configuration.hpp"
#include "audit_gate/gate/verdict.hpp"
#include "audit_gate/metrics/sharpness.hpp"

namespace audit_gate::gate {

// score < threshold
bool is_blurry_score(int score, int threshold);

// Final verdict from the aggregated score. Insufficient content is blurry
// with score 0.
GateVerdict classify(const metrics::SharpnessAggregate& agg,
                     const config::GatekeeperConfig& cfg);

// Availability over strict gating: a technical failure lets the image through
// with the configured sentinel score instead of blocking the workflow.
GateVerdict fail_open_verdict(VerdictReason reason, const config::GatekeeperConfig& cfg);

} // namespace audit_gate::gate
