#include "audit_gate/gate/verdict.hpp"

namespace audit_gate::gate {

nlohmann::json verdict_to_json(const GateVerdict& v) {
    nlohmann::json j;
    j["is_blurry"] = v.is_blurry;
    j["score"] = v.score;
    j["reason"] = reason_to_string(v.reason);
    j["threshold"] = v.threshold;
    j["edge_samples"] = v.edge_samples;
    j["top_k"] = v.top_k;
    j["interior_cells"] = v.interior_cells;
    j["source_width"] = v.source_width;
    j["source_height"] = v.source_height;
    j["analysis_width"] = v.analysis_width;
    j["analysis_height"] = v.analysis_height;
    j["elapsed_ms"] = v.elapsed_ms;
    return j;
}

} // namespace audit_gate::gate
