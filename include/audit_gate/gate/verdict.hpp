#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>

namespace audit_gate::gate {

enum class VerdictReason {
    Sharp,
    Blurry,
    InsufficientContent,  // too few edges survive the noise gate
    DecodeFailure,        // fail-open
    ProcessingError       // fail-open
};

inline std::string reason_to_string(VerdictReason reason) {
    switch (reason) {
        case VerdictReason::Sharp: return "SHARP";
        case VerdictReason::Blurry: return "BLURRY";
        case VerdictReason::InsufficientContent: return "INSUFFICIENT_CONTENT";
        case VerdictReason::DecodeFailure: return "DECODE_FAILURE";
        case VerdictReason::ProcessingError: return "PROCESSING_ERROR";
        default: return "UNKNOWN";
    }
}

// Outcome of one gate call. is_blurry and score are the decision; the other
// fields are diagnostics only.
struct GateVerdict {
    bool is_blurry = false;
    int score = 0;

    VerdictReason reason = VerdictReason::Sharp;
    int threshold = 0;
    size_t edge_samples = 0;
    size_t top_k = 0;
    size_t interior_cells = 0;
    int source_width = 0;
    int source_height = 0;
    int analysis_width = 0;
    int analysis_height = 0;
    double elapsed_ms = 0.0;

    bool failed_open() const {
        return reason == VerdictReason::DecodeFailure || reason == VerdictReason::ProcessingError;
    }
};

nlohmann::json verdict_to_json(const GateVerdict& v);

} // namespace audit_gate::gate
