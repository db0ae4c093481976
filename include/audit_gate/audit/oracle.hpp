#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace audit_gate::audit {

struct ImagePart {
    std::string role;         // "goods" or "document"
    std::string mime_type;
    std::string base64_data;
};

struct AuditRequest {
    std::vector<ImagePart> images;  // goods photo first, document photo second
    bool degraded = false;          // document failed the gate and the user overrode it
    int gate_score = 0;
};

// External multimodal reasoning service. Returns the audit document as JSON
// (inspection_summary, physical_analysis, document_analysis, reasoning_logic,
// recommendation). Implementations throw OracleError on failure.
class AuditOracle {
public:
    virtual ~AuditOracle() = default;
    virtual nlohmann::json audit(const AuditRequest& request) = 0;
};

} // namespace audit_gate::audit
