#include "audit_gate/audit/report.hpp"
#include "audit_gate/core/errors.hpp"
#include "audit_gate/core/utils.hpp"

namespace audit_gate::audit {

std::string format_override_note(const std::string& note_template, int score, int threshold) {
    std::string note = core::replace_all(note_template, "{score}", std::to_string(score));
    return core::replace_all(note, "{threshold}", std::to_string(threshold));
}

void annotate_degraded_report(nlohmann::json& report, const std::string& note) {
    if (!report.is_object()) {
        throw ValidationError("audit report must be a JSON object");
    }
    nlohmann::json& logic = report["reasoning_logic"];
    if (logic.is_null()) {
        logic = nlohmann::json::object();
    }
    if (!logic.is_object()) {
        throw ValidationError("reasoning_logic must be an object");
    }
    nlohmann::json& anomalies = logic["anomalies_found"];
    if (anomalies.is_null()) {
        anomalies = nlohmann::json::array();
    }
    if (!anomalies.is_array()) {
        throw ValidationError("reasoning_logic.anomalies_found must be an array");
    }
    anomalies.push_back(note);
}

} // namespace audit_gate::audit
