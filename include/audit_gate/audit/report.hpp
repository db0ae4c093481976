#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace audit_gate::audit {

// Replaces {score} and {threshold} in the configured note template.
std::string format_override_note(const std::string& note_template, int score, int threshold);

// Appends the note to reasoning_logic.anomalies_found, creating the path if
// missing. Nothing else in the report is touched. Throws ValidationError if
// the report is not a JSON object or the path holds a non-array value.
void annotate_degraded_report(nlohmann::json& report, const std::string& note);

} // namespace audit_gate::audit
