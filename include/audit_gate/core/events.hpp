#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace audit_gate::core {

using json = nlohmann::json;

// Writes one JSON object per line: {"type", "run_id", "ts", ...}
class EventEmitter {
public:
    EventEmitter() = default;

    void run_start(const std::string& run_id, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, bool success, const std::string& status, std::ostream& out);

    void gate_start(const std::string& run_id, const std::string& source,
                    size_t payload_bytes, std::ostream& out);
    void gate_verdict(const std::string& run_id, const json& verdict, std::ostream& out);
    void gate_cancelled(const std::string& run_id, GateStage stage, std::ostream& out);

    void audit_start(const std::string& run_id, bool degraded, std::ostream& out);
    void audit_end(const std::string& run_id, const std::string& status, const json& extra,
                   std::ostream& out);

    void warning(const std::string& run_id, const std::string& message, std::ostream& out);
    void error(const std::string& run_id, const std::string& message, std::ostream& out);

private:
    void emit(const json& event, std::ostream& out);
    json base_event(const std::string& type, const std::string& run_id);
};

} // namespace audit_gate::core
