#include "audit_gate/core/events.hpp"
#include "audit_gate/core/utils.hpp"

namespace audit_gate::core {

json EventEmitter::base_event(const std::string& type, const std::string& run_id) {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event, std::ostream& out) {
    // Caller-supplied strings (file names, MIME types) may not be valid UTF-8.
    out << event.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    out.flush();
}

void EventEmitter::run_start(const std::string& run_id, const json& extra, std::ostream& out) {
    json event = base_event("run_start", run_id);
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::run_end(const std::string& run_id, bool success,
                           const std::string& status, std::ostream& out) {
    json event = base_event("run_end", run_id);
    event["success"] = success;
    event["status"] = status;
    emit(event, out);
}

void EventEmitter::gate_start(const std::string& run_id, const std::string& source,
                              size_t payload_bytes, std::ostream& out) {
    json event = base_event("gate_start", run_id);
    event["source"] = source;
    event["payload_bytes"] = payload_bytes;
    emit(event, out);
}

void EventEmitter::gate_verdict(const std::string& run_id, const json& verdict,
                                std::ostream& out) {
    json event = base_event("gate_verdict", run_id);
    for (auto& [key, value] : verdict.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::gate_cancelled(const std::string& run_id, GateStage stage,
                                  std::ostream& out) {
    json event = base_event("gate_cancelled", run_id);
    event["stage"] = stage_to_int(stage);
    event["stage_name"] = stage_to_string(stage);
    emit(event, out);
}

void EventEmitter::audit_start(const std::string& run_id, bool degraded, std::ostream& out) {
    json event = base_event("audit_start", run_id);
    event["degraded"] = degraded;
    emit(event, out);
}

void EventEmitter::audit_end(const std::string& run_id, const std::string& status,
                             const json& extra, std::ostream& out) {
    json event = base_event("audit_end", run_id);
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message,
                           std::ostream& out) {
    json event = base_event("warning", run_id);
    event["message"] = message;
    emit(event, out);
}

void EventEmitter::error(const std::string& run_id, const std::string& message,
                         std::ostream& out) {
    json event = base_event("error", run_id);
    event["message"] = message;
    emit(event, out);
}

} // namespace audit_gate::core
