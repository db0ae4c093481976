#pragma once

#include "audit_gate/audit/oracle.hpp"
#include "audit_gate/config/configuration.hpp"
#include "audit_gate/gate/gatekeeper.hpp"

#include <atomic>
#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace audit_gate::audit {

struct PhotoSlot {
    std::vector<uint8_t> bytes;
    std::string mime_type;
    std::string label;  // file name, shown in the event log

    bool present() const { return !bytes.empty(); }
};

enum class PhotoRole {
    Goods,
    Document
};

inline std::string role_to_string(PhotoRole role) {
    return role == PhotoRole::Goods ? "goods" : "document";
}

enum class SessionState {
    AwaitingPhotos,
    AwaitingUserDecision,
    Completed
};

enum class PreCheckStatus {
    Proceeded,          // gate passed, report available
    AwaitUserDecision,  // gate rejected the photo, caller must call resolve()
    Cancelled
};

enum class UserChoice {
    Retake,        // drop the rejected document photo
    ForceOverride  // audit anyway, report tagged as degraded
};

struct PreCheckOutcome {
    PreCheckStatus status = PreCheckStatus::Cancelled;
    std::optional<gate::GateVerdict> document_verdict;
    std::optional<gate::GateVerdict> goods_verdict;
    int score = 0;      // score of the rejected photo (AwaitUserDecision)
    int threshold = 0;
    std::optional<PhotoRole> rejected_photo;  // slot to re-upload on Retake
    std::optional<nlohmann::json> report;
};

// Caller side of the gate: runs the gate on the document photo (and the goods
// photo when configured), calls the oracle only after the verdict, and handles
// the retake / override branch.
class AuditSession {
public:
    AuditSession(config::Config cfg, const gate::SharpnessGatekeeper& gatekeeper,
                 AuditOracle& oracle, std::ostream& log, std::string run_id);

    void set_goods_photo(PhotoSlot photo);
    void set_document_photo(PhotoSlot photo);

    // Throws ValidationError unless both photos are present and no decision
    // is pending. Oracle failures propagate as OracleError.
    PreCheckOutcome start_precheck(const std::atomic<bool>* stop_flag = nullptr);

    // Only valid while AwaitingUserDecision. Returns the annotated report for
    // ForceOverride and std::nullopt for Retake, which clears the rejected slot.
    std::optional<nlohmann::json> resolve(UserChoice choice);

    SessionState state() const { return state_; }
    bool has_document_photo() const { return document_.present(); }
    bool has_goods_photo() const { return goods_.present(); }

private:
    nlohmann::json run_audit(bool degraded, int gate_score);

    config::Config cfg_;
    const gate::SharpnessGatekeeper& gatekeeper_;
    AuditOracle& oracle_;
    std::ostream& log_;
    std::string run_id_;

    PhotoSlot goods_;
    PhotoSlot document_;
    SessionState state_ = SessionState::AwaitingPhotos;
    int pending_score_ = 0;
    PhotoRole pending_role_ = PhotoRole::Document;
};

} // namespace audit_gate::audit
