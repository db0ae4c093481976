#include "audit_gate/audit/session.hpp"
#include "audit_gate/audit/report.hpp"
#include "audit_gate/core/errors.hpp"
#include "audit_gate/core/events.hpp"
#include "audit_gate/core/utils.hpp"

#include <future>
#include <sstream>
#include <utility>

namespace audit_gate::audit {

AuditSession::AuditSession(config::Config cfg, const gate::SharpnessGatekeeper& gatekeeper,
                           AuditOracle& oracle, std::ostream& log, std::string run_id)
    : cfg_(std::move(cfg)), gatekeeper_(gatekeeper), oracle_(oracle), log_(log),
      run_id_(std::move(run_id)) {}

void AuditSession::set_goods_photo(PhotoSlot photo) {
    goods_ = std::move(photo);
    if (state_ == SessionState::Completed) {
        state_ = SessionState::AwaitingPhotos;
    }
}

void AuditSession::set_document_photo(PhotoSlot photo) {
    document_ = std::move(photo);
    if (state_ == SessionState::Completed) {
        state_ = SessionState::AwaitingPhotos;
    }
}

PreCheckOutcome AuditSession::start_precheck(const std::atomic<bool>* stop_flag) {
    if (state_ == SessionState::AwaitingUserDecision) {
        throw ValidationError("a gate decision is pending; call resolve() first");
    }
    if (!goods_.present() || !document_.present()) {
        throw ValidationError("both the goods photo and the document photo are required");
    }

    PreCheckOutcome out;
    out.threshold = gatekeeper_.config().blur_threshold;

    // Per-call log buffers so parallel evaluations never share a stream; they
    // are flushed in a fixed order afterwards.
    std::ostringstream doc_log;
    std::ostringstream goods_log;

    gate::GateCall doc_call{run_id_, "document:" + document_.label, &doc_log, stop_flag};
    std::future<std::optional<gate::GateVerdict>> goods_future;
    if (cfg_.session.gate_goods_photo) {
        gate::GateCall goods_call{run_id_, "goods:" + goods_.label, &goods_log, stop_flag};
        goods_future = gatekeeper_.evaluate_async(goods_.bytes, goods_.mime_type, goods_call);
    }
    out.document_verdict = gatekeeper_.evaluate(document_.bytes, document_.mime_type, doc_call);
    if (goods_future.valid()) {
        out.goods_verdict = goods_future.get();
    }

    log_ << doc_log.str() << goods_log.str();
    log_.flush();

    if (!out.document_verdict || (cfg_.session.gate_goods_photo && !out.goods_verdict)) {
        out.status = PreCheckStatus::Cancelled;
        return out;
    }

    const gate::GateVerdict* rejected = nullptr;
    if (out.document_verdict->is_blurry) {
        rejected = &*out.document_verdict;
        out.rejected_photo = PhotoRole::Document;
    } else if (out.goods_verdict && out.goods_verdict->is_blurry) {
        rejected = &*out.goods_verdict;
        out.rejected_photo = PhotoRole::Goods;
    }

    if (rejected) {
        out.status = PreCheckStatus::AwaitUserDecision;
        out.score = rejected->score;
        pending_score_ = rejected->score;
        pending_role_ = *out.rejected_photo;
        state_ = SessionState::AwaitingUserDecision;
        return out;
    }

    out.score = out.document_verdict->score;
    out.report = run_audit(false, out.document_verdict->score);
    out.status = PreCheckStatus::Proceeded;
    return out;
}

std::optional<nlohmann::json> AuditSession::resolve(UserChoice choice) {
    if (state_ != SessionState::AwaitingUserDecision) {
        throw ValidationError("no gate decision is pending");
    }

    if (choice == UserChoice::Retake) {
        if (pending_role_ == PhotoRole::Goods) {
            goods_ = PhotoSlot{};
        } else {
            document_ = PhotoSlot{};
        }
        state_ = SessionState::AwaitingPhotos;
        core::EventEmitter emitter;
        emitter.warning(run_id_, role_to_string(pending_role_) + " photo rejected (score " +
                                     std::to_string(pending_score_) +
                                     "); waiting for a clearer upload", log_);
        return std::nullopt;
    }

    nlohmann::json report = run_audit(true, pending_score_);
    annotate_degraded_report(report, format_override_note(cfg_.session.override_note, pending_score_,
                                                          gatekeeper_.config().blur_threshold));
    return report;
}

nlohmann::json AuditSession::run_audit(bool degraded, int gate_score) {
    core::EventEmitter emitter;
    emitter.audit_start(run_id_, degraded, log_);

    AuditRequest req;
    req.degraded = degraded;
    req.gate_score = gate_score;
    req.images.push_back({"goods", goods_.mime_type, core::encode_base64(goods_.bytes)});
    req.images.push_back({"document", document_.mime_type, core::encode_base64(document_.bytes)});

    nlohmann::json report;
    try {
        report = oracle_.audit(req);
    } catch (const std::exception& e) {
        // Keep the pending decision so the caller can retry the same choice.
        emitter.audit_end(run_id_, "error", {{"message", e.what()}}, log_);
        throw;
    }

    state_ = SessionState::Completed;
    emitter.audit_end(run_id_, "ok", {{"degraded", degraded}, {"gate_score", gate_score}}, log_);
    return report;
}

} // namespace audit_gate::audit
