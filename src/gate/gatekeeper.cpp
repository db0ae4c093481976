#include "audit_gate/gate/gatekeeper.hpp"
#include "audit_gate/core/errors.hpp"
#include "audit_gate/core/events.hpp"
#include "audit_gate/core/utils.hpp"
#include "audit_gate/gate/classifier.hpp"
#include "audit_gate/image/preprocess.hpp"
#include "audit_gate/metrics/edge_magnitude.hpp"
#include "audit_gate/metrics/sharpness.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace audit_gate::gate {

namespace {

void check_stop(const std::atomic<bool>* stop_flag) {
    if (stop_flag && stop_flag->load(std::memory_order_relaxed)) {
        throw StopRequested();
    }
}

// Event logging must never turn into a failed gate call.
template <typename Fn>
void log_event(const GateCall& call, Fn&& fn) {
    if (!call.log) return;
    try {
        fn(*call.log);
    } catch (const std::exception& e) {
        std::cerr << "[audit_gate] event log write failed: " << e.what() << std::endl;
    }
}

} // namespace

GateVerdict run_gate_pipeline(const ImageBuffer& img, const config::GatekeeperConfig& cfg,
                              const std::atomic<bool>* stop_flag, GateStage* stage_out,
                              const std::function<void(GateStage)>& progress_cb) {
    auto set_stage = [&](GateStage* out, GateStage stage) {
        if (out) *out = stage;
        if (progress_cb) progress_cb(stage);
    };

    set_stage(stage_out, GateStage::PREPROCESS);
    check_stop(stop_flag);
    image::AnalysisSize size;
    Matrix2Df gray = image::preprocess(img, cfg, &size);

    set_stage(stage_out, GateStage::EDGE_DETECTION);
    check_stop(stop_flag);
    metrics::EdgeSampleSet edges = metrics::collect_edge_samples(gray, cfg.noise_floor, stop_flag);
    const size_t interior = edges.interior_cells;

    set_stage(stage_out, GateStage::AGGREGATION);
    check_stop(stop_flag);
    metrics::SharpnessAggregate agg = metrics::aggregate_sharpness(std::move(edges.magnitudes), cfg);

    set_stage(stage_out, GateStage::CLASSIFICATION);
    check_stop(stop_flag);
    GateVerdict v = classify(agg, cfg);
    v.interior_cells = interior;
    v.source_width = img.width;
    v.source_height = img.height;
    v.analysis_width = static_cast<int>(gray.cols());
    v.analysis_height = static_cast<int>(gray.rows());

    set_stage(stage_out, GateStage::DONE);
    return v;
}

SharpnessGatekeeper::SharpnessGatekeeper(config::GatekeeperConfig cfg,
                                         std::shared_ptr<const image::ImageDecoder> decoder)
    : cfg_(std::move(cfg)), decoder_(std::move(decoder)) {
    if (!decoder_) {
        throw ConfigError("SharpnessGatekeeper requires an image decoder");
    }
}

std::optional<GateVerdict> SharpnessGatekeeper::evaluate(const std::vector<uint8_t>& bytes,
                                                         const std::string& mime_type,
                                                         const GateCall& call) const {
    return guarded_run(&bytes, mime_type, nullptr, call);
}

std::optional<GateVerdict> SharpnessGatekeeper::evaluate_image(const ImageBuffer& img,
                                                               const GateCall& call) const {
    return guarded_run(nullptr, std::string(), &img, call);
}

std::future<std::optional<GateVerdict>> SharpnessGatekeeper::evaluate_async(
    std::vector<uint8_t> bytes, std::string mime_type, GateCall call) const {
    return std::async(std::launch::async,
                      [this, bytes = std::move(bytes), mime_type = std::move(mime_type),
                       call = std::move(call)]() {
                          return evaluate(bytes, mime_type, call);
                      });
}

std::optional<GateVerdict> SharpnessGatekeeper::guarded_run(const std::vector<uint8_t>* bytes,
                                                            const std::string& mime_type,
                                                            const ImageBuffer* decoded,
                                                            const GateCall& call) const {
    core::EventEmitter emitter;
    const auto t0 = std::chrono::steady_clock::now();
    auto elapsed_ms = [&]() {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
    };

    const size_t payload_bytes = bytes ? bytes->size() : (decoded ? decoded->samples.size() : 0);
    log_event(call, [&](std::ostream& out) {
        emitter.gate_start(call.run_id, call.source, payload_bytes, out);
    });

    auto finish = [&](GateVerdict v) {
        v.elapsed_ms = elapsed_ms();
        log_event(call, [&](std::ostream& out) {
            nlohmann::json j = verdict_to_json(v);
            j["source"] = call.source;
            if (bytes) j["payload_sha256"] = core::sha256_bytes(*bytes);
            emitter.gate_verdict(call.run_id, j, out);
        });
        return v;
    };

    GateStage stage = GateStage::DECODE;
    try {
        check_stop(call.stop_flag);

        ImageBuffer owned;
        const ImageBuffer* img = decoded;
        if (bytes) {
            owned = decoder_->decode(*bytes, mime_type);
            img = &owned;
        }
        image::validate_image_buffer(*img);

        return finish(run_gate_pipeline(*img, cfg_, call.stop_flag, &stage, call.progress_cb));
    } catch (const StopRequested&) {
        // Partial work is dropped; there is nothing to release.
        log_event(call, [&](std::ostream& out) { emitter.gate_cancelled(call.run_id, stage, out); });
        return std::nullopt;
    } catch (const std::exception& e) {
        const bool decode_failed = stage == GateStage::DECODE;
        log_event(call, [&](std::ostream& out) {
            const std::string msg = "gate fail-open at " + stage_to_string(stage) + " (" +
                                    call.source + "): " + e.what();
            if (decode_failed) {
                emitter.warning(call.run_id, msg, out);
            } else {
                emitter.error(call.run_id, msg, out);
            }
        });
        return finish(fail_open_verdict(
            decode_failed ? VerdictReason::DecodeFailure : VerdictReason::ProcessingError, cfg_));
    }
}

} // namespace audit_gate::gate
