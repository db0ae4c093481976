#pragma once

#include "audit_gate/config/configuration.hpp"
#include "audit_gate/core/types.hpp"
#include "audit_gate/gate/verdict.hpp"
#include "audit_gate/image/decoder.hpp"

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace audit_gate::gate {

// Per-call context. Nothing in here is shared between calls unless the caller
// shares it.
struct GateCall {
    std::string run_id;
    std::string source;                          // label for the event log
    std::ostream* log = nullptr;                 // JSON-lines events, nullptr = silent
    const std::atomic<bool>* stop_flag = nullptr;
    std::function<void(GateStage)> progress_cb = nullptr;  // called as each stage starts
};

// Preprocess -> edge samples -> aggregate -> classify on a decoded image.
// Throws on any failure (StopRequested when cancelled). stage_out, if given,
// tracks the stage currently running; progress_cb is told about each new stage.
GateVerdict run_gate_pipeline(const ImageBuffer& img, const config::GatekeeperConfig& cfg,
                              const std::atomic<bool>* stop_flag = nullptr,
                              GateStage* stage_out = nullptr,
                              const std::function<void(GateStage)>& progress_cb = nullptr);

// Sharpness gate in front of the audit oracle. Stateless after construction;
// one instance can serve concurrent calls.
class SharpnessGatekeeper {
public:
    SharpnessGatekeeper(config::GatekeeperConfig cfg,
                        std::shared_ptr<const image::ImageDecoder> decoder);

    // Always resolves to a verdict; std::nullopt only when the call was
    // cancelled through call.stop_flag.
    std::optional<GateVerdict> evaluate(const std::vector<uint8_t>& bytes,
                                        const std::string& mime_type,
                                        const GateCall& call) const;

    // Same as evaluate for an already decoded image.
    std::optional<GateVerdict> evaluate_image(const ImageBuffer& img, const GateCall& call) const;

    // Runs evaluate on a worker thread. The gatekeeper, call.log and
    // call.stop_flag must outlive the future.
    std::future<std::optional<GateVerdict>> evaluate_async(std::vector<uint8_t> bytes,
                                                           std::string mime_type,
                                                           GateCall call) const;

    const config::GatekeeperConfig& config() const { return cfg_; }

private:
    std::optional<GateVerdict> guarded_run(const std::vector<uint8_t>* bytes,
                                           const std::string& mime_type,
                                           const ImageBuffer* decoded,
                                           const GateCall& call) const;

    config::GatekeeperConfig cfg_;
    std::shared_ptr<const image::ImageDecoder> decoder_;
};

} // namespace audit_gate::gate
