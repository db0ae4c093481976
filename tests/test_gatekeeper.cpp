#include "audit_gate/config/configuration.hpp"
#include "audit_gate/core/errors.hpp"
#include "audit_gate/gate/gatekeeper.hpp"
#include "audit_gate/image/decoder.hpp"
#include "test_images.hpp"

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using audit_gate::ImageBuffer;
using audit_gate::config::GatekeeperConfig;
using audit_gate::gate::GateCall;
using audit_gate::gate::GateVerdict;
using audit_gate::gate::SharpnessGatekeeper;
using audit_gate::gate::VerdictReason;
using audit_gate::image::OpenCvImageDecoder;
using audit_gate::image::RawImageDecoder;

namespace {

SharpnessGatekeeper make_gatekeeper(GatekeeperConfig cfg = GatekeeperConfig()) {
  return SharpnessGatekeeper(cfg, std::make_shared<OpenCvImageDecoder>());
}

GateVerdict gate_image(const ImageBuffer &img) {
  SharpnessGatekeeper gk = make_gatekeeper();
  auto v = gk.evaluate_image(img, GateCall{});
  REQUIRE(v.has_value());
  return *v;
}

std::vector<nlohmann::json> parse_events(const std::string &log) {
  std::vector<nlohmann::json> out;
  std::istringstream in(log);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty()) out.push_back(nlohmann::json::parse(line));
  }
  return out;
}

} // namespace

TEST_CASE("gate_sharp_checkerboard_passes") {
  GateVerdict v = gate_image(audit_gate::test::checkerboard(800, 600, 32));
  REQUIRE_FALSE(v.is_blurry);
  REQUIRE(v.reason == VerdictReason::Sharp);
  REQUIRE(v.score >= 255);
  REQUIRE(v.analysis_width == 800);
  REQUIRE(v.analysis_height == 600);
  REQUIRE(v.edge_samples >= 100);
}

TEST_CASE("gate_uniform_and_black_images_are_blurry_zero") {
  for (uint8_t value : {uint8_t(0), uint8_t(128), uint8_t(255)}) {
    GateVerdict v = gate_image(audit_gate::test::uniform_image(800, 600, value));
    REQUIRE(v.is_blurry);
    REQUIRE(v.score == 0);
    REQUIRE(v.reason == VerdictReason::InsufficientContent);
  }
}

TEST_CASE("gate_tiny_image_has_no_samples") {
  GateVerdict v = gate_image(audit_gate::test::checkerboard(2, 2, 1));
  REQUIRE(v.is_blurry);
  REQUIRE(v.score == 0);
  REQUIRE(v.interior_cells == 0);
  REQUIRE(v.edge_samples == 0);
}

TEST_CASE("gate_collapsed_height_is_insufficient") {
  GateVerdict v = gate_image(audit_gate::test::checkerboard(4000, 4, 2));
  REQUIRE(v.is_blurry);
  REQUIRE(v.score == 0);
  REQUIRE(v.analysis_width == 800);
  REQUIRE(v.analysis_height == 0);
}

TEST_CASE("gate_low_contrast_texture_stays_under_noise_floor") {
  // Column pairs differing by 7 produce magnitude 14 everywhere.
  ImageBuffer img = audit_gate::test::uniform_image(400, 300, 100, 1);
  for (int y = 0; y < img.height; ++y) {
    for (int x = 1; x < img.width; x += 2) {
      img.samples[static_cast<size_t>(y) * img.width + x] = 107;
    }
  }
  GateVerdict v = gate_image(img);
  REQUIRE(v.edge_samples == 0);
  REQUIRE(v.is_blurry);
  REQUIRE(v.score == 0);
}

TEST_CASE("gate_score_decreases_with_blur") {
  const ImageBuffer sharp = audit_gate::test::checkerboard(800, 600, 32);
  int previous = gate_image(sharp).score;
  for (int radius = 1; radius <= 3; ++radius) {
    const int score = gate_image(audit_gate::test::box_blurred(sharp, radius)).score;
    REQUIRE(score < previous);
    previous = score;
  }

  GateVerdict heavy = gate_image(audit_gate::test::box_blurred(sharp, 10));
  REQUIRE(heavy.is_blurry);
}

TEST_CASE("gate_downsampled_checkerboard_stays_sharp") {
  GateVerdict v = gate_image(audit_gate::test::checkerboard(1600, 1200, 64));
  REQUIRE_FALSE(v.is_blurry);
  REQUIRE(v.source_width == 1600);
  REQUIRE(v.analysis_width == 800);
  REQUIRE(v.analysis_height == 600);
}

TEST_CASE("gate_invoice_photo_passes") {
  GateVerdict v = gate_image(audit_gate::test::invoice_page(3000, 4000));
  REQUIRE(v.analysis_width == 800);
  REQUIRE(v.analysis_height == 1066);
  REQUIRE_FALSE(v.is_blurry);
  REQUIRE(v.score >= 45);
}

TEST_CASE("gate_is_deterministic") {
  const ImageBuffer img = audit_gate::test::box_blurred(audit_gate::test::checkerboard(800, 600, 20), 1);
  GateVerdict a = gate_image(img);
  GateVerdict b = gate_image(img);
  REQUIRE(a.score == b.score);
  REQUIRE(a.is_blurry == b.is_blurry);
  REQUIRE(a.edge_samples == b.edge_samples);
}

TEST_CASE("gate_decodes_png_payload") {
  const ImageBuffer img = audit_gate::test::checkerboard(640, 480, 16);
  SharpnessGatekeeper gk = make_gatekeeper();
  auto v = gk.evaluate(audit_gate::test::encode_png(img), "image/png", GateCall{});
  REQUIRE(v.has_value());
  REQUIRE_FALSE(v->is_blurry);
  REQUIRE(v->source_width == 640);
  REQUIRE(v->analysis_width == 640);
  REQUIRE(v->score == gate_image(img).score);
}

TEST_CASE("gate_fails_open_on_undecodable_payload") {
  SharpnessGatekeeper gk = make_gatekeeper();
  std::ostringstream log;
  GateCall call{"run1", "garbage.jpg", &log, nullptr};

  std::vector<uint8_t> garbage = {0x00, 0x01, 0x02, 0x03, 0xde, 0xad, 0xbe, 0xef};
  auto v = gk.evaluate(garbage, "image/jpeg", call);
  REQUIRE(v.has_value());
  REQUIRE_FALSE(v->is_blurry);
  REQUIRE(v->score == 999);
  REQUIRE(v->reason == VerdictReason::DecodeFailure);

  auto events = parse_events(log.str());
  REQUIRE(events.size() == 3);
  REQUIRE(events[0]["type"] == "gate_start");
  REQUIRE(events[1]["type"] == "warning");
  REQUIRE(events[2]["type"] == "gate_verdict");
  REQUIRE(events[2]["score"] == 999);
  REQUIRE(events[2]["source"] == "garbage.jpg");
}

TEST_CASE("gate_fails_open_on_empty_or_non_image_payload") {
  SharpnessGatekeeper gk = make_gatekeeper();
  auto empty = gk.evaluate({}, "image/png", GateCall{});
  REQUIRE(empty->reason == VerdictReason::DecodeFailure);
  REQUIRE(empty->score == 999);

  const auto png = audit_gate::test::encode_png(audit_gate::test::checkerboard(64, 64, 8));
  auto pdf = gk.evaluate(png, "application/pdf", GateCall{});
  REQUIRE(pdf->reason == VerdictReason::DecodeFailure);
  REQUIRE_FALSE(pdf->is_blurry);
}

TEST_CASE("gate_fails_open_on_zero_width_buffer") {
  SharpnessGatekeeper gk(GatekeeperConfig(), std::make_shared<RawImageDecoder>(0, 10, 3));
  auto v = gk.evaluate(std::vector<uint8_t>(30, 0), "", GateCall{});
  REQUIRE(v.has_value());
  REQUIRE_FALSE(v->is_blurry);
  REQUIRE(v->score == 999);
}

TEST_CASE("gate_fail_open_score_follows_config") {
  GatekeeperConfig cfg;
  cfg.fail_open_score = 1234;
  SharpnessGatekeeper gk = make_gatekeeper(cfg);
  auto v = gk.evaluate({1, 2, 3}, "image/jpeg", GateCall{});
  REQUIRE(v->score == 1234);
}

TEST_CASE("gate_requires_decoder") {
  REQUIRE_THROWS_AS(SharpnessGatekeeper(GatekeeperConfig(), nullptr), audit_gate::ConfigError);
}

TEST_CASE("gate_cancelled_call_has_no_verdict") {
  SharpnessGatekeeper gk = make_gatekeeper();
  std::atomic<bool> stop{true};
  std::ostringstream log;
  GateCall call{"run2", "doc.png", &log, &stop};

  auto v = gk.evaluate_image(audit_gate::test::checkerboard(800, 600, 32), call);
  REQUIRE_FALSE(v.has_value());

  auto events = parse_events(log.str());
  REQUIRE(events.back()["type"] == "gate_cancelled");
}

TEST_CASE("gate_async_matches_sync") {
  SharpnessGatekeeper gk = make_gatekeeper();
  const auto png = audit_gate::test::encode_png(audit_gate::test::checkerboard(800, 600, 32));

  auto fut = gk.evaluate_async(png, "image/png", GateCall{});
  auto sync = gk.evaluate(png, "image/png", GateCall{});
  auto async = fut.get();
  REQUIRE(async.has_value());
  REQUIRE(async->score == sync->score);
  REQUIRE(async->is_blurry == sync->is_blurry);
}

TEST_CASE("gate_concurrent_calls_are_independent") {
  SharpnessGatekeeper gk = make_gatekeeper();
  const ImageBuffer sharp = audit_gate::test::checkerboard(800, 600, 32);
  const ImageBuffer flat = audit_gate::test::uniform_image(800, 600, 90);
  const int sharp_score = gate_image(sharp).score;

  std::vector<int> scores(8, -1);
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&, i]() {
      auto v = gk.evaluate_image(i % 2 == 0 ? sharp : flat, GateCall{});
      scores[static_cast<size_t>(i)] = v ? v->score : -1;
    });
  }
  for (auto &t : threads) t.join();

  for (int i = 0; i < 8; ++i) {
    REQUIRE(scores[static_cast<size_t>(i)] == (i % 2 == 0 ? sharp_score : 0));
  }
}

TEST_CASE("gate_survives_non_utf8_labels") {
  SharpnessGatekeeper gk = make_gatekeeper();
  std::ostringstream log;
  GateCall call{"run3", "factura_\xf1.jpg", &log, nullptr};

  const std::vector<uint8_t> payload = {1, 2, 3, 4};
  std::optional<GateVerdict> v;
  REQUIRE_NOTHROW(v = gk.evaluate(payload, "image/jp\xe9g", call));
  REQUIRE(v.has_value());
  REQUIRE(v->reason == VerdictReason::DecodeFailure);
  REQUIRE(v->score == 999);

  auto events = parse_events(log.str());
  REQUIRE(events.size() == 3);
  REQUIRE(events[1]["type"] == "warning");
  REQUIRE(events[2]["type"] == "gate_verdict");
}

TEST_CASE("gate_reports_stages_in_order") {
  SharpnessGatekeeper gk = make_gatekeeper();
  std::vector<audit_gate::GateStage> seen;
  GateCall call;
  call.progress_cb = [&](audit_gate::GateStage stage) { seen.push_back(stage); };

  auto v = gk.evaluate_image(audit_gate::test::checkerboard(64, 64, 8), call);
  REQUIRE(v.has_value());
  const std::vector<audit_gate::GateStage> expected = {
      audit_gate::GateStage::PREPROCESS, audit_gate::GateStage::EDGE_DETECTION,
      audit_gate::GateStage::AGGREGATION, audit_gate::GateStage::CLASSIFICATION,
      audit_gate::GateStage::DONE};
  REQUIRE(seen == expected);
}

TEST_CASE("gate_fails_open_on_processing_error") {
  SharpnessGatekeeper gk = make_gatekeeper();
  std::ostringstream log;
  GateCall call{"run4", "doc.png", &log, nullptr};
  call.progress_cb = [](audit_gate::GateStage stage) {
    if (stage == audit_gate::GateStage::EDGE_DETECTION) {
      throw std::runtime_error("edge buffer unavailable");
    }
  };

  const auto png = audit_gate::test::encode_png(audit_gate::test::checkerboard(640, 480, 16));
  auto v = gk.evaluate(png, "image/png", call);
  REQUIRE(v.has_value());
  REQUIRE_FALSE(v->is_blurry);
  REQUIRE(v->score == 999);
  REQUIRE(v->reason == VerdictReason::ProcessingError);

  auto events = parse_events(log.str());
  REQUIRE(events.size() == 3);
  REQUIRE(events[1]["type"] == "error");
  REQUIRE(events[1]["message"].get<std::string>().find("EDGE_DETECTION") != std::string::npos);
  REQUIRE(events[2]["reason"] == "PROCESSING_ERROR");
}
