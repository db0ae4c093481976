#include "audit_gate/config/configuration.hpp"
#include "audit_gate/core/types.hpp"
#include "audit_gate/image/preprocess.hpp"
#include "test_images.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using audit_gate::ImageBuffer;
using audit_gate::Matrix2Df;
using audit_gate::image::AnalysisSize;
using audit_gate::image::compute_analysis_size;
using audit_gate::image::preprocess;
using audit_gate::image::to_grayscale;

TEST_CASE("analysis_size_downscales_wide_sources_with_floor_height") {
  AnalysisSize s = compute_analysis_size(3000, 4000, 800);
  REQUIRE(s.resampled);
  REQUIRE(s.width == 800);
  // 4000 * 800 / 3000 = 1066.67, truncated
  REQUIRE(s.height == 1066);
}

TEST_CASE("analysis_size_keeps_target_width_sources") {
  AnalysisSize s = compute_analysis_size(800, 600, 800);
  REQUIRE_FALSE(s.resampled);
  REQUIRE(s.width == 800);
  REQUIRE(s.height == 600);
  REQUIRE(s.scale == 1.0);
}

TEST_CASE("analysis_size_never_upscales") {
  AnalysisSize s = compute_analysis_size(640, 480, 800);
  REQUIRE_FALSE(s.resampled);
  REQUIRE(s.width == 640);
  REQUIRE(s.height == 480);
}

TEST_CASE("analysis_size_extreme_aspect_can_collapse_height") {
  AnalysisSize s = compute_analysis_size(4000, 4, 800);
  REQUIRE(s.resampled);
  REQUIRE(s.width == 800);
  REQUIRE(s.height == 0);
}

TEST_CASE("grayscale_uses_luma_weights") {
  ImageBuffer img = audit_gate::test::uniform_image(1, 1, 0, 3);
  img.samples = {255, 0, 0};
  REQUIRE(to_grayscale(img)(0, 0) == Catch::Approx(76.245f).margin(1e-3));

  img.samples = {0, 255, 0};
  REQUIRE(to_grayscale(img)(0, 0) == Catch::Approx(149.685f).margin(1e-3));

  img.samples = {0, 0, 255};
  REQUIRE(to_grayscale(img)(0, 0) == Catch::Approx(29.07f).margin(1e-3));
}

TEST_CASE("grayscale_ignores_alpha") {
  ImageBuffer opaque = audit_gate::test::uniform_image(1, 1, 0, 4);
  opaque.samples = {10, 20, 30, 255};
  ImageBuffer transparent = opaque;
  transparent.samples[3] = 0;

  REQUIRE(to_grayscale(opaque)(0, 0) == to_grayscale(transparent)(0, 0));
}

TEST_CASE("grayscale_single_channel_passes_through") {
  ImageBuffer img = audit_gate::test::uniform_image(3, 2, 0, 1);
  img.samples = {0, 1, 2, 100, 200, 255};

  Matrix2Df g = to_grayscale(img);
  REQUIRE(g.rows() == 2);
  REQUIRE(g.cols() == 3);
  REQUIRE(g(0, 2) == 2.0f);
  REQUIRE(g(1, 0) == 100.0f);
  REQUIRE(g(1, 2) == 255.0f);
}

TEST_CASE("preprocess_downsamples_to_target_width") {
  audit_gate::config::GatekeeperConfig cfg;
  ImageBuffer img = audit_gate::test::checkerboard(1600, 1200, 64);

  AnalysisSize size;
  Matrix2Df g = preprocess(img, cfg, &size);
  REQUIRE(size.resampled);
  REQUIRE(g.cols() == 800);
  REQUIRE(g.rows() == 600);
  // Exact 2x area average keeps the squares pure black / white.
  REQUIRE(g(0, 0) == Catch::Approx(255.0f).margin(0.5));
  REQUIRE(g(0, 32) == Catch::Approx(0.0f).margin(0.5));
}

TEST_CASE("preprocess_collapsed_height_yields_empty_grid") {
  audit_gate::config::GatekeeperConfig cfg;
  ImageBuffer img = audit_gate::test::uniform_image(4000, 4, 128);

  Matrix2Df g = preprocess(img, cfg);
  REQUIRE(g.rows() == 0);
  REQUIRE(g.cols() == 800);
}
