#pragma once

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace audit_gate::config {

namespace fs = std::filesystem;

// Calibration constants of the sharpness gate. The defaults are tuned for
// photographed printed documents.
struct GatekeeperConfig {
  int target_width = 800;        // analysis width; narrower sources are not upscaled
  float noise_floor = 15.0f;     // Laplacian magnitudes <= floor are discarded
  float top_fraction = 0.2f;     // share of strongest edges averaged into the score
  int min_edge_samples = 100;    // fewer surviving edges => blurry with score 0
  int blur_threshold = 40;       // score < threshold => blurry
  int fail_open_score = 999;     // score reported when the gate fails open
};

struct SessionConfig {
  bool gate_goods_photo = false;
  std::string override_note =
      "[SYSTEM NOTE] Audit performed on blurry image (Score: {score}). "
      "Accuracy may be degraded.";
};

struct RuntimeConfig {
  int parallel_workers = 4;
  std::string event_log; // empty = stderr only
};

struct Config {
  GatekeeperConfig gatekeeper;
  SessionConfig session;
  RuntimeConfig runtime;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

} // namespace audit_gate::config
