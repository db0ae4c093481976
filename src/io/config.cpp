#include "audit_gate/config/configuration.hpp"
#include "audit_gate/core/errors.hpp"

#include <fstream>

namespace audit_gate::config {

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["gatekeeper"]) {
            auto g = node["gatekeeper"];
            if (g["target_width"]) cfg.gatekeeper.target_width = g["target_width"].as<int>();
            if (g["noise_floor"]) cfg.gatekeeper.noise_floor = g["noise_floor"].as<float>();
            if (g["top_fraction"]) cfg.gatekeeper.top_fraction = g["top_fraction"].as<float>();
            if (g["min_edge_samples"]) cfg.gatekeeper.min_edge_samples = g["min_edge_samples"].as<int>();
            if (g["blur_threshold"]) cfg.gatekeeper.blur_threshold = g["blur_threshold"].as<int>();
            if (g["fail_open_score"]) cfg.gatekeeper.fail_open_score = g["fail_open_score"].as<int>();
        }

        if (node["session"]) {
            auto s = node["session"];
            if (s["gate_goods_photo"]) cfg.session.gate_goods_photo = s["gate_goods_photo"].as<bool>();
            if (s["override_note"]) cfg.session.override_note = s["override_note"].as<std::string>();
        }

        if (node["runtime"]) {
            auto r = node["runtime"];
            if (r["parallel_workers"]) cfg.runtime.parallel_workers = r["parallel_workers"].as<int>();
            if (r["event_log"]) cfg.runtime.event_log = r["event_log"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["gatekeeper"]["target_width"] = gatekeeper.target_width;
    node["gatekeeper"]["noise_floor"] = gatekeeper.noise_floor;
    node["gatekeeper"]["top_fraction"] = gatekeeper.top_fraction;
    node["gatekeeper"]["min_edge_samples"] = gatekeeper.min_edge_samples;
    node["gatekeeper"]["blur_threshold"] = gatekeeper.blur_threshold;
    node["gatekeeper"]["fail_open_score"] = gatekeeper.fail_open_score;

    node["session"]["gate_goods_photo"] = session.gate_goods_photo;
    node["session"]["override_note"] = session.override_note;

    node["runtime"]["parallel_workers"] = runtime.parallel_workers;
    node["runtime"]["event_log"] = runtime.event_log;

    return node;
}

void Config::validate() const {
    if (gatekeeper.target_width < 16 || gatekeeper.target_width > 8192) {
        throw ValidationError("gatekeeper.target_width must be in [16,8192]");
    }
    if (!(gatekeeper.noise_floor >= 0.0f)) {
        throw ValidationError("gatekeeper.noise_floor must be >= 0");
    }
    if (!(gatekeeper.top_fraction > 0.0f) || gatekeeper.top_fraction > 1.0f) {
        throw ValidationError("gatekeeper.top_fraction must be in (0,1]");
    }
    if (gatekeeper.min_edge_samples < 1) {
        throw ValidationError("gatekeeper.min_edge_samples must be >= 1");
    }
    if (gatekeeper.blur_threshold < 0) {
        throw ValidationError("gatekeeper.blur_threshold must be >= 0");
    }
    if (gatekeeper.fail_open_score < gatekeeper.blur_threshold) {
        throw ValidationError("gatekeeper.fail_open_score must be >= gatekeeper.blur_threshold");
    }

    if (session.override_note.find("{score}") == std::string::npos) {
        throw ValidationError("session.override_note must contain '{score}'");
    }

    if (runtime.parallel_workers < 1 || runtime.parallel_workers > 64) {
        throw ValidationError("runtime.parallel_workers must be in [1,64]");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "gatekeeper": {
      "type": "object",
      "properties": {
        "target_width": {"type": "integer", "minimum": 16, "maximum": 8192},
        "noise_floor": {"type": "number", "minimum": 0},
        "top_fraction": {"type": "number", "exclusiveMinimum": 0, "maximum": 1},
        "min_edge_samples": {"type": "integer", "minimum": 1},
        "blur_threshold": {"type": "integer", "minimum": 0},
        "fail_open_score": {"type": "integer", "minimum": 0}
      }
    },
    "session": {
      "type": "object",
      "properties": {
        "gate_goods_photo": {"type": "boolean"},
        "override_note": {"type": "string", "pattern": "\\{score\\}"}
      }
    },
    "runtime": {
      "type": "object",
      "properties": {
        "parallel_workers": {"type": "integer", "minimum": 1, "maximum": 64},
        "event_log": {"type": "string"}
      }
    }
  }
})";
}

} // namespace audit_gate::config
