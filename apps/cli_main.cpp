#include "cli_shared.hpp"

#include "audit_gate/audit/report.hpp"
#include "audit_gate/config/configuration.hpp"
#include "audit_gate/core/errors.hpp"
#include "audit_gate/core/events.hpp"
#include "audit_gate/core/utils.hpp"
#include "audit_gate/gate/gatekeeper.hpp"
#include "audit_gate/image/decoder.hpp"
#include "audit_gate/image/preprocess.hpp"
#include "audit_gate/metrics/edge_magnitude.hpp"

#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <yaml-cpp/yaml.h>

#include <atomic>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace config = audit_gate::config;
namespace core = audit_gate::core;
namespace gate = audit_gate::gate;
namespace image = audit_gate::image;

constexpr int kExitBlurry = 3;

static std::atomic<bool> g_stop_requested{false};

static void handle_sigint(int) {
    g_stop_requested.store(true);
}

static void print_json(const json& j) {
    std::cout << j.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
}

static std::string read_stdin() {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
}

static config::Config load_config_or_default(const std::string& path) {
    config::Config cfg = path.empty() ? config::Config() : config::Config::load(path);
    cfg.validate();
    return cfg;
}

// Gate events go to stderr, and additionally to runtime.event_log when set.
class EventSink {
public:
    explicit EventSink(const std::string& event_log) {
        if (event_log.empty()) return;
        file_.open(event_log, std::ios::app);
        if (!file_) {
            throw audit_gate::IOError("Cannot open event log: " + event_log);
        }
        tee_ = std::make_unique<audit_gate::cli::TeeBuf>(std::cerr.rdbuf(), file_.rdbuf());
        stream_ = std::make_unique<std::ostream>(tee_.get());
    }

    std::ostream& out() { return stream_ ? *stream_ : std::cerr; }

private:
    std::ofstream file_;
    std::unique_ptr<audit_gate::cli::TeeBuf> tee_;
    std::unique_ptr<std::ostream> stream_;
};

static std::string gate_action(const gate::GateVerdict& v) {
    return v.is_blurry ? "retake_or_override" : "proceed";
}

static void write_edge_map(const fs::path& out_path, const image::ImageBuffer& img,
                           const config::GatekeeperConfig& cfg) {
    audit_gate::Matrix2Df gray = image::preprocess(img, cfg);
    audit_gate::Matrix2Df lap = audit_gate::metrics::laplacian_map(gray);

    cv::Mat lap_cv(static_cast<int>(lap.rows()), static_cast<int>(lap.cols()), CV_32F, lap.data());
    cv::Mat out8;
    // Magnitudes above 255 saturate, matching the 8-bit intensity range.
    lap_cv.convertTo(out8, CV_8U);
    if (!cv::imwrite(out_path.string(), out8)) {
        throw audit_gate::IOError("Cannot write edge map: " + out_path.string());
    }
}

// ============================================================================
// check <image> [--config P] [--mime T] [--edge-map OUT] [--strict-exit-codes]
// ============================================================================
int cmd_check(const std::string& path, const std::string& config_path,
              const std::string& mime_arg, const std::string& edge_map, bool strict_exit) {
    json result;
    result["ok"] = false;
    result["path"] = path;

    config::Config cfg;
    std::vector<uint8_t> bytes;
    std::unique_ptr<EventSink> sink;
    try {
        cfg = load_config_or_default(config_path);
        bytes = core::read_bytes(path);
        sink = std::make_unique<EventSink>(cfg.runtime.event_log);
    } catch (const audit_gate::AuditGateError& e) {
        result["error"] = e.what();
        print_json(result);
        return 2;
    }

    const std::string mime = mime_arg.empty() ? core::guess_mime_type(path) : mime_arg;
    auto decoder = std::make_shared<image::OpenCvImageDecoder>();
    gate::SharpnessGatekeeper gatekeeper(cfg.gatekeeper, decoder);

    gate::GateCall call;
    call.run_id = core::get_run_id();
    call.source = fs::path(path).filename().string();
    call.log = &sink->out();

    std::optional<gate::GateVerdict> verdict = gatekeeper.evaluate(bytes, mime, call);
    if (!verdict) {
        result["error"] = "cancelled";
        print_json(result);
        return 1;
    }

    result["ok"] = true;
    result["mime_type"] = mime;
    result["run_id"] = call.run_id;
    result["verdict"] = gate::verdict_to_json(*verdict);
    result["action"] = gate_action(*verdict);
    result["warnings"] = json::array();

    if (!edge_map.empty()) {
        try {
            write_edge_map(edge_map, decoder->decode(bytes, mime), cfg.gatekeeper);
            result["edge_map"] = edge_map;
        } catch (const std::exception& e) {
            result["warnings"].push_back(std::string("edge map not written: ") + e.what());
        }
    }

    print_json(result);
    if (strict_exit && verdict->is_blurry) {
        return kExitBlurry;
    }
    return 0;
}

// ============================================================================
// check-batch <dir> [--config P] [--workers N] [--pattern GLOBS] [--strict-exit-codes]
// ============================================================================
int cmd_check_batch(const std::string& dir, const std::string& config_path,
                    int workers_arg, const std::string& pattern, bool strict_exit) {
    json result;
    result["ok"] = false;
    result["input_dir"] = dir;

    config::Config cfg;
    std::unique_ptr<EventSink> sink;
    try {
        cfg = load_config_or_default(config_path);
        sink = std::make_unique<EventSink>(cfg.runtime.event_log);
    } catch (const audit_gate::AuditGateError& e) {
        result["error"] = e.what();
        print_json(result);
        return 2;
    }

    const std::vector<fs::path> files = pattern.empty() ? core::discover_images(dir)
                                                        : core::discover_images(dir, pattern);
    if (files.empty()) {
        std::cerr << "Error: No images found in " << dir << std::endl;
        result["error"] = "no images found";
        print_json(result);
        return 1;
    }

    const int workers = audit_gate::cli::compute_worker_count(
        workers_arg > 0 ? workers_arg : cfg.runtime.parallel_workers, files.size());
    std::cerr << "[BATCH] " << files.size() << " images ("
              << audit_gate::cli::format_bytes(audit_gate::cli::estimate_total_file_bytes(files))
              << "), " << workers << " workers" << std::endl;

    gate::SharpnessGatekeeper gatekeeper(cfg.gatekeeper, std::make_shared<image::OpenCvImageDecoder>());
    core::EventEmitter emitter;
    const std::string run_id = core::get_run_id();
    emitter.run_start(run_id, {{"input_dir", dir}, {"images", files.size()}, {"workers", workers}},
                      sink->out());

    std::signal(SIGINT, handle_sigint);

    std::vector<json> entries(files.size());
    std::atomic<size_t> next{0};
    std::atomic<size_t> done{0};
    std::mutex log_mutex;

    auto worker = [&]() {
        while (true) {
            const size_t i = next.fetch_add(1);
            if (i >= files.size()) {
                break;
            }
            json entry;
            entry["path"] = files[i].string();

            std::ostringstream call_log;
            gate::GateCall call{run_id, files[i].filename().string(), &call_log, &g_stop_requested};
            try {
                const std::vector<uint8_t> bytes = core::read_bytes(files[i]);
                std::optional<gate::GateVerdict> v =
                    gatekeeper.evaluate(bytes, core::guess_mime_type(files[i]), call);
                if (v) {
                    entry["verdict"] = gate::verdict_to_json(*v);
                    entry["action"] = gate_action(*v);
                } else {
                    entry["cancelled"] = true;
                }
            } catch (const audit_gate::IOError& e) {
                entry["error"] = e.what();
            }

            const size_t n = done.fetch_add(1) + 1;
            std::lock_guard<std::mutex> lock(log_mutex);
            sink->out() << call_log.str();
            std::cerr << "[BATCH] " << n << "/" << files.size() << " " << files[i].filename().string()
                      << std::endl;
            entries[i] = std::move(entry);
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(static_cast<size_t>(workers));
    for (int w = 0; w < workers; ++w) {
        pool.emplace_back(worker);
    }
    for (auto& t : pool) {
        t.join();
    }

    std::signal(SIGINT, SIG_DFL);

    int n_blurry = 0;
    int n_failed_open = 0;
    int n_cancelled = 0;
    result["results"] = json::array();
    for (auto& e : entries) {
        if (e.contains("verdict")) {
            if (e["verdict"]["is_blurry"].get<bool>()) ++n_blurry;
            const std::string reason = e["verdict"]["reason"].get<std::string>();
            if (reason == "DECODE_FAILURE" || reason == "PROCESSING_ERROR") ++n_failed_open;
        }
        if (e.contains("cancelled")) ++n_cancelled;
        result["results"].push_back(std::move(e));
    }

    const bool cancelled = g_stop_requested.load();
    result["ok"] = !cancelled;
    result["run_id"] = run_id;
    result["summary"] = {{"images", files.size()},
                         {"blurry", n_blurry},
                         {"failed_open", n_failed_open},
                         {"cancelled", n_cancelled}};
    emitter.run_end(run_id, !cancelled, cancelled ? "cancelled" : "ok", sink->out());

    print_json(result);
    if (cancelled) return 1;
    if (strict_exit && n_blurry > 0) return kExitBlurry;
    return 0;
}

// ============================================================================
// annotate-report (<report.json> | --stdin) --score N [--config P]
// ============================================================================
int cmd_annotate_report(const std::string& path, bool use_stdin, const std::string& score_arg,
                        const std::string& config_path) {
    if (score_arg.empty()) {
        std::cerr << "annotate-report requires --score N\n";
        return 1;
    }

    json report;
    try {
        config::Config cfg = load_config_or_default(config_path);
        const int score = std::stoi(score_arg);
        std::string raw = use_stdin ? read_stdin() : core::read_text(path);
        report = json::parse(raw);
        audit_gate::audit::annotate_degraded_report(
            report, audit_gate::audit::format_override_note(cfg.session.override_note, score,
                                                            cfg.gatekeeper.blur_threshold));
    } catch (const json::parse_error& e) {
        std::cerr << "annotate-report: failed to parse JSON: " << e.what() << "\n";
        return 2;
    } catch (const std::logic_error&) {
        std::cerr << "annotate-report: --score must be an integer\n";
        return 1;
    } catch (const audit_gate::AuditGateError& e) {
        std::cerr << "annotate-report: " << e.what() << "\n";
        return 2;
    }

    print_json(report);
    return 0;
}

// ============================================================================
// validate-config (--path P | --yaml Y | --stdin) [--strict-exit-codes]
// ============================================================================
int cmd_validate_config(const std::string& path, const std::string& yaml_arg, bool use_stdin,
                        bool strict_exit) {
    json result;
    result["valid"] = false;
    result["errors"] = json::array();
    if (!path.empty()) result["path"] = path;

    try {
        std::string yaml_text;
        if (!path.empty()) {
            yaml_text = core::read_text(path);
        } else if (use_stdin) {
            yaml_text = read_stdin();
        } else {
            yaml_text = yaml_arg;
        }
        YAML::Node node = YAML::Load(yaml_text);
        config::Config cfg = config::Config::from_yaml(node);
        cfg.validate();
        result["valid"] = true;
    } catch (const std::exception& e) {
        result["errors"].push_back(e.what());
    }

    print_json(result);
    if (strict_exit) {
        return result["valid"].get<bool>() ? 0 : 1;
    }
    return 0;
}

// ============================================================================
// get-schema
// ============================================================================
int cmd_get_schema() {
    std::cout << config::get_schema_json() << std::endl;
    return 0;
}

// ============================================================================
// dump-default-config [--out P]
// ============================================================================
int cmd_dump_default_config(const std::string& out_path) {
    config::Config cfg;
    if (out_path.empty()) {
        std::cout << cfg.to_yaml() << std::endl;
        return 0;
    }
    try {
        cfg.save(out_path);
    } catch (const audit_gate::ConfigError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    json result;
    result["ok"] = true;
    result["path"] = out_path;
    print_json(result);
    return 0;
}

void print_usage() {
    std::cout << "Usage: audit_gate_cli <command> [options]\n"
              << "\nCommands:\n"
              << "  check <image> [--config P] [--mime T] [--edge-map OUT] [--strict-exit-codes]\n"
              << "                                  Run the sharpness gate on one image\n"
              << "  check-batch <dir> [--config P] [--workers N] [--pattern GLOBS] [--strict-exit-codes]\n"
              << "                                  Run the gate on every image in a directory\n"
              << "  annotate-report (<report.json> | --stdin) --score N [--config P]\n"
              << "                                  Tag an audit report as produced from a blurry image\n"
              << "  validate-config (--path P | --yaml Y | --stdin)  Validate config\n"
              << "  get-schema                      Print JSON schema for config\n"
              << "  dump-default-config [--out P]   Print or save the default config\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];

    auto get_arg = [&](const char* name) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0) {
                return argv[i + 1];
            }
        }
        return "";
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    // Boolean flags never take a value; every other --option consumes the next argument.
    auto get_positional = [&](int pos) -> std::string {
        int count = 0;
        for (int i = 2; i < argc; ++i) {
            if (argv[i][0] != '-') {
                if (count == pos) return argv[i];
                ++count;
            } else if (std::strcmp(argv[i], "--stdin") != 0 &&
                       std::strcmp(argv[i], "--strict-exit-codes") != 0 && i + 1 < argc) {
                ++i;
            }
        }
        return "";
    };

    if (command == "check") {
        std::string path = get_positional(0);
        if (path.empty()) {
            std::cerr << "check requires an image path\n";
            return 1;
        }
        return cmd_check(path, get_arg("--config"), get_arg("--mime"), get_arg("--edge-map"),
                         has_flag("--strict-exit-codes"));
    }

    if (command == "check-batch") {
        std::string dir = get_positional(0);
        if (dir.empty()) {
            std::cerr << "check-batch requires an input directory\n";
            return 1;
        }
        std::string workers_str = get_arg("--workers");
        int workers = 0;
        if (!workers_str.empty()) {
            try {
                workers = std::stoi(workers_str);
            } catch (const std::exception&) {
                std::cerr << "--workers must be an integer\n";
                return 1;
            }
        }
        return cmd_check_batch(dir, get_arg("--config"), workers, get_arg("--pattern"),
                               has_flag("--strict-exit-codes"));
    }

    if (command == "annotate-report") {
        bool use_stdin = has_flag("--stdin");
        std::string path = get_positional(0);
        if (path.empty() && !use_stdin) {
            std::cerr << "annotate-report requires a report path or --stdin\n";
            return 1;
        }
        return cmd_annotate_report(path, use_stdin, get_arg("--score"), get_arg("--config"));
    }

    if (command == "validate-config") {
        std::string path = get_arg("--path");
        std::string yaml = get_arg("--yaml");
        bool use_stdin = has_flag("--stdin");
        bool strict = has_flag("--strict-exit-codes");

        if (path.empty() && yaml.empty() && !use_stdin) {
            std::cerr << "validate-config requires --path, --yaml, or --stdin\n";
            return 1;
        }
        return cmd_validate_config(path, yaml, use_stdin, strict);
    }

    if (command == "get-schema") {
        return cmd_get_schema();
    }

    if (command == "dump-default-config") {
        return cmd_dump_default_config(get_arg("--out"));
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage();
    return 1;
}
