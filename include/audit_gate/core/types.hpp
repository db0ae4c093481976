#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace audit_gate {

namespace fs = std::filesystem;

// Matrix types
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Decoded image, interleaved 8-bit samples, row-major.
// channels: 1 = gray, 3 = RGB, 4 = RGBA
struct ImageBuffer {
    int width = 0;
    int height = 0;
    int channels = 0;
    std::vector<uint8_t> samples;

    size_t expected_size() const {
        return static_cast<size_t>(width) * static_cast<size_t>(height) *
               static_cast<size_t>(channels);
    }
    bool empty() const { return width <= 0 || height <= 0 || samples.empty(); }
};

// Gate pipeline stage enumeration
enum class GateStage {
    DECODE = 0,
    PREPROCESS = 1,
    EDGE_DETECTION = 2,
    AGGREGATION = 3,
    CLASSIFICATION = 4,
    DONE = 5
};

inline std::string stage_to_string(GateStage stage) {
    switch (stage) {
        case GateStage::DECODE: return "DECODE";
        case GateStage::PREPROCESS: return "PREPROCESS";
        case GateStage::EDGE_DETECTION: return "EDGE_DETECTION";
        case GateStage::AGGREGATION: return "AGGREGATION";
        case GateStage::CLASSIFICATION: return "CLASSIFICATION";
        case GateStage::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int stage_to_int(GateStage stage) {
    return static_cast<int>(stage);
}

} // namespace audit_gate
