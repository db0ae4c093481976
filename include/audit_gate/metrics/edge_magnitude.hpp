#pragma once

#include "audit_gate/core/types.hpp"
#include <atomic>
#include <cstddef>
#include <vector>

namespace audit_gate::metrics {

// Gated Laplacian magnitudes of one grid. Consumed once by the aggregator.
struct EdgeSampleSet {
    std::vector<float> magnitudes;  // every value > noise floor
    size_t interior_cells = 0;      // (w-2)*(h-2), 0 when w < 3 or h < 3
};

// |4c - t - b - l - r|
inline float laplacian_magnitude(float center, float top, float bottom, float left, float right) {
    const float v = 4.0f * center - top - bottom - left - right;
    return v < 0.0f ? -v : v;
}

// Visits interior cells (1 <= x <= w-2, 1 <= y <= h-2) and keeps magnitudes
// strictly above noise_floor. Throws StopRequested when stop_flag is raised
// (checked once per row).
EdgeSampleSet collect_edge_samples(const Matrix2Df& gray, float noise_floor,
                                   const std::atomic<bool>* stop_flag = nullptr);

// Ungated magnitude map of the same size as gray; border cells are 0.
Matrix2Df laplacian_map(const Matrix2Df& gray);

} // namespace audit_gate::metrics
