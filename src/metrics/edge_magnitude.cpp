#include "audit_gate/metrics/edge_magnitude.hpp"
#include "audit_gate/core/errors.hpp"

namespace audit_gate::metrics {

EdgeSampleSet collect_edge_samples(const Matrix2Df& gray, float noise_floor,
                                   const std::atomic<bool>* stop_flag) {
    EdgeSampleSet out;
    const int h = static_cast<int>(gray.rows());
    const int w = static_cast<int>(gray.cols());
    if (w < 3 || h < 3) {
        return out;
    }

    out.interior_cells = static_cast<size_t>(w - 2) * static_cast<size_t>(h - 2);

    const float* data = gray.data();
    for (int y = 1; y < h - 1; ++y) {
        if (stop_flag && stop_flag->load(std::memory_order_relaxed)) {
            throw StopRequested();
        }
        const float* up = data + static_cast<size_t>(y - 1) * static_cast<size_t>(w);
        const float* row = up + w;
        const float* down = row + w;
        for (int x = 1; x < w - 1; ++x) {
            const float lap = laplacian_magnitude(row[x], up[x], down[x], row[x - 1], row[x + 1]);
            if (lap > noise_floor) {
                out.magnitudes.push_back(lap);
            }
        }
    }
    return out;
}

Matrix2Df laplacian_map(const Matrix2Df& gray) {
    const int h = static_cast<int>(gray.rows());
    const int w = static_cast<int>(gray.cols());
    Matrix2Df out = Matrix2Df::Zero(h, w);
    for (int y = 1; y < h - 1; ++y) {
        for (int x = 1; x < w - 1; ++x) {
            out(y, x) = laplacian_magnitude(gray(y, x), gray(y - 1, x), gray(y + 1, x),
                                            gray(y, x - 1), gray(y, x + 1));
        }
    }
    return out;
}

} // namespace audit_gate::metrics
