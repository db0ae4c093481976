#pragma once

#include "audit_gate/config/configuration.hpp"
#include "audit_gate/core/types.hpp"

namespace audit_gate::image {

// Luminance weights applied to R, G, B
constexpr double kLumaR = 0.299;
constexpr double kLumaG = 0.587;
constexpr double kLumaB = 0.114;

struct AnalysisSize {
    int width = 0;
    int height = 0;
    double scale = 1.0;
    bool resampled = false;
};

// scale = target / width when the source is wider than target, otherwise 1
// (sources are never upscaled). height = floor(source_height * scale).
AnalysisSize compute_analysis_size(int source_width, int source_height, int target_width);

// Area-averaging downsample (anti-aliased). Returns the input unchanged when no
// resampling is needed and an empty buffer when the scaled height is 0.
ImageBuffer resample_to_analysis_size(const ImageBuffer& img, const AnalysisSize& size);

// 0.299 R + 0.587 G + 0.114 B per pixel; alpha is ignored, gray passes through.
Matrix2Df to_grayscale(const ImageBuffer& img);

// Resample + grayscale. Writes the chosen analysis size to size_out if given.
Matrix2Df preprocess(const ImageBuffer& img, const config::GatekeeperConfig& cfg,
                     AnalysisSize* size_out = nullptr);

} // namespace audit_gate::image
