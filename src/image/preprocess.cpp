#include "audit_gate/image/preprocess.hpp"
#include "audit_gate/image/decoder.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace audit_gate::image {

AnalysisSize compute_analysis_size(int source_width, int source_height, int target_width) {
    AnalysisSize s;
    if (source_width <= 0 || source_height <= 0) {
        return s;
    }
    if (source_width > target_width) {
        s.scale = static_cast<double>(target_width) / static_cast<double>(source_width);
        s.width = target_width;
        s.height = static_cast<int>(std::floor(static_cast<double>(source_height) * s.scale));
        s.resampled = true;
    } else {
        s.scale = 1.0;
        s.width = source_width;
        s.height = source_height;
        s.resampled = false;
    }
    return s;
}

ImageBuffer resample_to_analysis_size(const ImageBuffer& img, const AnalysisSize& size) {
    if (!size.resampled) {
        return img;
    }
    if (size.width <= 0 || size.height <= 0) {
        ImageBuffer empty;
        empty.width = size.width;
        empty.height = 0;
        empty.channels = img.channels;
        return empty;
    }

    cv::Mat src = as_mat(img);
    cv::Mat dst;
    cv::resize(src, dst, cv::Size(size.width, size.height), 0.0, 0.0, cv::INTER_AREA);
    return to_image_buffer(dst);
}

Matrix2Df to_grayscale(const ImageBuffer& img) {
    const int h = std::max(0, img.height);
    const int w = std::max(0, img.width);
    if (h == 0 || w == 0 || img.samples.size() < img.expected_size()) {
        return Matrix2Df(0, w);
    }

    Matrix2Df gray(h, w);

    const int c = img.channels;
    const uint8_t* px = img.samples.data();
    for (int y = 0; y < h; ++y) {
        float* out = gray.data() + static_cast<size_t>(y) * static_cast<size_t>(w);
        const uint8_t* row = px + static_cast<size_t>(y) * static_cast<size_t>(w) * static_cast<size_t>(c);
        if (c == 1) {
            for (int x = 0; x < w; ++x) out[x] = static_cast<float>(row[x]);
            continue;
        }
        for (int x = 0; x < w; ++x) {
            const uint8_t* p = row + static_cast<size_t>(x) * static_cast<size_t>(c);
            const double v = kLumaR * p[0] + kLumaG * p[1] + kLumaB * p[2];
            out[x] = static_cast<float>(v);
        }
    }
    return gray;
}

Matrix2Df preprocess(const ImageBuffer& img, const config::GatekeeperConfig& cfg,
                     AnalysisSize* size_out) {
    const AnalysisSize size = compute_analysis_size(img.width, img.height, cfg.target_width);
    if (size_out) *size_out = size;
    return to_grayscale(resample_to_analysis_size(img, size));
}

} // namespace audit_gate::image
