#include "audit_gate/image/decoder.hpp"
#include "audit_gate/core/errors.hpp"
#include "audit_gate/core/utils.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <cstring>

namespace audit_gate::image {

void validate_image_buffer(const ImageBuffer& img) {
    if (img.width <= 0 || img.height <= 0) {
        throw DecodeError("image has zero width or height (" + std::to_string(img.width) +
                          "x" + std::to_string(img.height) + ")");
    }
    if (img.channels != 1 && img.channels != 3 && img.channels != 4) {
        throw DecodeError("unsupported channel count " + std::to_string(img.channels));
    }
    if (img.samples.size() != img.expected_size()) {
        throw DecodeError("sample count " + std::to_string(img.samples.size()) +
                          " does not match " + std::to_string(img.width) + "x" +
                          std::to_string(img.height) + "x" + std::to_string(img.channels));
    }
}

ImageBuffer to_image_buffer(const cv::Mat& mat) {
    if (mat.depth() != CV_8U) {
        throw DecodeError("expected 8-bit samples");
    }
    ImageBuffer out;
    out.width = mat.cols;
    out.height = mat.rows;
    out.channels = mat.channels();
    out.samples.resize(out.expected_size());

    const size_t row_bytes = static_cast<size_t>(mat.cols) * static_cast<size_t>(mat.channels());
    for (int r = 0; r < mat.rows; ++r) {
        std::memcpy(out.samples.data() + static_cast<size_t>(r) * row_bytes, mat.ptr<uint8_t>(r), row_bytes);
    }
    return out;
}

cv::Mat as_mat(const ImageBuffer& img) {
    return cv::Mat(img.height, img.width, CV_8UC(img.channels),
                   const_cast<uint8_t*>(img.samples.data()));
}

ImageBuffer OpenCvImageDecoder::decode(const std::vector<uint8_t>& bytes,
                                       const std::string& mime_type) const {
    if (!mime_type.empty() && !core::starts_with(core::to_lower(mime_type), "image/")) {
        throw DecodeError("unsupported MIME type '" + mime_type + "'");
    }
    if (bytes.empty()) {
        throw DecodeError("empty payload");
    }

    cv::Mat encoded(1, static_cast<int>(bytes.size()), CV_8UC1, const_cast<uint8_t*>(bytes.data()));
    cv::Mat decoded = cv::imdecode(encoded, cv::IMREAD_UNCHANGED);
    if (decoded.empty()) {
        throw DecodeError("cv::imdecode could not decode " + std::to_string(bytes.size()) +
                          " bytes (" + (mime_type.empty() ? std::string("unknown type") : mime_type) + ")");
    }

    // 16-bit PNG/TIFF
    if (decoded.depth() != CV_8U) {
        cv::Mat scaled;
        const double scale = decoded.depth() == CV_16U ? 1.0 / 257.0 : 1.0;
        decoded.convertTo(scaled, CV_8U, scale);
        decoded = scaled;
    }

    cv::Mat rgb;
    switch (decoded.channels()) {
        case 1: rgb = decoded; break;
        case 3: cv::cvtColor(decoded, rgb, cv::COLOR_BGR2RGB); break;
        case 4: cv::cvtColor(decoded, rgb, cv::COLOR_BGRA2RGBA); break;
        default:
            throw DecodeError("unsupported channel count " + std::to_string(decoded.channels()));
    }

    ImageBuffer out = to_image_buffer(rgb);
    validate_image_buffer(out);
    return out;
}

RawImageDecoder::RawImageDecoder(int width, int height, int channels)
    : width_(width), height_(height), channels_(channels) {}

ImageBuffer RawImageDecoder::decode(const std::vector<uint8_t>& bytes,
                                    const std::string& /*mime_type*/) const {
    ImageBuffer out;
    out.width = width_;
    out.height = height_;
    out.channels = channels_;
    out.samples = bytes;
    validate_image_buffer(out);
    return out;
}

} // namespace audit_gate::image
