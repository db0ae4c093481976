#pragma once

#include "audit_gate/core/types.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace audit_gate::image {

// Turns an encoded payload into an ImageBuffer. Implementations throw
// DecodeError for anything they cannot turn into a non-empty image.
class ImageDecoder {
public:
    virtual ~ImageDecoder() = default;
    virtual ImageBuffer decode(const std::vector<uint8_t>& bytes,
                               const std::string& mime_type) const = 0;
};

// JPEG / PNG / WebP / BMP / TIFF through cv::imdecode, samples in RGB(A) order.
class OpenCvImageDecoder : public ImageDecoder {
public:
    ImageBuffer decode(const std::vector<uint8_t>& bytes,
                       const std::string& mime_type) const override;
};

// Payload is already raw interleaved 8-bit samples of a known geometry.
// Used for synthetic grids and for callers that hold decoded pixels.
class RawImageDecoder : public ImageDecoder {
public:
    RawImageDecoder(int width, int height, int channels);

    ImageBuffer decode(const std::vector<uint8_t>& bytes,
                       const std::string& mime_type) const override;

private:
    int width_;
    int height_;
    int channels_;
};

// Throws DecodeError unless the buffer has positive dimensions, 1/3/4 channels
// and a matching sample count.
void validate_image_buffer(const ImageBuffer& img);

// Copies an 8-bit gray / RGB / RGBA matrix into an ImageBuffer.
ImageBuffer to_image_buffer(const cv::Mat& mat);

// Non-owning CV_8UC(n) view of the buffer's samples.
cv::Mat as_mat(const ImageBuffer& img);

} // namespace audit_gate::image
