#pragma once

/**
 * @file frame_encoder.h
 * @brief Downscale and JPEG-encode raw pixel buffers
 */

#include "errors.h"
#include "media_types.h"

namespace cv {
class Mat;
}

namespace live_relay {
namespace capture {

struct FrameSize {
    int width = 0;
    int height = 0;
};

/**
 * @brief Fit inside a max_dim x max_dim box, keeping aspect ratio. Never upscales.
 */
FrameSize thumbnail_size(int width, int height, int max_dim);

/**
 * @brief Cap width at max_width, keeping aspect ratio. Never upscales.
 */
FrameSize width_capped_size(int width, int height, int max_width);

/**
 * @brief Resize a BGR image to target (no-op when equal) and encode as JPEG
 * @param quality JPEG quality 0-100
 */
Result<MediaFrame> encode_jpeg_frame(const cv::Mat& bgr, FrameSize target, int quality);

} // namespace capture
} // namespace live_relay
