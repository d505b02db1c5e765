#include "capture/frame_encoder.h"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <vector>

namespace live_relay {
namespace capture {

FrameSize thumbnail_size(int width, int height, int max_dim) {
    FrameSize size{width, height};
    if (width <= 0 || height <= 0 || max_dim <= 0) return size;
    if (width <= max_dim && height <= max_dim) return size;

    double scale = std::min(static_cast<double>(max_dim) / width,
                            static_cast<double>(max_dim) / height);
    size.width = std::max(1, static_cast<int>(std::lround(width * scale)));
    size.height = std::max(1, static_cast<int>(std::lround(height * scale)));
    size.width = std::min(size.width, max_dim);
    size.height = std::min(size.height, max_dim);
    return size;
}

FrameSize width_capped_size(int width, int height, int max_width) {
    FrameSize size{width, height};
    if (width <= 0 || height <= 0 || max_width <= 0) return size;
    if (width <= max_width) return size;

    size.width = max_width;
    size.height = std::max(1, static_cast<int>(static_cast<int64_t>(max_width) * height / width));
    return size;
}

Result<MediaFrame> encode_jpeg_frame(const cv::Mat& bgr, FrameSize target, int quality) {
    if (bgr.empty()) {
        return make_io_error("Empty frame");
    }

    cv::Mat scaled;
    if (target.width > 0 && target.height > 0 &&
        (target.width != bgr.cols || target.height != bgr.rows)) {
        cv::resize(bgr, scaled, cv::Size(target.width, target.height), 0, 0, cv::INTER_AREA);
    } else {
        scaled = bgr;
    }

    std::vector<uchar> encoded;
    std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, std::clamp(quality, 0, 100)};
    try {
        if (!cv::imencode(".jpg", scaled, encoded, params)) {
            return make_io_error("JPEG encode failed");
        }
    } catch (const cv::Exception& e) {
        return make_io_error(std::string("JPEG encode failed: ") + e.what());
    }

    MediaFrame frame;
    frame.mime_type = "image/jpeg";
    frame.payload.assign(encoded.begin(), encoded.end());
    frame.captured_at = std::chrono::steady_clock::now();
    return frame;
}

} // namespace capture
} // namespace live_relay
