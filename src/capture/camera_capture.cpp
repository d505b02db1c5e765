#include "capture/camera_capture.h"
#include "capture/frame_encoder.h"
#include "logger.h"
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

namespace live_relay {
namespace capture {

class CameraCapture::Impl {
public:
    Impl(int device_index, int max_dimension, int jpeg_quality)
        : device_index_(device_index), max_dimension_(max_dimension), jpeg_quality_(jpeg_quality) {}

    Result<void> open() {
        if (capture_.isOpened()) return Result<void>();
        // Opening can take around a second on some drivers
        if (!capture_.open(device_index_)) {
            return make_resource_error("Failed to open camera " + std::to_string(device_index_));
        }
        LOG_CAPTURE("Camera " + std::to_string(device_index_) + " opened");
        return Result<void>();
    }

    Result<OutboundItem> capture() {
        if (!capture_.isOpened()) {
            return make_state_error("Camera not open");
        }
        cv::Mat frame;
        if (!capture_.read(frame) || frame.empty()) {
            return make_io_error("Camera read failed");
        }
        FrameSize target = thumbnail_size(frame.cols, frame.rows, max_dimension_);
        auto encoded = encode_jpeg_frame(frame, target, jpeg_quality_);
        if (!encoded) {
            return encoded.error();
        }
        return OutboundItem(std::move(encoded.value()));
    }

    void close() {
        if (capture_.isOpened()) {
            capture_.release();
            LOG_CAPTURE("Camera " + std::to_string(device_index_) + " released");
        }
    }

private:
    int device_index_;
    int max_dimension_;
    int jpeg_quality_;
    cv::VideoCapture capture_;
};

CameraCapture::CameraCapture(int device_index, int max_dimension, int jpeg_quality,
                             std::chrono::milliseconds interval)
    : pimpl_(std::make_unique<Impl>(device_index, max_dimension, jpeg_quality)),
      interval_(interval) {}

CameraCapture::~CameraCapture() {
    pimpl_->close();
}

Result<void> CameraCapture::open() {
    return pimpl_->open();
}

Result<OutboundItem> CameraCapture::capture() {
    return pimpl_->capture();
}

void CameraCapture::close() {
    pimpl_->close();
}

} // namespace capture
} // namespace live_relay
