#include "capture/screen_capture.h"
#include "capture/frame_encoder.h"
#include "logger.h"
#include <atomic>
#include <mutex>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
// Xlib defines None/Status/Bool macros; keep it after every C++ header
#include <X11/Xlib.h>
#include <X11/Xutil.h>

namespace live_relay {
namespace capture {

namespace {

std::once_flag g_xlib_init;
std::atomic<int> g_last_x_error{0};

// Default Xlib handler exits the process; record the code instead.
int record_x_error(Display*, XErrorEvent* event) {
    g_last_x_error.store(event->error_code);
    return 0;
}

} // namespace

class ScreenCapture::Impl {
public:
    Impl(const std::string& display_name, int max_width, int jpeg_quality)
        : display_name_(display_name), max_width_(max_width), jpeg_quality_(jpeg_quality) {}

    Result<void> open() {
        if (display_) return Result<void>();

        std::call_once(g_xlib_init, [] {
            XInitThreads();
            XSetErrorHandler(record_x_error);
        });

        display_ = XOpenDisplay(display_name_.empty() ? nullptr : display_name_.c_str());
        if (!display_) {
            return make_resource_error("Cannot open X display " +
                                 (display_name_.empty() ? std::string("$DISPLAY") : display_name_));
        }
        root_ = DefaultRootWindow(display_);
        LOG_CAPTURE("Screen capture opened on " + std::string(DisplayString(display_)));
        return Result<void>();
    }

    Result<OutboundItem> capture() {
        if (!display_) {
            return make_state_error("Screen capture not open");
        }

        // Root geometry can change (monitor hotplug); query per grab
        XWindowAttributes attrs;
        if (!XGetWindowAttributes(display_, root_, &attrs) || attrs.width <= 0 || attrs.height <= 0) {
            return make_io_error("Failed to query root window geometry");
        }

        g_last_x_error.store(0);
        XImage* image = XGetImage(display_, root_, 0, 0,
                                  static_cast<unsigned int>(attrs.width),
                                  static_cast<unsigned int>(attrs.height),
                                  AllPlanes, ZPixmap);
        if (!image) {
            return make_io_error("XGetImage failed (X error " + std::to_string(g_last_x_error.load()) + ")");
        }
        if (image->bits_per_pixel != 32) {
            int bpp = image->bits_per_pixel;
            XDestroyImage(image);
            return make_io_error("Unsupported screen depth: " + std::to_string(bpp) + " bpp");
        }

        cv::Mat bgra(image->height, image->width, CV_8UC4, image->data,
                     static_cast<size_t>(image->bytes_per_line));
        cv::Mat bgr;
        cv::cvtColor(bgra, bgr, cv::COLOR_BGRA2BGR);
        XDestroyImage(image);

        FrameSize target = width_capped_size(bgr.cols, bgr.rows, max_width_);
        auto encoded = encode_jpeg_frame(bgr, target, jpeg_quality_);
        if (!encoded) {
            return encoded.error();
        }
        return OutboundItem(std::move(encoded.value()));
    }

    void close() {
        if (display_) {
            XCloseDisplay(display_);
            display_ = nullptr;
            LOG_CAPTURE("Screen capture closed");
        }
    }

private:
    std::string display_name_;
    int max_width_;
    int jpeg_quality_;
    Display* display_ = nullptr;
    Window root_ = 0;
};

ScreenCapture::ScreenCapture(const std::string& display_name, int max_width, int jpeg_quality,
                             std::chrono::milliseconds interval)
    : pimpl_(std::make_unique<Impl>(display_name, max_width, jpeg_quality)),
      interval_(interval) {}

ScreenCapture::~ScreenCapture() {
    pimpl_->close();
}

Result<void> ScreenCapture::open() {
    return pimpl_->open();
}

Result<OutboundItem> ScreenCapture::capture() {
    return pimpl_->capture();
}

void ScreenCapture::close() {
    pimpl_->close();
}

} // namespace capture
} // namespace live_relay
