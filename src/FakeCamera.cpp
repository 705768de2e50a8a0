#include "camring/FakeCamera.hpp"
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono;

namespace camring {

FakeCamera::FakeCamera(int w, int h, int fps, int type)
    : width_(w), height_(h), fps_(fps), type_(type), roi_(0, 0, w, h)
{}

void FakeCamera::open()  { opened_ = true; running_ = false; }
void FakeCamera::close() { opened_ = false; running_ = false; }

void FakeCamera::start()
{
    if (!opened_) throw DeviceError(DeviceErrorCode::Disconnected, "FakeCamera not opened");
    std::lock_guard<std::mutex> lock(mtx_);
    running_ = true;
    last_ts_ = steady_clock::now();
}

void FakeCamera::stop() { running_ = false; }

void FakeCamera::configure_roi(const cv::Rect& roi)
{
    const cv::Rect sensor(0, 0, width_, height_);
    if (roi.area() <= 0 || (roi & sensor) != roi)
        throw DeviceError(DeviceErrorCode::InvalidParameter,
                          "roi " + std::to_string(roi.x) + "," + std::to_string(roi.y) + " " +
                          std::to_string(roi.width) + "x" + std::to_string(roi.height) +
                          " does not fit the " + std::to_string(width_) + "x" +
                          std::to_string(height_) + " sensor");
    std::lock_guard<std::mutex> lock(mtx_);
    roi_ = roi;
}

cv::Rect FakeCamera::roi() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return roi_;
}

void FakeCamera::inject_fault(DeviceErrorCode code)
{
    std::lock_guard<std::mutex> lock(mtx_);
    fault_ = code;
}

cv::Mat FakeCamera::acquire_frame(int timeout_ms)
{
    if (!running_) throw DeviceError(DeviceErrorCode::NotRunning, "FakeCamera not started");

    cv::Rect roi;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (fault_) {
            const DeviceErrorCode code = *fault_;
            fault_.reset();
            throw DeviceError(code, "injected fault after " + std::to_string(timeout_ms) + " ms");
        }
        roi = roi_;

        if (fps_ > 0) {
            auto dt = duration_cast<milliseconds>(steady_clock::now() - last_ts_).count();
            if (dt < 1000 / fps_) std::this_thread::sleep_for(milliseconds(1000 / fps_ - dt));
            last_ts_ = steady_clock::now();
        }
    }

    // generate simple gradient, in sensor coordinates so the ROI crops it
    const uint64_t idx = frame_idx_++;
    cv::Mat grad(roi.height, roi.width, CV_8UC1);
    for (int y = 0; y < roi.height; ++y) {
        uint8_t* row = grad.ptr<uint8_t>(y);
        for (int x = 0; x < roi.width; ++x)
            row[x] = static_cast<uint8_t>((roi.x + x + roi.y + y + idx) % 256);
    }

    const int cn = CV_MAT_CN(type_);
    cv::Mat plane;
    grad.convertTo(plane, CV_MAT_DEPTH(type_));
    if (cn == 1) return plane;

    cv::Mat out;
    cv::merge(std::vector<cv::Mat>(cn, plane), out);
    return out;
}

} // namespace camring
