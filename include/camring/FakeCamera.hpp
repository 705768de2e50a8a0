#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <opencv2/core.hpp>

#include "camring/Errors.hpp"
#include "camring/ICamera.hpp"

namespace camring {

/**
 * @brief Simple fake camera that generates synthetic gradient frames.
 *
 * Frames have the size of the current ROI and the OpenCV type given at
 * construction. With fps <= 0 frames are produced as fast as they are asked for.
 */
class FakeCamera : public ICamera {
public:
    FakeCamera(int width = 640, int height = 480, int fps = 30, int type = CV_8UC1);

    void open() override;
    void close() override;
    void start() override;
    void stop() override;

    cv::Mat acquire_frame(int timeout_ms = 100) override;

    void configure_roi(const cv::Rect& roi) override;
    cv::Rect roi() const override;

    /// Make the next acquire_frame() fail with `code`.
    void inject_fault(DeviceErrorCode code);

    uint64_t frames_generated() const { return frame_idx_; }

private:
    int width_, height_, fps_, type_;
    std::atomic<bool> opened_{false};
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> frame_idx_{0};

    mutable std::mutex mtx_;
    cv::Rect roi_;
    std::optional<DeviceErrorCode> fault_;
    std::chrono::steady_clock::time_point last_ts_;
};

} // namespace camring
