#pragma once
#include <opencv2/core.hpp>

namespace camring {

/**
 * @brief Frame source contract.
 *
 * Every failure is a DeviceError (timeout, disconnect, unsupported parameter,
 * not started). Implementations wrap a vendor SDK; only FakeCamera lives here.
 */
class ICamera {
public:
  virtual ~ICamera() = default;
  virtual void open() = 0;
  virtual void close() = 0;
  virtual void start() = 0;
  virtual void stop() = 0;

  /// Next frame, sized to the current ROI.
  virtual cv::Mat acquire_frame(int timeout_ms) = 0;

  virtual void configure_roi(const cv::Rect& roi) = 0;
  virtual cv::Rect roi() const = 0;
};

} // namespace camring
