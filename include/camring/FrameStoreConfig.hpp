#pragma once
#include <cstddef>
#include <string>
#include <opencv2/core.hpp>

namespace camring {

/// Largest capacity that still fits the four-digit slot names (img0000..img9999).
constexpr size_t kMaxCapacity = 10000;

struct FrameStoreConfig {
    size_t      capacity  = 100;
    std::string directory = ".";
    std::string filename  = "rbuffer.h5";
    bool        recording = true;
    cv::Rect    roi{10, 100, 10, 100};   // default ROI for writes without one

    /// Throws ConfigError when a field is out of range.
    void validate() const;

    /// directory joined with filename.
    std::string path() const;
};

} // namespace camring
