#pragma once
#include <atomic>
#include <cstdint>
#include <exception>
#include <mutex>
#include <thread>

#include "camring/FrameStore.hpp"
#include "camring/ICamera.hpp"

namespace camring {

/**
 * @brief Acquisition loop: pulls frames from a camera into a FrameStore.
 *
 * Timeouts are counted and skipped. Any other DeviceError, and any store
 * failure, ends the loop; the exception is kept in last_error(). Nothing is
 * retried.
 */
class Recorder {
public:
    Recorder(ICamera& camera, FrameStore& store) : camera_(camera), store_(store) {}
    ~Recorder() { stop(); }

    Recorder(const Recorder&) = delete;
    Recorder& operator=(const Recorder&) = delete;

    /// Returns false if already running.
    bool start(int timeout_ms = 100);
    void stop();

    bool running() const { return running_; }
    uint64_t frames_pushed() const { return frames_pushed_; }
    uint64_t timeouts() const { return timeouts_; }
    std::exception_ptr last_error() const;

private:
    void loop();
    void fail(std::exception_ptr err);

    ICamera& camera_;
    FrameStore& store_;

    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> frames_pushed_{0};
    std::atomic<uint64_t> timeouts_{0};
    int timeout_ms_ = 100;

    mutable std::mutex err_mtx_;
    std::exception_ptr last_error_;
};

} // namespace camring
