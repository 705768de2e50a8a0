#include "camring/Recorder.hpp"
#include "camring/Errors.hpp"

namespace camring {

bool Recorder::start(int timeout_ms)
{
    if (running_) return false;
    if (worker_.joinable()) worker_.join();   // loop ended by itself earlier

    timeout_ms_ = timeout_ms;
    {
        std::lock_guard<std::mutex> lock(err_mtx_);
        last_error_ = nullptr;
    }

    running_ = true;
    worker_ = std::thread(&Recorder::loop, this);
    return true;
}

void Recorder::loop()
{
    while (running_) {
        try {
            cv::Mat frame = camera_.acquire_frame(timeout_ms_);
            store_.write(frame, camera_.roi());
        } catch (const DeviceError& e) {
            if (e.code() == DeviceErrorCode::Timeout) {
                timeouts_++;
                continue;
            }
            fail(std::current_exception());
            return;
        } catch (const std::exception&) {
            // StorageError, ClosedError, or a frame the store cannot hold
            fail(std::current_exception());
            return;
        }
        frames_pushed_++;
    }
}

void Recorder::fail(std::exception_ptr err)
{
    {
        std::lock_guard<std::mutex> lock(err_mtx_);
        last_error_ = std::move(err);
    }
    running_ = false;
}

void Recorder::stop()
{
    running_ = false;
    if (worker_.joinable()) worker_.join();
}

std::exception_ptr Recorder::last_error() const
{
    std::lock_guard<std::mutex> lock(err_mtx_);
    return last_error_;
}

} // namespace camring
