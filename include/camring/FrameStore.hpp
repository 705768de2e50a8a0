#pragma once
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <H5Cpp.h>
#include <opencv2/core.hpp>

#include "camring/Events.hpp"
#include "camring/FrameStoreConfig.hpp"

namespace camring {

/// One slot read under a single lock: the frame and the metadata written with it.
struct FrameRecord {
    cv::Mat frame;
    std::string timestamp;
    cv::Rect roi;
};

/**
 * @brief Fixed-capacity ring of frames persisted in an HDF5 file.
 *
 * Layout: group /images, one dataset per slot named img0000..img9999, each
 * with a `timestamp` string attribute ("YYYY-MM-DD HH:MM:SS.ffffff", local
 * time) and a 4-int `roi` attribute (x, y, width, height).
 *
 * One writer and any number of readers may share an instance. All HDF5
 * access goes through a single mutex, so a reader never sees a slot between
 * its delete and its re-insert, and close() waits for an in-flight write.
 *
 * Usage:
 *   FrameStore store(cfg);
 *   store.write(frame);            // slot 0
 *   cv::Mat m = store.read(0);
 *   store.close();
 */
class FrameStore {
public:
    /// Creates or truncates cfg.path(). Throws ConfigError or StorageError.
    explicit FrameStore(const FrameStoreConfig& cfg, EventSink sink = {});
    virtual ~FrameStore();

    FrameStore(const FrameStore&) = delete;
    FrameStore& operator=(const FrameStore&) = delete;

    static std::unique_ptr<FrameStore> open(const FrameStoreConfig& cfg, EventSink sink = {});

    /// Store `data` at the write cursor and advance it. No-op while paused.
    /// Falls back to default_roi() when `roi` is empty. If HDF5 fails the
    /// slot is left empty, the cursor stays put and StorageError is thrown.
    void write(const cv::Mat& data, std::optional<cv::Rect> roi = std::nullopt);

    cv::Mat read(size_t index) const;
    std::optional<cv::Mat> try_read(size_t index) const;
    bool contains(size_t index) const;

    /// Frame, timestamp and roi of a slot in one pass; nullopt when empty.
    std::optional<FrameRecord> try_read_record(size_t index) const;

    std::chrono::system_clock::time_point timestamp(size_t index) const;
    std::string timestamp_string(size_t index) const;
    cv::Rect roi(size_t index) const;

    /// Number of occupied slots.
    size_t length() const;

    /// Slot the next write goes to.
    size_t index() const;

    bool recording() const;
    void set_recording_state(bool state);
    void toggle();

    /// Flush and release the file. Safe to call more than once.
    void close();

    bool is_open() const;
    size_t capacity() const { return capacity_; }
    const cv::Rect& default_roi() const { return default_roi_; }
    const std::string& path() const { return path_; }

    /// Forward an event to the installed sink.
    void notify(FrameStoreEventKind kind, const std::string& message) const;

protected:
    /// Attach the timestamp and roi attributes to a freshly created slot.
    virtual void write_metadata(H5::DataSet& ds, const std::string& stamp, const cv::Rect& roi);

private:
    void ensure_open() const;
    void check_range(size_t index) const;
    H5::DataSet open_slot(size_t index) const;

    const size_t capacity_;
    const cv::Rect default_roi_;
    const std::string path_;
    EventSink sink_;

    mutable std::mutex mtx_;
    H5::H5File file_;
    H5::Group images_;
    size_t index_ = 0;
    bool recording_ = true;
    bool closed_ = false;
};

/// "img0042" for slot 42.
std::string slot_name(size_t index);

/// wall clock -> "YYYY-MM-DD HH:MM:SS.ffffff" (local time) and back.
std::string format_timestamp(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point parse_timestamp(const std::string& text);

} // namespace camring
