#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

#include "camring/FrameStore.hpp"

namespace camring {

/**
 * @brief Bulk readout of a FrameStore, independent of its write path.
 *
 * Frames are taken in slot order 0..N-1 and the walk stops at the first
 * empty slot. Before the ring has wrapped that is exactly write order. After
 * it has wrapped slot 0 holds whatever overwrote it last, so index order is
 * not temporal order; use time_ordered() when that matters.
 *
 * Each frame is read under the store lock, but the walk as a whole is not a
 * snapshot: pause recording first if a live writer must not interleave.
 */
class Exporter {
public:
    explicit Exporter(const FrameStore& store) : store_(store) {}

    std::vector<cv::Mat> to_list() const;

    /// to_list() frames sorted by their stored timestamp (ties keep slot order).
    /// Each frame is paired with the timestamp read in the same locked pass.
    std::vector<cv::Mat> time_ordered() const;

    /// Dump to_list() to an XRAW archive, optionally LZ4-compressed per frame.
    /// Timestamps and ROIs are not kept. Throws IoError.
    void save_bulk(const std::string& path, bool compressed = false) const;

    /// Pick the format from the extension: ".xraw" plain, ".xlz4" compressed.
    /// Anything else throws UnsupportedFormatError.
    void save_as(const std::string& path) const;

private:
    struct Slot {
        size_t index;
        cv::Mat frame;
        std::string timestamp;
    };
    std::vector<Slot> collect() const;

    const FrameStore& store_;
};

struct ArchiveEntry {
    uint64_t slot_index = 0;
    uint32_t payload_bytes = 0;   // bytes on disk (compressed size for LZ4)
    cv::Mat  frame;
};

struct Archive {
    bool     compressed = false;
    uint64_t created_unix_ns = 0;
    std::vector<ArchiveEntry> entries;
};

/// Size of `frame` in an archive record. Throws IoError past 4 GiB.
uint32_t record_bytes(const cv::Mat& frame);

/// Read back an archive written by Exporter::save_bulk. Throws IoError.
Archive load_archive(const std::string& path);

/// Frames of load_archive(path), in archive order.
std::vector<cv::Mat> load_bulk(const std::string& path);

} // namespace camring
