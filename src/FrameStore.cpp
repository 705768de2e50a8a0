#include "camring/FrameStore.hpp"
#include "camring/Errors.hpp"

#include <unistd.h>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace camring {

namespace {

const H5::PredType& h5_type_for_depth(int depth)
{
    switch (depth) {
    case CV_8U:  return H5::PredType::NATIVE_UINT8;
    case CV_8S:  return H5::PredType::NATIVE_INT8;
    case CV_16U: return H5::PredType::NATIVE_UINT16;
    case CV_16S: return H5::PredType::NATIVE_INT16;
    case CV_32S: return H5::PredType::NATIVE_INT32;
    case CV_32F: return H5::PredType::NATIVE_FLOAT;
    case CV_64F: return H5::PredType::NATIVE_DOUBLE;
    default:
        throw std::invalid_argument("unsupported frame depth " + std::to_string(depth));
    }
}

int depth_for_h5_type(const H5::DataType& type, const std::string& name)
{
    static const int depths[] = {CV_8U, CV_8S, CV_16U, CV_16S, CV_32S, CV_32F, CV_64F};
    for (int d : depths) {
        if (type == h5_type_for_depth(d)) return d;
    }
    throw StorageError(name + ": sample type has no matching frame depth");
}

cv::Mat read_dataset(const H5::DataSet& ds, const std::string& name)
{
    H5::DataSpace space = ds.getSpace();
    const int rank = space.getSimpleExtentNdims();
    if (rank != 2 && rank != 3)
        throw StorageError(name + ": expected rank 2 or 3, got " + std::to_string(rank));

    hsize_t dims[3] = {0, 0, 1};
    space.getSimpleExtentDims(dims);
    if (dims[2] > CV_CN_MAX)
        throw StorageError(name + ": too many channels (" + std::to_string(dims[2]) + ")");

    const int depth = depth_for_h5_type(ds.getDataType(), name);
    cv::Mat out(static_cast<int>(dims[0]), static_cast<int>(dims[1]),
                CV_MAKETYPE(depth, static_cast<int>(dims[2])));
    ds.read(out.data, h5_type_for_depth(depth));
    return out;
}

std::string read_timestamp_attr(const H5::DataSet& ds)
{
    H5::Attribute attr = ds.openAttribute("timestamp");
    std::string out;
    attr.read(attr.getStrType(), out);
    return out;
}

cv::Rect read_roi_attr(const H5::DataSet& ds, const std::string& name)
{
    H5::Attribute attr = ds.openAttribute("roi");
    if (attr.getSpace().getSimpleExtentNpoints() != 4)
        throw StorageError(name + ": roi attribute must hold 4 values");
    int32_t v[4] = {0, 0, 0, 0};
    attr.read(H5::PredType::NATIVE_INT32, v);
    return cv::Rect(v[0], v[1], v[2], v[3]);
}

const FrameStoreConfig& checked(const FrameStoreConfig& cfg)
{
    cfg.validate();
    if (::access(cfg.directory.c_str(), W_OK) != 0)
        throw StorageError("directory not writable: " + cfg.directory +
                           " (" + std::strerror(errno) + ")");
    return cfg;
}

H5::H5File create_file(const std::string& path)
{
    // Errors are reported through exceptions; keep HDF5 from printing its stack too.
    H5::Exception::dontPrint();
    try {
        return H5::H5File(path, H5F_ACC_TRUNC);
    } catch (const H5::Exception& e) {
        throw StorageError("cannot create " + path + ": " + e.getDetailMsg());
    }
}

H5::Group create_images_group(const H5::H5File& file, const std::string& path)
{
    try {
        H5::Group g = file.createGroup("/images");
        file.flush(H5F_SCOPE_GLOBAL);
        return g;
    } catch (const H5::Exception& e) {
        throw StorageError("cannot create /images in " + path + ": " + e.getDetailMsg());
    }
}

} // namespace

std::string slot_name(size_t index)
{
    char name[16];
    std::snprintf(name, sizeof(name), "img%04zu", index);
    return name;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp)
{
    using namespace std::chrono;
    const int64_t us = duration_cast<microseconds>(tp.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(us / 1000000);
    long frac = static_cast<long>(us % 1000000);
    if (frac < 0) { frac += 1000000; --secs; }

    std::tm tm{};
    localtime_r(&secs, &tm);
    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm);
    char out[48];
    std::snprintf(out, sizeof(out), "%s.%06ld", date, frac);
    return out;
}

std::chrono::system_clock::time_point parse_timestamp(const std::string& text)
{
    std::tm tm{};
    std::istringstream is(text);
    is >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (is.fail())
        throw StorageError("malformed timestamp '" + text + "'");

    // Fractional part: up to 6 digits are significant, missing ones are zeros.
    long frac = 0;
    int digits = 0;
    if (is.peek() == '.') {
        is.get();
        while (std::isdigit(is.peek())) {
            const int c = is.get();
            if (digits < 6) { frac = frac * 10 + (c - '0'); ++digits; }
        }
    }
    for (; digits < 6; ++digits) frac *= 10;

    tm.tm_isdst = -1;
    const std::time_t secs = std::mktime(&tm);
    return std::chrono::system_clock::from_time_t(secs) + std::chrono::microseconds(frac);
}

// ---------------- open/close ----------------

FrameStore::FrameStore(const FrameStoreConfig& cfg, EventSink sink)
    : capacity_(checked(cfg).capacity),
      default_roi_(cfg.roi),
      path_(cfg.path()),
      sink_(sink ? std::move(sink) : stderr_sink()),
      file_(create_file(path_)),
      images_(create_images_group(file_, path_)),
      recording_(cfg.recording)
{
    notify(FrameStoreEventKind::Opened,
           path_ + " (capacity " + std::to_string(capacity_) + ")");
}

FrameStore::~FrameStore()
{
    try {
        close();
    } catch (const Error& e) {
        notify(FrameStoreEventKind::CloseFailed, e.what());
    }
}

std::unique_ptr<FrameStore> FrameStore::open(const FrameStoreConfig& cfg, EventSink sink)
{
    return std::make_unique<FrameStore>(cfg, std::move(sink));
}

void FrameStore::close()
{
    std::lock_guard<std::mutex> lock(mtx_);
    if (closed_) return;
    closed_ = true;
    try {
        file_.flush(H5F_SCOPE_GLOBAL);
        images_.close();
        file_.close();
    } catch (const H5::Exception& e) {
        throw StorageError("close " + path_ + ": " + e.getDetailMsg());
    }
    notify(FrameStoreEventKind::Closed, path_);
}

bool FrameStore::is_open() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return !closed_;
}

void FrameStore::notify(FrameStoreEventKind kind, const std::string& message) const
{
    if (sink_) sink_(FrameStoreEvent{kind, message});
}

void FrameStore::ensure_open() const
{
    if (closed_) throw ClosedError("frame store " + path_ + " is closed");
}

void FrameStore::check_range(size_t index) const
{
    if (index >= capacity_)
        throw RangeError("slot " + std::to_string(index) + " outside [0, " +
                         std::to_string(capacity_) + ")");
}

// ---------------- write path ----------------

void FrameStore::write(const cv::Mat& data, std::optional<cv::Rect> roi)
{
    std::lock_guard<std::mutex> lock(mtx_);
    ensure_open();
    if (!recording_) return;

    if (data.empty() || data.dims != 2)
        throw std::invalid_argument("FrameStore::write: expected a non-empty 2-D frame");
    const H5::PredType& sample_type = h5_type_for_depth(data.depth());
    const cv::Mat src = data.isContinuous() ? data : data.clone();
    const cv::Rect r = roi ? *roi : default_roi_;
    const std::string name = slot_name(index_);
    const std::string stamp = format_timestamp(std::chrono::system_clock::now());

    try {
        // Delete then insert: the new dataset never inherits attributes from the old one.
        if (images_.nameExists(name))
            images_.unlink(name);

        hsize_t dims[3] = {static_cast<hsize_t>(src.rows),
                           static_cast<hsize_t>(src.cols),
                           static_cast<hsize_t>(src.channels())};
        H5::DataSpace space(src.channels() > 1 ? 3 : 2, dims);
        H5::DataSet ds = images_.createDataSet(name, sample_type, space);
        ds.write(src.data, sample_type);

        write_metadata(ds, stamp, r);

        file_.flush(H5F_SCOPE_GLOBAL);
    } catch (const H5::Exception& e) {
        std::string msg = "write " + name + " to " + path_ + ": " + e.getDetailMsg();
        // A dataset without its attributes must not stay visible.
        try {
            if (images_.nameExists(name))
                images_.unlink(name);
        } catch (const H5::Exception& cleanup) {
            msg += "; could not remove partial slot: " + cleanup.getDetailMsg();
        }
        throw StorageError(msg);
    }

    index_ = (index_ + 1) % capacity_;
}

void FrameStore::write_metadata(H5::DataSet& ds, const std::string& stamp, const cv::Rect& r)
{
    H5::StrType str_type(H5::PredType::C_S1, stamp.size());
    H5::Attribute ts_attr = ds.createAttribute("timestamp", str_type, H5::DataSpace(H5S_SCALAR));
    ts_attr.write(str_type, stamp);

    const int32_t roi_vals[4] = {r.x, r.y, r.width, r.height};
    const hsize_t roi_dims[1] = {4};
    H5::Attribute roi_attr = ds.createAttribute("roi", H5::PredType::NATIVE_INT32,
                                                H5::DataSpace(1, roi_dims));
    roi_attr.write(H5::PredType::NATIVE_INT32, roi_vals);
}

// ---------------- read path ----------------

H5::DataSet FrameStore::open_slot(size_t index) const
{
    check_range(index);
    const std::string name = slot_name(index);
    if (!images_.nameExists(name))
        throw NotFoundError("no frame in slot " + std::to_string(index));
    return images_.openDataSet(name);
}

cv::Mat FrameStore::read(size_t index) const
{
    std::lock_guard<std::mutex> lock(mtx_);
    ensure_open();
    try {
        return read_dataset(open_slot(index), slot_name(index));
    } catch (const H5::Exception& e) {
        throw StorageError("read " + slot_name(index) + ": " + e.getDetailMsg());
    }
}

std::optional<cv::Mat> FrameStore::try_read(size_t index) const
{
    std::lock_guard<std::mutex> lock(mtx_);
    ensure_open();
    check_range(index);
    try {
        const std::string name = slot_name(index);
        if (!images_.nameExists(name)) return std::nullopt;
        return read_dataset(images_.openDataSet(name), name);
    } catch (const H5::Exception& e) {
        throw StorageError("read " + slot_name(index) + ": " + e.getDetailMsg());
    }
}

bool FrameStore::contains(size_t index) const
{
    std::lock_guard<std::mutex> lock(mtx_);
    ensure_open();
    check_range(index);
    try {
        return images_.nameExists(slot_name(index));
    } catch (const H5::Exception& e) {
        throw StorageError("lookup " + slot_name(index) + ": " + e.getDetailMsg());
    }
}

std::optional<FrameRecord> FrameStore::try_read_record(size_t index) const
{
    std::lock_guard<std::mutex> lock(mtx_);
    ensure_open();
    check_range(index);
    const std::string name = slot_name(index);
    try {
        if (!images_.nameExists(name)) return std::nullopt;
        const H5::DataSet ds = images_.openDataSet(name);
        return FrameRecord{read_dataset(ds, name), read_timestamp_attr(ds), read_roi_attr(ds, name)};
    } catch (const H5::Exception& e) {
        throw StorageError("read " + name + ": " + e.getDetailMsg());
    }
}

std::string FrameStore::timestamp_string(size_t index) const
{
    std::lock_guard<std::mutex> lock(mtx_);
    ensure_open();
    try {
        return read_timestamp_attr(open_slot(index));
    } catch (const H5::Exception& e) {
        throw StorageError("timestamp of " + slot_name(index) + ": " + e.getDetailMsg());
    }
}

std::chrono::system_clock::time_point FrameStore::timestamp(size_t index) const
{
    return parse_timestamp(timestamp_string(index));
}

cv::Rect FrameStore::roi(size_t index) const
{
    std::lock_guard<std::mutex> lock(mtx_);
    ensure_open();
    try {
        return read_roi_attr(open_slot(index), slot_name(index));
    } catch (const H5::Exception& e) {
        throw StorageError("roi of " + slot_name(index) + ": " + e.getDetailMsg());
    }
}

size_t FrameStore::length() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    ensure_open();
    try {
        return static_cast<size_t>(images_.getNumObjs());
    } catch (const H5::Exception& e) {
        throw StorageError("count slots in " + path_ + ": " + e.getDetailMsg());
    }
}

size_t FrameStore::index() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    ensure_open();
    return index_;
}

// ---------------- recording gate ----------------

bool FrameStore::recording() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    ensure_open();
    return recording_;
}

void FrameStore::set_recording_state(bool state)
{
    std::lock_guard<std::mutex> lock(mtx_);
    ensure_open();
    recording_ = state;
}

void FrameStore::toggle()
{
    std::lock_guard<std::mutex> lock(mtx_);
    ensure_open();
    if (recording_)
        notify(FrameStoreEventKind::RecordingPaused, "pausing ring buffer recording");
    else
        notify(FrameStoreEventKind::RecordingResumed, "resuming ring buffer recording");
    recording_ = !recording_;
}

} // namespace camring
