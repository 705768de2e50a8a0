#include "camring/Exporter.hpp"
#include "camring/Errors.hpp"

#include <lz4frame.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <climits>
#include <cstring>
#include <memory>

namespace camring {

namespace {

// ---------- headers written to disk ----------
#pragma pack(push,1)
struct ArchiveHeader {
    uint32_t magic;           // 'X','R','A','W' = 0x58524157
    uint16_t version;         // 3
    uint16_t header_size;     // sizeof(ArchiveHeader)
    uint32_t frame_count;
    uint32_t flags;           // bit 0: payloads are LZ4 frames
    uint64_t created_unix_ns;
};

struct RecordHeader {
    uint32_t magic;           // 'X','B','I','N' = 0x5842494E
    uint16_t version;         // 3
    uint16_t header_size;     // sizeof(RecordHeader)
    uint64_t slot_index;
    uint32_t rows;
    uint32_t cols;
    int32_t  cv_type;         // OpenCV type: depth + channels
    uint32_t raw_bytes;       // rows * cols * elem size
    uint32_t payload_bytes;   // == raw_bytes unless compressed
    uint32_t reserved;        // 0
};
#pragma pack(pop)

constexpr uint32_t MAGIC_FILE   = 0x58524157; // 'XRAW'
constexpr uint32_t MAGIC_RECORD = 0x5842494E; // 'XBIN'
constexpr uint16_t VER_ARCHIVE  = 3;
constexpr uint32_t FLAG_LZ4     = 1u << 0;

using FilePtr = std::unique_ptr<FILE, decltype(&std::fclose)>;

FilePtr open_file(const std::string& path, const char* mode)
{
    FILE* fp = std::fopen(path.c_str(), mode);
    if (!fp) throw IoError("cannot open " + path + ": " + std::strerror(errno));
    return FilePtr(fp, &std::fclose);
}

void put(FILE* fp, const void* data, size_t n, const std::string& path)
{
    if (n && std::fwrite(data, 1, n, fp) != n)
        throw IoError("short write to " + path + ": " + std::strerror(errno));
}

void get(FILE* fp, void* data, size_t n, const std::string& path)
{
    if (n && std::fread(data, 1, n, fp) != n)
        throw IoError("truncated archive " + path);
}

std::vector<uint8_t> compress(const cv::Mat& frame, size_t raw_size)
{
    std::vector<uint8_t> out(LZ4F_compressFrameBound(raw_size, nullptr));
    const size_t n = LZ4F_compressFrame(out.data(), out.size(), frame.data, raw_size, nullptr);
    if (LZ4F_isError(n))
        throw IoError(std::string("LZ4 compression error: ") + LZ4F_getErrorName(n));
    out.resize(n);
    return out;
}

void decompress(const std::vector<uint8_t>& payload, cv::Mat& frame, const std::string& path)
{
    LZ4F_dctx* dctx = nullptr;
    const LZ4F_errorCode_t err = LZ4F_createDecompressionContext(&dctx, LZ4F_VERSION);
    if (LZ4F_isError(err))
        throw IoError(std::string("LZ4 context: ") + LZ4F_getErrorName(err));
    std::unique_ptr<LZ4F_dctx, decltype(&LZ4F_freeDecompressionContext)>
        guard(dctx, &LZ4F_freeDecompressionContext);

    uint8_t* dst = frame.data;
    const size_t dst_total = frame.total() * frame.elemSize();
    size_t src_pos = 0, dst_pos = 0;
    while (src_pos < payload.size()) {
        size_t dst_size = dst_total - dst_pos;
        size_t src_size = payload.size() - src_pos;
        const size_t ret = LZ4F_decompress(dctx, dst + dst_pos, &dst_size,
                                           payload.data() + src_pos, &src_size, nullptr);
        if (LZ4F_isError(ret))
            throw IoError(path + ": LZ4 decompression error: " + LZ4F_getErrorName(ret));
        src_pos += src_size;
        dst_pos += dst_size;
        if (ret == 0) break;
        if (src_size == 0 && dst_size == 0)
            throw IoError(path + ": LZ4 payload larger than its frame");
    }
    if (dst_pos != dst_total)
        throw IoError(path + ": LZ4 payload decoded to " + std::to_string(dst_pos) +
                      " bytes, expected " + std::to_string(dst_total));
}

bool ends_with(const std::string& s, const std::string& suffix)
{
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// rows * cols * elem size of a record header, or 0 when it cannot be a frame.
uint64_t expected_raw_bytes(const RecordHeader& rh)
{
    if (rh.cv_type < 0 || rh.cv_type > CV_MAT_TYPE_MASK || CV_MAT_DEPTH(rh.cv_type) > CV_64F)
        return 0;
    if (rh.rows == 0 || rh.cols == 0 || rh.rows > INT_MAX || rh.cols > INT_MAX)
        return 0;
    const uint64_t pixels = uint64_t(rh.rows) * rh.cols;
    const uint64_t elem = CV_ELEM_SIZE(rh.cv_type);
    if (pixels > UINT32_MAX / elem) return 0;
    return pixels * elem;
}

} // namespace

uint32_t record_bytes(const cv::Mat& frame)
{
    const uint64_t n = uint64_t(frame.total()) * frame.elemSize();
    if (n > UINT32_MAX)
        throw IoError("frame of " + std::to_string(n) + " bytes does not fit an XRAW record");
    return static_cast<uint32_t>(n);
}

// ---------------- readout ----------------

std::vector<Exporter::Slot> Exporter::collect() const
{
    std::vector<Slot> out;
    for (size_t i = 0; i < store_.capacity(); ++i) {
        std::optional<FrameRecord> rec = store_.try_read_record(i);
        if (!rec) break;
        out.push_back(Slot{i, std::move(rec->frame), std::move(rec->timestamp)});
    }
    return out;
}

std::vector<cv::Mat> Exporter::to_list() const
{
    std::vector<cv::Mat> frames;
    for (auto& s : collect()) frames.push_back(std::move(s.frame));
    return frames;
}

std::vector<cv::Mat> Exporter::time_ordered() const
{
    struct Stamped {
        std::chrono::system_clock::time_point ts;
        cv::Mat frame;
    };
    std::vector<Stamped> stamped;
    for (auto& s : collect())
        stamped.push_back(Stamped{parse_timestamp(s.timestamp), std::move(s.frame)});

    std::stable_sort(stamped.begin(), stamped.end(),
                     [](const Stamped& a, const Stamped& b) { return a.ts < b.ts; });

    std::vector<cv::Mat> frames;
    for (auto& s : stamped) frames.push_back(std::move(s.frame));
    return frames;
}

// ---------------- archive ----------------

void Exporter::save_bulk(const std::string& path, bool compressed) const
{
    const std::vector<Slot> slots = collect();
    store_.notify(FrameStoreEventKind::MetadataDropped,
                  "bulk export to " + path + " loses timestamp and ROI information");

    FilePtr fp = open_file(path, "wb");

    ArchiveHeader fh{};
    fh.magic       = MAGIC_FILE;
    fh.version     = VER_ARCHIVE;
    fh.header_size = static_cast<uint16_t>(sizeof(ArchiveHeader));
    fh.frame_count = static_cast<uint32_t>(slots.size());
    fh.flags       = compressed ? FLAG_LZ4 : 0;
    fh.created_unix_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    put(fp.get(), &fh, sizeof(fh), path);

    for (const auto& s : slots) {
        const cv::Mat frame = s.frame.isContinuous() ? s.frame : s.frame.clone();
        const uint32_t raw_size = record_bytes(frame);

        std::vector<uint8_t> packed;
        if (compressed) {
            packed = compress(frame, raw_size);
            if (packed.size() > UINT32_MAX)
                throw IoError("compressed frame " + std::to_string(s.index) +
                              " does not fit an XRAW record");
        }

        RecordHeader rh{};
        rh.magic         = MAGIC_RECORD;
        rh.version       = VER_ARCHIVE;
        rh.header_size   = static_cast<uint16_t>(sizeof(RecordHeader));
        rh.slot_index    = s.index;
        rh.rows          = static_cast<uint32_t>(frame.rows);
        rh.cols          = static_cast<uint32_t>(frame.cols);
        rh.cv_type       = frame.type();
        rh.raw_bytes     = raw_size;
        rh.payload_bytes = compressed ? static_cast<uint32_t>(packed.size()) : raw_size;
        rh.reserved      = 0;

        put(fp.get(), &rh, sizeof(rh), path);
        if (compressed) put(fp.get(), packed.data(), packed.size(), path);
        else            put(fp.get(), frame.data, raw_size, path);
    }

    if (std::fclose(fp.release()) != 0)
        throw IoError("cannot finish " + path + ": " + std::strerror(errno));
}

void Exporter::save_as(const std::string& path) const
{
    if (ends_with(path, ".xraw"))
        save_bulk(path, false);
    else if (ends_with(path, ".xlz4"))
        save_bulk(path, true);
    else
        throw UnsupportedFormatError("saving " + path +
                                     " is not supported; use a .xraw or .xlz4 file");
}

Archive load_archive(const std::string& path)
{
    FilePtr fp = open_file(path, "rb");

    ArchiveHeader fh{};
    get(fp.get(), &fh, sizeof(fh), path);
    if (fh.magic != MAGIC_FILE || fh.version != VER_ARCHIVE || fh.header_size != sizeof(fh))
        throw IoError(path + " is not an XRAW v" + std::to_string(VER_ARCHIVE) + " archive");

    Archive archive;
    archive.compressed = (fh.flags & FLAG_LZ4) != 0;
    archive.created_unix_ns = fh.created_unix_ns;

    for (uint32_t i = 0; i < fh.frame_count; ++i) {
        RecordHeader rh{};
        get(fp.get(), &rh, sizeof(rh), path);
        if (rh.magic != MAGIC_RECORD || rh.header_size != sizeof(rh))
            throw IoError(path + ": bad record header at frame " + std::to_string(i));

        // Shape is checked against raw_bytes before anything is allocated.
        const uint64_t raw_size = expected_raw_bytes(rh);
        if (raw_size == 0)
            throw IoError(path + ": unsupported frame layout at frame " + std::to_string(i));
        if (rh.raw_bytes != raw_size)
            throw IoError(path + ": frame " + std::to_string(i) + " size does not match its shape");

        ArchiveEntry entry;
        entry.slot_index = rh.slot_index;
        entry.payload_bytes = rh.payload_bytes;
        entry.frame.create(static_cast<int>(rh.rows), static_cast<int>(rh.cols), rh.cv_type);

        if (archive.compressed) {
            if (rh.payload_bytes > LZ4F_compressFrameBound(raw_size, nullptr))
                throw IoError(path + ": frame " + std::to_string(i) + " payload too large");
            std::vector<uint8_t> payload(rh.payload_bytes);
            get(fp.get(), payload.data(), payload.size(), path);
            decompress(payload, entry.frame, path);
        } else {
            if (rh.payload_bytes != raw_size)
                throw IoError(path + ": frame " + std::to_string(i) + " payload size mismatch");
            get(fp.get(), entry.frame.data, raw_size, path);
        }
        archive.entries.push_back(std::move(entry));
    }
    return archive;
}

std::vector<cv::Mat> load_bulk(const std::string& path)
{
    std::vector<cv::Mat> frames;
    for (auto& e : load_archive(path).entries) frames.push_back(std::move(e.frame));
    return frames;
}

} // namespace camring
