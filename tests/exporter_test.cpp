#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

#include "camring/Errors.hpp"
#include "camring/Exporter.hpp"
#include "camring/FrameStore.hpp"
#include "test_util.hpp"

using camring::Exporter;
using camring::FrameStore;
using camring::FrameStoreEventKind;
using namespace camring_test;

TEST(Exporter, EmptyStoreExportsNothing) {
  TempDir dir;
  EventLog log;
  FrameStore store(config_in(dir, 3), log.sink());

  EXPECT_TRUE(Exporter(store).to_list().empty());
}

TEST(Exporter, BeforeWrapListIsWriteOrder) {
  TempDir dir;
  EventLog log;
  FrameStore store(config_in(dir, 5), log.sink());

  std::vector<cv::Mat> frames;
  for (int k = 0; k < 3; ++k) {
    frames.push_back(make_frame(4, 6, CV_8UC1, k));
    store.write(frames.back());
  }

  const std::vector<cv::Mat> listed = Exporter(store).to_list();
  ASSERT_EQ(listed.size(), 3u);
  for (size_t i = 0; i < listed.size(); ++i) EXPECT_TRUE(same_pixels(listed[i], frames[i]));
}

TEST(Exporter, AfterWrapListIsSlotOrderNotTimeOrder) {
  TempDir dir;
  EventLog log;
  FrameStore store(config_in(dir, 3), log.sink());

  const cv::Mat a = make_frame(3, 3, CV_8UC1, 1);
  const cv::Mat b = make_frame(3, 3, CV_8UC1, 2);
  const cv::Mat c = make_frame(3, 3, CV_8UC1, 3);
  const cv::Mat d = make_frame(3, 3, CV_8UC1, 4);
  for (const cv::Mat *m : {&a, &b, &c}) {
    store.write(*m);
    // keep the microsecond timestamps strictly increasing
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  store.write(d);

  EXPECT_EQ(store.length(), 3u);
  EXPECT_TRUE(same_pixels(store.read(0), d));

  Exporter exporter(store);
  const std::vector<cv::Mat> listed = exporter.to_list();
  ASSERT_EQ(listed.size(), 3u);
  EXPECT_TRUE(same_pixels(listed[0], d));
  EXPECT_TRUE(same_pixels(listed[1], b));
  EXPECT_TRUE(same_pixels(listed[2], c));

  const std::vector<cv::Mat> ordered = exporter.time_ordered();
  ASSERT_EQ(ordered.size(), 3u);
  EXPECT_TRUE(same_pixels(ordered[0], b));
  EXPECT_TRUE(same_pixels(ordered[1], c));
  EXPECT_TRUE(same_pixels(ordered[2], d));
}

TEST(Exporter, BulkArchiveRoundTrip) {
  TempDir dir;
  EventLog log;
  FrameStore store(config_in(dir, 4), log.sink());
  store.write(make_frame(8, 5, CV_8UC1, 1));
  store.write(make_frame(3, 9, CV_16UC1, 2));
  store.write(make_frame(6, 6, CV_32FC3, 3));

  Exporter exporter(store);
  const std::string path = dir.file("dump.xraw");
  exporter.save_bulk(path, false);

  const std::vector<cv::Mat> expected = exporter.to_list();
  const std::vector<cv::Mat> loaded = camring::load_bulk(path);
  ASSERT_EQ(loaded.size(), expected.size());
  for (size_t i = 0; i < loaded.size(); ++i) EXPECT_TRUE(same_pixels(loaded[i], expected[i]));

  const camring::Archive archive = camring::load_archive(path);
  EXPECT_FALSE(archive.compressed);
  ASSERT_EQ(archive.entries.size(), 3u);
  EXPECT_EQ(archive.entries[2].slot_index, 2u);
  EXPECT_EQ(archive.entries[0].payload_bytes, 8u * 5u);
}

TEST(Exporter, CompressedBulkArchiveRoundTrip) {
  TempDir dir;
  EventLog log;
  FrameStore store(config_in(dir, 3), log.sink());
  // flat frames compress well, noisy ones barely at all
  store.write(cv::Mat(64, 64, CV_16UC1, cv::Scalar(1234)));
  store.write(make_frame(32, 16, CV_8UC3, 9));

  Exporter exporter(store);
  const std::string path = dir.file("dump.xlz4");
  exporter.save_bulk(path, true);

  const camring::Archive archive = camring::load_archive(path);
  EXPECT_TRUE(archive.compressed);
  ASSERT_EQ(archive.entries.size(), 2u);
  EXPECT_LT(archive.entries[0].payload_bytes, 64u * 64u * 2u);
  EXPECT_TRUE(same_pixels(archive.entries[0].frame, store.read(0)));
  EXPECT_TRUE(same_pixels(archive.entries[1].frame, store.read(1)));
}

TEST(Exporter, BulkExportWarnsThatMetadataIsDropped) {
  TempDir dir;
  EventLog log;
  FrameStore store(config_in(dir, 2), log.sink());
  store.write(make_frame(2, 2, CV_8UC1, 1));

  Exporter(store).save_bulk(dir.file("dump.xraw"));
  EXPECT_EQ(log.count(FrameStoreEventKind::MetadataDropped), 1u);
}

TEST(Exporter, SaveAsPicksFormatFromExtension) {
  TempDir dir;
  EventLog log;
  FrameStore store(config_in(dir, 2), log.sink());
  store.write(make_frame(2, 2, CV_8UC1, 1));
  Exporter exporter(store);

  exporter.save_as(dir.file("a.xraw"));
  EXPECT_FALSE(camring::load_archive(dir.file("a.xraw")).compressed);

  exporter.save_as(dir.file("b.xlz4"));
  EXPECT_TRUE(camring::load_archive(dir.file("b.xlz4")).compressed);

  for (const char *name : {"c.npz", "d.h5", "e.fits", "f.zip", "noext"}) {
    EXPECT_THROW(exporter.save_as(dir.file(name)), camring::UnsupportedFormatError) << name;
    EXPECT_FALSE(std::filesystem::exists(dir.file(name))) << name;
  }
  EXPECT_THROW(exporter.save_as(dir.file("g.npz")), camring::IoError);
}

TEST(Exporter, UnwritablePathIsIoError) {
  TempDir dir;
  EventLog log;
  FrameStore store(config_in(dir, 2), log.sink());
  store.write(make_frame(2, 2, CV_8UC1, 1));

  EXPECT_THROW(Exporter(store).save_bulk("/nonexistent/camring/dump.xraw"), camring::IoError);
}

TEST(Exporter, TruncatedOrForeignArchiveIsIoError) {
  TempDir dir;
  EventLog log;
  FrameStore store(config_in(dir, 2), log.sink());
  store.write(make_frame(16, 16, CV_8UC1, 1));

  const std::string path = dir.file("dump.xraw");
  Exporter(store).save_bulk(path);
  std::filesystem::resize_file(path, std::filesystem::file_size(path) - 10);
  EXPECT_THROW(camring::load_bulk(path), camring::IoError);

  const std::string foreign = dir.file("foreign.xraw");
  std::ofstream(foreign) << "definitely not an archive";
  EXPECT_THROW(camring::load_bulk(foreign), camring::IoError);

  EXPECT_THROW(camring::load_bulk(dir.file("missing.xraw")), camring::IoError);
}

namespace {

// Overwrite a little-endian uint32 of an archive in place.
void patch_u32(const std::string &path, std::streamoff offset, uint32_t value) {
  std::fstream f(path, std::ios::in | std::ios::out | std::ios::binary);
  f.seekp(offset);
  const char bytes[4] = {char(value & 0xff), char((value >> 8) & 0xff), char((value >> 16) & 0xff),
                         char((value >> 24) & 0xff)};
  f.write(bytes, 4);
}

// file header is 24 bytes; rows, cols and cv_type sit 16, 20 and 24 bytes into a record
constexpr std::streamoff kFirstRows = 24 + 16;
constexpr std::streamoff kFirstCols = 24 + 20;
constexpr std::streamoff kFirstType = 24 + 24;

}  // namespace

TEST(Exporter, ImpossibleFrameShapeIsIoError) {
  TempDir dir;
  EventLog log;
  FrameStore store(config_in(dir, 2), log.sink());
  store.write(make_frame(4, 4, CV_8UC1, 1));
  Exporter exporter(store);

  const std::string negative = dir.file("negative.xraw");
  exporter.save_bulk(negative);
  patch_u32(negative, kFirstRows, 0x80000000u);
  EXPECT_THROW(camring::load_bulk(negative), camring::IoError);

  // terabytes of pixels announced, 16 bytes on disk
  const std::string huge = dir.file("huge.xlz4");
  exporter.save_bulk(huge, true);
  patch_u32(huge, kFirstRows, 60000);
  patch_u32(huge, kFirstCols, 60000);
  patch_u32(huge, kFirstType, CV_MAKETYPE(CV_64F, 512));
  EXPECT_THROW(camring::load_bulk(huge), camring::IoError);

  const std::string foreign_type = dir.file("type.xraw");
  exporter.save_bulk(foreign_type);
  patch_u32(foreign_type, kFirstType, 0x7fffffff);
  EXPECT_THROW(camring::load_bulk(foreign_type), camring::IoError);
}

TEST(Exporter, RecordSizeIsLimitedToFourGiB) {
  // headers only: the shapes are never dereferenced
  uint8_t byte = 0;
  EXPECT_EQ(camring::record_bytes(cv::Mat(3, 5, CV_16UC3, &byte)), 3u * 5u * 6u);
  EXPECT_EQ(camring::record_bytes(cv::Mat(65536, 65535, CV_8UC1, &byte)), 65536u * 65535u);
  EXPECT_THROW(camring::record_bytes(cv::Mat(65536, 65536, CV_8UC1, &byte)), camring::IoError);
  EXPECT_THROW(camring::record_bytes(cv::Mat(40000, 40000, CV_32FC1, &byte)), camring::IoError);
}

TEST(Exporter, TimeOrderedPairsFramesWithTheirOwnStamps) {
  TempDir dir;
  EventLog log;
  FrameStore store(config_in(dir, 2), log.sink());
  const cv::Mat a = make_frame(3, 3, CV_8UC1, 1);
  const cv::Mat b = make_frame(3, 3, CV_8UC1, 2);
  const cv::Mat c = make_frame(3, 3, CV_8UC1, 3);
  store.write(a);
  std::this_thread::sleep_for(std::chrono::milliseconds(2));
  store.write(b);
  std::this_thread::sleep_for(std::chrono::milliseconds(2));
  store.write(c);

  // slot 0 (c) is newest, slot 1 (b) older
  const std::vector<cv::Mat> ordered = Exporter(store).time_ordered();
  ASSERT_EQ(ordered.size(), 2u);
  EXPECT_TRUE(same_pixels(ordered[0], b));
  EXPECT_TRUE(same_pixels(ordered[1], c));
}

TEST(Exporter, ClosedStoreCannotBeExported) {
  TempDir dir;
  EventLog log;
  FrameStore store(config_in(dir, 2), log.sink());
  store.write(make_frame(2, 2, CV_8UC1, 1));
  store.close();

  EXPECT_THROW(Exporter(store).to_list(), camring::ClosedError);
}
