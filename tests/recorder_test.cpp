#include <gtest/gtest.h>

#include <exception>

#include "camring/Errors.hpp"
#include "camring/FakeCamera.hpp"
#include "camring/FrameStore.hpp"
#include "camring/Recorder.hpp"
#include "test_util.hpp"

using camring::DeviceError;
using camring::DeviceErrorCode;
using camring::FakeCamera;
using camring::FrameStore;
using camring::Recorder;
using namespace camring_test;

namespace {

DeviceErrorCode device_code(std::exception_ptr err) {
  try {
    std::rethrow_exception(err);
  } catch (const DeviceError &e) {
    return e.code();
  }
}

}  // namespace

TEST(FakeCamera, FramesFollowTheRoi) {
  FakeCamera cam(64, 48, 0);
  cam.open();
  cam.start();

  cv::Mat full = cam.acquire_frame();
  EXPECT_EQ(full.cols, 64);
  EXPECT_EQ(full.rows, 48);
  EXPECT_EQ(full.type(), CV_8UC1);

  cam.configure_roi(cv::Rect(8, 4, 16, 10));
  EXPECT_EQ(cam.roi(), cv::Rect(8, 4, 16, 10));
  cv::Mat cropped = cam.acquire_frame();
  EXPECT_EQ(cropped.cols, 16);
  EXPECT_EQ(cropped.rows, 10);
  EXPECT_EQ(cam.frames_generated(), 2u);
}

TEST(FakeCamera, KeepsRequestedType) {
  FakeCamera cam(10, 6, 0, CV_16UC3);
  cam.open();
  cam.start();
  EXPECT_EQ(cam.acquire_frame().type(), CV_16UC3);
}

TEST(FakeCamera, RejectsRoiOutsideSensor) {
  FakeCamera cam(64, 48, 0);
  cam.open();

  for (const cv::Rect &bad : {cv::Rect(60, 0, 10, 10), cv::Rect(-1, 0, 5, 5), cv::Rect(0, 0, 0, 4)}) {
    try {
      cam.configure_roi(bad);
      ADD_FAILURE() << "accepted " << bad;
    } catch (const DeviceError &e) {
      EXPECT_EQ(e.code(), DeviceErrorCode::InvalidParameter);
    }
  }
  EXPECT_EQ(cam.roi(), cv::Rect(0, 0, 64, 48));
}

TEST(FakeCamera, MustBeOpenedAndStarted) {
  FakeCamera cam(8, 8, 0);
  try {
    cam.start();
    ADD_FAILURE() << "started an unopened camera";
  } catch (const DeviceError &e) {
    EXPECT_EQ(e.code(), DeviceErrorCode::Disconnected);
  }

  cam.open();
  try {
    cam.acquire_frame();
    ADD_FAILURE() << "acquired from a stopped camera";
  } catch (const DeviceError &e) {
    EXPECT_EQ(e.code(), DeviceErrorCode::NotRunning);
  }
}

TEST(Recorder, FillsTheRingWithCameraFrames) {
  TempDir dir;
  EventLog log;
  FrameStore store(config_in(dir, 4), log.sink());
  FakeCamera cam(32, 24, 0);
  cam.open();
  cam.configure_roi(cv::Rect(2, 3, 8, 6));
  cam.start();

  Recorder recorder(cam, store);
  ASSERT_TRUE(recorder.start(50));
  EXPECT_FALSE(recorder.start(50));
  ASSERT_TRUE(wait_for([&] { return recorder.frames_pushed() >= 6; }));
  recorder.stop();
  EXPECT_FALSE(recorder.running());
  EXPECT_FALSE(recorder.last_error());

  EXPECT_EQ(store.length(), 4u);
  EXPECT_EQ(store.index(), recorder.frames_pushed() % 4);
  EXPECT_EQ(store.roi(0), cv::Rect(2, 3, 8, 6));
  EXPECT_EQ(store.read(1).size(), cv::Size(8, 6));
}

TEST(Recorder, RecordsTheConfiguredRoi) {
  TempDir dir;
  EventLog log;
  auto cfg = config_in(dir, 3);
  cfg.roi = cv::Rect(10, 100, 10, 100);
  FrameStore store(cfg, log.sink());

  // same wiring as the node: the configured roi is applied to the sensor
  FakeCamera cam(640, 480, 0);
  cam.open();
  cam.configure_roi(store.default_roi());
  cam.start();

  Recorder recorder(cam, store);
  recorder.start(50);
  ASSERT_TRUE(wait_for([&] { return recorder.frames_pushed() >= 2; }));
  recorder.stop();

  EXPECT_EQ(store.roi(0), cfg.roi);
  EXPECT_EQ(store.read(1).size(), cfg.roi.size());
}

TEST(Recorder, SkipsTimeouts) {
  TempDir dir;
  EventLog log;
  FrameStore store(config_in(dir, 8), log.sink());
  FakeCamera cam(8, 8, 0);
  cam.open();
  cam.start();
  cam.inject_fault(DeviceErrorCode::Timeout);

  Recorder recorder(cam, store);
  recorder.start();
  ASSERT_TRUE(wait_for([&] { return recorder.frames_pushed() >= 3; }));
  recorder.stop();

  EXPECT_EQ(recorder.timeouts(), 1u);
  EXPECT_FALSE(recorder.last_error());
}

TEST(Recorder, StopsOnDeviceFailure) {
  TempDir dir;
  EventLog log;
  FrameStore store(config_in(dir, 8), log.sink());
  FakeCamera cam(8, 8, 0);
  cam.open();
  cam.start();
  cam.inject_fault(DeviceErrorCode::Disconnected);

  Recorder recorder(cam, store);
  recorder.start();
  ASSERT_TRUE(wait_for([&] { return !recorder.running(); }));

  ASSERT_TRUE(recorder.last_error());
  EXPECT_EQ(device_code(recorder.last_error()), DeviceErrorCode::Disconnected);
  EXPECT_EQ(recorder.frames_pushed(), 0u);
  EXPECT_EQ(store.length(), 0u);
}

TEST(Recorder, StopsWhenTheStoreIsClosed) {
  TempDir dir;
  EventLog log;
  FrameStore store(config_in(dir, 4), log.sink());
  FakeCamera cam(8, 8, 0);
  cam.open();
  cam.start();

  Recorder recorder(cam, store);
  recorder.start();
  ASSERT_TRUE(wait_for([&] { return recorder.frames_pushed() >= 1; }));
  store.close();
  ASSERT_TRUE(wait_for([&] { return !recorder.running(); }));

  ASSERT_TRUE(recorder.last_error());
  EXPECT_THROW(std::rethrow_exception(recorder.last_error()), camring::ClosedError);
}

TEST(Recorder, PausedStoreIgnoresFrames) {
  TempDir dir;
  EventLog log;
  FrameStore store(config_in(dir, 4), log.sink());
  store.set_recording_state(false);
  FakeCamera cam(8, 8, 0);
  cam.open();
  cam.start();

  Recorder recorder(cam, store);
  recorder.start();
  ASSERT_TRUE(wait_for([&] { return recorder.frames_pushed() >= 5; }));
  recorder.stop();

  EXPECT_EQ(store.length(), 0u);
  EXPECT_EQ(store.index(), 0u);
}
