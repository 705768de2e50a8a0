#include "camring/FrameStoreNode.hpp"
#include "camring/Errors.hpp"
#include "camring/Exporter.hpp"

#include <chrono>

namespace camring
{

FrameStoreNode::FrameStoreNode()
    : rclcpp_lifecycle::LifecycleNode("camring")
{
    declare_parameter<int>("capacity", 100);
    declare_parameter<std::string>("directory", ".");
    declare_parameter<std::string>("filename", "rbuffer.h5");
    declare_parameter<bool>("recording", true);
    declare_parameter<std::vector<int64_t>>("roi", {10, 100, 10, 100});

    declare_parameter<int>("width", 640);
    declare_parameter<int>("height", 480);
    declare_parameter<int>("fps", 30);

    // empty = no export on deactivate; otherwise .xraw or .xlz4
    declare_parameter<std::string>("export_path", "");

    param_cb_ = add_on_set_parameters_callback(
        [this](const std::vector<rclcpp::Parameter> & params) { return on_parameters(params); });
}

FrameStoreNode::~FrameStoreNode()
{
    release();
}

FrameStoreNode::CallbackReturn FrameStoreNode::on_configure(const rclcpp_lifecycle::State &)
{
    FrameStoreConfig cfg;
    const int64_t capacity = get_parameter("capacity").as_int();
    cfg.capacity  = capacity > 0 ? static_cast<size_t>(capacity) : 0;
    cfg.directory = get_parameter("directory").as_string();
    cfg.filename  = get_parameter("filename").as_string();
    cfg.recording = get_parameter("recording").as_bool();

    const std::vector<int64_t> roi = get_parameter("roi").as_integer_array();
    if (roi.size() != 4) {
        RCLCPP_ERROR(get_logger(), "roi must have 4 values, got %zu", roi.size());
        return CallbackReturn::FAILURE;
    }
    cfg.roi = cv::Rect(static_cast<int>(roi[0]), static_cast<int>(roi[1]),
                       static_cast<int>(roi[2]), static_cast<int>(roi[3]));

    const int width  = get_parameter("width").as_int();
    const int height = get_parameter("height").as_int();
    const int fps    = get_parameter("fps").as_int();

    auto logger = get_logger();
    EventSink sink = [logger](const FrameStoreEvent & ev) {
        switch (ev.kind) {
        case FrameStoreEventKind::RecordingPaused:
        case FrameStoreEventKind::RecordingResumed:
            RCLCPP_DEBUG(logger, "%s", ev.message.c_str());
            break;
        case FrameStoreEventKind::MetadataDropped:
        case FrameStoreEventKind::CloseFailed:
            RCLCPP_WARN(logger, "%s: %s", to_string(ev.kind), ev.message.c_str());
            break;
        default:
            RCLCPP_INFO(logger, "ring buffer %s: %s", to_string(ev.kind), ev.message.c_str());
        }
    };

    try {
        camera_ = std::make_shared<FakeCamera>(width, height, fps);
        camera_->open();
        camera_->configure_roi(cfg.roi);
        store_ = FrameStore::open(cfg, sink);
        RCLCPP_INFO(get_logger(), "Configured FakeCamera %dx%d @ %d fps, %zu slots in %s",
                    width, height, fps, cfg.capacity, store_->path().c_str());
        return CallbackReturn::SUCCESS;
    } catch (const Error & e) {
        RCLCPP_ERROR(get_logger(), "Configure failed: %s", e.what());
        release();
        return CallbackReturn::FAILURE;
    }
}

FrameStoreNode::CallbackReturn FrameStoreNode::on_activate(const rclcpp_lifecycle::State &)
{
    if (!camera_ || !store_) {
        RCLCPP_ERROR(get_logger(), "Camera not configured.");
        return CallbackReturn::FAILURE;
    }

    try {
        camera_->start();
    } catch (const DeviceError & e) {
        RCLCPP_ERROR(get_logger(), "Camera start failed: %s", e.what());
        return CallbackReturn::FAILURE;
    }

    recorder_ = std::make_unique<Recorder>(*camera_, *store_);
    recorder_->start(100);

    running_ = true;
    worker_ = std::thread(&FrameStoreNode::run_loop, this);

    RCLCPP_INFO(get_logger(), "Camera active and recording to %s", store_->path().c_str());
    return CallbackReturn::SUCCESS;
}

FrameStoreNode::CallbackReturn FrameStoreNode::on_deactivate(const rclcpp_lifecycle::State &)
{
    stop_acquisition();

    const std::string export_path = get_parameter("export_path").as_string();
    if (!export_path.empty() && store_) {
        try {
            Exporter(*store_).save_as(export_path);
            RCLCPP_INFO(get_logger(), "Exported ring buffer to %s", export_path.c_str());
        } catch (const Error & e) {
            RCLCPP_ERROR(get_logger(), "Export failed: %s", e.what());
        }
    }

    RCLCPP_INFO(get_logger(), "Camera deactivated and recording stopped.");
    return CallbackReturn::SUCCESS;
}

FrameStoreNode::CallbackReturn FrameStoreNode::on_cleanup(const rclcpp_lifecycle::State &)
{
    release();
    RCLCPP_INFO(get_logger(), "Ring buffer closed.");
    return CallbackReturn::SUCCESS;
}

FrameStoreNode::CallbackReturn FrameStoreNode::on_shutdown(const rclcpp_lifecycle::State &)
{
    release();
    return CallbackReturn::SUCCESS;
}

void FrameStoreNode::stop_acquisition()
{
    running_ = false;
    if (worker_.joinable()) worker_.join();

    if (recorder_) recorder_->stop();
    if (camera_)  camera_->stop();
    recorder_.reset();
}

void FrameStoreNode::release()
{
    stop_acquisition();
    if (store_) {
        try {
            store_->close();
        } catch (const StorageError & e) {
            RCLCPP_ERROR(get_logger(), "Ring buffer close failed: %s", e.what());
        }
        store_.reset();
    }
    if (camera_) camera_->close();
    camera_.reset();
}

rcl_interfaces::msg::SetParametersResult
FrameStoreNode::on_parameters(const std::vector<rclcpp::Parameter> & params)
{
    rcl_interfaces::msg::SetParametersResult result;
    result.successful = true;
    for (const auto & p : params) {
        if (p.get_name() != "recording" || !store_) continue;
        try {
            store_->set_recording_state(p.as_bool());
            RCLCPP_INFO(get_logger(), "Ring buffer recording %s", p.as_bool() ? "on" : "off");
        } catch (const ClosedError & e) {
            result.successful = false;
            result.reason = e.what();
        }
    }
    return result;
}

void FrameStoreNode::run_loop()
{
    uint64_t last_count = recorder_->frames_pushed();
    auto last_heartbeat = std::chrono::steady_clock::now();

    while (running_ && rclcpp::ok()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        if (!recorder_->running()) {
            if (auto err = recorder_->last_error()) {
                try {
                    std::rethrow_exception(err);
                } catch (const std::exception & e) {
                    RCLCPP_ERROR(get_logger(), "Acquisition stopped: %s", e.what());
                }
            }
            break;
        }

        try {
            RCLCPP_INFO_THROTTLE(get_logger(), *get_clock(), 2000,
                                 "Write cursor at slot %zu, %zu slots occupied",
                                 store_->index(), store_->length());
        } catch (const Error & e) {
            RCLCPP_WARN(get_logger(), "Ring buffer status unavailable: %s", e.what());
        }

        // --- Heartbeat: print FPS every second ---
        auto now = std::chrono::steady_clock::now();
        double elapsed = std::chrono::duration<double>(now - last_heartbeat).count();
        if (elapsed >= 1.0) {
            const uint64_t count = recorder_->frames_pushed();
            double fps_est = (count - last_count) / elapsed;
            RCLCPP_INFO(get_logger(), "Heartbeat: %.2f fps (%.0f frames in %.2fs, %lu timeouts)",
                        fps_est, (double)(count - last_count), elapsed,
                        (unsigned long)recorder_->timeouts());
            last_count = count;
            last_heartbeat = now;
        }
    }
}

}  // namespace camring
