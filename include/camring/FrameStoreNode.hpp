#pragma once

#include <rclcpp/rclcpp.hpp>
#include <rclcpp_lifecycle/lifecycle_node.hpp>
#include <thread>
#include <atomic>
#include <memory>

#include "camring/FakeCamera.hpp"
#include "camring/FrameStore.hpp"
#include "camring/Recorder.hpp"

namespace camring
{

/**
 * @brief Lifecycle node that wraps a camera, a FrameStore and a Recorder.
 *
 * When configured, it opens the camera and creates the ring buffer file.
 * When activated, it starts acquiring into the ring buffer.
 * When deactivated, it stops, joins all threads and optionally exports.
 * On cleanup/shutdown, it closes the ring buffer file.
 */
class FrameStoreNode : public rclcpp_lifecycle::LifecycleNode
{
public:
    FrameStoreNode();
    ~FrameStoreNode() override;

    using CallbackReturn =
        rclcpp_lifecycle::node_interfaces::LifecycleNodeInterface::CallbackReturn;

protected:
    CallbackReturn on_configure(const rclcpp_lifecycle::State &) override;
    CallbackReturn on_activate(const rclcpp_lifecycle::State &) override;
    CallbackReturn on_deactivate(const rclcpp_lifecycle::State &) override;
    CallbackReturn on_cleanup(const rclcpp_lifecycle::State &) override;
    CallbackReturn on_shutdown(const rclcpp_lifecycle::State &) override;

private:
    void run_loop();
    void stop_acquisition();
    void release();
    rcl_interfaces::msg::SetParametersResult on_parameters(const std::vector<rclcpp::Parameter> & params);

    std::shared_ptr<ICamera> camera_;
    std::unique_ptr<FrameStore> store_;
    std::unique_ptr<Recorder> recorder_;
    rclcpp::node_interfaces::OnSetParametersCallbackHandle::SharedPtr param_cb_;

    std::thread worker_;
    std::atomic<bool> running_{false};
};

}  // namespace camring
