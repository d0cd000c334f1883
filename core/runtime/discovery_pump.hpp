#pragma once

#include <atomic>
#include <cstddef>
#include <thread>

#include "registry/device_manager.hpp"
#include "transport/scan_event_queue.hpp"

namespace tactile {
namespace runtime {

/**
 * DiscoveryPump - single consumer of the scan-event channel.
 *
 * Applies found/lost/notification events to the DeviceManager in arrival
 * order, so a device's lifecycle is never reordered between scanners and
 * the registry.
 */
class DiscoveryPump {
public:
    DiscoveryPump(transport::ScanEventQueue &queue, registry::DeviceManager &devices);
    ~DiscoveryPump();

    DiscoveryPump(const DiscoveryPump &) = delete;
    DiscoveryPump &operator=(const DiscoveryPump &) = delete;

    bool start();

    // Drains what is already queued, then joins
    void stop();

    bool is_running() const { return running_; }

    // Applies one event; used by the pump thread and by tests
    void apply(const transport::ScanEvent &event);

    size_t processed_count() const { return processed_; }

private:
    void run();

    transport::ScanEventQueue &queue_;
    registry::DeviceManager &devices_;

    std::atomic<bool> running_{false};
    std::atomic<size_t> processed_{0};
    std::thread thread_;
};

}  // namespace runtime
}  // namespace tactile
