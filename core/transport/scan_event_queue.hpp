#pragma once

/**
 * @file scan_event_queue.hpp
 * @brief Channel from transport scanners to the discovery pump
 *
 * Scanners run on their own threads (radio stacks, serial enumerators) and
 * push events here. A single consumer (runtime::DiscoveryPump) drains the
 * queue and applies events to the DeviceManager in arrival order.
 *
 * Unlike the event emitter's subscriber queues this channel never drops:
 * a lost DeviceLost would leave a dead device registered. When full, push()
 * waits for space up to the given timeout and reports failure.
 */

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <variant>

#include "device/device_types.hpp"

namespace tactile {
namespace transport {

struct DeviceFound {
    device::DeviceIdentity identity;
    device::DeviceProbe probe;
};

struct DeviceLost {
    device::DeviceIdentity identity;
};

struct DeviceNotification {
    device::DeviceIdentity identity;
    device::RawNotification notification;
};

using ScanEvent = std::variant<DeviceFound, DeviceLost, DeviceNotification>;

class ScanEventQueue {
public:
    explicit ScanEventQueue(size_t max_size = 1024);

    ScanEventQueue(const ScanEventQueue &) = delete;
    ScanEventQueue &operator=(const ScanEventQueue &) = delete;

    // Producer side. Returns false if the queue is closed or stayed full for timeout_ms.
    bool push(ScanEvent event, int timeout_ms = 1000);

    // Consumer side. Blocks up to timeout_ms (0 = non-blocking).
    std::optional<ScanEvent> pop(int timeout_ms = 0);

    // Wakes every waiter; subsequent pushes fail, pops drain what is left
    void close();
    bool is_closed() const;

    size_t size() const;

private:
    const size_t max_size_;

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<ScanEvent> queue_;
    bool closed_ = false;
};

}  // namespace transport
}  // namespace tactile
