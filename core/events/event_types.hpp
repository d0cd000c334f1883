#pragma once

/**
 * @file event_types.hpp
 * @brief Events emitted by the DeviceManager
 *
 * Consumed by one Session per connected client (forwarded as id-0 messages).
 *
 * Design principles:
 * - Events are immutable value types (cheap enough to copy per subscriber)
 * - Lifecycle events for one device are emitted under that device's lock,
 *   so every subscriber sees them in registry processing order
 * - Timestamps are epoch milliseconds
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "device/device_types.hpp"

namespace tactile {
namespace events {

/**
 * @brief A device was registered and is ready for commands
 */
struct DeviceAddedEvent {
    uint64_t event_id = 0;
    device::DeviceIndex device_index = 0;
    std::string device_name;
    device::CapabilitySet capabilities;
    int64_t timestamp_ms = 0;
};

/**
 * @brief A device was lost or found unreachable; its index is now inactive
 */
struct DeviceRemovedEvent {
    uint64_t event_id = 0;
    device::DeviceIndex device_index = 0;
    std::string device_name;
    int64_t timestamp_ms = 0;
};

/**
 * @brief Unsolicited sensor data interpreted from a device notification
 */
struct SensorReadingEvent {
    uint64_t event_id = 0;
    device::DeviceIndex device_index = 0;
    std::vector<device::SensorReading> readings;
    int64_t timestamp_ms = 0;
};

using Event = std::variant<DeviceAddedEvent, DeviceRemovedEvent, SensorReadingEvent>;

inline int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

inline uint64_t get_event_id(const Event &event) {
    return std::visit([](auto &&e) { return e.event_id; }, event);
}

inline device::DeviceIndex get_device_index(const Event &event) {
    return std::visit([](auto &&e) { return e.device_index; }, event);
}

inline int64_t get_timestamp_ms(const Event &event) {
    return std::visit([](auto &&e) { return e.timestamp_ms; }, event);
}

}  // namespace events
}  // namespace tactile
