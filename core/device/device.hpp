#ifndef TACTILE_DEVICE_DEVICE_HPP
#define TACTILE_DEVICE_DEVICE_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "device/device_protocol.hpp"
#include "device/device_types.hpp"
#include "transport/i_device_transport.hpp"

namespace tactile {
namespace device {

/**
 * Device - one connected unit.
 *
 * Thread Safety:
 * - identity/capabilities/index are immutable and may be read without locking
 * - every *_locked() method requires the caller to hold lock(); this serializes
 *   translate + write per device so raw frames never interleave
 * - is_connected() is atomic and safe from any thread
 */
class Device {
public:
    Device(DeviceIndex index, DeviceIdentity identity, std::unique_ptr<DeviceProtocol> protocol,
           std::shared_ptr<transport::IDeviceTransport> transport);

    Device(const Device &) = delete;
    Device &operator=(const Device &) = delete;

    DeviceIndex index() const { return index_; }
    const DeviceIdentity &identity() const { return identity_; }
    const CapabilitySet &capabilities() const { return protocol_->capabilities(); }
    const std::string &protocol_name() const { return protocol_->name(); }

    bool is_connected() const { return connected_.load(); }

    std::unique_lock<std::mutex> lock() { return std::unique_lock<std::mutex>(mutex_); }

    // Translate and write. SensorRead commands fill readings.
    bool execute_locked(const DeviceCommand &command, std::vector<SensorReading> &readings, DeviceError &error);

    // Attempts every stop write even after a failure; error holds the first one
    bool stop_locked(DeviceError &error);

    bool interpret_locked(const RawNotification &notification, std::vector<SensorReading> &readings,
                          DeviceError &error);

    // False once the transport says the device is gone (or was released)
    bool transport_reachable_locked() const;

    // Mark disconnected and release the transport handle
    void disconnect_locked();

    static constexpr int SENSOR_READ_TIMEOUT_MS = 1000;

private:
    bool write_all_locked(const std::vector<RawWrite> &writes, DeviceError &error);
    bool write_one_locked(const RawWrite &write, DeviceError &error);
    bool read_sensor_locked(uint32_t sensor_index, std::vector<SensorReading> &readings, DeviceError &error);

    const DeviceIndex index_;
    const DeviceIdentity identity_;
    std::unique_ptr<DeviceProtocol> protocol_;
    std::shared_ptr<transport::IDeviceTransport> transport_;
    std::atomic<bool> connected_{true};

    std::mutex mutex_;
};

}  // namespace device
}  // namespace tactile

#endif  // TACTILE_DEVICE_DEVICE_HPP
