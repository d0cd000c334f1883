#ifndef TACTILE_REGISTRY_DEVICE_MANAGER_HPP
#define TACTILE_REGISTRY_DEVICE_MANAGER_HPP

#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "device/device.hpp"
#include "device/device_types.hpp"
#include "device/protocol_registry.hpp"
#include "events/event_emitter.hpp"

namespace tactile {
namespace registry {

struct RegisterResult {
    bool success = false;
    bool created = false;  // false when the identity was already registered
    device::DeviceIndex index = 0;
    device::ErrorCode code = device::ErrorCode::OK;
    std::string error_message;
};

struct DispatchResult {
    bool success = false;
    device::ErrorCode code = device::ErrorCode::OK;
    std::string error_message;
    std::vector<device::SensorReading> readings;  // SensorRead commands only
};

struct StopFailure {
    device::DeviceIndex index = 0;
    std::string device_name;
    device::ErrorCode code = device::ErrorCode::OK;
    std::string error_message;
};

struct StopAllReport {
    size_t attempted = 0;
    size_t succeeded = 0;
    std::vector<StopFailure> failures;

    bool all_succeeded() const { return failures.empty(); }
};

// By-value snapshot of a registered device
struct DeviceInfo {
    device::DeviceIndex index = 0;
    std::string name;
    std::string protocol;
    device::DeviceIdentity identity;
    device::CapabilitySet capabilities;
    bool connected = false;
};

/**
 * DeviceManager - central device registry and command router.
 *
 * Storage is an append-only arena: a Device's index is its position in
 * devices_ and is never reused. identity_to_index_ only maps identities that
 * are currently connected, so a device that comes back after removal is
 * registered again under a new index.
 *
 * Thread Safety:
 * - mutex_ (shared_mutex) guards the arena and the identity map, and is held
 *   only for lookup and mutation, never across protocol or transport calls
 * - translate + write run under the per-Device mutex (one command per device
 *   at a time; different devices proceed in parallel)
 * - lifecycle events are emitted while holding the Device's mutex so a
 *   subscriber observes them in processing order for that device
 * - lock order is Device mutex -> registry mutex
 * - nothing is thrown; every outcome is a typed result
 */
class DeviceManager {
public:
    // emitter may be null (no events)
    explicit DeviceManager(device::ProtocolRegistry protocols, events::EventEmitter *emitter = nullptr);

    DeviceManager(const DeviceManager &) = delete;
    DeviceManager &operator=(const DeviceManager &) = delete;

    // Discovery lifecycle
    RegisterResult register_device(const device::DeviceIdentity &identity, const device::DeviceProbe &probe);
    bool remove_device(const device::DeviceIdentity &identity);

    // Routing
    DispatchResult dispatch(device::DeviceIndex index, const device::DeviceCommand &command);

    // Safety sweeps: every device attempted, failures aggregated
    StopAllReport stop_all();
    StopAllReport stop_devices(const std::set<device::DeviceIndex> &indices);

    // Interpret a raw notification and emit SensorReading events
    bool handle_notification(const device::DeviceIdentity &identity, const device::RawNotification &notification);

    // Lookup - by-value snapshots
    std::vector<DeviceInfo> list_devices() const;  // connected only, index order
    std::optional<DeviceInfo> get_device_info(device::DeviceIndex index) const;

    // Indices ever allocated
    size_t device_count() const;
    size_t connected_count() const;

    // Shutdown: release every transport without emitting events
    void disconnect_all();

    const device::ProtocolRegistry &protocols() const { return protocols_; }

private:
    std::shared_ptr<device::Device> find(device::DeviceIndex index) const;
    std::shared_ptr<device::Device> find_connected(const device::DeviceIdentity &identity) const;

    StopAllReport stop_sweep(const std::vector<std::shared_ptr<device::Device>> &devices);

    // Requires the device's lock. Unmaps, disconnects and emits DeviceRemoved.
    void remove_locked(device::Device &device, const std::string &reason);

    static DeviceInfo snapshot(const device::Device &device);

    void emit(events::Event event);

    device::ProtocolRegistry protocols_;
    events::EventEmitter *emitter_;

    std::vector<std::shared_ptr<device::Device>> devices_;
    std::unordered_map<std::string, device::DeviceIndex> identity_to_index_;  // connected identities only

    mutable std::shared_mutex mutex_;
};

}  // namespace registry
}  // namespace tactile

#endif  // TACTILE_REGISTRY_DEVICE_MANAGER_HPP
