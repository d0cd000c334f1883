#include "device_manager.hpp"

#include <mutex>
#include <utility>

#include "logging/logger.hpp"

namespace tactile {
namespace registry {

using device::Device;
using device::DeviceError;
using device::DeviceIndex;
using device::ErrorCode;

DeviceManager::DeviceManager(device::ProtocolRegistry protocols, events::EventEmitter *emitter)
    : protocols_(std::move(protocols)), emitter_(emitter) {}

RegisterResult DeviceManager::register_device(const device::DeviceIdentity &identity,
                                              const device::DeviceProbe &probe) {
    RegisterResult result;

    // Idempotent for identities that are still connected
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = identity_to_index_.find(identity.key());
        if (it != identity_to_index_.end()) {
            result.success = true;
            result.index = it->second;
            return result;
        }
    }

    if (!probe.transport) {
        result.code = ErrorCode::TRANSPORT_ERROR;
        result.error_message = "Device '" + identity.name + "' found without a transport handle";
        LOG_ERROR("[DeviceManager] " << result.error_message);
        return result;
    }

    // Protocol match and capability build happen outside the registry lock
    DeviceError error;
    std::unique_ptr<device::DeviceProtocol> protocol = protocols_.create(identity, probe, error);
    if (!protocol) {
        result.code = error.code;
        result.error_message = error.message;
        LOG_WARN("[DeviceManager] " << identity.key() << ": " << error.message);
        return result;
    }

    std::shared_ptr<Device> device;
    std::unique_lock<std::mutex> device_lock;

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        // Lost a race with another registration of the same identity
        auto it = identity_to_index_.find(identity.key());
        if (it != identity_to_index_.end()) {
            result.success = true;
            result.index = it->second;
            return result;
        }

        const auto index = static_cast<DeviceIndex>(devices_.size());
        device = std::make_shared<Device>(index, identity, std::move(protocol), probe.transport);

        // Not yet visible to anyone else, so this cannot block
        device_lock = device->lock();

        devices_.push_back(device);
        identity_to_index_[identity.key()] = index;
    }

    result.success = true;
    result.created = true;
    result.index = device->index();

    LOG_INFO("[DeviceManager] Registered " << identity.name << " (" << identity.key() << ") as device "
                                           << result.index << " using " << device->protocol_name() << " ("
                                           << device->capabilities().actuators.size() << " actuators, "
                                           << device->capabilities().sensors.size() << " sensors)");

    events::DeviceAddedEvent added;
    added.device_index = device->index();
    added.device_name = identity.name;
    added.capabilities = device->capabilities();
    added.timestamp_ms = events::now_epoch_ms();
    emit(std::move(added));

    return result;
}

bool DeviceManager::remove_device(const device::DeviceIdentity &identity) {
    std::shared_ptr<Device> device = find_connected(identity);
    if (!device) {
        LOG_DEBUG("[DeviceManager] Remove for unknown identity " << identity.key() << " ignored");
        return false;
    }

    auto lock = device->lock();
    if (!device->is_connected()) {
        return false;
    }
    remove_locked(*device, "lost by scanner");
    return true;
}

DispatchResult DeviceManager::dispatch(DeviceIndex index, const device::DeviceCommand &command) {
    DispatchResult result;

    std::shared_ptr<Device> device = find(index);
    if (!device) {
        result.code = ErrorCode::UNKNOWN_DEVICE;
        result.error_message = "Unknown device index " + std::to_string(index);
        return result;
    }

    auto lock = device->lock();

    if (!device->is_connected()) {
        result.code = ErrorCode::DEVICE_NOT_CONNECTED;
        result.error_message = "Device " + std::to_string(index) + " is no longer connected";
        return result;
    }

    DeviceError error;
    if (device->execute_locked(command, result.readings, error)) {
        result.success = true;
        return result;
    }

    result.code = error.code;
    result.error_message = error.message;

    if (error.code == ErrorCode::TRANSPORT_ERROR) {
        LOG_ERROR("[DeviceManager] " << device::command_name(command) << " on device " << index << " failed: "
                                     << error.message);
        if (!device->transport_reachable_locked()) {
            remove_locked(*device, "transport unreachable");
        }
    } else {
        LOG_DEBUG("[DeviceManager] " << device::command_name(command) << " on device " << index << " rejected: "
                                     << device::error_code_to_string(error.code) << ": " << error.message);
    }

    return result;
}

StopAllReport DeviceManager::stop_all() {
    std::vector<std::shared_ptr<Device>> targets;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto &device : devices_) {
            if (device->is_connected()) {
                targets.push_back(device);
            }
        }
    }

    LOG_INFO("[DeviceManager] Stop all: " << targets.size() << " connected devices");
    return stop_sweep(targets);
}

StopAllReport DeviceManager::stop_devices(const std::set<DeviceIndex> &indices) {
    std::vector<std::shared_ptr<Device>> targets;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (DeviceIndex index : indices) {
            if (index < devices_.size() && devices_[index]->is_connected()) {
                targets.push_back(devices_[index]);
            }
        }
    }

    LOG_INFO("[DeviceManager] Stop " << targets.size() << " of " << indices.size() << " requested devices");
    return stop_sweep(targets);
}

StopAllReport DeviceManager::stop_sweep(const std::vector<std::shared_ptr<Device>> &devices) {
    StopAllReport report;

    for (const auto &device : devices) {
        auto lock = device->lock();
        if (!device->is_connected()) {
            continue;  // removed since the snapshot
        }

        ++report.attempted;

        DeviceError error;
        if (device->stop_locked(error)) {
            ++report.succeeded;
            continue;
        }

        LOG_ERROR("[DeviceManager] Stop failed for device " << device->index() << " (" << device->identity().name
                                                            << "): " << error.message);
        report.failures.push_back(StopFailure{device->index(), device->identity().name, error.code, error.message});

        if (error.code == ErrorCode::TRANSPORT_ERROR && !device->transport_reachable_locked()) {
            remove_locked(*device, "transport unreachable during stop");
        }
    }

    if (!report.failures.empty()) {
        LOG_WARN("[DeviceManager] Stop sweep: " << report.succeeded << "/" << report.attempted << " succeeded");
    }
    return report;
}

bool DeviceManager::handle_notification(const device::DeviceIdentity &identity,
                                        const device::RawNotification &notification) {
    std::shared_ptr<Device> device = find_connected(identity);
    if (!device) {
        LOG_DEBUG("[DeviceManager] Notification for unregistered " << identity.key() << " dropped");
        return false;
    }

    auto lock = device->lock();
    if (!device->is_connected()) {
        return false;
    }

    std::vector<device::SensorReading> readings;
    DeviceError error;
    if (!device->interpret_locked(notification, readings, error)) {
        LOG_WARN("[DeviceManager] Device " << device->index() << " notification on '" << notification.endpoint
                                           << "' not understood: " << error.message);
        return false;
    }

    if (readings.empty()) {
        return true;
    }

    events::SensorReadingEvent event;
    event.device_index = device->index();
    event.readings = std::move(readings);
    event.timestamp_ms = events::now_epoch_ms();
    emit(std::move(event));
    return true;
}

std::vector<DeviceInfo> DeviceManager::list_devices() const {
    std::vector<std::shared_ptr<Device>> devices;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        devices = devices_;
    }

    std::vector<DeviceInfo> result;
    for (const auto &device : devices) {
        if (device->is_connected()) {
            result.push_back(snapshot(*device));
        }
    }
    return result;
}

std::optional<DeviceInfo> DeviceManager::get_device_info(DeviceIndex index) const {
    std::shared_ptr<Device> device = find(index);
    if (!device) {
        return std::nullopt;
    }
    return snapshot(*device);
}

size_t DeviceManager::device_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return devices_.size();
}

size_t DeviceManager::connected_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return identity_to_index_.size();
}

void DeviceManager::disconnect_all() {
    std::vector<std::shared_ptr<Device>> devices;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        devices = devices_;
        identity_to_index_.clear();
    }

    for (const auto &device : devices) {
        auto lock = device->lock();
        device->disconnect_locked();
    }
}

std::shared_ptr<Device> DeviceManager::find(DeviceIndex index) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (index >= devices_.size()) {
        return nullptr;
    }
    return devices_[index];
}

std::shared_ptr<Device> DeviceManager::find_connected(const device::DeviceIdentity &identity) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = identity_to_index_.find(identity.key());
    if (it == identity_to_index_.end()) {
        return nullptr;
    }
    return devices_[it->second];
}

void DeviceManager::remove_locked(Device &device, const std::string &reason) {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = identity_to_index_.find(device.identity().key());
        if (it != identity_to_index_.end() && it->second == device.index()) {
            identity_to_index_.erase(it);
        }
    }

    device.disconnect_locked();

    LOG_INFO("[DeviceManager] Removed device " << device.index() << " (" << device.identity().name << "): " << reason);

    events::DeviceRemovedEvent removed;
    removed.device_index = device.index();
    removed.device_name = device.identity().name;
    removed.timestamp_ms = events::now_epoch_ms();
    emit(std::move(removed));
}

DeviceInfo DeviceManager::snapshot(const Device &device) {
    DeviceInfo info;
    info.index = device.index();
    info.name = device.identity().name;
    info.protocol = device.protocol_name();
    info.identity = device.identity();
    info.capabilities = device.capabilities();
    info.connected = device.is_connected();
    return info;
}

void DeviceManager::emit(events::Event event) {
    if (emitter_ != nullptr) {
        emitter_->emit(std::move(event));
    }
}

}  // namespace registry
}  // namespace tactile
