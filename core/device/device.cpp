#include "device.hpp"

#include "logging/logger.hpp"

namespace tactile {
namespace device {

Device::Device(DeviceIndex index, DeviceIdentity identity, std::unique_ptr<DeviceProtocol> protocol,
               std::shared_ptr<transport::IDeviceTransport> transport)
    : index_(index), identity_(std::move(identity)), protocol_(std::move(protocol)), transport_(std::move(transport)) {}

bool Device::execute_locked(const DeviceCommand &command, std::vector<SensorReading> &readings, DeviceError &error) {
    if (!connected_.load() || !transport_) {
        error.set(ErrorCode::DEVICE_NOT_CONNECTED, "Device " + std::to_string(index_) + " is not connected");
        return false;
    }

    if (const auto *read = std::get_if<SensorReadCommand>(&command)) {
        return read_sensor_locked(read->sensor_index, readings, error);
    }

    std::vector<RawWrite> writes;
    if (!protocol_->translate(command, writes, error)) {
        return false;
    }

    if (writes.empty()) {
        LOG_DEBUG("[Device] " << identity_.name << " (" << index_ << "): " << command_name(command)
                              << " suppressed, no change");
        return true;
    }

    return write_all_locked(writes, error);
}

bool Device::stop_locked(DeviceError &error) {
    if (!connected_.load() || !transport_) {
        error.set(ErrorCode::DEVICE_NOT_CONNECTED, "Device " + std::to_string(index_) + " is not connected");
        return false;
    }

    // Every stop write is attempted; the first failure is reported
    bool ok = true;
    for (const auto &write : protocol_->stop_writes()) {
        DeviceError write_error;
        if (write_one_locked(write, write_error)) {
            continue;
        }
        if (ok) {
            error = write_error;
            ok = false;
        }
    }
    return ok;
}

bool Device::interpret_locked(const RawNotification &notification, std::vector<SensorReading> &readings,
                              DeviceError &error) {
    return protocol_->interpret(notification, readings, error);
}

bool Device::transport_reachable_locked() const { return transport_ && transport_->is_reachable(); }

void Device::disconnect_locked() {
    connected_.store(false);
    if (transport_) {
        transport_->disconnect();
        transport_.reset();
    }
}

bool Device::write_all_locked(const std::vector<RawWrite> &writes, DeviceError &error) {
    for (const auto &write : writes) {
        if (!write_one_locked(write, error)) {
            return false;
        }
    }
    return true;
}

bool Device::write_one_locked(const RawWrite &write, DeviceError &error) {
    if (!transport_->write(write)) {
        // Unknown what reached the hardware
        protocol_->invalidate_cache();
        error.set(ErrorCode::TRANSPORT_ERROR, "Write to " + identity_.name + " endpoint '" + write.endpoint +
                                                  "' failed: " + transport_->last_error());
        return false;
    }
    protocol_->write_completed(write);
    return true;
}

bool Device::read_sensor_locked(uint32_t sensor_index, std::vector<SensorReading> &readings, DeviceError &error) {
    RawWrite request;
    std::string reply_endpoint;
    if (!protocol_->sensor_read_request(sensor_index, request, reply_endpoint, error)) {
        return false;
    }

    if (!request.data.empty() && !transport_->write(request)) {
        error.set(ErrorCode::TRANSPORT_ERROR,
                  "Sensor request to " + identity_.name + " failed: " + transport_->last_error());
        return false;
    }

    RawNotification reply;
    reply.endpoint = reply_endpoint;
    if (!transport_->read(reply_endpoint, reply.data, SENSOR_READ_TIMEOUT_MS)) {
        error.set(ErrorCode::TRANSPORT_ERROR,
                  "Sensor read from " + identity_.name + " failed: " + transport_->last_error());
        return false;
    }

    if (!protocol_->interpret(reply, readings, error)) {
        return false;
    }

    if (readings.empty()) {
        error.set(ErrorCode::TRANSPORT_ERROR, "Sensor reply from " + identity_.name + " carried no reading");
        return false;
    }
    return true;
}

}  // namespace device
}  // namespace tactile
