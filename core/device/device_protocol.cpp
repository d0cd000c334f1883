#include "device_protocol.hpp"

#include <cmath>
#include <set>
#include <sstream>
#include <type_traits>

namespace tactile {
namespace device {

DeviceProtocol::DeviceProtocol(std::string name, CapabilitySet capabilities)
    : name_(std::move(name)), capabilities_(std::move(capabilities)) {}

bool DeviceProtocol::translate(const DeviceCommand &command, std::vector<RawWrite> &writes, DeviceError &error) {
    return std::visit(
        [&](auto &&cmd) -> bool {
            using T = std::decay_t<decltype(cmd)>;
            if constexpr (std::is_same_v<T, ActuatorCommand>) {
                return translate_actuators(cmd, writes, error);
            } else if constexpr (std::is_same_v<T, RawWriteCommand>) {
                return translate_raw_write(cmd, writes, error);
            } else if constexpr (std::is_same_v<T, StopDeviceCommand>) {
                auto stop = stop_writes();
                writes.insert(writes.end(), stop.begin(), stop.end());
                return true;
            } else {
                error.set(ErrorCode::UNSUPPORTED_COMMAND, "Sensor reads are not write commands");
                return false;
            }
        },
        command);
}

std::vector<RawWrite> DeviceProtocol::stop_writes() {
    for (const auto &actuator : capabilities_.actuators) {
        if (actuator.kind == ActuatorKind::VIBRATE || actuator.kind == ActuatorKind::ROTATE) {
            last_sent_[actuator.index] = SentState{0, true};
        }
    }
    return encode_stop();
}

bool DeviceProtocol::interpret(const RawNotification &notification, std::vector<SensorReading> &readings,
                               DeviceError &error) {
    static_cast<void>(notification);
    static_cast<void>(readings);
    static_cast<void>(error);
    return true;
}

bool DeviceProtocol::sensor_read_request(uint32_t sensor_index, RawWrite &request, std::string &reply_endpoint,
                                         DeviceError &error) {
    const SensorDescriptor *sensor = capabilities_.find_sensor(sensor_index);
    if (sensor == nullptr) {
        error.set(ErrorCode::INVALID_ACTUATOR_INDEX, "Sensor index " + std::to_string(sensor_index) +
                                                         " not present on " + name_ + " device");
        return false;
    }
    return encode_sensor_read(*sensor, request, reply_endpoint, error);
}

void DeviceProtocol::invalidate_cache() { last_sent_.clear(); }

void DeviceProtocol::write_completed(const RawWrite &write) { static_cast<void>(write); }

bool DeviceProtocol::encode_sensor_read(const SensorDescriptor &sensor, RawWrite &request,
                                        std::string &reply_endpoint, DeviceError &error) {
    static_cast<void>(request);
    static_cast<void>(reply_endpoint);
    error.set(ErrorCode::UNSUPPORTED_COMMAND,
              std::string(sensor_kind_to_string(sensor.kind)) + " sensor cannot be read on demand");
    return false;
}

uint32_t DeviceProtocol::to_step(const ActuatorDescriptor &actuator, double value) {
    const double span = actuator.range.max - actuator.range.min;
    if (span <= 0.0 || actuator.step_count == 0) {
        return 0;
    }
    const double normalized = (value - actuator.range.min) / span;
    return static_cast<uint32_t>(std::lround(normalized * static_cast<double>(actuator.step_count)));
}

const ActuatorDescriptor &DeviceProtocol::actuator(uint32_t index) const {
    // Only called with validated indices
    return *capabilities_.find_actuator(index);
}

bool DeviceProtocol::validate_actuator_command(const ActuatorCommand &command, DeviceError &error) const {
    if (command.kind == ActuatorKind::RAW_WRITE) {
        error.set(ErrorCode::UNSUPPORTED_COMMAND, "RawWrite must be sent as a raw write command");
        return false;
    }

    if (command.settings.empty()) {
        error.set(ErrorCode::UNSUPPORTED_COMMAND,
                  std::string(actuator_kind_to_string(command.kind)) + " command has no settings");
        return false;
    }

    std::set<uint32_t> seen;
    for (const auto &setting : command.settings) {
        const ActuatorDescriptor *descriptor = capabilities_.find_actuator(setting.actuator_index);
        if (descriptor == nullptr) {
            error.set(ErrorCode::INVALID_ACTUATOR_INDEX, "Actuator index " + std::to_string(setting.actuator_index) +
                                                             " not present on " + name_ + " device");
            return false;
        }

        if (descriptor->kind != command.kind) {
            error.set(ErrorCode::UNSUPPORTED_COMMAND, "Actuator " + std::to_string(setting.actuator_index) + " is " +
                                                          actuator_kind_to_string(descriptor->kind) + ", not " +
                                                          actuator_kind_to_string(command.kind));
            return false;
        }

        if (!seen.insert(setting.actuator_index).second) {
            error.set(ErrorCode::UNSUPPORTED_COMMAND,
                      "Actuator index " + std::to_string(setting.actuator_index) + " given twice");
            return false;
        }

        if (!descriptor->range.contains(setting.value)) {
            std::ostringstream oss;
            oss << "Value " << setting.value << " outside range [" << descriptor->range.min << ", "
                << descriptor->range.max << "] for actuator " << setting.actuator_index;
            error.set(ErrorCode::OUT_OF_RANGE, oss.str());
            return false;
        }
    }

    return true;
}

bool DeviceProtocol::translate_actuators(const ActuatorCommand &command, std::vector<RawWrite> &writes,
                                         DeviceError &error) {
    if (!validate_actuator_command(command, error)) {
        return false;
    }

    std::vector<ActuatorSetting> changed;
    changed.reserve(command.settings.size());

    for (const auto &setting : command.settings) {
        if (command.kind == ActuatorKind::LINEAR) {
            changed.push_back(setting);
            continue;
        }

        const SentState next{to_step(actuator(setting.actuator_index), setting.value),
                             command.kind == ActuatorKind::ROTATE ? setting.clockwise : true};
        auto it = last_sent_.find(setting.actuator_index);
        if (it != last_sent_.end() && it->second.step == next.step && it->second.clockwise == next.clockwise) {
            continue;
        }
        changed.push_back(setting);
    }

    if (changed.empty()) {
        return true;
    }

    if (!encode_actuators(command.kind, changed, writes, error)) {
        return false;
    }

    if (command.kind != ActuatorKind::LINEAR) {
        for (const auto &setting : changed) {
            last_sent_[setting.actuator_index] = SentState{to_step(actuator(setting.actuator_index), setting.value),
                                                           command.kind == ActuatorKind::ROTATE ? setting.clockwise
                                                                                                : true};
        }
    }
    return true;
}

bool DeviceProtocol::translate_raw_write(const RawWriteCommand &command, std::vector<RawWrite> &writes,
                                         DeviceError &error) {
    const ActuatorDescriptor *descriptor = capabilities_.find_actuator(command.actuator_index);
    if (descriptor == nullptr) {
        error.set(ErrorCode::INVALID_ACTUATOR_INDEX, "Actuator index " + std::to_string(command.actuator_index) +
                                                         " not present on " + name_ + " device");
        return false;
    }
    if (descriptor->kind != ActuatorKind::RAW_WRITE) {
        error.set(ErrorCode::UNSUPPORTED_COMMAND,
                  "Actuator " + std::to_string(command.actuator_index) + " does not accept raw writes");
        return false;
    }
    if (command.data.empty()) {
        error.set(ErrorCode::OUT_OF_RANGE, "Raw write carries no data");
        return false;
    }

    RawWrite write;
    write.endpoint = descriptor->endpoint;
    write.data = command.data;
    write.write_with_response = command.write_with_response;
    writes.push_back(std::move(write));

    // Device state is now unknown to the protocol
    last_sent_.clear();
    return true;
}

}  // namespace device
}  // namespace tactile
