#include "device_types.hpp"

#include <algorithm>
#include <type_traits>

namespace tactile {
namespace device {

const char *error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
            return "Ok";
        case ErrorCode::HANDSHAKE_REQUIRED:
            return "HandshakeRequired";
        case ErrorCode::VERSION_MISMATCH:
            return "VersionMismatch";
        case ErrorCode::DUPLICATE_MESSAGE_ID:
            return "DuplicateMessageId";
        case ErrorCode::UNEXPECTED_MESSAGE:
            return "UnexpectedMessage";
        case ErrorCode::INVALID_MESSAGE_ID:
            return "InvalidMessageId";
        case ErrorCode::UNKNOWN_DEVICE:
            return "UnknownDevice";
        case ErrorCode::DEVICE_NOT_CONNECTED:
            return "DeviceNotConnected";
        case ErrorCode::INVALID_ACTUATOR_INDEX:
            return "InvalidActuatorIndex";
        case ErrorCode::OUT_OF_RANGE:
            return "OutOfRange";
        case ErrorCode::UNSUPPORTED_DEVICE:
            return "UnsupportedDevice";
        case ErrorCode::UNSUPPORTED_COMMAND:
            return "UnsupportedCommand";
        case ErrorCode::UNRECOGNIZED_MESSAGE:
            return "UnrecognizedMessage";
        case ErrorCode::TRANSPORT_ERROR:
            return "TransportError";
        case ErrorCode::PING_TIMEOUT:
            return "PingTimeout";
        case ErrorCode::CANCELLED:
            return "Cancelled";
        default:
            return "Unknown";
    }
}

ErrorCategory category_of(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
            return ErrorCategory::NONE;
        case ErrorCode::HANDSHAKE_REQUIRED:
        case ErrorCode::VERSION_MISMATCH:
        case ErrorCode::DUPLICATE_MESSAGE_ID:
        case ErrorCode::UNEXPECTED_MESSAGE:
        case ErrorCode::INVALID_MESSAGE_ID:
            return ErrorCategory::PROTOCOL_VIOLATION;
        case ErrorCode::TRANSPORT_ERROR:
            return ErrorCategory::TRANSPORT_ERROR;
        case ErrorCode::PING_TIMEOUT:
            return ErrorCategory::SAFETY_TIMEOUT;
        default:
            return ErrorCategory::DEVICE_ERROR;
    }
}

const char *actuator_kind_to_string(ActuatorKind kind) {
    switch (kind) {
        case ActuatorKind::VIBRATE:
            return "Vibrate";
        case ActuatorKind::ROTATE:
            return "Rotate";
        case ActuatorKind::LINEAR:
            return "Linear";
        case ActuatorKind::RAW_WRITE:
            return "RawWrite";
        default:
            return "Unknown";
    }
}

const char *sensor_kind_to_string(SensorKind kind) {
    switch (kind) {
        case SensorKind::BATTERY:
            return "Battery";
        case SensorKind::RSSI:
            return "Rssi";
        case SensorKind::PRESSURE:
            return "Pressure";
        case SensorKind::BUTTON:
            return "Button";
        default:
            return "Unknown";
    }
}

const ActuatorDescriptor *CapabilitySet::find_actuator(uint32_t index) const {
    auto it = std::find_if(actuators.begin(), actuators.end(),
                           [index](const ActuatorDescriptor &a) { return a.index == index; });
    return it == actuators.end() ? nullptr : &*it;
}

const SensorDescriptor *CapabilitySet::find_sensor(uint32_t index) const {
    auto it = std::find_if(sensors.begin(), sensors.end(),
                           [index](const SensorDescriptor &s) { return s.index == index; });
    return it == sensors.end() ? nullptr : &*it;
}

size_t CapabilitySet::count_actuators(ActuatorKind kind) const {
    return static_cast<size_t>(
        std::count_if(actuators.begin(), actuators.end(), [kind](const ActuatorDescriptor &a) { return a.kind == kind; }));
}

const char *command_name(const DeviceCommand &command) {
    return std::visit(
        [](auto &&cmd) -> const char * {
            using T = std::decay_t<decltype(cmd)>;
            if constexpr (std::is_same_v<T, ActuatorCommand>) {
                return actuator_kind_to_string(cmd.kind);
            } else if constexpr (std::is_same_v<T, RawWriteCommand>) {
                return "RawWrite";
            } else if constexpr (std::is_same_v<T, SensorReadCommand>) {
                return "SensorRead";
            } else {
                return "StopDevice";
            }
        },
        command);
}

RawWrite RawWrite::from_string(const std::string &endpoint, const std::string &text) {
    RawWrite write;
    write.endpoint = endpoint;
    write.data.assign(text.begin(), text.end());
    return write;
}

}  // namespace device
}  // namespace tactile
