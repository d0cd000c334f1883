#ifndef TACTILE_DEVICE_DEVICE_TYPES_HPP
#define TACTILE_DEVICE_DEVICE_TYPES_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tactile {

namespace transport {
class IDeviceTransport;
}

namespace device {

// Server-assigned device identifier, stable for the process lifetime
using DeviceIndex = uint32_t;

/**
 * Error codes shared by the device, registry and session layers.
 * Values are mirrored by the wire ErrorCode enum.
 */
enum class ErrorCode {
    OK,
    // Protocol violations (always close the session)
    HANDSHAKE_REQUIRED,
    VERSION_MISMATCH,
    DUPLICATE_MESSAGE_ID,
    UNEXPECTED_MESSAGE,
    INVALID_MESSAGE_ID,
    // Device errors (correlated reply, session stays open)
    UNKNOWN_DEVICE,
    DEVICE_NOT_CONNECTED,
    INVALID_ACTUATOR_INDEX,
    OUT_OF_RANGE,
    UNSUPPORTED_DEVICE,
    UNSUPPORTED_COMMAND,
    UNRECOGNIZED_MESSAGE,
    // Transport failures
    TRANSPORT_ERROR,
    // Safety / lifecycle
    PING_TIMEOUT,
    CANCELLED
};

enum class ErrorCategory { NONE, PROTOCOL_VIOLATION, DEVICE_ERROR, TRANSPORT_ERROR, SAFETY_TIMEOUT };

const char *error_code_to_string(ErrorCode code);
ErrorCategory category_of(ErrorCode code);

struct DeviceError {
    ErrorCode code = ErrorCode::OK;
    std::string message;

    bool ok() const { return code == ErrorCode::OK; }
    void set(ErrorCode c, std::string msg) {
        code = c;
        message = std::move(msg);
    }
};

// Immutable identity reported by a transport scanner
struct DeviceIdentity {
    std::string transport_kind;  // e.g. "ble", "serial", "sim"
    std::string address;         // vendor-assigned address or handle
    std::string name;            // advertised display name

    // Dedup key for the registry
    std::string key() const { return transport_kind + "/" + address; }
};

enum class ActuatorKind { VIBRATE, ROTATE, LINEAR, RAW_WRITE };
enum class SensorKind { BATTERY, RSSI, PRESSURE, BUTTON };

const char *actuator_kind_to_string(ActuatorKind kind);
const char *sensor_kind_to_string(SensorKind kind);

struct ValueRange {
    double min = 0.0;
    double max = 1.0;

    bool contains(double value) const { return value >= min && value <= max; }
};

struct ActuatorDescriptor {
    ActuatorKind kind = ActuatorKind::VIBRATE;
    uint32_t index = 0;
    ValueRange range;
    uint32_t step_count = 0;  // hardware resolution, 0 for raw endpoints
    std::string endpoint;
};

struct SensorDescriptor {
    SensorKind kind = SensorKind::BATTERY;
    uint32_t index = 0;
    ValueRange range;
    std::string endpoint;
};

// Fixed per device after registration
struct CapabilitySet {
    std::vector<ActuatorDescriptor> actuators;
    std::vector<SensorDescriptor> sensors;

    const ActuatorDescriptor *find_actuator(uint32_t index) const;
    const SensorDescriptor *find_sensor(uint32_t index) const;
    size_t count_actuators(ActuatorKind kind) const;
};

// What a scanner learned about a device before connection
struct DeviceProbe {
    std::vector<std::string> services;  // advertised service ids
    std::shared_ptr<transport::IDeviceTransport> transport;
};

// ----------------------------------------------------------------------------
// Generic commands
// ----------------------------------------------------------------------------

struct ActuatorSetting {
    uint32_t actuator_index = 0;
    double value = 0.0;
    bool clockwise = true;     // ROTATE only
    uint32_t duration_ms = 0;  // LINEAR only
};

struct ActuatorCommand {
    ActuatorKind kind = ActuatorKind::VIBRATE;
    std::vector<ActuatorSetting> settings;
};

struct RawWriteCommand {
    uint32_t actuator_index = 0;  // index of a RAW_WRITE actuator
    std::vector<uint8_t> data;
    bool write_with_response = false;
};

struct SensorReadCommand {
    uint32_t sensor_index = 0;
};

struct StopDeviceCommand {};

using DeviceCommand = std::variant<ActuatorCommand, RawWriteCommand, SensorReadCommand, StopDeviceCommand>;

const char *command_name(const DeviceCommand &command);

// ----------------------------------------------------------------------------
// Raw transport traffic
// ----------------------------------------------------------------------------

struct RawWrite {
    std::string endpoint;
    std::vector<uint8_t> data;
    bool write_with_response = false;

    static RawWrite from_string(const std::string &endpoint, const std::string &text);
};

struct RawNotification {
    std::string endpoint;
    std::vector<uint8_t> data;
};

struct SensorReading {
    SensorKind kind = SensorKind::BATTERY;
    uint32_t sensor_index = 0;
    double value = 0.0;
};

}  // namespace device
}  // namespace tactile

#endif  // TACTILE_DEVICE_DEVICE_TYPES_HPP
