#include "message_codec.hpp"

#include <optional>
#include <type_traits>

namespace tactile {
namespace codec {

namespace wire = tactile::wire::v1;

namespace {

wire::ActuatorKind actuator_kind_to_wire(device::ActuatorKind kind) {
    switch (kind) {
        case device::ActuatorKind::VIBRATE:
            return wire::ACTUATOR_KIND_VIBRATE;
        case device::ActuatorKind::ROTATE:
            return wire::ACTUATOR_KIND_ROTATE;
        case device::ActuatorKind::LINEAR:
            return wire::ACTUATOR_KIND_LINEAR;
        case device::ActuatorKind::RAW_WRITE:
            return wire::ACTUATOR_KIND_RAW_WRITE;
        default:
            return wire::ACTUATOR_KIND_UNSPECIFIED;
    }
}

std::optional<device::ActuatorKind> actuator_kind_from_wire(wire::ActuatorKind kind) {
    switch (kind) {
        case wire::ACTUATOR_KIND_VIBRATE:
            return device::ActuatorKind::VIBRATE;
        case wire::ACTUATOR_KIND_ROTATE:
            return device::ActuatorKind::ROTATE;
        case wire::ACTUATOR_KIND_LINEAR:
            return device::ActuatorKind::LINEAR;
        case wire::ACTUATOR_KIND_RAW_WRITE:
            return device::ActuatorKind::RAW_WRITE;
        default:
            return std::nullopt;
    }
}

wire::SensorKind sensor_kind_to_wire(device::SensorKind kind) {
    switch (kind) {
        case device::SensorKind::BATTERY:
            return wire::SENSOR_KIND_BATTERY;
        case device::SensorKind::RSSI:
            return wire::SENSOR_KIND_RSSI;
        case device::SensorKind::PRESSURE:
            return wire::SENSOR_KIND_PRESSURE;
        case device::SensorKind::BUTTON:
            return wire::SENSOR_KIND_BUTTON;
        default:
            return wire::SENSOR_KIND_UNSPECIFIED;
    }
}

device::SensorKind sensor_kind_from_wire(wire::SensorKind kind) {
    switch (kind) {
        case wire::SENSOR_KIND_RSSI:
            return device::SensorKind::RSSI;
        case wire::SENSOR_KIND_PRESSURE:
            return device::SensorKind::PRESSURE;
        case wire::SENSOR_KIND_BUTTON:
            return device::SensorKind::BUTTON;
        default:
            return device::SensorKind::BATTERY;
    }
}

void entry_to_wire(const session::DeviceEntry &entry, wire::DeviceInfo &info) {
    info.set_device_index(entry.device_index);
    info.set_device_name(entry.device_name);

    for (const auto &actuator : entry.capabilities.actuators) {
        auto *out = info.add_actuators();
        out->set_kind(actuator_kind_to_wire(actuator.kind));
        out->set_index(actuator.index);
        out->set_min(actuator.range.min);
        out->set_max(actuator.range.max);
        out->set_step_count(actuator.step_count);
        out->set_endpoint(actuator.endpoint);
    }

    for (const auto &sensor : entry.capabilities.sensors) {
        auto *out = info.add_sensors();
        out->set_kind(sensor_kind_to_wire(sensor.kind));
        out->set_index(sensor.index);
        out->set_min(sensor.range.min);
        out->set_max(sensor.range.max);
        out->set_endpoint(sensor.endpoint);
    }
}

session::DeviceEntry entry_from_wire(const wire::DeviceInfo &info) {
    session::DeviceEntry entry;
    entry.device_index = info.device_index();
    entry.device_name = info.device_name();

    for (const auto &in : info.actuators()) {
        device::ActuatorDescriptor actuator;
        actuator.kind = actuator_kind_from_wire(in.kind()).value_or(device::ActuatorKind::RAW_WRITE);
        actuator.index = in.index();
        actuator.range = device::ValueRange{in.min(), in.max()};
        actuator.step_count = in.step_count();
        actuator.endpoint = in.endpoint();
        entry.capabilities.actuators.push_back(actuator);
    }

    for (const auto &in : info.sensors()) {
        device::SensorDescriptor sensor;
        sensor.kind = sensor_kind_from_wire(in.kind());
        sensor.index = in.index();
        sensor.range = device::ValueRange{in.min(), in.max()};
        sensor.endpoint = in.endpoint();
        entry.capabilities.sensors.push_back(sensor);
    }
    return entry;
}

void command_to_wire(const session::DeviceCommandRequest &request, wire::DeviceCommand &out) {
    out.set_device_index(request.device_index);

    std::visit(
        [&out](auto &&cmd) {
            using T = std::decay_t<decltype(cmd)>;
            if constexpr (std::is_same_v<T, device::ActuatorCommand>) {
                auto *actuator = out.mutable_actuator();
                actuator->set_kind(actuator_kind_to_wire(cmd.kind));
                for (const auto &setting : cmd.settings) {
                    auto *s = actuator->add_settings();
                    s->set_actuator_index(setting.actuator_index);
                    s->set_value(setting.value);
                    s->set_clockwise(setting.clockwise);
                    s->set_duration_ms(setting.duration_ms);
                }
            } else if constexpr (std::is_same_v<T, device::RawWriteCommand>) {
                auto *raw = out.mutable_raw_write();
                raw->set_actuator_index(cmd.actuator_index);
                raw->set_data(std::string(cmd.data.begin(), cmd.data.end()));
                raw->set_write_with_response(cmd.write_with_response);
            } else if constexpr (std::is_same_v<T, device::SensorReadCommand>) {
                out.mutable_sensor_read()->set_sensor_index(cmd.sensor_index);
            } else {
                out.mutable_stop();
            }
        },
        request.command);
}

// nullopt when the command variant or actuator kind is unknown
std::optional<session::DeviceCommandRequest> command_from_wire(const wire::DeviceCommand &in) {
    session::DeviceCommandRequest request;
    request.device_index = in.device_index();

    switch (in.command_case()) {
        case wire::DeviceCommand::kActuator: {
            auto kind = actuator_kind_from_wire(in.actuator().kind());
            if (!kind) {
                return std::nullopt;
            }
            device::ActuatorCommand cmd;
            cmd.kind = *kind;
            for (const auto &s : in.actuator().settings()) {
                device::ActuatorSetting setting;
                setting.actuator_index = s.actuator_index();
                setting.value = s.value();
                setting.clockwise = s.clockwise();
                setting.duration_ms = s.duration_ms();
                cmd.settings.push_back(setting);
            }
            request.command = std::move(cmd);
            return request;
        }
        case wire::DeviceCommand::kRawWrite: {
            device::RawWriteCommand cmd;
            cmd.actuator_index = in.raw_write().actuator_index();
            cmd.data.assign(in.raw_write().data().begin(), in.raw_write().data().end());
            cmd.write_with_response = in.raw_write().write_with_response();
            request.command = std::move(cmd);
            return request;
        }
        case wire::DeviceCommand::kSensorRead:
            request.command = device::SensorReadCommand{in.sensor_read().sensor_index()};
            return request;
        case wire::DeviceCommand::kStop:
            request.command = device::StopDeviceCommand{};
            return request;
        default:
            return std::nullopt;
    }
}

void readings_to_wire(const std::vector<device::SensorReading> &readings, wire::SensorReading &out) {
    for (const auto &reading : readings) {
        auto *r = out.add_readings();
        r->set_kind(sensor_kind_to_wire(reading.kind));
        r->set_sensor_index(reading.sensor_index);
        r->set_value(reading.value);
    }
}

}  // namespace

wire::ErrorCode MessageCodec::to_wire(device::ErrorCode code) {
    switch (code) {
        case device::ErrorCode::OK:
            return wire::ERROR_CODE_OK;
        case device::ErrorCode::HANDSHAKE_REQUIRED:
            return wire::ERROR_CODE_HANDSHAKE_REQUIRED;
        case device::ErrorCode::VERSION_MISMATCH:
            return wire::ERROR_CODE_VERSION_MISMATCH;
        case device::ErrorCode::DUPLICATE_MESSAGE_ID:
            return wire::ERROR_CODE_DUPLICATE_MESSAGE_ID;
        case device::ErrorCode::UNEXPECTED_MESSAGE:
            return wire::ERROR_CODE_UNEXPECTED_MESSAGE;
        case device::ErrorCode::INVALID_MESSAGE_ID:
            return wire::ERROR_CODE_INVALID_MESSAGE_ID;
        case device::ErrorCode::UNKNOWN_DEVICE:
            return wire::ERROR_CODE_UNKNOWN_DEVICE;
        case device::ErrorCode::DEVICE_NOT_CONNECTED:
            return wire::ERROR_CODE_DEVICE_NOT_CONNECTED;
        case device::ErrorCode::INVALID_ACTUATOR_INDEX:
            return wire::ERROR_CODE_INVALID_ACTUATOR_INDEX;
        case device::ErrorCode::OUT_OF_RANGE:
            return wire::ERROR_CODE_OUT_OF_RANGE;
        case device::ErrorCode::UNSUPPORTED_DEVICE:
            return wire::ERROR_CODE_UNSUPPORTED_DEVICE;
        case device::ErrorCode::UNSUPPORTED_COMMAND:
            return wire::ERROR_CODE_UNSUPPORTED_COMMAND;
        case device::ErrorCode::UNRECOGNIZED_MESSAGE:
            return wire::ERROR_CODE_UNRECOGNIZED_MESSAGE;
        case device::ErrorCode::TRANSPORT_ERROR:
            return wire::ERROR_CODE_TRANSPORT_ERROR;
        case device::ErrorCode::PING_TIMEOUT:
            return wire::ERROR_CODE_PING_TIMEOUT;
        case device::ErrorCode::CANCELLED:
            return wire::ERROR_CODE_CANCELLED;
        default:
            return wire::ERROR_CODE_UNRECOGNIZED_MESSAGE;
    }
}

device::ErrorCode MessageCodec::from_wire(wire::ErrorCode code) {
    switch (code) {
        case wire::ERROR_CODE_OK:
            return device::ErrorCode::OK;
        case wire::ERROR_CODE_HANDSHAKE_REQUIRED:
            return device::ErrorCode::HANDSHAKE_REQUIRED;
        case wire::ERROR_CODE_VERSION_MISMATCH:
            return device::ErrorCode::VERSION_MISMATCH;
        case wire::ERROR_CODE_DUPLICATE_MESSAGE_ID:
            return device::ErrorCode::DUPLICATE_MESSAGE_ID;
        case wire::ERROR_CODE_UNEXPECTED_MESSAGE:
            return device::ErrorCode::UNEXPECTED_MESSAGE;
        case wire::ERROR_CODE_INVALID_MESSAGE_ID:
            return device::ErrorCode::INVALID_MESSAGE_ID;
        case wire::ERROR_CODE_UNKNOWN_DEVICE:
            return device::ErrorCode::UNKNOWN_DEVICE;
        case wire::ERROR_CODE_DEVICE_NOT_CONNECTED:
            return device::ErrorCode::DEVICE_NOT_CONNECTED;
        case wire::ERROR_CODE_INVALID_ACTUATOR_INDEX:
            return device::ErrorCode::INVALID_ACTUATOR_INDEX;
        case wire::ERROR_CODE_OUT_OF_RANGE:
            return device::ErrorCode::OUT_OF_RANGE;
        case wire::ERROR_CODE_UNSUPPORTED_DEVICE:
            return device::ErrorCode::UNSUPPORTED_DEVICE;
        case wire::ERROR_CODE_UNSUPPORTED_COMMAND:
            return device::ErrorCode::UNSUPPORTED_COMMAND;
        case wire::ERROR_CODE_UNRECOGNIZED_MESSAGE:
            return device::ErrorCode::UNRECOGNIZED_MESSAGE;
        case wire::ERROR_CODE_TRANSPORT_ERROR:
            return device::ErrorCode::TRANSPORT_ERROR;
        case wire::ERROR_CODE_PING_TIMEOUT:
            return device::ErrorCode::PING_TIMEOUT;
        case wire::ERROR_CODE_CANCELLED:
            return device::ErrorCode::CANCELLED;
        default:
            return device::ErrorCode::UNRECOGNIZED_MESSAGE;
    }
}

void MessageCodec::to_envelope(const session::Message &message, wire::Envelope &envelope) {
    envelope.Clear();
    envelope.set_id(message.id);

    std::visit(
        [&envelope](auto &&p) {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, session::HandshakeRequest>) {
                auto *out = envelope.mutable_handshake_request();
                out->set_client_name(p.client_name);
                out->set_min_version(p.min_version);
                out->set_max_version(p.max_version);
            } else if constexpr (std::is_same_v<T, session::HandshakeReply>) {
                auto *out = envelope.mutable_handshake_reply();
                out->set_server_name(p.server_name);
                out->set_version(p.version);
                out->set_max_ping_time_ms(p.max_ping_time_ms);
            } else if constexpr (std::is_same_v<T, session::Ping>) {
                envelope.mutable_ping();
            } else if constexpr (std::is_same_v<T, session::DeviceListRequest>) {
                envelope.mutable_device_list_request();
            } else if constexpr (std::is_same_v<T, session::DeviceListReply>) {
                auto *out = envelope.mutable_device_list_reply();
                for (const auto &entry : p.devices) {
                    entry_to_wire(entry, *out->add_devices());
                }
            } else if constexpr (std::is_same_v<T, session::DeviceAdded>) {
                entry_to_wire(p.device, *envelope.mutable_device_added()->mutable_device());
            } else if constexpr (std::is_same_v<T, session::DeviceRemoved>) {
                envelope.mutable_device_removed()->set_device_index(p.device_index);
            } else if constexpr (std::is_same_v<T, session::DeviceCommandRequest>) {
                command_to_wire(p, *envelope.mutable_device_command());
            } else if constexpr (std::is_same_v<T, session::CommandResult>) {
                envelope.mutable_command_result()->set_device_index(p.device_index);
            } else if constexpr (std::is_same_v<T, session::SensorReadingReport>) {
                auto *out = envelope.mutable_sensor_reading();
                out->set_device_index(p.device_index);
                readings_to_wire(p.readings, *out);
            } else if constexpr (std::is_same_v<T, session::StopAllRequest>) {
                envelope.mutable_stop_all_request();
            } else if constexpr (std::is_same_v<T, session::Ok>) {
                envelope.mutable_ok();
            } else if constexpr (std::is_same_v<T, session::ErrorReply>) {
                auto *out = envelope.mutable_error();
                out->set_code(to_wire(p.code));
                out->set_message(p.message);
            }
            // Unrecognized: id only, no payload
        },
        message.payload);
}

session::Message MessageCodec::from_envelope(const wire::Envelope &envelope) {
    session::Message message;
    message.id = envelope.id();

    switch (envelope.payload_case()) {
        case wire::Envelope::kHandshakeRequest: {
            const auto &in = envelope.handshake_request();
            message.payload = session::HandshakeRequest{in.client_name(), in.min_version(), in.max_version()};
            break;
        }
        case wire::Envelope::kHandshakeReply: {
            const auto &in = envelope.handshake_reply();
            message.payload = session::HandshakeReply{in.server_name(), in.version(), in.max_ping_time_ms()};
            break;
        }
        case wire::Envelope::kPing:
            message.payload = session::Ping{};
            break;
        case wire::Envelope::kDeviceListRequest:
            message.payload = session::DeviceListRequest{};
            break;
        case wire::Envelope::kDeviceListReply: {
            session::DeviceListReply reply;
            for (const auto &info : envelope.device_list_reply().devices()) {
                reply.devices.push_back(entry_from_wire(info));
            }
            message.payload = std::move(reply);
            break;
        }
        case wire::Envelope::kDeviceAdded:
            message.payload = session::DeviceAdded{entry_from_wire(envelope.device_added().device())};
            break;
        case wire::Envelope::kDeviceRemoved:
            message.payload = session::DeviceRemoved{envelope.device_removed().device_index()};
            break;
        case wire::Envelope::kDeviceCommand: {
            auto request = command_from_wire(envelope.device_command());
            if (request) {
                message.payload = std::move(*request);
            } else {
                message.payload = session::Unrecognized{};
            }
            break;
        }
        case wire::Envelope::kCommandResult:
            message.payload = session::CommandResult{envelope.command_result().device_index()};
            break;
        case wire::Envelope::kSensorReading: {
            session::SensorReadingReport report;
            report.device_index = envelope.sensor_reading().device_index();
            for (const auto &r : envelope.sensor_reading().readings()) {
                report.readings.push_back(
                    device::SensorReading{sensor_kind_from_wire(r.kind()), r.sensor_index(), r.value()});
            }
            message.payload = std::move(report);
            break;
        }
        case wire::Envelope::kStopAllRequest:
            message.payload = session::StopAllRequest{};
            break;
        case wire::Envelope::kOk:
            message.payload = session::Ok{};
            break;
        case wire::Envelope::kError:
            message.payload =
                session::ErrorReply{from_wire(envelope.error().code()), envelope.error().message()};
            break;
        default:
            message.payload = session::Unrecognized{};
            break;
    }

    return message;
}

bool MessageCodec::encode(const session::Message &message, std::vector<uint8_t> &bytes, std::string &error) {
    wire::Envelope envelope;
    to_envelope(message, envelope);

    const size_t size = envelope.ByteSizeLong();
    bytes.resize(size);
    if (size > 0 && !envelope.SerializeToArray(bytes.data(), static_cast<int>(size))) {
        error = std::string("Failed to serialize ") + session::kind_name(message.payload);
        return false;
    }
    return true;
}

bool MessageCodec::decode(const std::vector<uint8_t> &bytes, session::Message &message, std::string &error) {
    wire::Envelope envelope;
    if (!envelope.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        error = "Malformed envelope (" + std::to_string(bytes.size()) + " bytes)";
        return false;
    }
    message = from_envelope(envelope);
    return true;
}

}  // namespace codec
}  // namespace tactile
