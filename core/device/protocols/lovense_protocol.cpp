#include "lovense_protocol.hpp"

#include <algorithm>
#include <cctype>

namespace tactile {
namespace device {

LovenseProtocol::LovenseProtocol(CapabilitySet capabilities)
    : DeviceProtocol("lovense", std::move(capabilities)),
      multi_motor_(this->capabilities().count_actuators(ActuatorKind::VIBRATE) > 1) {}

uint32_t LovenseProtocol::motor_number(uint32_t actuator_index) const {
    uint32_t number = 0;
    for (const auto &actuator : capabilities().actuators) {
        if (actuator.kind != ActuatorKind::VIBRATE) {
            continue;
        }
        ++number;
        if (actuator.index == actuator_index) {
            return number;
        }
    }
    return number;
}

bool LovenseProtocol::encode_actuators(ActuatorKind kind, const std::vector<ActuatorSetting> &settings,
                                       std::vector<RawWrite> &writes, DeviceError &error) {
    for (const auto &setting : settings) {
        const uint32_t step = to_step(actuator(setting.actuator_index), setting.value);

        switch (kind) {
            case ActuatorKind::VIBRATE: {
                std::string cmd = multi_motor_ ? "Vibrate" + std::to_string(motor_number(setting.actuator_index))
                                               : std::string("Vibrate");
                writes.push_back(RawWrite::from_string(TX_ENDPOINT, cmd + ":" + std::to_string(step) + ";"));
                break;
            }
            case ActuatorKind::ROTATE:
                if (setting.clockwise != clockwise_) {
                    writes.push_back(RawWrite::from_string(TX_ENDPOINT, "RotateChange;"));
                }
                writes.push_back(RawWrite::from_string(TX_ENDPOINT, "Rotate:" + std::to_string(step) + ";"));
                break;
            default:
                error.set(ErrorCode::UNSUPPORTED_COMMAND,
                          std::string("Lovense devices do not support ") + actuator_kind_to_string(kind));
                return false;
        }
    }
    return true;
}

void LovenseProtocol::write_completed(const RawWrite &write) {
    static const std::string rotate_change = "RotateChange;";
    if (write.data.size() == rotate_change.size() &&
        std::equal(write.data.begin(), write.data.end(), rotate_change.begin())) {
        clockwise_ = !clockwise_;
    }
}

std::vector<RawWrite> LovenseProtocol::encode_stop() {
    std::vector<RawWrite> writes;
    if (capabilities().count_actuators(ActuatorKind::VIBRATE) > 0) {
        // Plain Vibrate stops every motor, multi-motor models included
        writes.push_back(RawWrite::from_string(TX_ENDPOINT, "Vibrate:0;"));
    }
    if (capabilities().count_actuators(ActuatorKind::ROTATE) > 0) {
        writes.push_back(RawWrite::from_string(TX_ENDPOINT, "Rotate:0;"));
    }
    return writes;
}

bool LovenseProtocol::encode_sensor_read(const SensorDescriptor &sensor, RawWrite &request,
                                         std::string &reply_endpoint, DeviceError &error) {
    if (sensor.kind != SensorKind::BATTERY) {
        return DeviceProtocol::encode_sensor_read(sensor, request, reply_endpoint, error);
    }
    request = RawWrite::from_string(TX_ENDPOINT, "Battery;");
    reply_endpoint = RX_ENDPOINT;
    return true;
}

bool LovenseProtocol::interpret(const RawNotification &notification, std::vector<SensorReading> &readings,
                                DeviceError &error) {
    static_cast<void>(error);

    std::string text(notification.data.begin(), notification.data.end());
    if (text.empty() || text.back() != ';') {
        return true;  // not a reply we understand
    }
    text.pop_back();

    if (text.empty() || text.size() > 3) {
        return true;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return true;
        }
    }

    const int percent = std::stoi(text);
    if (percent > 100) {
        return true;
    }

    for (const auto &sensor : capabilities().sensors) {
        if (sensor.kind == SensorKind::BATTERY) {
            readings.push_back(SensorReading{SensorKind::BATTERY, sensor.index, percent / 100.0});
            break;
        }
    }
    return true;
}

}  // namespace device
}  // namespace tactile
