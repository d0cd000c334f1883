#include "generic_vibrator_protocol.hpp"

namespace tactile {
namespace device {

GenericVibratorProtocol::GenericVibratorProtocol(CapabilitySet capabilities)
    : DeviceProtocol("generic-vibrator", std::move(capabilities)) {}

bool GenericVibratorProtocol::encode_actuators(ActuatorKind kind, const std::vector<ActuatorSetting> &settings,
                                               std::vector<RawWrite> &writes, DeviceError &error) {
    if (kind != ActuatorKind::VIBRATE) {
        error.set(ErrorCode::UNSUPPORTED_COMMAND,
                  std::string("Generic vibrators do not support ") + actuator_kind_to_string(kind));
        return false;
    }

    for (const auto &setting : settings) {
        RawWrite write;
        write.endpoint = TX_ENDPOINT;
        write.data = {static_cast<uint8_t>(MOTOR_BASE + setting.actuator_index),
                      static_cast<uint8_t>(to_step(actuator(setting.actuator_index), setting.value))};
        writes.push_back(std::move(write));
    }
    return true;
}

std::vector<RawWrite> GenericVibratorProtocol::encode_stop() {
    std::vector<RawWrite> writes;
    for (const auto &actuator : capabilities().actuators) {
        if (actuator.kind != ActuatorKind::VIBRATE) {
            continue;
        }
        RawWrite write;
        write.endpoint = TX_ENDPOINT;
        write.data = {static_cast<uint8_t>(MOTOR_BASE + actuator.index), 0x00};
        writes.push_back(std::move(write));
    }
    return writes;
}

}  // namespace device
}  // namespace tactile
