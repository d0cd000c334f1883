#include "vorze_protocol.hpp"

namespace tactile {
namespace device {

namespace {
constexpr uint8_t DEVICE_TYPE = 0x01;
constexpr uint8_t COMMAND_ROTATE = 0x01;
}  // namespace

VorzeProtocol::VorzeProtocol(CapabilitySet capabilities) : DeviceProtocol("vorze", std::move(capabilities)) {}

bool VorzeProtocol::encode_actuators(ActuatorKind kind, const std::vector<ActuatorSetting> &settings,
                                     std::vector<RawWrite> &writes, DeviceError &error) {
    if (kind != ActuatorKind::ROTATE) {
        error.set(ErrorCode::UNSUPPORTED_COMMAND,
                  std::string("Vorze devices do not support ") + actuator_kind_to_string(kind));
        return false;
    }

    for (const auto &setting : settings) {
        const uint32_t speed = to_step(actuator(setting.actuator_index), setting.value);
        RawWrite write;
        write.endpoint = TX_ENDPOINT;
        write.data = {DEVICE_TYPE, COMMAND_ROTATE,
                      static_cast<uint8_t>((setting.clockwise ? 0x80 : 0x00) | (speed & 0x7F))};
        writes.push_back(std::move(write));
    }
    return true;
}

std::vector<RawWrite> VorzeProtocol::encode_stop() {
    RawWrite write;
    write.endpoint = TX_ENDPOINT;
    write.data = {DEVICE_TYPE, COMMAND_ROTATE, 0x00};
    return {write};
}

}  // namespace device
}  // namespace tactile
