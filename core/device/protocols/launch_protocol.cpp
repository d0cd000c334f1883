#include "launch_protocol.hpp"

#include <algorithm>
#include <cmath>

namespace tactile {
namespace device {

LaunchProtocol::LaunchProtocol(CapabilitySet capabilities) : DeviceProtocol("launch", std::move(capabilities)) {}

uint8_t LaunchProtocol::speed_for(double distance, uint32_t duration_ms) {
    if (distance <= 0.0) {
        return 0;
    }
    if (duration_ms == 0) {
        return static_cast<uint8_t>(STEP_COUNT);
    }

    // Empirical fit of stroke time against speed byte
    const double speed = 25000.0 * std::pow(duration_ms * 90.0 / (distance * 100.0), -1.05);
    return static_cast<uint8_t>(std::clamp(std::lround(speed), 0L, static_cast<long>(STEP_COUNT)));
}

bool LaunchProtocol::encode_actuators(ActuatorKind kind, const std::vector<ActuatorSetting> &settings,
                                      std::vector<RawWrite> &writes, DeviceError &error) {
    if (kind != ActuatorKind::LINEAR) {
        error.set(ErrorCode::UNSUPPORTED_COMMAND,
                  std::string("Launch devices do not support ") + actuator_kind_to_string(kind));
        return false;
    }

    for (const auto &setting : settings) {
        const uint32_t position = to_step(actuator(setting.actuator_index), setting.value);
        const double distance =
            std::abs(static_cast<double>(position) - static_cast<double>(last_position_)) / STEP_COUNT;

        RawWrite write;
        write.endpoint = TX_ENDPOINT;
        write.data = {static_cast<uint8_t>(position), speed_for(distance, setting.duration_ms)};
        writes.push_back(std::move(write));

        last_position_ = position;
    }
    return true;
}

}  // namespace device
}  // namespace tactile
