#pragma once

#include <vector>

#include "device/device_protocol.hpp"

namespace tactile {
namespace device {

// Simple N-motor vibrator declared from configuration.
// One 2-byte frame per motor: {0xA0 + motor, step}, step 0..100.
class GenericVibratorProtocol : public DeviceProtocol {
public:
    explicit GenericVibratorProtocol(CapabilitySet capabilities);

    static constexpr const char *TX_ENDPOINT = "tx";
    static constexpr uint32_t STEP_COUNT = 100;
    static constexpr uint8_t MOTOR_BASE = 0xA0;

protected:
    bool encode_actuators(ActuatorKind kind, const std::vector<ActuatorSetting> &settings,
                          std::vector<RawWrite> &writes, DeviceError &error) override;
    std::vector<RawWrite> encode_stop() override;
};

}  // namespace device
}  // namespace tactile
