#pragma once

#include <vector>

#include "device/device_protocol.hpp"

namespace tactile {
namespace device {

// Vorze rotators: 3-byte frame {0x01, 0x01, direction<<7 | speed}, speed 0..99
class VorzeProtocol : public DeviceProtocol {
public:
    explicit VorzeProtocol(CapabilitySet capabilities);

    static constexpr const char *TX_ENDPOINT = "tx";
    static constexpr uint32_t STEP_COUNT = 99;

protected:
    bool encode_actuators(ActuatorKind kind, const std::vector<ActuatorSetting> &settings,
                          std::vector<RawWrite> &writes, DeviceError &error) override;
    std::vector<RawWrite> encode_stop() override;
};

}  // namespace device
}  // namespace tactile
