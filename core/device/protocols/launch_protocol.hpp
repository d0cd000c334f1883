#pragma once

#include <vector>

#include "device/device_protocol.hpp"

namespace tactile {
namespace device {

/**
 * Launch linear stroker: 2-byte frame {position 0..99, speed 0..99}.
 *
 * Clients send a target position and a duration; the device wants a speed, so
 * the protocol tracks the last commanded position and derives the speed from
 * travel distance over time. Linear moves are never suppressed.
 */
class LaunchProtocol : public DeviceProtocol {
public:
    explicit LaunchProtocol(CapabilitySet capabilities);

    static constexpr const char *TX_ENDPOINT = "tx";
    static constexpr uint32_t STEP_COUNT = 99;

    // Speed (0..99) needed to cover distance (0..1 of full stroke) in duration_ms
    static uint8_t speed_for(double distance, uint32_t duration_ms);

protected:
    bool encode_actuators(ActuatorKind kind, const std::vector<ActuatorSetting> &settings,
                          std::vector<RawWrite> &writes, DeviceError &error) override;

    // A stroker holds position when no move is pending; stop is a no-op
    std::vector<RawWrite> encode_stop() override { return {}; }

private:
    uint32_t last_position_ = 0;
};

}  // namespace device
}  // namespace tactile
