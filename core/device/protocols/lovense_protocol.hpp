#pragma once

#include <string>
#include <vector>

#include "device/device_protocol.hpp"

namespace tactile {
namespace device {

/**
 * Lovense ASCII protocol.
 *
 * Commands are ';'-terminated strings written to "tx":
 *   Vibrate:N;   single-motor models, N in 0..20
 *   VibrateK:N;  K-th motor (1-based) on multi-motor models
 *   Rotate:N;    N in 0..20
 *   RotateChange;  flip direction
 *   Battery;     reply "NN;" (percent) on "rx"
 */
class LovenseProtocol : public DeviceProtocol {
public:
    explicit LovenseProtocol(CapabilitySet capabilities);

    bool interpret(const RawNotification &notification, std::vector<SensorReading> &readings,
                   DeviceError &error) override;

    // Direction flips only once RotateChange; has been written
    void write_completed(const RawWrite &write) override;

    static constexpr const char *TX_ENDPOINT = "tx";
    static constexpr const char *RX_ENDPOINT = "rx";
    static constexpr uint32_t STEP_COUNT = 20;

protected:
    bool encode_actuators(ActuatorKind kind, const std::vector<ActuatorSetting> &settings,
                          std::vector<RawWrite> &writes, DeviceError &error) override;
    std::vector<RawWrite> encode_stop() override;
    bool encode_sensor_read(const SensorDescriptor &sensor, RawWrite &request, std::string &reply_endpoint,
                            DeviceError &error) override;

private:
    // 1-based motor number among the vibrators, in capability order
    uint32_t motor_number(uint32_t actuator_index) const;

    bool multi_motor_;
    bool clockwise_ = true;  // direction the head is turning, as confirmed by writes
};

}  // namespace device
}  // namespace tactile
