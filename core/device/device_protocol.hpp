#ifndef TACTILE_DEVICE_DEVICE_PROTOCOL_HPP
#define TACTILE_DEVICE_DEVICE_PROTOCOL_HPP

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "device/device_types.hpp"

namespace tactile {
namespace device {

/**
 * DeviceProtocol - vendor translator between generic commands and raw writes.
 *
 * One instance per Device, owned by it and only ever called under that
 * Device's lock. The base class does all capability validation so concrete
 * protocols only see commands that reference existing actuators of the right
 * kind with in-range values.
 *
 * Redundant-write suppression: VIBRATE and ROTATE settings whose hardware step
 * (and direction) equal the last one sent are dropped before encode. The cache
 * is optimization only; Device calls invalidate_cache() when a write fails so
 * a retry is never suppressed.
 */
class DeviceProtocol {
public:
    DeviceProtocol(std::string name, CapabilitySet capabilities);
    virtual ~DeviceProtocol() = default;

    DeviceProtocol(const DeviceProtocol &) = delete;
    DeviceProtocol &operator=(const DeviceProtocol &) = delete;

    const std::string &name() const { return name_; }
    const CapabilitySet &capabilities() const { return capabilities_; }

    // Generic command -> raw writes. May legitimately produce zero writes
    // (everything suppressed). Returns false with error set on caller errors.
    bool translate(const DeviceCommand &command, std::vector<RawWrite> &writes, DeviceError &error);

    // Protocol-defined stop for every actuator; never suppressed
    std::vector<RawWrite> stop_writes();

    // Raw notification -> sensor readings. Default: nothing to interpret.
    virtual bool interpret(const RawNotification &notification, std::vector<SensorReading> &readings,
                           DeviceError &error);

    // Raw request for an on-demand sensor read and the endpoint the reply arrives on
    bool sensor_read_request(uint32_t sensor_index, RawWrite &request, std::string &reply_endpoint,
                             DeviceError &error);

    void invalidate_cache();

    // Called by Device after each raw write the transport accepted. State that
    // must track the hardware (not what was merely encoded) updates here.
    virtual void write_completed(const RawWrite &write);

protected:
    // Encode validated settings (only the ones that changed)
    virtual bool encode_actuators(ActuatorKind kind, const std::vector<ActuatorSetting> &settings,
                                  std::vector<RawWrite> &writes, DeviceError &error) = 0;

    virtual std::vector<RawWrite> encode_stop() = 0;

    // Default: protocol has no request for this sensor
    virtual bool encode_sensor_read(const SensorDescriptor &sensor, RawWrite &request, std::string &reply_endpoint,
                                    DeviceError &error);

    // Map a validated value onto the actuator's hardware step scale
    static uint32_t to_step(const ActuatorDescriptor &actuator, double value);

    const ActuatorDescriptor &actuator(uint32_t index) const;

private:
    struct SentState {
        uint32_t step = 0;
        bool clockwise = true;
    };

    bool validate_actuator_command(const ActuatorCommand &command, DeviceError &error) const;
    bool translate_actuators(const ActuatorCommand &command, std::vector<RawWrite> &writes, DeviceError &error);
    bool translate_raw_write(const RawWriteCommand &command, std::vector<RawWrite> &writes, DeviceError &error);

    std::string name_;
    CapabilitySet capabilities_;
    std::unordered_map<uint32_t, SentState> last_sent_;  // actuator index -> last state written
};

}  // namespace device
}  // namespace tactile

#endif  // TACTILE_DEVICE_DEVICE_PROTOCOL_HPP
