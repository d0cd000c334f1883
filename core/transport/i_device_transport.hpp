#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "device/device_types.hpp"

namespace tactile {
namespace transport {

// Byte-level link to one connected device (BLE characteristic set, serial port,
// HID handle...). Implemented per transport kind; mocked in tests.
class IDeviceTransport {
public:
    virtual ~IDeviceTransport() = default;

    // Blocking write of one raw frame. Returns false on failure (see last_error()).
    virtual bool write(const device::RawWrite &write) = 0;

    // Blocking read from an endpoint, used for on-demand sensor reads
    virtual bool read(const std::string &endpoint, std::vector<uint8_t> &data, int timeout_ms) = 0;

    // False once the transport has judged the device gone for good
    virtual bool is_reachable() const = 0;

    // Release the underlying handle. Safe to call more than once.
    virtual void disconnect() = 0;

    virtual std::string last_error() const = 0;
};

}  // namespace transport
}  // namespace tactile
