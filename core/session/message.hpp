#ifndef TACTILE_SESSION_MESSAGE_HPP
#define TACTILE_SESSION_MESSAGE_HPP

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "device/device_types.hpp"

namespace tactile {
namespace session {

// Client -> server

struct HandshakeRequest {
    std::string client_name;
    uint32_t min_version = 0;
    uint32_t max_version = 0;
};

struct Ping {};

struct DeviceListRequest {};

struct DeviceCommandRequest {
    device::DeviceIndex device_index = 0;
    device::DeviceCommand command;
};

struct StopAllRequest {};

// Server -> client

struct HandshakeReply {
    std::string server_name;
    uint32_t version = 0;
    uint32_t max_ping_time_ms = 0;
};

struct DeviceEntry {
    device::DeviceIndex device_index = 0;
    std::string device_name;
    device::CapabilitySet capabilities;
};

struct DeviceListReply {
    std::vector<DeviceEntry> devices;
};

struct DeviceAdded {
    DeviceEntry device;
};

struct DeviceRemoved {
    device::DeviceIndex device_index = 0;
};

struct CommandResult {
    device::DeviceIndex device_index = 0;
};

struct SensorReadingReport {
    device::DeviceIndex device_index = 0;
    std::vector<device::SensorReading> readings;
};

struct Ok {};

struct ErrorReply {
    device::ErrorCode code = device::ErrorCode::OK;
    std::string message;
};

// A frame whose kind this server does not know; carries only the id
struct Unrecognized {};

using Payload = std::variant<HandshakeRequest, HandshakeReply, Ping, DeviceListRequest, DeviceListReply, DeviceAdded,
                             DeviceRemoved, DeviceCommandRequest, CommandResult, SensorReadingReport, StopAllRequest,
                             Ok, ErrorReply, Unrecognized>;

/**
 * One protocol message.
 *
 * id 0 is reserved for messages that are not correlated with a reply
 * (server events, and optionally Ping).
 */
struct Message {
    uint32_t id = 0;
    Payload payload;

    template <typename T>
    bool is() const {
        return std::holds_alternative<T>(payload);
    }
};

const char *kind_name(const Payload &payload);

// True for kinds a client may send (Unrecognized excluded)
bool is_client_kind(const Payload &payload);

}  // namespace session
}  // namespace tactile

#endif  // TACTILE_SESSION_MESSAGE_HPP
