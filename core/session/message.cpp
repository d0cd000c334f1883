#include "message.hpp"

#include <type_traits>

namespace tactile {
namespace session {

const char *kind_name(const Payload &payload) {
    return std::visit(
        [](auto &&p) -> const char * {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, HandshakeRequest>) return "HandshakeRequest";
            else if constexpr (std::is_same_v<T, HandshakeReply>) return "HandshakeReply";
            else if constexpr (std::is_same_v<T, Ping>) return "Ping";
            else if constexpr (std::is_same_v<T, DeviceListRequest>) return "DeviceListRequest";
            else if constexpr (std::is_same_v<T, DeviceListReply>) return "DeviceListReply";
            else if constexpr (std::is_same_v<T, DeviceAdded>) return "DeviceAdded";
            else if constexpr (std::is_same_v<T, DeviceRemoved>) return "DeviceRemoved";
            else if constexpr (std::is_same_v<T, DeviceCommandRequest>) return "DeviceCommand";
            else if constexpr (std::is_same_v<T, CommandResult>) return "CommandResult";
            else if constexpr (std::is_same_v<T, SensorReadingReport>) return "SensorReading";
            else if constexpr (std::is_same_v<T, StopAllRequest>) return "StopAllRequest";
            else if constexpr (std::is_same_v<T, Ok>) return "Ok";
            else if constexpr (std::is_same_v<T, ErrorReply>) return "Error";
            else return "Unrecognized";
        },
        payload);
}

bool is_client_kind(const Payload &payload) {
    return std::holds_alternative<HandshakeRequest>(payload) || std::holds_alternative<Ping>(payload) ||
           std::holds_alternative<DeviceListRequest>(payload) ||
           std::holds_alternative<DeviceCommandRequest>(payload) || std::holds_alternative<StopAllRequest>(payload);
}

}  // namespace session
}  // namespace tactile
