#ifndef TACTILE_DEVICE_PROTOCOL_REGISTRY_HPP
#define TACTILE_DEVICE_PROTOCOL_REGISTRY_HPP

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "device/device_protocol.hpp"
#include "device/device_types.hpp"

namespace tactile {
namespace device {

using ProtocolFactory = std::function<std::unique_ptr<DeviceProtocol>(CapabilitySet capabilities)>;

// One matching rule: which devices a protocol handles and what they expose
struct ProtocolRule {
    std::string protocol_name;
    std::vector<std::string> name_patterns;      // exact, or prefix when ending in '*'
    std::vector<std::string> required_services;  // all must be advertised
    std::vector<std::string> endpoints;          // exposed as RawWrite actuators when enabled
    CapabilitySet capabilities;                  // template copied into each Device
    ProtocolFactory factory;
};

/**
 * ProtocolRegistry - static protocol selection.
 *
 * Rules are checked in insertion order; the first whose name pattern matches
 * the advertised name and whose required services are all present wins.
 * Config rules are added in front of the built-ins so they can override them.
 *
 * Not thread-safe for mutation: populate during startup, then only create().
 */
class ProtocolRegistry {
public:
    ProtocolRegistry() = default;

    // Registry preloaded with lovense, vorze and launch rules
    static ProtocolRegistry with_builtin_rules();

    void add_rule(ProtocolRule rule);
    void add_rule_front(ProtocolRule rule);

    // Build a rule for a built-in protocol by name ("lovense", "vorze", "launch",
    // "generic-vibrator"). vibrators sizes lovense and generic-vibrator layouts.
    static bool make_rule(const std::string &protocol, const std::string &name_pattern, uint32_t vibrators,
                          const std::vector<std::string> &required_services, ProtocolRule &rule,
                          std::string &error);

    static bool is_known_protocol(const std::string &protocol);

    // When enabled every created protocol also exposes one RawWrite actuator per rule endpoint
    void set_allow_raw_writes(bool allow) { allow_raw_writes_ = allow; }
    bool allow_raw_writes() const { return allow_raw_writes_; }

    const ProtocolRule *match(const DeviceIdentity &identity, const DeviceProbe &probe) const;

    // Match + instantiate. UNSUPPORTED_DEVICE when nothing matches.
    std::unique_ptr<DeviceProtocol> create(const DeviceIdentity &identity, const DeviceProbe &probe,
                                           DeviceError &error) const;

    size_t rule_count() const { return rules_.size(); }

    static bool name_matches(const std::string &pattern, const std::string &name);

private:
    std::vector<ProtocolRule> rules_;
    bool allow_raw_writes_ = false;
};

}  // namespace device
}  // namespace tactile

#endif  // TACTILE_DEVICE_PROTOCOL_REGISTRY_HPP
