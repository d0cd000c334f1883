#include "protocol_registry.hpp"

#include <algorithm>

#include "device/protocols/generic_vibrator_protocol.hpp"
#include "device/protocols/launch_protocol.hpp"
#include "device/protocols/lovense_protocol.hpp"
#include "device/protocols/vorze_protocol.hpp"
#include "logging/logger.hpp"

namespace tactile {
namespace device {

namespace {

void add_actuators(CapabilitySet &caps, ActuatorKind kind, uint32_t count, uint32_t step_count,
                   const std::string &endpoint) {
    for (uint32_t i = 0; i < count; ++i) {
        ActuatorDescriptor actuator;
        actuator.kind = kind;
        actuator.index = static_cast<uint32_t>(caps.actuators.size());
        actuator.step_count = step_count;
        actuator.endpoint = endpoint;
        caps.actuators.push_back(actuator);
    }
}

}  // namespace

ProtocolRegistry ProtocolRegistry::with_builtin_rules() {
    ProtocolRegistry registry;
    std::string error;

    ProtocolRule rule;
    if (make_rule("lovense", "LVS-Edge*", 2, {}, rule, error)) {
        registry.add_rule(std::move(rule));
    }

    // Nora: one vibrator plus a rotating head
    rule = ProtocolRule{};
    if (make_rule("lovense", "LVS-Nora*", 1, {}, rule, error)) {
        add_actuators(rule.capabilities, ActuatorKind::ROTATE, 1, LovenseProtocol::STEP_COUNT,
                      LovenseProtocol::TX_ENDPOINT);
        registry.add_rule(std::move(rule));
    }

    rule = ProtocolRule{};
    if (make_rule("lovense", "LVS-*", 1, {}, rule, error)) {
        registry.add_rule(std::move(rule));
    }

    rule = ProtocolRule{};
    if (make_rule("vorze", "CycSA", 0, {}, rule, error)) {
        registry.add_rule(std::move(rule));
    }

    rule = ProtocolRule{};
    if (make_rule("launch", "Launch", 0, {}, rule, error)) {
        registry.add_rule(std::move(rule));
    }

    return registry;
}

void ProtocolRegistry::add_rule(ProtocolRule rule) { rules_.push_back(std::move(rule)); }

void ProtocolRegistry::add_rule_front(ProtocolRule rule) { rules_.insert(rules_.begin(), std::move(rule)); }

bool ProtocolRegistry::is_known_protocol(const std::string &protocol) {
    return protocol == "lovense" || protocol == "vorze" || protocol == "launch" || protocol == "generic-vibrator";
}

bool ProtocolRegistry::make_rule(const std::string &protocol, const std::string &name_pattern, uint32_t vibrators,
                                 const std::vector<std::string> &required_services, ProtocolRule &rule,
                                 std::string &error) {
    if (name_pattern.empty()) {
        error = "Protocol rule needs a name pattern";
        return false;
    }

    rule.protocol_name = protocol;
    rule.name_patterns = {name_pattern};
    rule.required_services = required_services;
    rule.capabilities = CapabilitySet{};

    if (protocol == "lovense") {
        if (vibrators == 0) {
            error = "lovense rule '" + name_pattern + "' needs at least one vibrator";
            return false;
        }
        add_actuators(rule.capabilities, ActuatorKind::VIBRATE, vibrators, LovenseProtocol::STEP_COUNT,
                      LovenseProtocol::TX_ENDPOINT);

        SensorDescriptor battery;
        battery.kind = SensorKind::BATTERY;
        battery.index = 0;
        battery.endpoint = LovenseProtocol::RX_ENDPOINT;
        rule.capabilities.sensors.push_back(battery);

        rule.endpoints = {LovenseProtocol::TX_ENDPOINT};
        rule.factory = [](CapabilitySet caps) { return std::make_unique<LovenseProtocol>(std::move(caps)); };
        return true;
    }

    if (protocol == "vorze") {
        add_actuators(rule.capabilities, ActuatorKind::ROTATE, 1, VorzeProtocol::STEP_COUNT,
                      VorzeProtocol::TX_ENDPOINT);
        rule.endpoints = {VorzeProtocol::TX_ENDPOINT};
        rule.factory = [](CapabilitySet caps) { return std::make_unique<VorzeProtocol>(std::move(caps)); };
        return true;
    }

    if (protocol == "launch") {
        add_actuators(rule.capabilities, ActuatorKind::LINEAR, 1, LaunchProtocol::STEP_COUNT,
                      LaunchProtocol::TX_ENDPOINT);
        rule.endpoints = {LaunchProtocol::TX_ENDPOINT};
        rule.factory = [](CapabilitySet caps) { return std::make_unique<LaunchProtocol>(std::move(caps)); };
        return true;
    }

    if (protocol == "generic-vibrator") {
        if (vibrators == 0) {
            error = "generic-vibrator rule '" + name_pattern + "' needs at least one vibrator";
            return false;
        }
        add_actuators(rule.capabilities, ActuatorKind::VIBRATE, vibrators, GenericVibratorProtocol::STEP_COUNT,
                      GenericVibratorProtocol::TX_ENDPOINT);
        rule.endpoints = {GenericVibratorProtocol::TX_ENDPOINT};
        rule.factory = [](CapabilitySet caps) {
            return std::make_unique<GenericVibratorProtocol>(std::move(caps));
        };
        return true;
    }

    error = "Unknown protocol '" + protocol + "'";
    return false;
}

bool ProtocolRegistry::name_matches(const std::string &pattern, const std::string &name) {
    if (!pattern.empty() && pattern.back() == '*') {
        const std::string prefix = pattern.substr(0, pattern.size() - 1);
        return name.compare(0, prefix.size(), prefix) == 0;
    }
    return pattern == name;
}

const ProtocolRule *ProtocolRegistry::match(const DeviceIdentity &identity, const DeviceProbe &probe) const {
    for (const auto &rule : rules_) {
        bool name_ok = std::any_of(rule.name_patterns.begin(), rule.name_patterns.end(),
                                   [&](const std::string &pattern) { return name_matches(pattern, identity.name); });
        if (!name_ok) {
            continue;
        }

        bool services_ok = std::all_of(
            rule.required_services.begin(), rule.required_services.end(), [&](const std::string &service) {
                return std::find(probe.services.begin(), probe.services.end(), service) != probe.services.end();
            });
        if (!services_ok) {
            LOG_DEBUG("[ProtocolRegistry] " << identity.name << " matches " << rule.protocol_name
                                            << " by name but lacks required services");
            continue;
        }

        return &rule;
    }
    return nullptr;
}

std::unique_ptr<DeviceProtocol> ProtocolRegistry::create(const DeviceIdentity &identity, const DeviceProbe &probe,
                                                         DeviceError &error) const {
    const ProtocolRule *rule = match(identity, probe);
    if (rule == nullptr || !rule->factory) {
        error.set(ErrorCode::UNSUPPORTED_DEVICE, "No protocol matches device '" + identity.name + "'");
        return nullptr;
    }

    CapabilitySet caps = rule->capabilities;
    if (allow_raw_writes_) {
        for (const auto &endpoint : rule->endpoints) {
            add_actuators(caps, ActuatorKind::RAW_WRITE, 1, 0, endpoint);
        }
    }

    return rule->factory(std::move(caps));
}

}  // namespace device
}  // namespace tactile
