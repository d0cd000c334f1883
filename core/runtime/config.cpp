#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <sstream>

#include "device/protocol_registry.hpp"
#include "logging/logger.hpp"

namespace tactile {
namespace runtime {

namespace {

std::vector<std::string> load_string_list(const YAML::Node &node) {
    std::vector<std::string> values;
    if (node.IsSequence()) {
        for (const auto &item : node) {
            values.push_back(item.as<std::string>());
        }
    } else if (node.IsScalar()) {
        values.push_back(node.as<std::string>());
    }
    return values;
}

bool parse_yaml(const YAML::Node &yaml, RuntimeConfig &config, std::string &error) {
    if (!yaml.IsMap()) {
        if (yaml.IsNull()) {
            return validate_config(config, error);
        }
        error = "Config root must be a mapping";
        return false;
    }

    // Check for unknown top-level keys
    const std::vector<std::string> valid_keys = {"server",  "listener",   "safety", "events",
                                                 "devices", "simulation", "logging"};
    for (const auto &key_node : yaml) {
        std::string key = key_node.first.as<std::string>();
        bool known = false;
        for (const auto &valid_key : valid_keys) {
            if (key == valid_key) {
                known = true;
                break;
            }
        }
        if (!known) {
            LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
        }
    }

    if (yaml["server"]) {
        const auto &server = yaml["server"];
        if (server["name"]) {
            config.server.name = server["name"].as<std::string>();
        }
        if (server["min_version"]) {
            config.server.min_version = server["min_version"].as<uint32_t>();
        }
        if (server["max_version"]) {
            config.server.max_version = server["max_version"].as<uint32_t>();
        }
        if (server["max_ping_time_ms"]) {
            config.server.max_ping_time_ms = server["max_ping_time_ms"].as<uint32_t>();
        }
        if (server["allow_raw_messages"]) {
            config.server.allow_raw_messages = server["allow_raw_messages"].as<bool>();
        }
    }

    if (yaml["listener"]) {
        const auto &listener = yaml["listener"];
        if (listener["enabled"]) {
            config.listener.enabled = listener["enabled"].as<bool>();
        }
        if (listener["bind"]) {
            config.listener.bind = listener["bind"].as<std::string>();
        }
        if (listener["port"]) {
            config.listener.port = listener["port"].as<int>();
        }
        if (listener["max_sessions"]) {
            config.listener.max_sessions = listener["max_sessions"].as<int>();
        }
    }

    if (yaml["safety"]) {
        const auto &safety = yaml["safety"];
        if (safety["check_interval_ms"]) {
            config.safety.check_interval_ms = safety["check_interval_ms"].as<int>();
        }
        if (safety["stop_scope"]) {
            auto scope_str = safety["stop_scope"].as<std::string>();
            if (!session::parse_stop_scope(scope_str, config.safety.stop_scope)) {
                error = "Invalid safety.stop_scope '" + scope_str + "': must be global or session";
                return false;
            }
        }
    }

    if (yaml["events"]) {
        if (yaml["events"]["queue_size"]) {
            config.events.queue_size = yaml["events"]["queue_size"].as<int>();
        }
    }

    if (yaml["devices"]) {
        config.devices.clear();  // Ensure idempotent parsing
        for (const auto &rule_node : yaml["devices"]) {
            DeviceRuleConfig rule;
            if (rule_node["name"]) {
                rule.name = rule_node["name"].as<std::string>();
            }
            if (rule_node["protocol"]) {
                rule.protocol = rule_node["protocol"].as<std::string>();
            }
            if (rule_node["vibrators"]) {
                rule.vibrators = rule_node["vibrators"].as<int>();
            }
            if (rule_node["services"]) {
                rule.services = load_string_list(rule_node["services"]);
            }
            config.devices.push_back(rule);
        }
    }

    if (yaml["simulation"]) {
        const auto &simulation = yaml["simulation"];
        if (simulation["enabled"]) {
            config.simulation.enabled = simulation["enabled"].as<bool>();
        }
        if (simulation["devices"]) {
            config.simulation.devices.clear();
            for (const auto &device_node : simulation["devices"]) {
                transport::SimDeviceConfig device;
                if (device_node["name"]) {
                    device.name = device_node["name"].as<std::string>();
                }
                if (device_node["address"]) {
                    device.address = device_node["address"].as<std::string>();
                }
                if (device_node["services"]) {
                    device.services = load_string_list(device_node["services"]);
                }
                if (device_node["battery"]) {
                    device.battery = device_node["battery"].as<double>();
                }
                config.simulation.devices.push_back(device);
            }
        }
    }

    if (yaml["logging"]) {
        if (yaml["logging"]["level"]) {
            config.logging.level = yaml["logging"]["level"].as<std::string>();
        }
    }

    return validate_config(config, error);
}

void log_summary(const RuntimeConfig &config) {
    LOG_INFO("[Config] Server: " << config.server.name << " (versions " << config.server.min_version << "-"
                                 << config.server.max_version << ", max ping " << config.server.max_ping_time_ms
                                 << "ms)");

    std::stringstream listener_msg;
    listener_msg << "[Config] Listener: " << (config.listener.enabled ? "enabled" : "disabled");
    if (config.listener.enabled) {
        listener_msg << " (" << config.listener.bind << ":" << config.listener.port << ")";
    }
    LOG_INFO(listener_msg.str());

    LOG_INFO("[Config] Safety: check every " << config.safety.check_interval_ms << "ms, "
                                              << session::stop_scope_to_string(config.safety.stop_scope)
                                              << " stop scope");
    LOG_INFO("[Config] " << config.devices.size() << " device rule(s)");

    std::stringstream sim_msg;
    sim_msg << "[Config] Simulation: " << (config.simulation.enabled ? "enabled" : "disabled");
    if (config.simulation.enabled) {
        sim_msg << " (" << config.simulation.devices.size() << " devices)";
    }
    LOG_INFO(sim_msg.str());

    LOG_INFO("[Config] Log level: " << config.logging.level);
}

}  // namespace

session::SessionConfig RuntimeConfig::session_config() const {
    session::SessionConfig out;
    out.server_name = server.name;
    out.min_version = server.min_version;
    out.max_version = server.max_version;
    out.max_ping_time_ms = server.max_ping_time_ms;
    out.stop_scope = safety.stop_scope;
    out.event_queue_size = static_cast<size_t>(events.queue_size);
    return out;
}

transport::ListenerConfig RuntimeConfig::listener_config() const {
    transport::ListenerConfig out;
    out.bind = listener.bind;
    out.port = static_cast<uint16_t>(listener.port);
    out.max_sessions = static_cast<size_t>(listener.max_sessions);
    return out;
}

bool validate_config(const RuntimeConfig &config, std::string &error) {
    // Validate server settings
    if (config.server.name.empty()) {
        error = "server.name must not be empty";
        return false;
    }
    if (config.server.min_version < 1) {
        error = "server.min_version must be >= 1";
        return false;
    }
    if (config.server.min_version > config.server.max_version) {
        error = "server.min_version (" + std::to_string(config.server.min_version) +
                ") must not exceed server.max_version (" + std::to_string(config.server.max_version) + ")";
        return false;
    }

    // Validate listener settings
    if (config.listener.enabled) {
        if (config.listener.port < 0 || config.listener.port > 65535) {
            error = "listener.port must be between 0 and 65535";
            return false;
        }
        if (config.listener.bind.empty()) {
            error = "listener.bind must not be empty";
            return false;
        }
        if (config.listener.max_sessions < 1) {
            error = "listener.max_sessions must be at least 1";
            return false;
        }
    }

    // Validate safety settings
    if (config.safety.check_interval_ms < 10) {
        error = "safety.check_interval_ms must be >= 10ms";
        return false;
    }
    if (config.server.max_ping_time_ms > 0 &&
        static_cast<uint32_t>(config.safety.check_interval_ms) >= config.server.max_ping_time_ms) {
        error = "safety.check_interval_ms (" + std::to_string(config.safety.check_interval_ms) +
                ") must be shorter than server.max_ping_time_ms (" +
                std::to_string(config.server.max_ping_time_ms) + ")";
        return false;
    }

    if (config.events.queue_size < 1) {
        error = "events.queue_size must be at least 1";
        return false;
    }

    // Validate device rules
    for (const auto &rule : config.devices) {
        if (rule.name.empty()) {
            error = "Device rule missing 'name' field";
            return false;
        }
        if (!device::ProtocolRegistry::is_known_protocol(rule.protocol)) {
            error = "Device rule '" + rule.name + "' has unknown protocol: '" + rule.protocol + "'";
            return false;
        }
        if (rule.vibrators < 0 || rule.vibrators > 16) {
            error = "Device rule '" + rule.name + "' vibrators must be between 0 and 16";
            return false;
        }
        device::ProtocolRule probe_rule;
        std::string rule_error;
        if (!device::ProtocolRegistry::make_rule(rule.protocol, rule.name, static_cast<uint32_t>(rule.vibrators),
                                                 rule.services, probe_rule, rule_error)) {
            error = "Device rule '" + rule.name + "': " + rule_error;
            return false;
        }
    }

    // Validate simulated devices
    if (config.simulation.enabled) {
        for (size_t i = 0; i < config.simulation.devices.size(); ++i) {
            const auto &device = config.simulation.devices[i];
            if (device.name.empty() || device.address.empty()) {
                error = "simulation.devices[" + std::to_string(i) + "] needs both 'name' and 'address'";
                return false;
            }
            if (device.battery && (*device.battery < 0.0 || *device.battery > 1.0)) {
                error = "simulation device '" + device.name + "' battery must be between 0 and 1";
                return false;
            }
            for (size_t j = 0; j < i; ++j) {
                if (config.simulation.devices[j].address == device.address) {
                    error = "Duplicate simulation device address: " + device.address;
                    return false;
                }
            }
        }
    }

    // Validate logging settings
    if (!logging::parse_level(config.logging.level)) {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);
        if (!parse_yaml(yaml, config, error)) {
            return false;
        }
        log_summary(config);
        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

bool load_config_from_string(const std::string &yaml_text, RuntimeConfig &config, std::string &error) {
    try {
        return parse_yaml(YAML::Load(yaml_text), config, error);
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace tactile
