#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "session/session.hpp"
#include "transport/sim_scanner.hpp"
#include "transport/tcp_listener.hpp"

namespace tactile {
namespace runtime {

// server: section
struct ServerConfig {
    std::string name = "tactile";
    uint32_t min_version = 1;
    uint32_t max_version = 3;
    uint32_t max_ping_time_ms = 1000;  // 0 disables the ping requirement
    bool allow_raw_messages = false;
};

struct ListenerSectionConfig {
    bool enabled = true;
    std::string bind = "127.0.0.1";
    int port = 12345;
    int max_sessions = 16;
};

struct SafetyConfig {
    int check_interval_ms = 100;
    session::StopScope stop_scope = session::StopScope::GLOBAL;
};

struct EventsConfig {
    int queue_size = 256;
};

// Extra protocol rule from the devices: list
struct DeviceRuleConfig {
    std::string name;  // exact name, or prefix when ending in '*'
    std::string protocol;
    int vibrators = 1;
    std::vector<std::string> services;
};

struct SimulationConfig {
    bool enabled = false;
    std::vector<transport::SimDeviceConfig> devices;
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct RuntimeConfig {
    ServerConfig server;
    ListenerSectionConfig listener;
    SafetyConfig safety;
    EventsConfig events;
    std::vector<DeviceRuleConfig> devices;
    SimulationConfig simulation;
    LoggingConfig logging;

    session::SessionConfig session_config() const;
    transport::ListenerConfig listener_config() const;
};

// Loads configuration from a YAML file and validates it
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Same as load_config, from YAML text
bool load_config_from_string(const std::string &yaml_text, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

}  // namespace runtime
}  // namespace tactile
