#include "runtime/config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace tactile;
using namespace tactile::runtime;

class ConfigTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        // Create temporary test directory
        temp_dir = fs::temp_directory_path() / "tactile_config_test";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        // Clean up temporary files
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    std::string create_config_file(const std::string &name, const std::string &content) {
        fs::path config_path = temp_dir / name;
        std::ofstream file(config_path);
        file << content;
        file.close();
        return config_path.string();
    }

    bool load(const std::string &yaml, RuntimeConfig &config, std::string &error) {
        return load_config_from_string(yaml, config, error);
    }
};

TEST_F(ConfigTest, ValidFullConfig) {
    std::string config_content = R"(
server:
  name: test-server
  min_version: 1
  max_version: 2
  max_ping_time_ms: 500
  allow_raw_messages: true

listener:
  enabled: true
  bind: 0.0.0.0
  port: 4000
  max_sessions: 4

safety:
  check_interval_ms: 50
  stop_scope: session

events:
  queue_size: 32

devices:
  - name: VendorX*
    protocol: generic-vibrator
    vibrators: 2
    services: [fff0, fff1]

simulation:
  enabled: true
  devices:
    - name: LVS-Z36
      address: sim-00
      battery: 0.5
    - name: CycSA
      address: sim-01
      services: fff0

logging:
  level: debug
)";

    std::string config_path = create_config_file("full.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(config.server.name, "test-server");
    EXPECT_EQ(config.server.max_version, 2u);
    EXPECT_EQ(config.server.max_ping_time_ms, 500u);
    EXPECT_TRUE(config.server.allow_raw_messages);
    EXPECT_EQ(config.listener.bind, "0.0.0.0");
    EXPECT_EQ(config.listener.port, 4000);
    EXPECT_EQ(config.listener.max_sessions, 4);
    EXPECT_EQ(config.safety.check_interval_ms, 50);
    EXPECT_EQ(config.safety.stop_scope, session::StopScope::SESSION);
    EXPECT_EQ(config.events.queue_size, 32);

    ASSERT_EQ(config.devices.size(), 1u);
    EXPECT_EQ(config.devices[0].name, "VendorX*");
    EXPECT_EQ(config.devices[0].protocol, "generic-vibrator");
    EXPECT_EQ(config.devices[0].vibrators, 2);
    EXPECT_EQ(config.devices[0].services, (std::vector<std::string>{"fff0", "fff1"}));

    EXPECT_TRUE(config.simulation.enabled);
    ASSERT_EQ(config.simulation.devices.size(), 2u);
    ASSERT_TRUE(config.simulation.devices[0].battery.has_value());
    EXPECT_DOUBLE_EQ(*config.simulation.devices[0].battery, 0.5);
    EXPECT_FALSE(config.simulation.devices[1].battery.has_value());
    EXPECT_EQ(config.simulation.devices[1].services, std::vector<std::string>{"fff0"});

    EXPECT_EQ(config.logging.level, "debug");
}

TEST_F(ConfigTest, EmptyDocumentUsesDefaults) {
    RuntimeConfig config;
    std::string error;

    ASSERT_TRUE(load("", config, error)) << error;
    EXPECT_EQ(config.server.name, "tactile");
    EXPECT_EQ(config.server.min_version, 1u);
    EXPECT_EQ(config.server.max_version, 3u);
    EXPECT_EQ(config.server.max_ping_time_ms, 1000u);
    EXPECT_FALSE(config.server.allow_raw_messages);
    EXPECT_TRUE(config.listener.enabled);
    EXPECT_EQ(config.listener.port, 12345);
    EXPECT_EQ(config.safety.stop_scope, session::StopScope::GLOBAL);
    EXPECT_TRUE(config.devices.empty());
    EXPECT_FALSE(config.simulation.enabled);
    EXPECT_EQ(config.logging.level, "info");
}

TEST_F(ConfigTest, PartialSectionKeepsOtherDefaults) {
    RuntimeConfig config;
    std::string error;

    ASSERT_TRUE(load("listener:\n  port: 0\n", config, error)) << error;
    EXPECT_EQ(config.listener.port, 0);
    EXPECT_EQ(config.listener.bind, "127.0.0.1");
    EXPECT_EQ(config.server.name, "tactile");
}

TEST_F(ConfigTest, NonMappingRootIsRejected) {
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load("- a\n- b\n", config, error));
    EXPECT_NE(error.find("mapping"), std::string::npos);
}

TEST_F(ConfigTest, UnknownTopLevelKeyIsIgnored) {
    RuntimeConfig config;
    std::string error;

    EXPECT_TRUE(load("telemetry:\n  enabled: true\nserver:\n  name: x\n", config, error)) << error;
    EXPECT_EQ(config.server.name, "x");
}

TEST_F(ConfigTest, MissingFile) {
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load_config((temp_dir / "nope.yaml").string(), config, error));
    EXPECT_NE(error.find("Cannot open"), std::string::npos);
}

TEST_F(ConfigTest, YamlSyntaxError) {
    std::string config_path = create_config_file("broken.yaml", "server: [unclosed\n");
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("YAML parse error"), std::string::npos);
}

TEST_F(ConfigTest, WrongValueType) {
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load("listener:\n  port: not-a-number\n", config, error));
    EXPECT_FALSE(error.empty());
}

// ============================================================================
// Server and listener validation
// ============================================================================

TEST_F(ConfigTest, EmptyServerName) {
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load("server:\n  name: \"\"\n", config, error));
    EXPECT_NE(error.find("server.name"), std::string::npos);
}

TEST_F(ConfigTest, VersionRange) {
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load("server:\n  min_version: 0\n", config, error));
    EXPECT_NE(error.find("min_version must be >= 1"), std::string::npos);

    RuntimeConfig inverted;
    EXPECT_FALSE(load("server:\n  min_version: 3\n  max_version: 2\n", inverted, error));
    EXPECT_NE(error.find("must not exceed"), std::string::npos);
}

TEST_F(ConfigTest, PortOutOfRange) {
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load("listener:\n  port: 70000\n", config, error));
    EXPECT_NE(error.find("listener.port"), std::string::npos);
}

TEST_F(ConfigTest, DisabledListenerIsNotValidated) {
    RuntimeConfig config;
    std::string error;

    EXPECT_TRUE(load("listener:\n  enabled: false\n  port: 70000\n", config, error)) << error;
    EXPECT_FALSE(config.listener.enabled);
}

TEST_F(ConfigTest, ZeroMaxSessions) {
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load("listener:\n  max_sessions: 0\n", config, error));
    EXPECT_NE(error.find("max_sessions"), std::string::npos);
}

// ============================================================================
// Safety and events validation
// ============================================================================

TEST_F(ConfigTest, InvalidStopScope) {
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load("safety:\n  stop_scope: everything\n", config, error));
    EXPECT_NE(error.find("Invalid safety.stop_scope"), std::string::npos);
}

TEST_F(ConfigTest, CheckIntervalTooShort) {
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load("safety:\n  check_interval_ms: 5\n", config, error));
    EXPECT_NE(error.find(">= 10ms"), std::string::npos);
}

TEST_F(ConfigTest, CheckIntervalMustBeShorterThanMaxPing) {
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load("server:\n  max_ping_time_ms: 200\nsafety:\n  check_interval_ms: 200\n", config, error));
    EXPECT_NE(error.find("must be shorter than"), std::string::npos);
}

TEST_F(ConfigTest, NoPingRequirementAllowsAnyInterval) {
    RuntimeConfig config;
    std::string error;

    EXPECT_TRUE(load("server:\n  max_ping_time_ms: 0\nsafety:\n  check_interval_ms: 5000\n", config, error))
        << error;
    EXPECT_EQ(config.server.max_ping_time_ms, 0u);
}

TEST_F(ConfigTest, EventQueueSize) {
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load("events:\n  queue_size: 0\n", config, error));
    EXPECT_NE(error.find("events.queue_size"), std::string::npos);
}

// ============================================================================
// Device rules
// ============================================================================

TEST_F(ConfigTest, DeviceRuleMissingName) {
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load("devices:\n  - protocol: lovense\n", config, error));
    EXPECT_NE(error.find("missing 'name'"), std::string::npos);
}

TEST_F(ConfigTest, DeviceRuleUnknownProtocol) {
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load("devices:\n  - name: Foo\n    protocol: teleport\n", config, error));
    EXPECT_NE(error.find("unknown protocol"), std::string::npos);
}

TEST_F(ConfigTest, DeviceRuleVibratorCount) {
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load("devices:\n  - name: Foo\n    protocol: generic-vibrator\n    vibrators: 17\n", config,
                      error));
    EXPECT_NE(error.find("between 0 and 16"), std::string::npos);

    RuntimeConfig none;
    EXPECT_FALSE(load("devices:\n  - name: Foo\n    protocol: generic-vibrator\n    vibrators: 0\n", none, error));
    EXPECT_NE(error.find("at least one vibrator"), std::string::npos);

    // Rotators do not need vibrators
    RuntimeConfig vorze;
    EXPECT_TRUE(load("devices:\n  - name: Foo\n    protocol: vorze\n    vibrators: 0\n", vorze, error)) << error;
}

// ============================================================================
// Simulation and logging
// ============================================================================

TEST_F(ConfigTest, DuplicateSimulationAddress) {
    std::string yaml = R"(
simulation:
  enabled: true
  devices:
    - name: LVS-Z36
      address: sim-00
    - name: CycSA
      address: sim-00
)";
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load(yaml, config, error));
    EXPECT_NE(error.find("Duplicate simulation device address"), std::string::npos);
}

TEST_F(ConfigTest, SimulationBatteryOutOfRange) {
    std::string yaml = R"(
simulation:
  enabled: true
  devices:
    - name: LVS-Z36
      address: sim-00
      battery: 1.5
)";
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load(yaml, config, error));
    EXPECT_NE(error.find("battery must be between 0 and 1"), std::string::npos);
}

TEST_F(ConfigTest, SimulationDeviceNeedsAddress) {
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load("simulation:\n  enabled: true\n  devices:\n    - name: LVS-Z36\n", config, error));
    EXPECT_NE(error.find("needs both"), std::string::npos);

    // Disabled simulation is not checked
    RuntimeConfig disabled;
    EXPECT_TRUE(load("simulation:\n  enabled: false\n  devices:\n    - name: LVS-Z36\n", disabled, error)) << error;
}

TEST_F(ConfigTest, InvalidLogLevel) {
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load("logging:\n  level: verbose\n", config, error));
    EXPECT_NE(error.find("Invalid log level"), std::string::npos);

    RuntimeConfig upper;
    EXPECT_TRUE(load("logging:\n  level: WARN\n", upper, error)) << error;
}

// ============================================================================
// Conversions
// ============================================================================

TEST_F(ConfigTest, SessionConfigConversion) {
    RuntimeConfig config;
    config.server.name = "srv";
    config.server.min_version = 2;
    config.server.max_version = 3;
    config.server.max_ping_time_ms = 750;
    config.safety.stop_scope = session::StopScope::SESSION;
    config.events.queue_size = 64;

    session::SessionConfig out = config.session_config();
    EXPECT_EQ(out.server_name, "srv");
    EXPECT_EQ(out.min_version, 2u);
    EXPECT_EQ(out.max_version, 3u);
    EXPECT_EQ(out.max_ping_time_ms, 750u);
    EXPECT_EQ(out.stop_scope, session::StopScope::SESSION);
    EXPECT_EQ(out.event_queue_size, 64u);
}

TEST_F(ConfigTest, ListenerConfigConversion) {
    RuntimeConfig config;
    config.listener.bind = "0.0.0.0";
    config.listener.port = 9000;
    config.listener.max_sessions = 2;

    transport::ListenerConfig out = config.listener_config();
    EXPECT_EQ(out.bind, "0.0.0.0");
    EXPECT_EQ(out.port, 9000);
    EXPECT_EQ(out.max_sessions, 2u);
}

TEST_F(ConfigTest, ShippedSampleConfigLoads) {
    const fs::path sample = fs::path(__FILE__).parent_path().parent_path().parent_path() / "tactile-server.yaml";
    if (!fs::exists(sample)) {
        GTEST_SKIP() << "Sample config not found at " << sample;
    }

    RuntimeConfig config;
    std::string error;
    ASSERT_TRUE(load_config(sample.string(), config, error)) << error;
    EXPECT_TRUE(config.simulation.enabled);
    EXPECT_EQ(config.simulation.devices.size(), 3u);
    ASSERT_EQ(config.devices.size(), 1u);
    EXPECT_EQ(config.devices[0].protocol, "generic-vibrator");
}
