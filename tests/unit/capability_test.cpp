/**
 * capability_test.cpp - device types and shared DeviceProtocol validation
 *
 * Every protocol goes through the same base-class checks, so they are
 * exercised here through the simplest one (generic-vibrator).
 */

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "device/device_protocol.hpp"
#include "device/device_types.hpp"
#include "device/protocol_registry.hpp"

using namespace tactile::device;

namespace {

std::unique_ptr<DeviceProtocol> make_protocol(const std::string &protocol, uint32_t vibrators,
                                              bool with_raw_endpoint = false) {
    ProtocolRule rule;
    std::string error;
    EXPECT_TRUE(ProtocolRegistry::make_rule(protocol, "Test*", vibrators, {}, rule, error)) << error;

    CapabilitySet caps = rule.capabilities;
    if (with_raw_endpoint) {
        ActuatorDescriptor raw;
        raw.kind = ActuatorKind::RAW_WRITE;
        raw.index = static_cast<uint32_t>(caps.actuators.size());
        raw.endpoint = "tx";
        caps.actuators.push_back(raw);
    }
    return rule.factory(caps);
}

ActuatorCommand vibrate(std::vector<std::pair<uint32_t, double>> values) {
    ActuatorCommand cmd;
    cmd.kind = ActuatorKind::VIBRATE;
    for (const auto &v : values) {
        ActuatorSetting setting;
        setting.actuator_index = v.first;
        setting.value = v.second;
        cmd.settings.push_back(setting);
    }
    return cmd;
}

}  // namespace

// ============================================================================
// Types
// ============================================================================

TEST(DeviceTypesTest, IdentityKeyCombinesKindAndAddress) {
    DeviceIdentity identity{"sim", "00:11", "LVS-Z36"};
    EXPECT_EQ(identity.key(), "sim/00:11");

    DeviceIdentity same_address_other_kind{"ble", "00:11", "LVS-Z36"};
    EXPECT_NE(identity.key(), same_address_other_kind.key());
}

TEST(DeviceTypesTest, CapabilityLookup) {
    CapabilitySet caps;
    caps.actuators.push_back(ActuatorDescriptor{ActuatorKind::VIBRATE, 0, {}, 20, "tx"});
    caps.actuators.push_back(ActuatorDescriptor{ActuatorKind::VIBRATE, 1, {}, 20, "tx"});
    caps.actuators.push_back(ActuatorDescriptor{ActuatorKind::ROTATE, 2, {}, 20, "tx"});
    caps.sensors.push_back(SensorDescriptor{SensorKind::BATTERY, 0, {}, "rx"});

    ASSERT_NE(caps.find_actuator(2), nullptr);
    EXPECT_EQ(caps.find_actuator(2)->kind, ActuatorKind::ROTATE);
    EXPECT_EQ(caps.find_actuator(3), nullptr);
    ASSERT_NE(caps.find_sensor(0), nullptr);
    EXPECT_EQ(caps.find_sensor(1), nullptr);

    EXPECT_EQ(caps.count_actuators(ActuatorKind::VIBRATE), 2u);
    EXPECT_EQ(caps.count_actuators(ActuatorKind::LINEAR), 0u);
}

TEST(DeviceTypesTest, ValueRangeIsInclusive) {
    ValueRange range;
    EXPECT_TRUE(range.contains(0.0));
    EXPECT_TRUE(range.contains(1.0));
    EXPECT_FALSE(range.contains(1.2));
    EXPECT_FALSE(range.contains(-0.01));
}

TEST(DeviceTypesTest, ErrorCodeNamesAndCategories) {
    EXPECT_STREQ(error_code_to_string(ErrorCode::VERSION_MISMATCH), "VersionMismatch");
    EXPECT_STREQ(error_code_to_string(ErrorCode::OUT_OF_RANGE), "OutOfRange");
    EXPECT_STREQ(error_code_to_string(ErrorCode::PING_TIMEOUT), "PingTimeout");

    EXPECT_EQ(category_of(ErrorCode::HANDSHAKE_REQUIRED), ErrorCategory::PROTOCOL_VIOLATION);
    EXPECT_EQ(category_of(ErrorCode::DUPLICATE_MESSAGE_ID), ErrorCategory::PROTOCOL_VIOLATION);
    EXPECT_EQ(category_of(ErrorCode::UNKNOWN_DEVICE), ErrorCategory::DEVICE_ERROR);
    EXPECT_EQ(category_of(ErrorCode::UNRECOGNIZED_MESSAGE), ErrorCategory::DEVICE_ERROR);
    EXPECT_EQ(category_of(ErrorCode::TRANSPORT_ERROR), ErrorCategory::TRANSPORT_ERROR);
    EXPECT_EQ(category_of(ErrorCode::PING_TIMEOUT), ErrorCategory::SAFETY_TIMEOUT);
    EXPECT_EQ(category_of(ErrorCode::OK), ErrorCategory::NONE);
}

TEST(DeviceTypesTest, CommandNames) {
    EXPECT_STREQ(command_name(DeviceCommand{vibrate({{0, 0.5}})}), "Vibrate");
    EXPECT_STREQ(command_name(DeviceCommand{RawWriteCommand{}}), "RawWrite");
    EXPECT_STREQ(command_name(DeviceCommand{SensorReadCommand{}}), "SensorRead");
    EXPECT_STREQ(command_name(DeviceCommand{StopDeviceCommand{}}), "StopDevice");
}

// ============================================================================
// Validation
// ============================================================================

TEST(ProtocolValidationTest, InRangeValueProducesWrite) {
    auto protocol = make_protocol("generic-vibrator", 2);
    std::vector<RawWrite> writes;
    DeviceError error;

    ASSERT_TRUE(protocol->translate(vibrate({{1, 0.5}}), writes, error)) << error.message;
    ASSERT_EQ(writes.size(), 1u);
    EXPECT_EQ(writes[0].endpoint, "tx");
    EXPECT_EQ(writes[0].data, (std::vector<uint8_t>{0xA1, 50}));
}

TEST(ProtocolValidationTest, ValueAboveRangeIsOutOfRange) {
    auto protocol = make_protocol("generic-vibrator", 1);
    std::vector<RawWrite> writes;
    DeviceError error;

    EXPECT_FALSE(protocol->translate(vibrate({{0, 1.2}}), writes, error));
    EXPECT_EQ(error.code, ErrorCode::OUT_OF_RANGE);
    EXPECT_TRUE(writes.empty());
}

TEST(ProtocolValidationTest, NegativeValueIsOutOfRange) {
    auto protocol = make_protocol("generic-vibrator", 1);
    std::vector<RawWrite> writes;
    DeviceError error;

    EXPECT_FALSE(protocol->translate(vibrate({{0, -0.1}}), writes, error));
    EXPECT_EQ(error.code, ErrorCode::OUT_OF_RANGE);
}

TEST(ProtocolValidationTest, MissingActuatorIndex) {
    auto protocol = make_protocol("generic-vibrator", 1);
    std::vector<RawWrite> writes;
    DeviceError error;

    EXPECT_FALSE(protocol->translate(vibrate({{5, 0.5}}), writes, error));
    EXPECT_EQ(error.code, ErrorCode::INVALID_ACTUATOR_INDEX);
}

TEST(ProtocolValidationTest, KindMismatchIsUnsupportedCommand) {
    auto protocol = make_protocol("generic-vibrator", 1);
    ActuatorCommand rotate;
    rotate.kind = ActuatorKind::ROTATE;
    rotate.settings.push_back(ActuatorSetting{0, 0.5, true, 0});

    std::vector<RawWrite> writes;
    DeviceError error;
    EXPECT_FALSE(protocol->translate(rotate, writes, error));
    EXPECT_EQ(error.code, ErrorCode::UNSUPPORTED_COMMAND);
}

TEST(ProtocolValidationTest, EmptyAndDuplicateSettingsRejected) {
    auto protocol = make_protocol("generic-vibrator", 2);
    std::vector<RawWrite> writes;
    DeviceError error;

    EXPECT_FALSE(protocol->translate(vibrate({}), writes, error));
    EXPECT_EQ(error.code, ErrorCode::UNSUPPORTED_COMMAND);

    error = DeviceError{};
    EXPECT_FALSE(protocol->translate(vibrate({{0, 0.2}, {0, 0.4}}), writes, error));
    EXPECT_EQ(error.code, ErrorCode::UNSUPPORTED_COMMAND);
    EXPECT_TRUE(writes.empty());
}

TEST(ProtocolValidationTest, SensorReadIsNotAWriteCommand) {
    auto protocol = make_protocol("generic-vibrator", 1);
    std::vector<RawWrite> writes;
    DeviceError error;

    EXPECT_FALSE(protocol->translate(SensorReadCommand{0}, writes, error));
    EXPECT_EQ(error.code, ErrorCode::UNSUPPORTED_COMMAND);
}

TEST(ProtocolValidationTest, SensorReadOfMissingSensor) {
    auto protocol = make_protocol("generic-vibrator", 1);
    RawWrite request;
    std::string reply_endpoint;
    DeviceError error;

    EXPECT_FALSE(protocol->sensor_read_request(0, request, reply_endpoint, error));
    EXPECT_EQ(error.code, ErrorCode::INVALID_ACTUATOR_INDEX);
}

// ============================================================================
// Redundant-write suppression
// ============================================================================

TEST(ProtocolSuppressionTest, RepeatedStepIsSuppressed) {
    auto protocol = make_protocol("generic-vibrator", 1);
    std::vector<RawWrite> writes;
    DeviceError error;

    ASSERT_TRUE(protocol->translate(vibrate({{0, 0.5}}), writes, error));
    EXPECT_EQ(writes.size(), 1u);

    // 0.501 maps onto the same hardware step
    writes.clear();
    ASSERT_TRUE(protocol->translate(vibrate({{0, 0.501}}), writes, error));
    EXPECT_TRUE(writes.empty());

    writes.clear();
    ASSERT_TRUE(protocol->translate(vibrate({{0, 0.6}}), writes, error));
    EXPECT_EQ(writes.size(), 1u);
}

TEST(ProtocolSuppressionTest, OnlyChangedMotorsAreWritten) {
    auto protocol = make_protocol("generic-vibrator", 2);
    std::vector<RawWrite> writes;
    DeviceError error;

    ASSERT_TRUE(protocol->translate(vibrate({{0, 0.3}, {1, 0.3}}), writes, error));
    EXPECT_EQ(writes.size(), 2u);

    writes.clear();
    ASSERT_TRUE(protocol->translate(vibrate({{0, 0.3}, {1, 0.7}}), writes, error));
    ASSERT_EQ(writes.size(), 1u);
    EXPECT_EQ(writes[0].data[0], 0xA1);
}

TEST(ProtocolSuppressionTest, StopIsNeverSuppressed) {
    auto protocol = make_protocol("generic-vibrator", 2);

    auto first = protocol->stop_writes();
    auto second = protocol->stop_writes();
    EXPECT_EQ(first.size(), 2u);
    EXPECT_EQ(second.size(), 2u);
}

TEST(ProtocolSuppressionTest, StopResetsLastSentState) {
    auto protocol = make_protocol("generic-vibrator", 1);
    std::vector<RawWrite> writes;
    DeviceError error;

    ASSERT_TRUE(protocol->translate(vibrate({{0, 0.5}}), writes, error));
    protocol->stop_writes();

    // Already stopped
    writes.clear();
    ASSERT_TRUE(protocol->translate(vibrate({{0, 0.0}}), writes, error));
    EXPECT_TRUE(writes.empty());

    // Same value as before the stop must go out again
    writes.clear();
    ASSERT_TRUE(protocol->translate(vibrate({{0, 0.5}}), writes, error));
    EXPECT_EQ(writes.size(), 1u);
}

TEST(ProtocolSuppressionTest, InvalidateCacheForcesRewrite) {
    auto protocol = make_protocol("generic-vibrator", 1);
    std::vector<RawWrite> writes;
    DeviceError error;

    ASSERT_TRUE(protocol->translate(vibrate({{0, 0.5}}), writes, error));
    protocol->invalidate_cache();

    writes.clear();
    ASSERT_TRUE(protocol->translate(vibrate({{0, 0.5}}), writes, error));
    EXPECT_EQ(writes.size(), 1u);
}

// ============================================================================
// Raw writes
// ============================================================================

TEST(ProtocolRawWriteTest, ForwardsBytesUnchanged) {
    auto protocol = make_protocol("generic-vibrator", 1, true);
    RawWriteCommand raw;
    raw.actuator_index = 1;
    raw.data = {0xDE, 0xAD, 0xBE, 0xEF};
    raw.write_with_response = true;

    std::vector<RawWrite> writes;
    DeviceError error;
    ASSERT_TRUE(protocol->translate(raw, writes, error)) << error.message;
    ASSERT_EQ(writes.size(), 1u);
    EXPECT_EQ(writes[0].endpoint, "tx");
    EXPECT_EQ(writes[0].data, raw.data);
    EXPECT_TRUE(writes[0].write_with_response);
}

TEST(ProtocolRawWriteTest, RequiresRawWriteActuator) {
    auto protocol = make_protocol("generic-vibrator", 1, true);
    RawWriteCommand raw;
    raw.actuator_index = 0;  // the vibrator
    raw.data = {0x01};

    std::vector<RawWrite> writes;
    DeviceError error;
    EXPECT_FALSE(protocol->translate(raw, writes, error));
    EXPECT_EQ(error.code, ErrorCode::UNSUPPORTED_COMMAND);
}

TEST(ProtocolRawWriteTest, EmptyPayloadRejected) {
    auto protocol = make_protocol("generic-vibrator", 1, true);
    RawWriteCommand raw;
    raw.actuator_index = 1;

    std::vector<RawWrite> writes;
    DeviceError error;
    EXPECT_FALSE(protocol->translate(raw, writes, error));
    EXPECT_EQ(error.code, ErrorCode::OUT_OF_RANGE);
}

TEST(ProtocolRawWriteTest, RawWriteClearsSuppressionCache) {
    auto protocol = make_protocol("generic-vibrator", 1, true);
    std::vector<RawWrite> writes;
    DeviceError error;

    ASSERT_TRUE(protocol->translate(vibrate({{0, 0.5}}), writes, error));

    RawWriteCommand raw;
    raw.actuator_index = 1;
    raw.data = {0xA0, 0x00};
    ASSERT_TRUE(protocol->translate(raw, writes, error));

    writes.clear();
    ASSERT_TRUE(protocol->translate(vibrate({{0, 0.5}}), writes, error));
    EXPECT_EQ(writes.size(), 1u);
}
