#include "session/safety_monitor.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "registry/device_manager.hpp"
#include "transport/sim_scanner.hpp"

using namespace tactile;
using namespace tactile::session;
using namespace std::chrono_literals;

namespace {

// First write blocks until release(), like a wedged radio link
class GatedTransport : public transport::IDeviceTransport {
public:
    bool write(const device::RawWrite &write) override {
        std::unique_lock<std::mutex> lock(mutex_);
        writes_.emplace_back(write.data.begin(), write.data.end());
        if (writes_.size() == 1) {
            entered_ = true;
            cv_.notify_all();
            cv_.wait(lock, [this] { return released_; });
        }
        return true;
    }

    bool read(const std::string &, std::vector<uint8_t> &, int) override { return false; }
    bool is_reachable() const override { return true; }
    void disconnect() override {}
    std::string last_error() const override { return std::string(); }

    bool wait_entered(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return entered_; });
    }

    void release() {
        std::lock_guard<std::mutex> lock(mutex_);
        released_ = true;
        cv_.notify_all();
    }

    std::vector<std::string> writes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return writes_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::string> writes_;
    bool entered_ = false;
    bool released_ = false;
};

bool wait_for(const std::function<bool()> &condition, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!condition()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

}  // namespace

class SafetyMonitorTest : public ::testing::Test {
protected:
    std::shared_ptr<Session> make_session(const std::string &name, uint32_t max_ping_time_ms = 1000) {
        SessionConfig config;
        config.max_ping_time_ms = max_ping_time_ms;
        return std::make_shared<Session>(name, config, manager, nullptr, [](const Message &) {});
    }

    static void handshake(Session &s) {
        ASSERT_TRUE(s.handle_message(Message{1, HandshakeRequest{"client", 1, 3}}));
    }

    registry::DeviceManager manager{device::ProtocolRegistry::with_builtin_rules()};
};

TEST_F(SafetyMonitorTest, TickChecksEveryReadySession) {
    SafetyMonitor monitor(100);

    auto a = make_session("a");
    auto b = make_session("b");
    auto pending = make_session("pending");
    handshake(*a);
    handshake(*b);

    monitor.add_session(a);
    monitor.add_session(b);
    monitor.add_session(pending);
    EXPECT_EQ(monitor.session_count(), 3u);

    EXPECT_EQ(monitor.tick(Session::Clock::now()), 0u);
    EXPECT_EQ(monitor.tick(Session::Clock::now() + 2s), 2u);

    EXPECT_TRUE(a->is_closed());
    EXPECT_TRUE(b->is_closed());
    EXPECT_FALSE(pending->is_closed());

    // Closed sessions are pruned on the next tick
    EXPECT_EQ(monitor.tick(Session::Clock::now() + 4s), 0u);
    EXPECT_EQ(monitor.session_count(), 1u);
}

TEST_F(SafetyMonitorTest, DestroyedSessionsArePruned) {
    SafetyMonitor monitor(100);
    {
        auto transient = make_session("transient");
        monitor.add_session(transient);
        EXPECT_EQ(monitor.session_count(), 1u);
    }

    EXPECT_EQ(monitor.tick(Session::Clock::now()), 0u);
    EXPECT_EQ(monitor.session_count(), 0u);
}

TEST_F(SafetyMonitorTest, BackgroundThreadStopsSilentClient) {
    transport::SimDeviceConfig sim;
    sim.name = "LVS-Z36";
    sim.address = "aa";
    auto transport = std::make_shared<transport::SimDeviceTransport>(sim);
    device::DeviceProbe probe;
    probe.transport = transport;
    ASSERT_TRUE(manager.register_device(device::DeviceIdentity{"sim", "aa", "LVS-Z36"}, probe).success);

    SafetyMonitor monitor(10);
    auto silent = make_session("silent", 50);
    handshake(*silent);
    monitor.add_session(silent);

    ASSERT_TRUE(monitor.start());
    EXPECT_TRUE(monitor.is_running());

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!silent->is_closed() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    monitor.stop();

    EXPECT_TRUE(silent->is_closed());
    EXPECT_EQ(silent->close_reason(), device::ErrorCode::PING_TIMEOUT);
    EXPECT_EQ(transport->written_strings(), std::vector<std::string>{"Vibrate:0;"});
}

TEST_F(SafetyMonitorTest, HungDeviceDoesNotDelayOtherSessionsStop) {
    auto wedged = std::make_shared<GatedTransport>();
    device::DeviceProbe wedged_probe;
    wedged_probe.transport = wedged;
    ASSERT_TRUE(manager.register_device(device::DeviceIdentity{"sim", "aa", "LVS-Z36"}, wedged_probe).success);

    transport::SimDeviceConfig sim;
    sim.name = "LVS-Z36";
    sim.address = "bb";
    auto healthy = std::make_shared<transport::SimDeviceTransport>(sim);
    device::DeviceProbe healthy_probe;
    healthy_probe.transport = healthy;
    ASSERT_TRUE(manager.register_device(device::DeviceIdentity{"sim", "bb", "LVS-Z36"}, healthy_probe).success);

    SessionConfig config;
    config.max_ping_time_ms = 1000;
    config.stop_scope = StopScope::SESSION;
    std::atomic<int> replies{0};
    auto sink = [&replies](const Message &message) {
        if (message.id == 2) {
            ++replies;
        }
    };
    auto stuck = std::make_shared<Session>("stuck", config, manager, nullptr, sink);
    auto healthy_session = std::make_shared<Session>("healthy", config, manager, nullptr, sink);
    stuck->start();
    healthy_session->start();
    handshake(*stuck);
    handshake(*healthy_session);

    device::ActuatorCommand vibrate;
    vibrate.kind = device::ActuatorKind::VIBRATE;
    vibrate.settings.push_back(device::ActuatorSetting{0, 0.5, true, 0});

    ASSERT_TRUE(healthy_session->handle_message(Message{2, DeviceCommandRequest{1, vibrate}}));
    ASSERT_TRUE(wait_for([&] { return replies.load() == 1; }, 2000ms));

    // The stuck session's command never finishes its write
    ASSERT_TRUE(stuck->handle_message(Message{2, DeviceCommandRequest{0, vibrate}}));
    ASSERT_TRUE(wedged->wait_entered(2000ms));

    SafetyMonitor monitor(100);
    monitor.add_session(stuck);
    monitor.add_session(healthy_session);

    std::atomic<size_t> fired{0};
    std::thread ticker([&] { fired = monitor.tick(Session::Clock::now() + 5s); });

    EXPECT_TRUE(wait_for([&] { return healthy_session->is_closed(); }, 2000ms));
    EXPECT_EQ(healthy_session->close_reason(), device::ErrorCode::PING_TIMEOUT);
    EXPECT_EQ(healthy->written_strings(), (std::vector<std::string>{"Vibrate:10;", "Vibrate:0;"}));

    wedged->release();
    ticker.join();

    EXPECT_EQ(fired.load(), 2u);
    EXPECT_TRUE(stuck->is_closed());
    stuck->join();
    healthy_session->join();

    // The stop lands after the command it raced with
    const auto writes = wedged->writes();
    ASSERT_GE(writes.size(), 2u);
    EXPECT_EQ(writes.front(), "Vibrate:10;");
    EXPECT_EQ(writes.back(), "Vibrate:0;");
}

TEST_F(SafetyMonitorTest, StartAndStopAreIdempotent) {
    SafetyMonitor monitor(10);
    EXPECT_FALSE(monitor.is_running());

    EXPECT_TRUE(monitor.start());
    EXPECT_TRUE(monitor.start());
    EXPECT_TRUE(monitor.is_running());

    monitor.stop();
    monitor.stop();
    EXPECT_FALSE(monitor.is_running());
}
