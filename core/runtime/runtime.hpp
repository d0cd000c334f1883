#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "config.hpp"
#include "discovery_pump.hpp"
#include "events/event_emitter.hpp"
#include "registry/device_manager.hpp"
#include "session/safety_monitor.hpp"
#include "transport/scan_event_queue.hpp"
#include "transport/sim_scanner.hpp"
#include "transport/tcp_listener.hpp"

namespace tactile {
namespace runtime {

class Runtime {
public:
    explicit Runtime(const RuntimeConfig &config);
    ~Runtime();

    Runtime(const Runtime &) = delete;
    Runtime &operator=(const Runtime &) = delete;

    // Build every component and start discovery, the safety monitor and the listener
    bool initialize(std::string &error);

    // Main runtime loop (blocking)
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    // Global stop, then tear down listener, scanners and device transports
    void shutdown();

    registry::DeviceManager &get_device_manager() { return *device_manager_; }
    events::EventEmitter &get_event_emitter() { return *event_emitter_; }
    session::SafetyMonitor &get_safety_monitor() { return *safety_monitor_; }

    // Null when the corresponding section is disabled
    transport::TcpListener *get_listener() { return listener_.get(); }
    transport::SimScanner *get_sim_scanner() { return sim_scanner_.get(); }

    const RuntimeConfig &config() const { return config_; }

private:
    // Staged initialization helpers
    bool init_core_services(std::string &error);
    bool init_discovery(std::string &error);
    bool init_safety(std::string &error);
    bool init_listener(std::string &error);

    bool build_protocol_registry(device::ProtocolRegistry &protocols, std::string &error) const;

    RuntimeConfig config_;

    std::unique_ptr<events::EventEmitter> event_emitter_;
    std::unique_ptr<registry::DeviceManager> device_manager_;
    std::unique_ptr<transport::ScanEventQueue> scan_queue_;
    std::unique_ptr<transport::SimScanner> sim_scanner_;
    std::unique_ptr<DiscoveryPump> discovery_pump_;
    std::unique_ptr<session::SafetyMonitor> safety_monitor_;
    std::unique_ptr<transport::TcpListener> listener_;

    std::atomic<bool> running_{false};
    bool shut_down_ = false;
};

}  // namespace runtime
}  // namespace tactile
