#include "runtime.hpp"

#include <chrono>
#include <thread>

#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace tactile {
namespace runtime {

Runtime::Runtime(const RuntimeConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing " << config_.server.name);

    if (!init_core_services(error)) {
        return false;
    }

    if (!init_discovery(error)) {
        return false;
    }

    if (!init_safety(error)) {
        return false;
    }

    if (!init_listener(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::build_protocol_registry(device::ProtocolRegistry &protocols, std::string &error) const {
    protocols = device::ProtocolRegistry::with_builtin_rules();
    protocols.set_allow_raw_writes(config_.server.allow_raw_messages);

    // Config rules go in front of the built-ins, first rule first
    for (auto it = config_.devices.rbegin(); it != config_.devices.rend(); ++it) {
        device::ProtocolRule rule;
        if (!device::ProtocolRegistry::make_rule(it->protocol, it->name, static_cast<uint32_t>(it->vibrators),
                                                 it->services, rule, error)) {
            return false;
        }
        protocols.add_rule_front(std::move(rule));
        LOG_DEBUG("[Runtime] Device rule: " << it->name << " -> " << it->protocol);
    }

    LOG_INFO("[Runtime] " << protocols.rule_count() << " protocol rules ("
                          << (config_.server.allow_raw_messages ? "raw writes allowed" : "raw writes disabled")
                          << ")");
    return true;
}

bool Runtime::init_core_services(std::string &error) {
    event_emitter_ = std::make_unique<events::EventEmitter>(static_cast<size_t>(config_.events.queue_size));
    LOG_INFO("[Runtime] Event emitter created (queue size " << config_.events.queue_size << ")");

    device::ProtocolRegistry protocols;
    if (!build_protocol_registry(protocols, error)) {
        return false;
    }

    device_manager_ = std::make_unique<registry::DeviceManager>(std::move(protocols), event_emitter_.get());
    return true;
}

bool Runtime::init_discovery(std::string &error) {
    scan_queue_ = std::make_unique<transport::ScanEventQueue>();
    discovery_pump_ = std::make_unique<DiscoveryPump>(*scan_queue_, *device_manager_);
    if (!discovery_pump_->start()) {
        error = "Discovery pump failed to start";
        return false;
    }

    if (config_.simulation.enabled) {
        sim_scanner_ = std::make_unique<transport::SimScanner>(config_.simulation.devices);
        sim_scanner_->set_event_queue(scan_queue_.get());
        if (!sim_scanner_->start_scanning()) {
            error = "Simulated scanner failed to start: " + sim_scanner_->last_error();
            return false;
        }
    } else {
        LOG_INFO("[Runtime] Simulation disabled in config");
    }

    return true;
}

bool Runtime::init_safety(std::string &error) {
    safety_monitor_ = std::make_unique<session::SafetyMonitor>(config_.safety.check_interval_ms);
    if (config_.server.max_ping_time_ms == 0) {
        LOG_WARN("[Runtime] max_ping_time_ms is 0: clients are never stopped for silence");
    }
    if (!safety_monitor_->start()) {
        error = "Safety monitor failed to start";
        return false;
    }
    return true;
}

bool Runtime::init_listener(std::string &error) {
    if (!config_.listener.enabled) {
        LOG_INFO("[Runtime] Listener disabled in config");
        return true;
    }

    listener_ = std::make_unique<transport::TcpListener>(config_.listener_config(), config_.session_config(),
                                                         *device_manager_, event_emitter_.get(),
                                                         safety_monitor_.get());
    if (!listener_->start()) {
        error = "Listener failed to start: " + listener_->last_error();
        return false;
    }
    return true;
}

void Runtime::run() {
    LOG_INFO("[Runtime] Starting main loop");
    running_ = true;

    LOG_INFO("[Runtime] Press Ctrl+C to exit");

    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        // Check for shutdown signal
        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] Signal received, stopping...");
            running_ = false;
            break;
        }
    }

    LOG_INFO("[Runtime] Main loop exited");
}

void Runtime::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;
    running_ = false;

    // No new sessions or commands past this point
    if (listener_) {
        LOG_INFO("[Runtime] Stopping listener");
        listener_->stop();
    }

    if (safety_monitor_) {
        safety_monitor_->stop();
    }

    if (sim_scanner_) {
        sim_scanner_->stop_scanning();
    }

    if (scan_queue_) {
        scan_queue_->close();
    }
    if (discovery_pump_) {
        discovery_pump_->stop();
    }

    if (device_manager_) {
        auto report = device_manager_->stop_all();
        if (report.all_succeeded()) {
            LOG_INFO("[Runtime] Stopped " << report.succeeded << " device(s)");
        } else {
            LOG_WARN("[Runtime] Shutdown stop failed on " << report.failures.size() << " of " << report.attempted
                                                          << " device(s)");
        }
        device_manager_->disconnect_all();
    }

    LOG_INFO("[Runtime] Shutdown complete");
}

}  // namespace runtime
}  // namespace tactile
