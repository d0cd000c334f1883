#include "discovery_pump.hpp"

#include <type_traits>

#include "logging/logger.hpp"

namespace tactile {
namespace runtime {

namespace {
constexpr int kPopTimeoutMs = 100;
}

DiscoveryPump::DiscoveryPump(transport::ScanEventQueue &queue, registry::DeviceManager &devices)
    : queue_(queue), devices_(devices) {}

DiscoveryPump::~DiscoveryPump() { stop(); }

bool DiscoveryPump::start() {
    if (running_.exchange(true)) {
        return true;
    }
    thread_ = std::thread(&DiscoveryPump::run, this);
    LOG_INFO("[DiscoveryPump] Started");
    return true;
}

void DiscoveryPump::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    LOG_INFO("[DiscoveryPump] Stopped (" << processed_ << " events processed)");
}

void DiscoveryPump::apply(const transport::ScanEvent &event) {
    std::visit(
        [this](const auto &ev) {
            using T = std::decay_t<decltype(ev)>;
            if constexpr (std::is_same_v<T, transport::DeviceFound>) {
                auto result = devices_.register_device(ev.identity, ev.probe);
                if (!result.success) {
                    LOG_WARN("[DiscoveryPump] Ignoring " << ev.identity.name << " ("
                                                         << ev.identity.key()
                                                         << "): " << result.error_message);
                }
            } else if constexpr (std::is_same_v<T, transport::DeviceLost>) {
                if (!devices_.remove_device(ev.identity)) {
                    LOG_DEBUG("[DiscoveryPump] Lost unknown device " << ev.identity.key());
                }
            } else {
                if (!devices_.handle_notification(ev.identity, ev.notification)) {
                    LOG_DEBUG("[DiscoveryPump] Notification from " << ev.identity.key()
                                                                   << " not handled");
                }
            }
        },
        event);
    ++processed_;
}

void DiscoveryPump::run() {
    while (running_) {
        auto event = queue_.pop(kPopTimeoutMs);
        if (event) {
            apply(*event);
        } else if (queue_.is_closed()) {
            break;
        }
    }

    // Apply whatever scanners pushed before shutdown
    while (auto event = queue_.pop(0)) {
        apply(*event);
    }
}

}  // namespace runtime
}  // namespace tactile
