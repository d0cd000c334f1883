#include "sim_scanner.hpp"

#include <chrono>
#include <cmath>
#include <utility>

#include "logging/logger.hpp"
#include "transport/scan_event_queue.hpp"

namespace tactile {
namespace transport {

// ----------------------------------------------------------------------------
// SimDeviceTransport
// ----------------------------------------------------------------------------

SimDeviceTransport::SimDeviceTransport(SimDeviceConfig config) : config_(std::move(config)) {}

bool SimDeviceTransport::write(const device::RawWrite &write) {
    bool replied = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disconnected_) {
            error_ = "transport disconnected";
            return false;
        }
        if (!reachable_) {
            error_ = config_.address + " out of range";
            return false;
        }
        if (fail_writes_) {
            error_ = "simulated write failure";
            return false;
        }

        writes_.push_back(write);

        const std::string text(write.data.begin(), write.data.end());
        if (config_.battery && text == "Battery;") {
            const long percent = std::lround(*config_.battery * 100.0);
            const std::string reply = std::to_string(percent) + ";";
            replies_["rx"].emplace_back(reply.begin(), reply.end());
            replied = true;
        }
    }

    if (replied) {
        reply_cv_.notify_all();
    }
    return true;
}

bool SimDeviceTransport::read(const std::string &endpoint, std::vector<uint8_t> &data, int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);

    auto has_reply = [&] {
        auto it = replies_.find(endpoint);
        return disconnected_ || (it != replies_.end() && !it->second.empty());
    };
    if (timeout_ms > 0) {
        reply_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), has_reply);
    }

    if (disconnected_) {
        error_ = "transport disconnected";
        return false;
    }

    auto it = replies_.find(endpoint);
    if (it == replies_.end() || it->second.empty()) {
        error_ = "no reply on '" + endpoint + "'";
        return false;
    }

    data = std::move(it->second.front());
    it->second.pop_front();
    return true;
}

bool SimDeviceTransport::is_reachable() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reachable_ && !disconnected_;
}

void SimDeviceTransport::disconnect() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        disconnected_ = true;
    }
    reply_cv_.notify_all();
}

std::string SimDeviceTransport::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

void SimDeviceTransport::set_reachable(bool reachable) {
    std::lock_guard<std::mutex> lock(mutex_);
    reachable_ = reachable;
}

void SimDeviceTransport::set_fail_writes(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_writes_ = fail;
}

void SimDeviceTransport::push_reply(const std::string &endpoint, std::vector<uint8_t> data) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        replies_[endpoint].push_back(std::move(data));
    }
    reply_cv_.notify_all();
}

std::vector<device::RawWrite> SimDeviceTransport::writes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return writes_;
}

std::vector<std::string> SimDeviceTransport::written_strings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(writes_.size());
    for (const auto &write : writes_) {
        out.emplace_back(write.data.begin(), write.data.end());
    }
    return out;
}

void SimDeviceTransport::clear_writes() {
    std::lock_guard<std::mutex> lock(mutex_);
    writes_.clear();
}

bool SimDeviceTransport::is_disconnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disconnected_;
}

// ----------------------------------------------------------------------------
// SimScanner
// ----------------------------------------------------------------------------

SimScanner::SimScanner(std::vector<SimDeviceConfig> devices) : devices_(std::move(devices)) {}

SimScanner::~SimScanner() { stop_scanning(); }

void SimScanner::set_event_queue(ScanEventQueue *queue) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_ = queue;
}

bool SimScanner::start_scanning() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (scanning_) {
            return true;
        }
        if (queue_ == nullptr) {
            error_ = "No scan event queue set";
            LOG_ERROR("[SimScanner] " << error_);
            return false;
        }
        scanning_ = true;
    }

    // A previous scan thread has already exited its wait
    if (thread_.joinable()) {
        thread_.join();
    }
    thread_ = std::thread(&SimScanner::scan_loop, this);
    LOG_INFO("[SimScanner] Scanning (" << devices_.size() << " simulated devices)");
    return true;
}

void SimScanner::stop_scanning() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!scanning_) {
            return;
        }
        scanning_ = false;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    LOG_INFO("[SimScanner] Scanning stopped");
}

std::string SimScanner::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

device::DeviceIdentity SimScanner::identity(const SimDeviceConfig &config) const {
    return device::DeviceIdentity{kind_, config.address, config.name};
}

void SimScanner::scan_loop() {
    for (const auto &config : devices_) {
        std::shared_ptr<SimDeviceTransport> transport;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!scanning_) {
                return;
            }
            auto &slot = transports_[config.address];
            if (!slot || slot->is_disconnected()) {
                slot = std::make_shared<SimDeviceTransport>(config);
            }
            transport = slot;
        }

        DeviceFound found;
        found.identity = identity(config);
        found.probe.services = config.services;
        found.probe.transport = transport;
        if (!push(std::move(found))) {
            LOG_WARN("[SimScanner] Could not announce " << config.name << " (" << config.address << ")");
        }
    }

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !scanning_; });
}

bool SimScanner::lose_device(const std::string &address) {
    std::shared_ptr<SimDeviceTransport> transport;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = transports_.find(address);
        if (it == transports_.end()) {
            return false;
        }
        transport = it->second;
        transports_.erase(it);
    }

    transport->set_reachable(false);
    return push(DeviceLost{identity(transport->config())});
}

bool SimScanner::notify(const std::string &address, const device::RawNotification &notification) {
    std::shared_ptr<SimDeviceTransport> transport = this->transport(address);
    if (!transport) {
        return false;
    }
    return push(DeviceNotification{identity(transport->config()), notification});
}

std::shared_ptr<SimDeviceTransport> SimScanner::transport(const std::string &address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transports_.find(address);
    return it != transports_.end() ? it->second : nullptr;
}

bool SimScanner::push(ScanEvent event) {
    ScanEventQueue *queue = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue = queue_;
    }
    if (queue == nullptr) {
        return false;
    }
    return queue->push(std::move(event));
}

}  // namespace transport
}  // namespace tactile
