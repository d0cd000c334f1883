#pragma once

/**
 * @file sim_scanner.hpp
 * @brief Simulated transport ("sim") for running without radio hardware
 *
 * SimScanner announces configured devices when scanning starts; each gets a
 * SimDeviceTransport that records every raw write and answers Lovense-style
 * battery queries. Tests and the runtime drive loss and notifications through
 * the scanner so events flow the same way a real transport's would.
 */

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "device/device_types.hpp"
#include "transport/i_device_transport.hpp"
#include "transport/i_transport_scanner.hpp"
#include "transport/scan_event_queue.hpp"

namespace tactile {
namespace transport {

struct SimDeviceConfig {
    std::string name;
    std::string address;
    std::vector<std::string> services;
    std::optional<double> battery;  // 0..1, answers "Battery;" when set
};

class SimDeviceTransport : public IDeviceTransport {
public:
    explicit SimDeviceTransport(SimDeviceConfig config);

    bool write(const device::RawWrite &write) override;
    bool read(const std::string &endpoint, std::vector<uint8_t> &data, int timeout_ms) override;
    bool is_reachable() const override;
    void disconnect() override;
    std::string last_error() const override;

    // Test / simulation controls
    void set_reachable(bool reachable);
    void set_fail_writes(bool fail);
    void push_reply(const std::string &endpoint, std::vector<uint8_t> data);

    std::vector<device::RawWrite> writes() const;
    std::vector<std::string> written_strings() const;
    void clear_writes();
    bool is_disconnected() const;

    const SimDeviceConfig &config() const { return config_; }

private:
    const SimDeviceConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable reply_cv_;
    std::vector<device::RawWrite> writes_;
    std::map<std::string, std::deque<std::vector<uint8_t>>> replies_;
    bool reachable_ = true;
    bool fail_writes_ = false;
    bool disconnected_ = false;
    std::string error_;
};

class SimScanner : public ITransportScanner {
public:
    explicit SimScanner(std::vector<SimDeviceConfig> devices);
    ~SimScanner() override;

    SimScanner(const SimScanner &) = delete;
    SimScanner &operator=(const SimScanner &) = delete;

    const std::string &transport_kind() const override { return kind_; }
    void set_event_queue(ScanEventQueue *queue) override;

    bool start_scanning() override;
    void stop_scanning() override;
    bool is_scanning() const override { return scanning_; }

    std::string last_error() const override;

    // Simulated radio events
    bool lose_device(const std::string &address);
    bool notify(const std::string &address, const device::RawNotification &notification);

    std::shared_ptr<SimDeviceTransport> transport(const std::string &address) const;
    device::DeviceIdentity identity(const SimDeviceConfig &config) const;

private:
    void scan_loop();
    bool push(ScanEvent event);

    const std::string kind_ = "sim";
    const std::vector<SimDeviceConfig> devices_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    ScanEventQueue *queue_ = nullptr;
    std::map<std::string, std::shared_ptr<SimDeviceTransport>> transports_;  // address -> live transport
    std::string error_;

    std::atomic<bool> scanning_{false};
    std::thread thread_;
};

}  // namespace transport
}  // namespace tactile
