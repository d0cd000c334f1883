#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "events/event_emitter.hpp"
#include "registry/device_manager.hpp"
#include "session/safety_monitor.hpp"
#include "session/session.hpp"
#include "transport/connection.hpp"

namespace tactile {
namespace transport {

struct ListenerConfig {
    std::string bind = "127.0.0.1";
    uint16_t port = 12345;  // 0 = ephemeral
    size_t max_sessions = 16;
};

/**
 * TcpListener - accepts client connections and gives each one a Connection.
 *
 * One accept thread polls the listening socket; finished connections are
 * reaped on each pass. Connections beyond max_sessions are closed on accept.
 */
class TcpListener {
public:
    TcpListener(ListenerConfig config, session::SessionConfig session_config, registry::DeviceManager &devices,
                events::EventEmitter *emitter, session::SafetyMonitor *monitor);
    ~TcpListener();

    TcpListener(const TcpListener &) = delete;
    TcpListener &operator=(const TcpListener &) = delete;

    // Bind, listen and start the accept thread
    bool start();

    // Stop accepting and close every connection
    void stop();

    bool is_running() const { return running_; }

    // Actual bound port (useful with port 0)
    uint16_t port() const { return bound_port_; }

    size_t connection_count() const;

    const std::string &last_error() const { return error_; }

private:
    void accept_loop();
    void reap_finished();

    const ListenerConfig config_;
    const session::SessionConfig session_config_;
    registry::DeviceManager &devices_;
    events::EventEmitter *emitter_;
    session::SafetyMonitor *monitor_;

    int listen_fd_ = -1;
    uint16_t bound_port_ = 0;
    std::string error_;

    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<Connection>> connections_;
    uint64_t next_connection_id_ = 1;

    std::atomic<bool> running_{false};
    std::thread accept_thread_;
};

}  // namespace transport
}  // namespace tactile
