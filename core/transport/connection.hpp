#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "events/event_emitter.hpp"
#include "registry/device_manager.hpp"
#include "session/safety_monitor.hpp"
#include "session/session.hpp"
#include "transport/framed_stream.hpp"

namespace tactile {
namespace transport {

/**
 * Connection - one accepted client: framed socket <-> Session.
 *
 * Reader thread: read frame -> decode -> Session::handle_message().
 * Writer thread: drains encoded frames queued by the session sink. When the
 * session closes, frames already queued (e.g. the Error explaining a protocol
 * violation) are flushed before the socket is shut down.
 */
class Connection {
public:
    static constexpr size_t kMaxPendingFrames = 1024;

    Connection(std::string name, int fd, const session::SessionConfig &config, registry::DeviceManager &devices,
               events::EventEmitter *emitter, session::SafetyMonitor *monitor);
    ~Connection();

    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;

    void start();

    // Close the session (if still open) and join every thread
    void stop();

    // True once both I/O threads have exited
    bool is_finished() const { return reader_done_ && writer_done_; }

    const std::string &name() const { return name_; }
    std::shared_ptr<session::Session> session() const { return session_; }

private:
    void reader_loop();
    void writer_loop();

    void enqueue(const session::Message &message);
    void on_session_closed(device::ErrorCode reason);

    const std::string name_;
    std::unique_ptr<FramedStream> stream_;
    std::shared_ptr<session::Session> session_;
    session::SafetyMonitor *monitor_;

    std::mutex out_mutex_;
    std::condition_variable out_cv_;
    std::deque<std::vector<uint8_t>> outbound_;
    bool closing_ = false;

    std::atomic<bool> reader_done_{false};
    std::atomic<bool> writer_done_{false};
    std::thread reader_thread_;
    std::thread writer_thread_;
};

}  // namespace transport
}  // namespace tactile
