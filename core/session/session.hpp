#ifndef TACTILE_SESSION_SESSION_HPP
#define TACTILE_SESSION_SESSION_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>

#include "device/device_types.hpp"
#include "events/event_emitter.hpp"
#include "registry/device_manager.hpp"
#include "session/message.hpp"

namespace tactile {
namespace session {

enum class SessionState { AWAITING_HANDSHAKE, READY, CLOSED };

// What a ping timeout stops
enum class StopScope {
    GLOBAL,  // every connected device
    SESSION  // only devices this session has commanded
};

const char *session_state_to_string(SessionState state);
const char *stop_scope_to_string(StopScope scope);
bool parse_stop_scope(const std::string &text, StopScope &scope);

struct SessionConfig {
    std::string server_name = "tactile";
    uint32_t min_version = 1;
    uint32_t max_version = 3;
    uint32_t max_ping_time_ms = 1000;  // 0 = no ping requirement
    StopScope stop_scope = StopScope::GLOBAL;
    size_t event_queue_size = 256;
};

/**
 * Session - protocol state machine for one connected client.
 *
 * AwaitingHandshake -> Ready -> Closed. Closed is terminal.
 *
 * Threads:
 * - the owner's reader thread calls handle_message()
 * - a command worker (started by start()) runs device commands and stop-all
 *   so the reader never blocks on hardware
 * - an event thread forwards DeviceManager events as id-0 messages while Ready
 * - the SafetyMonitor calls expire_ping() and run_ping_stop(); a command that
 *   was mid-write when the timeout fired is followed by a second stop
 *
 * Outbound messages go through the sink, serialized by send_mutex_. The sink
 * is never called after close. on_close fires exactly once.
 *
 * Correlation: every request except Ping occupies its id in the outstanding
 * table until its reply is sent; on close the table is cleared and late
 * replies are discarded.
 */
class Session {
public:
    using Clock = std::chrono::steady_clock;
    using Sink = std::function<void(const Message &)>;
    using CloseHandler = std::function<void(device::ErrorCode reason)>;

    Session(std::string name, SessionConfig config, registry::DeviceManager &devices,
            events::EventEmitter *emitter, Sink sink, CloseHandler on_close = nullptr);
    ~Session();

    Session(const Session &) = delete;
    Session &operator=(const Session &) = delete;

    // Subscribe to events and start worker threads
    void start();

    // Feed one decoded client message. Returns false once the session is closed.
    bool handle_message(const Message &message);

    // Ping watchdog. Runs the safety stop and closes when the client has been
    // silent for longer than max_ping_time_ms. Returns true if it fired.
    bool check_ping(Clock::time_point now);

    // check_ping() in two steps. expire_ping() claims the timeout (true at most
    // once) without touching devices; run_ping_stop() then stops and closes.
    // Neither waits for an in-flight command.
    bool expire_ping(Clock::time_point now);
    void run_ping_stop();

    // Transition to Closed (idempotent). Safe from any thread, including the
    // session's own threads.
    void close(device::ErrorCode reason, const std::string &detail = "");

    // Join worker threads. Must not be called from a session thread.
    void join();

    const std::string &name() const { return name_; }
    SessionState state() const;
    bool is_closed() const { return state() == SessionState::CLOSED; }
    uint32_t negotiated_version() const;
    std::string client_name() const;
    device::ErrorCode close_reason() const;

    size_t outstanding_count() const;
    std::set<device::DeviceIndex> commanded_devices() const;

private:
    struct Work {
        uint32_t id = 0;
        Payload request;  // DeviceCommandRequest or StopAllRequest
    };

    bool handle_handshake(const Message &message);
    bool handle_ready(const Message &message);

    // Sends a correlated error then closes
    void violation(uint32_t id, device::ErrorCode code, const std::string &detail);

    // Send a reply and release its outstanding id; dropped once closed
    void reply(uint32_t id, Payload payload);
    void send(const Message &message);

    void worker_loop();
    void event_loop();
    Payload execute(const Work &work);
    void safety_stop();

    Message event_to_message(const events::Event &event) const;

    const std::string name_;
    const SessionConfig config_;
    registry::DeviceManager &devices_;
    events::EventEmitter *emitter_;
    Sink sink_;
    CloseHandler on_close_;

    mutable std::mutex mutex_;
    SessionState state_ = SessionState::AWAITING_HANDSHAKE;
    device::ErrorCode close_reason_ = device::ErrorCode::OK;
    uint32_t version_ = 0;
    std::string client_name_;
    Clock::time_point last_activity_;
    bool ping_stop_fired_ = false;
    std::unordered_map<uint32_t, std::string> outstanding_;  // id -> request kind
    std::set<device::DeviceIndex> commanded_;

    std::deque<Work> work_queue_;
    std::condition_variable work_cv_;

    // Lock order: send_mutex_ -> mutex_. Device locks are never taken under either.
    std::mutex send_mutex_;

    std::unique_ptr<events::Subscription> subscription_;
    std::atomic<bool> running_{false};
    std::thread worker_thread_;
    std::thread event_thread_;
};

}  // namespace session
}  // namespace tactile

#endif  // TACTILE_SESSION_SESSION_HPP
