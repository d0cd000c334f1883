#ifndef TACTILE_SESSION_SAFETY_MONITOR_HPP
#define TACTILE_SESSION_SAFETY_MONITOR_HPP

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "session/session.hpp"

namespace tactile {
namespace session {

/**
 * SafetyMonitor - periodic ping watchdog over all live sessions.
 *
 * One thread ticks every check_interval_ms. Each tick first checks every
 * session for a ping timeout, then runs the stops of the expired ones; when
 * several expire together their stops run concurrently. Sessions are held
 * weakly; closed or destroyed sessions are pruned on the next tick. A stop
 * never waits on a client or on a session's in-flight command.
 */
class SafetyMonitor {
public:
    explicit SafetyMonitor(int check_interval_ms = 100);
    ~SafetyMonitor();

    SafetyMonitor(const SafetyMonitor &) = delete;
    SafetyMonitor &operator=(const SafetyMonitor &) = delete;

    void add_session(const std::shared_ptr<Session> &session);

    bool start();
    void stop();
    bool is_running() const { return running_; }

    // One check over every session; returns the number of sessions that timed out
    size_t tick(Session::Clock::time_point now);

    size_t session_count() const;

private:
    void run();

    const int check_interval_ms_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::weak_ptr<Session>> sessions_;

    std::atomic<bool> running_{false};
    std::thread thread_;
};

}  // namespace session
}  // namespace tactile

#endif  // TACTILE_SESSION_SAFETY_MONITOR_HPP
