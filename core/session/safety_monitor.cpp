#include "safety_monitor.hpp"

#include <algorithm>
#include <chrono>

#include "logging/logger.hpp"

namespace tactile {
namespace session {

SafetyMonitor::SafetyMonitor(int check_interval_ms) : check_interval_ms_(check_interval_ms > 0 ? check_interval_ms : 1) {}

SafetyMonitor::~SafetyMonitor() { stop(); }

void SafetyMonitor::add_session(const std::shared_ptr<Session> &session) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.push_back(session);
}

bool SafetyMonitor::start() {
    if (running_) {
        return true;
    }
    running_ = true;
    thread_ = std::thread(&SafetyMonitor::run, this);
    LOG_INFO("[SafetyMonitor] Started (check interval " << check_interval_ms_ << " ms)");
    return true;
}

void SafetyMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    LOG_INFO("[SafetyMonitor] Stopped");
}

size_t SafetyMonitor::tick(Session::Clock::time_point now) {
    std::vector<std::shared_ptr<Session>> live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                       [](const std::weak_ptr<Session> &weak) {
                                           auto session = weak.lock();
                                           return !session || session->is_closed();
                                       }),
                        sessions_.end());
        for (const auto &weak : sessions_) {
            if (auto session = weak.lock()) {
                live.push_back(std::move(session));
            }
        }
    }

    std::vector<std::shared_ptr<Session>> expired;
    for (const auto &session : live) {
        if (session->expire_ping(now)) {
            expired.push_back(session);
        }
    }

    if (expired.size() == 1) {
        expired.front()->run_ping_stop();
    } else if (!expired.empty()) {
        // A stop blocked on one hung device must not hold up the others
        std::vector<std::thread> stops;
        stops.reserve(expired.size());
        for (const auto &session : expired) {
            stops.emplace_back([session] { session->run_ping_stop(); });
        }
        for (auto &stop : stops) {
            stop.join();
        }
    }
    return expired.size();
}

size_t SafetyMonitor::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

void SafetyMonitor::run() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, std::chrono::milliseconds(check_interval_ms_), [this] { return !running_; });
            if (!running_) {
                break;
            }
        }
        tick(Session::Clock::now());
    }
}

}  // namespace session
}  // namespace tactile
