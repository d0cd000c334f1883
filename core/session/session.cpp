#include "session.hpp"

#include <algorithm>
#include <exception>
#include <type_traits>
#include <utility>

#include "logging/logger.hpp"

namespace tactile {
namespace session {

using device::ErrorCode;

const char *session_state_to_string(SessionState state) {
    switch (state) {
        case SessionState::AWAITING_HANDSHAKE:
            return "AwaitingHandshake";
        case SessionState::READY:
            return "Ready";
        case SessionState::CLOSED:
            return "Closed";
        default:
            return "Unknown";
    }
}

const char *stop_scope_to_string(StopScope scope) { return scope == StopScope::SESSION ? "session" : "global"; }

bool parse_stop_scope(const std::string &text, StopScope &scope) {
    if (text == "global") {
        scope = StopScope::GLOBAL;
        return true;
    }
    if (text == "session") {
        scope = StopScope::SESSION;
        return true;
    }
    return false;
}

Session::Session(std::string name, SessionConfig config, registry::DeviceManager &devices,
                 events::EventEmitter *emitter, Sink sink, CloseHandler on_close)
    : name_(std::move(name)),
      config_(std::move(config)),
      devices_(devices),
      emitter_(emitter),
      sink_(std::move(sink)),
      on_close_(std::move(on_close)),
      last_activity_(Clock::now()) {}

Session::~Session() { join(); }

void Session::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::CLOSED || running_) {
            return;
        }
        running_ = true;
    }

    if (emitter_ != nullptr) {
        subscription_ = emitter_->subscribe(events::EventFilter::all(), config_.event_queue_size, name_);
        if (!subscription_) {
            LOG_WARN("[Session] " << name_ << ": no event subscription available, device events will not be sent");
        }
    }

    worker_thread_ = std::thread(&Session::worker_loop, this);
    if (subscription_) {
        event_thread_ = std::thread(&Session::event_loop, this);
    }
}

bool Session::handle_message(const Message &message) {
    SessionState state;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::CLOSED || ping_stop_fired_) {
            return false;
        }
        state = state_;
    }

    LOG_DEBUG("[Session] " << name_ << " <- " << kind_name(message.payload) << " id=" << message.id);

    if (state == SessionState::AWAITING_HANDSHAKE) {
        return handle_handshake(message);
    }
    return handle_ready(message);
}

bool Session::handle_handshake(const Message &message) {
    const auto *request = std::get_if<HandshakeRequest>(&message.payload);
    if (request == nullptr) {
        violation(message.id, ErrorCode::HANDSHAKE_REQUIRED,
                  std::string("Handshake required before ") + kind_name(message.payload));
        return false;
    }

    if (message.id == 0) {
        violation(message.id, ErrorCode::INVALID_MESSAGE_ID, "HandshakeRequest must carry a non-zero id");
        return false;
    }

    const uint32_t low = std::max(request->min_version, config_.min_version);
    const uint32_t high = std::min(request->max_version, config_.max_version);
    if (request->min_version > request->max_version || high < low) {
        violation(message.id, ErrorCode::VERSION_MISMATCH,
                  "Client versions [" + std::to_string(request->min_version) + ", " +
                      std::to_string(request->max_version) + "] do not overlap server versions [" +
                      std::to_string(config_.min_version) + ", " + std::to_string(config_.max_version) + "]");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = SessionState::READY;
        version_ = high;
        client_name_ = request->client_name;
        last_activity_ = Clock::now();
    }

    LOG_INFO("[Session] " << name_ << ": client '" << request->client_name << "' connected, protocol version "
                          << high);

    HandshakeReply reply;
    reply.server_name = config_.server_name;
    reply.version = high;
    reply.max_ping_time_ms = config_.max_ping_time_ms;
    send(Message{message.id, reply});
    return true;
}

bool Session::handle_ready(const Message &message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_activity_ = Clock::now();
    }

    if (message.is<Ping>()) {
        return true;
    }

    if (message.is<Unrecognized>()) {
        LOG_WARN("[Session] " << name_ << ": unrecognized message kind, id=" << message.id);
        send(Message{message.id, ErrorReply{ErrorCode::UNRECOGNIZED_MESSAGE, "Unrecognized message kind"}});
        return true;
    }

    if (message.is<HandshakeRequest>()) {
        violation(message.id, ErrorCode::UNEXPECTED_MESSAGE, "Handshake already completed");
        return false;
    }

    if (!is_client_kind(message.payload)) {
        violation(message.id, ErrorCode::UNEXPECTED_MESSAGE,
                  std::string(kind_name(message.payload)) + " is not a client request");
        return false;
    }

    if (message.id == 0) {
        violation(message.id, ErrorCode::INVALID_MESSAGE_ID,
                  std::string(kind_name(message.payload)) + " must carry a non-zero id");
        return false;
    }

    bool duplicate = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (outstanding_.count(message.id) > 0) {
            duplicate = true;
        } else {
            outstanding_[message.id] = kind_name(message.payload);
            if (const auto *command = std::get_if<DeviceCommandRequest>(&message.payload)) {
                commanded_.insert(command->device_index);
            }
        }
    }

    if (duplicate) {
        violation(message.id, ErrorCode::DUPLICATE_MESSAGE_ID,
                  "Message id " + std::to_string(message.id) + " is already outstanding");
        return false;
    }

    if (message.is<DeviceListRequest>()) {
        DeviceListReply list;
        for (const auto &info : devices_.list_devices()) {
            list.devices.push_back(DeviceEntry{info.index, info.name, info.capabilities});
        }
        reply(message.id, std::move(list));
        return true;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        work_queue_.push_back(Work{message.id, message.payload});
    }
    work_cv_.notify_one();
    return true;
}

bool Session::check_ping(Clock::time_point now) {
    if (!expire_ping(now)) {
        return false;
    }
    run_ping_stop();
    return true;
}

bool Session::expire_ping(Clock::time_point now) {
    int64_t silent_ms = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::READY || config_.max_ping_time_ms == 0 || ping_stop_fired_) {
            return false;
        }

        const auto silent = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_activity_);
        if (silent.count() <= static_cast<int64_t>(config_.max_ping_time_ms)) {
            return false;
        }

        // The worker stops picking up commands from here on
        ping_stop_fired_ = true;
        silent_ms = silent.count();
    }

    LOG_WARN("[Session] " << name_ << ": no ping for " << silent_ms << " ms (limit " << config_.max_ping_time_ms
                          << " ms), stopping " << stop_scope_to_string(config_.stop_scope) << " devices");
    return true;
}

void Session::run_ping_stop() {
    safety_stop();
    close(ErrorCode::PING_TIMEOUT, "ping timeout");
}

void Session::safety_stop() {
    std::set<device::DeviceIndex> commanded;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        commanded = commanded_;
    }

    registry::StopAllReport report =
        config_.stop_scope == StopScope::GLOBAL ? devices_.stop_all() : devices_.stop_devices(commanded);
    if (!report.all_succeeded()) {
        LOG_ERROR("[Session] " << name_ << ": safety stop failed on " << report.failures.size() << " of "
                               << report.attempted << " devices");
    }
}

void Session::close(ErrorCode reason, const std::string &detail) {
    CloseHandler handler;
    size_t cancelled = 0;

    {
        std::lock_guard<std::mutex> send_lock(send_mutex_);
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::CLOSED) {
            return;
        }
        state_ = SessionState::CLOSED;
        close_reason_ = reason;
        cancelled = outstanding_.size();
        outstanding_.clear();
        work_queue_.clear();
        running_ = false;
        handler = on_close_;
    }

    work_cv_.notify_all();

    LOG_INFO("[Session] " << name_ << " closed: " << device::error_code_to_string(reason)
                          << (detail.empty() ? "" : " (" + detail + ")")
                          << (cancelled > 0 ? ", " + std::to_string(cancelled) + " requests cancelled" : ""));

    if (handler) {
        handler(reason);
    }
}

void Session::join() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    work_cv_.notify_all();

    const auto self = std::this_thread::get_id();
    if (worker_thread_.joinable() && worker_thread_.get_id() != self) {
        worker_thread_.join();
    }
    if (event_thread_.joinable() && event_thread_.get_id() != self) {
        event_thread_.join();
    }

    subscription_.reset();
}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

uint32_t Session::negotiated_version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return version_;
}

std::string Session::client_name() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_name_;
}

ErrorCode Session::close_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return close_reason_;
}

size_t Session::outstanding_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outstanding_.size();
}

std::set<device::DeviceIndex> Session::commanded_devices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return commanded_;
}

void Session::violation(uint32_t id, ErrorCode code, const std::string &detail) {
    LOG_WARN("[Session] " << name_ << ": protocol violation " << device::error_code_to_string(code) << ": "
                          << detail);
    send(Message{id, ErrorReply{code, detail}});
    close(code, detail);
}

void Session::reply(uint32_t id, Payload payload) {
    std::lock_guard<std::mutex> send_lock(send_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::CLOSED || outstanding_.erase(id) == 0) {
            LOG_DEBUG("[Session] " << name_ << ": reply for id " << id << " discarded");
            return;
        }
    }

    try {
        sink_(Message{id, std::move(payload)});
    } catch (const std::exception &e) {
        LOG_ERROR("[Session] " << name_ << ": send failed: " << e.what());
    }
}

void Session::send(const Message &message) {
    std::lock_guard<std::mutex> send_lock(send_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::CLOSED) {
            return;
        }
    }

    try {
        sink_(message);
    } catch (const std::exception &e) {
        LOG_ERROR("[Session] " << name_ << ": send failed: " << e.what());
    }
}

void Session::worker_loop() {
    while (true) {
        Work work;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this] { return !work_queue_.empty() || !running_; });
            if (!running_) {
                break;
            }
            work = std::move(work_queue_.front());
            work_queue_.pop_front();
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != SessionState::READY || ping_stop_fired_) {
                continue;
            }
        }
        Payload result = execute(work);

        // A ping stop that ran while this command was in flight may have been
        // overtaken by it on the device; stop again so the stop is the last write
        bool restop = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            restop = ping_stop_fired_;
        }
        if (restop) {
            LOG_WARN("[Session] " << name_ << ": command finished after ping timeout, stopping again");
            safety_stop();
        }

        reply(work.id, std::move(result));
    }
}

Payload Session::execute(const Work &work) {
    if (const auto *request = std::get_if<DeviceCommandRequest>(&work.request)) {
        registry::DispatchResult result = devices_.dispatch(request->device_index, request->command);
        if (!result.success) {
            return ErrorReply{result.code, result.error_message};
        }
        if (std::holds_alternative<device::SensorReadCommand>(request->command)) {
            return SensorReadingReport{request->device_index, std::move(result.readings)};
        }
        return CommandResult{request->device_index};
    }

    registry::StopAllReport report = devices_.stop_all();
    if (report.all_succeeded()) {
        return Ok{};
    }
    return ErrorReply{report.failures.front().code, "Stop failed on " + std::to_string(report.failures.size()) +
                                                         " of " + std::to_string(report.attempted) + " devices"};
}

void Session::event_loop() {
    while (running_) {
        if (subscription_->overflowed()) {
            close(ErrorCode::CANCELLED, "event queue overflow");
            break;
        }

        auto event = subscription_->pop(100);
        if (!event) {
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != SessionState::READY) {
                continue;
            }
        }
        send(event_to_message(*event));
    }
}

Message Session::event_to_message(const events::Event &event) const {
    return std::visit(
        [](auto &&e) -> Message {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, events::DeviceAddedEvent>) {
                return Message{0, DeviceAdded{DeviceEntry{e.device_index, e.device_name, e.capabilities}}};
            } else if constexpr (std::is_same_v<T, events::DeviceRemovedEvent>) {
                return Message{0, DeviceRemoved{e.device_index}};
            } else {
                return Message{0, SensorReadingReport{e.device_index, e.readings}};
            }
        },
        event);
}

}  // namespace session
}  // namespace tactile
