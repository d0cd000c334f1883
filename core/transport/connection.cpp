#include "connection.hpp"

#include <utility>

#include "codec/message_codec.hpp"
#include "logging/logger.hpp"

namespace tactile {
namespace transport {

namespace {
constexpr int kReadPollMs = 200;
constexpr int kWriteTimeoutMs = 5000;
}  // namespace

Connection::Connection(std::string name, int fd, const session::SessionConfig &config,
                       registry::DeviceManager &devices, events::EventEmitter *emitter,
                       session::SafetyMonitor *monitor)
    : name_(std::move(name)), stream_(std::make_unique<FramedStream>(fd)), monitor_(monitor) {
    session_ = std::make_shared<session::Session>(
        name_, config, devices, emitter, [this](const session::Message &message) { enqueue(message); },
        [this](device::ErrorCode reason) { on_session_closed(reason); });
}

Connection::~Connection() { stop(); }

void Connection::start() {
    session_->start();
    if (monitor_ != nullptr) {
        monitor_->add_session(session_);
    }

    writer_thread_ = std::thread(&Connection::writer_loop, this);
    reader_thread_ = std::thread(&Connection::reader_loop, this);
    LOG_INFO("[Connection] " << name_ << " started");
}

void Connection::stop() {
    session_->close(device::ErrorCode::CANCELLED, "connection stopped");

    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }
    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }
    session_->join();
}

void Connection::enqueue(const session::Message &message) {
    std::vector<uint8_t> bytes;
    std::string error;
    if (!codec::MessageCodec::encode(message, bytes, error)) {
        LOG_ERROR("[Connection] " << name_ << ": " << error);
        return;
    }

    bool overflow = false;
    {
        std::lock_guard<std::mutex> lock(out_mutex_);
        if (outbound_.size() >= kMaxPendingFrames) {
            overflow = true;
        } else {
            outbound_.push_back(std::move(bytes));
        }
    }
    out_cv_.notify_one();

    if (overflow) {
        LOG_WARN("[Connection] " << name_ << ": client not reading, " << kMaxPendingFrames << " frames pending");
        // Cannot close from inside the session's send path; the writer does it
        std::lock_guard<std::mutex> lock(out_mutex_);
        closing_ = true;
        outbound_.clear();
        out_cv_.notify_one();
    }
}

void Connection::on_session_closed(device::ErrorCode reason) {
    {
        std::lock_guard<std::mutex> lock(out_mutex_);
        closing_ = true;
    }
    out_cv_.notify_one();
    LOG_DEBUG("[Connection] " << name_ << ": session closed (" << device::error_code_to_string(reason) << ")");
}

void Connection::reader_loop() {
    std::vector<uint8_t> frame;

    while (!session_->is_closed()) {
        if (!stream_->read_frame(frame, kReadPollMs)) {
            if (stream_->last_read_timed_out()) {
                continue;
            }
            if (!session_->is_closed()) {
                LOG_INFO("[Connection] " << name_ << ": client disconnected (" << stream_->last_read_error() << ")");
                session_->close(device::ErrorCode::CANCELLED, "client disconnected");
            }
            break;
        }

        session::Message message;
        std::string error;
        if (!codec::MessageCodec::decode(frame, message, error)) {
            LOG_WARN("[Connection] " << name_ << ": " << error);
            message = session::Message{0, session::Unrecognized{}};
        }

        session_->handle_message(message);
    }

    reader_done_ = true;
}

void Connection::writer_loop() {
    while (true) {
        std::vector<uint8_t> frame;
        {
            std::unique_lock<std::mutex> lock(out_mutex_);
            out_cv_.wait(lock, [this] { return !outbound_.empty() || closing_; });
            if (outbound_.empty()) {
                break;  // closing and fully flushed
            }
            frame = std::move(outbound_.front());
            outbound_.pop_front();
        }

        if (!stream_->write_frame(frame, kWriteTimeoutMs)) {
            LOG_WARN("[Connection] " << name_ << ": write failed: " << stream_->last_write_error());
            std::lock_guard<std::mutex> lock(out_mutex_);
            outbound_.clear();
            closing_ = true;
        }
    }

    // Unblocks the reader; the session is closed below if it is not already
    stream_->shutdown();
    session_->close(device::ErrorCode::CANCELLED, "connection lost");
    writer_done_ = true;
}

}  // namespace transport
}  // namespace tactile
