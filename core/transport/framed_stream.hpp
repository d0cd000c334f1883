#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace tactile {
namespace transport {

// Maximum frame size: 1 MiB
constexpr uint32_t kMaxFrameSize = 1024u * 1024u;

// FramedStream manages length-prefixed binary frames over a connected stream
// socket (or any stream fd, e.g. one end of a socketpair in tests).
// Frames are: uint32_le (length) + payload bytes. POSIX only.
//
// Owns the descriptor: closed on destruction. One reader and one writer may
// use the stream concurrently; shutdown() may be called from any thread.
class FramedStream {
public:
    explicit FramedStream(int fd);
    ~FramedStream();

    FramedStream(const FramedStream &) = delete;
    FramedStream &operator=(const FramedStream &) = delete;

    // Write one frame. Returns false on error (see last_write_error()).
    bool write_frame(const uint8_t *data, size_t len, int timeout_ms = -1);
    bool write_frame(const std::vector<uint8_t> &payload, int timeout_ms = -1) {
        return write_frame(payload.data(), payload.size(), timeout_ms);
    }

    // Read one frame. Returns false on EOF, timeout or error (see last_read_error()).
    // A timeout before the first byte of a frame leaves the stream usable.
    bool read_frame(std::vector<uint8_t> &out, int timeout_ms = -1);

    // Wait for data to be readable. Returns false on timeout or error.
    bool wait_for_data(int timeout_ms);

    // Unblock both directions; subsequent reads see EOF
    void shutdown();

    bool is_open() const { return !shut_down_.load(); }

    // True if the last failed read_frame() was a clean timeout between frames
    bool last_read_timed_out() const { return read_timed_out_; }

    const std::string &last_read_error() const { return read_error_; }
    const std::string &last_write_error() const { return write_error_; }

    int fd() const { return fd_; }

private:
    // Low-level read exactly n bytes
    bool read_exact(uint8_t *buf, size_t n, int timeout_ms);

    // Low-level write exactly n bytes (handles partial writes, EINTR, etc.)
    bool write_exact(const uint8_t *buf, size_t n, int timeout_ms);

    int fd_;
    std::atomic<bool> shut_down_{false};

    // Each error string is touched only by its own direction's thread
    std::string read_error_;
    std::string write_error_;
    bool read_timed_out_ = false;
};

}  // namespace transport
}  // namespace tactile
