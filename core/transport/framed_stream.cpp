#include "framed_stream.hpp"

#include <errno.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <thread>

namespace tactile {
namespace transport {

namespace {
// Once a frame has started, the rest must arrive within this window
constexpr int kFrameBodyTimeoutMs = 5000;

int remaining_ms(std::chrono::steady_clock::time_point start, int timeout_ms) {
    auto elapsed = std::chrono::steady_clock::now() - start;
    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    return static_cast<int>(timeout_ms - elapsed_ms);
}
}  // namespace

FramedStream::FramedStream(int fd) : fd_(fd) {}

FramedStream::~FramedStream() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool FramedStream::write_frame(const uint8_t *data, size_t len, int timeout_ms) {
    write_error_.clear();

    if (len > kMaxFrameSize) {
        write_error_ = "Frame too large: " + std::to_string(len) + " bytes";
        return false;
    }

    // Prefix and payload go out in one buffer
    std::vector<uint8_t> buf(4 + len);
    const uint32_t len32 = static_cast<uint32_t>(len);
    buf[0] = (len32 >> 0) & 0xFF;
    buf[1] = (len32 >> 8) & 0xFF;
    buf[2] = (len32 >> 16) & 0xFF;
    buf[3] = (len32 >> 24) & 0xFF;
    if (len > 0) {
        std::memcpy(buf.data() + 4, data, len);
    }

    return write_exact(buf.data(), buf.size(), timeout_ms);
}

bool FramedStream::read_frame(std::vector<uint8_t> &out, int timeout_ms) {
    read_error_.clear();
    read_timed_out_ = false;

    if (timeout_ms >= 0 && !wait_for_data(timeout_ms)) {
        if (read_error_.empty()) {
            read_timed_out_ = true;
            read_error_ = "Timeout waiting for frame";
        }
        return false;
    }

    const int body_timeout = timeout_ms >= 0 ? kFrameBodyTimeoutMs : -1;

    uint8_t len_buf[4];
    if (!read_exact(len_buf, 4, body_timeout)) {
        if (read_error_.empty()) {
            read_error_ = "EOF reading frame length";
        }
        return false;
    }

    uint32_t len = (uint32_t(len_buf[0]) << 0) | (uint32_t(len_buf[1]) << 8) | (uint32_t(len_buf[2]) << 16) |
                   (uint32_t(len_buf[3]) << 24);

    if (len > kMaxFrameSize) {
        read_error_ = "Frame too large: " + std::to_string(len) + " bytes";
        return false;
    }

    out.resize(len);
    if (len > 0) {
        if (!read_exact(out.data(), len, body_timeout)) {
            if (read_error_.empty()) {
                read_error_ = "EOF reading frame payload";
            }
            return false;
        }
    }

    return true;
}

bool FramedStream::wait_for_data(int timeout_ms) {
    if (fd_ < 0) {
        read_error_ = "Invalid socket";
        return false;
    }

    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int result;
    do {
        result = poll(&pfd, 1, timeout_ms);
    } while (result < 0 && errno == EINTR);

    if (result < 0) {
        read_error_ = "poll failed: " + std::string(strerror(errno));
        return false;
    }
    if (result == 0) {
        return false;
    }

    // POLLHUP with pending data still reads; the read then reports EOF
    if ((pfd.revents & (POLLIN | POLLHUP)) != 0) {
        return true;
    }
    read_error_ = "poll error on socket";
    return false;
}

void FramedStream::shutdown() {
    bool expected = false;
    if (shut_down_.compare_exchange_strong(expected, true) && fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

bool FramedStream::write_exact(const uint8_t *buf, size_t n, int timeout_ms) {
    size_t total = 0;
    auto start_time = std::chrono::steady_clock::now();

    while (total < n) {
        if (timeout_ms >= 0) {
            const int left = remaining_ms(start_time, timeout_ms);
            if (left <= 0) {
                write_error_ = "Timeout writing frame";
                return false;
            }

            struct pollfd pfd;
            pfd.fd = fd_;
            pfd.events = POLLOUT;
            pfd.revents = 0;
            int ready = poll(&pfd, 1, left);
            if (ready < 0 && errno != EINTR) {
                write_error_ = "poll failed: " + std::string(strerror(errno));
                return false;
            }
            if (ready <= 0) {
                continue;
            }
        }

        ssize_t w = ::send(fd_, buf + total, n - total, MSG_NOSIGNAL);
        if (w < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                continue;
            }
            if (errno == EPIPE) {
                write_error_ = "Broken pipe (peer closed)";
            } else {
                write_error_ = "Write failed: " + std::string(strerror(errno));
            }
            return false;
        }
        if (w == 0) {
            write_error_ = "Write returned 0 bytes";
            return false;
        }
        total += static_cast<size_t>(w);
    }
    return true;
}

bool FramedStream::read_exact(uint8_t *buf, size_t n, int timeout_ms) {
    size_t total = 0;
    auto start_time = std::chrono::steady_clock::now();

    while (total < n) {
        if (timeout_ms >= 0) {
            const int left = remaining_ms(start_time, timeout_ms);
            if (left <= 0) {
                if (read_error_.empty()) {
                    read_error_ = "Timeout reading frame";
                }
                return false;
            }
            if (!wait_for_data(left)) {
                if (read_error_.empty()) {
                    read_error_ = "Timeout waiting for data chunk";
                }
                return false;
            }
        }

        ssize_t r = ::recv(fd_, buf + total, n - total, 0);
        if (r < 0) {
            if (errno == EINTR) {
                continue;
            }
            read_error_ = "Read failed: " + std::string(strerror(errno));
            return false;
        }
        if (r == 0) {
            // EOF
            return false;
        }
        total += static_cast<size_t>(r);
    }
    return true;
}

}  // namespace transport
}  // namespace tactile
