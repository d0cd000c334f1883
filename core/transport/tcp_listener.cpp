#include "tcp_listener.hpp"

#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstring>
#include <utility>

#include "logging/logger.hpp"

namespace tactile {
namespace transport {

namespace {
constexpr int kAcceptPollMs = 200;
}

TcpListener::TcpListener(ListenerConfig config, session::SessionConfig session_config,
                         registry::DeviceManager &devices, events::EventEmitter *emitter,
                         session::SafetyMonitor *monitor)
    : config_(std::move(config)),
      session_config_(std::move(session_config)),
      devices_(devices),
      emitter_(emitter),
      monitor_(monitor) {}

TcpListener::~TcpListener() { stop(); }

bool TcpListener::start() {
    if (running_) {
        return true;
    }

    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
        error_ = "socket failed: " + std::string(strerror(errno));
        LOG_ERROR("[Listener] " << error_);
        return false;
    }

    int reuse = 1;
    if (::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        LOG_WARN("[Listener] SO_REUSEADDR failed: " << strerror(errno));
    }

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.port);
    if (::inet_pton(AF_INET, config_.bind.c_str(), &addr.sin_addr) != 1) {
        error_ = "Invalid bind address: " + config_.bind;
        LOG_ERROR("[Listener] " << error_);
        ::close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }

    if (::bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0 ||
        ::listen(listen_fd_, 16) < 0) {
        error_ = "bind/listen on " + config_.bind + ":" + std::to_string(config_.port) +
                 " failed: " + std::string(strerror(errno));
        LOG_ERROR("[Listener] " << error_);
        ::close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }

    socklen_t len = sizeof(addr);
    if (::getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&addr), &len) == 0) {
        bound_port_ = ntohs(addr.sin_port);
    } else {
        bound_port_ = config_.port;
    }

    running_ = true;
    accept_thread_ = std::thread(&TcpListener::accept_loop, this);

    LOG_INFO("[Listener] Listening on " << config_.bind << ":" << bound_port_ << " (max " << config_.max_sessions
                                        << " sessions)");
    return true;
}

void TcpListener::stop() {
    if (running_.exchange(false) && accept_thread_.joinable()) {
        accept_thread_.join();
    }

    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }

    std::vector<std::unique_ptr<Connection>> connections;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connections.swap(connections_);
    }

    if (!connections.empty()) {
        LOG_INFO("[Listener] Closing " << connections.size() << " connections");
    }
    for (auto &connection : connections) {
        connection->stop();
    }
}

size_t TcpListener::connection_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

void TcpListener::accept_loop() {
    while (running_) {
        reap_finished();

        struct pollfd pfd;
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = ::poll(&pfd, 1, kAcceptPollMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("[Listener] poll failed: " << strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;
        }

        sockaddr_in peer;
        socklen_t peer_len = sizeof(peer);
        int fd = ::accept(listen_fd_, reinterpret_cast<sockaddr *>(&peer), &peer_len);
        if (fd < 0) {
            if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
                LOG_WARN("[Listener] accept failed: " << strerror(errno));
            }
            continue;
        }

        char peer_ip[INET_ADDRSTRLEN] = {0};
        ::inet_ntop(AF_INET, &peer.sin_addr, peer_ip, sizeof(peer_ip));
        const std::string peer_name = std::string(peer_ip) + ":" + std::to_string(ntohs(peer.sin_port));

        std::lock_guard<std::mutex> lock(mutex_);
        if (config_.max_sessions > 0 && connections_.size() >= config_.max_sessions) {
            LOG_WARN("[Listener] Rejecting " << peer_name << ": " << connections_.size() << " sessions active");
            ::close(fd);
            continue;
        }

        int nodelay = 1;
        if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay)) < 0) {
            LOG_DEBUG("[Listener] TCP_NODELAY failed for " << peer_name << ": " << strerror(errno));
        }

        const std::string name = "session-" + std::to_string(next_connection_id_++) + "@" + peer_name;
        auto connection = std::make_unique<Connection>(name, fd, session_config_, devices_, emitter_, monitor_);
        connection->start();
        connections_.push_back(std::move(connection));
    }
}

void TcpListener::reap_finished() {
    std::vector<std::unique_ptr<Connection>> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = connections_.begin(); it != connections_.end();) {
            if ((*it)->is_finished()) {
                finished.push_back(std::move(*it));
                it = connections_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto &connection : finished) {
        connection->stop();
        LOG_DEBUG("[Listener] Reaped " << connection->name());
    }
}

}  // namespace transport
}  // namespace tactile
