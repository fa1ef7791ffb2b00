// SPDX-License-Identifier: Apache-2.0
#include "tcp_transport.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <utility>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <everest/logging.hpp>

namespace evsemu {

namespace {
// Pause after an accept() error the listener cannot recover from by itself (EMFILE, ENOBUFS).
constexpr std::chrono::milliseconds kAcceptRetryDelay{1000};

bool is_transient_accept_error(int err) {
    return err == EAGAIN || err == EWOULDBLOCK || err == EINTR || err == ECONNABORTED;
}
} // namespace

TcpTransport::TcpTransport(std::string bind_address, int port, const ReconnectPolicy& policy) :
    SerialTransport(policy), bind_address_(std::move(bind_address)), port_(port) {
    if (bind_address_.empty()) {
        bind_address_ = "0.0.0.0";
    }
}

TcpTransport::~TcpTransport() {
    teardown();
}

std::string TcpTransport::describe() const {
    return "tcp://" + bind_address_ + ":" + std::to_string(bound_port_ != 0 ? bound_port_ : port_);
}

void TcpTransport::open_endpoint() {
    if (port_ < 0 || port_ > 65535) {
        throw std::runtime_error("Invalid TCP port " + std::to_string(port_));
    }
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port_));
    if (::inet_pton(AF_INET, bind_address_.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("Invalid bind address " + bind_address_);
    }

    listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
    if (listen_fd_ < 0) {
        throw std::runtime_error(std::string("Failed to create TCP socket: ") + std::strerror(errno));
    }
    const int enable = 1;
    if (::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable)) < 0) {
        EVLOG_warning << "Failed to set SO_REUSEADDR: " << std::strerror(errno);
    }
    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 || ::listen(listen_fd_, 4) < 0) {
        const std::string err = std::strerror(errno);
        ::close(listen_fd_);
        listen_fd_ = -1;
        throw std::runtime_error("Failed to listen on " + bind_address_ + ":" + std::to_string(port_) + ": " + err);
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = port_;
    }
}

int TcpTransport::accept_client() {
    sockaddr_in peer{};
    socklen_t len = sizeof(peer);
    const int fd = ::accept4(listen_fd_, reinterpret_cast<sockaddr*>(&peer), &len, SOCK_CLOEXEC);
    if (fd < 0) {
        accept_failed_ = !is_transient_accept_error(errno);
        if (accept_failed_) {
            EVLOG_warning << "accept() on " << describe() << " failed: " << std::strerror(errno);
        }
        return -1;
    }
    accept_failed_ = false;
    const int nodelay = 1;
    if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay)) < 0) {
        EVLOG_debug << "Failed to set TCP_NODELAY: " << std::strerror(errno);
    }
    char ip[INET_ADDRSTRLEN] = {0};
    ::inet_ntop(AF_INET, &peer.sin_addr, ip, sizeof(ip));
    EVLOG_info << "RAPI client connected from " << ip << ":" << ntohs(peer.sin_port);
    return fd;
}

int TcpTransport::acquire_channel(std::chrono::milliseconds wait) {
    if (listen_fd_ < 0) {
        return -1;
    }
    pollfd fds[2]{};
    fds[0] = {listen_fd_, POLLIN, 0};
    fds[1] = {wake_fd(), POLLIN, 0};
    const int timeout = wait.count() < 0 ? -1 : static_cast<int>(wait.count());
    const int rc = ::poll(fds, 2, timeout);
    if (rc <= 0 || fds[1].revents != 0) {
        return -1;
    }
    if (fds[0].revents & POLLIN) {
        const int fd = accept_client();
        if (fd < 0 && accept_failed_) {
            // The pending connection stays queued, so the listener would poll readable again at once.
            wait_interruptible(wait.count() < 0 ? kAcceptRetryDelay : wait);
        }
        return fd;
    }
    return -1;
}

int TcpTransport::auxiliary_fd() const {
    if (listen_fd_ < 0 || std::chrono::steady_clock::now() < accept_paused_until_) {
        return -1;
    }
    return listen_fd_;
}

int TcpTransport::on_auxiliary_ready() {
    const int fd = accept_client();
    if (fd < 0 && accept_failed_) {
        // Keep serving the active client; look at the listener again once the pause is over.
        accept_paused_until_ = std::chrono::steady_clock::now() + kAcceptRetryDelay;
    }
    return fd;
}

ssize_t TcpTransport::write_some(int fd, const char* data, std::size_t size) {
    return ::send(fd, data, size, MSG_NOSIGNAL);
}

void TcpTransport::close_endpoint() {
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
}

} // namespace evsemu
