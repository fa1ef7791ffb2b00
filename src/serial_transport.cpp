// SPDX-License-Identifier: Apache-2.0
#include "serial_transport.hpp"
#include "pty_transport.hpp"
#include "tcp_transport.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <everest/logging.hpp>

namespace evsemu {

namespace {
constexpr int kWriteTimeoutMs = 200;
constexpr std::size_t kReadChunk = 256;

int to_poll_timeout(std::chrono::milliseconds wait) {
    if (wait.count() < 0) {
        return -1;
    }
    return static_cast<int>(std::min<std::chrono::milliseconds::rep>(wait.count(), 24 * 3600 * 1000));
}

void set_nonblocking(int fd) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        EVLOG_warning << "Failed to set O_NONBLOCK on fd " << fd << ": " << std::strerror(errno);
    }
}
} // namespace

const char* to_string(SerialMode mode) {
    return mode == SerialMode::Tcp ? "tcp" : "pty";
}

std::chrono::milliseconds next_backoff(const ReconnectPolicy& policy, std::chrono::milliseconds current) {
    const auto ceiling = std::max(policy.max_backoff, std::chrono::milliseconds(1));
    if (current.count() <= 0) {
        return std::min(std::max(policy.initial_backoff, std::chrono::milliseconds(1)), ceiling);
    }
    return current >= ceiling / 2 ? ceiling : current * 2;
}

ReconnectPolicy make_reconnect_policy(const SerialConfig& cfg) {
    ReconnectPolicy policy;
    policy.initial_backoff = std::chrono::milliseconds(std::max(0, cfg.reconnect_backoff_ms));
    policy.timeout = std::chrono::seconds(std::max(0, cfg.reconnect_timeout_sec));
    return policy;
}

SerialTransport::SerialTransport(const ReconnectPolicy& policy) : policy_(policy) {
    wake_fd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (wake_fd_ < 0) {
        throw std::runtime_error(std::string("Failed to create eventfd: ") + std::strerror(errno));
    }
}

SerialTransport::~SerialTransport() {
    if (wake_fd_ >= 0) {
        ::close(wake_fd_);
    }
}

void SerialTransport::open() {
    open_endpoint();
    const int fd = acquire_channel(std::chrono::milliseconds(0));
    if (fd >= 0) {
        install_channel(fd);
    }
    EVLOG_info << "Serial transport listening on " << describe();
}

bool SerialTransport::has_channel() const {
    std::lock_guard<std::mutex> lock(io_mutex_);
    return channel_fd_ >= 0;
}

void SerialTransport::set_channel_callback(ChannelCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_channel_ = std::move(cb);
}

void SerialTransport::close() {
    if (closing_.exchange(true)) {
        return;
    }
    signal_reader();
}

void SerialTransport::signal_reader() {
    const std::uint64_t one = 1;
    if (::write(wake_fd_, &one, sizeof(one)) != static_cast<ssize_t>(sizeof(one))) {
        EVLOG_warning << "Failed to wake the transport reader: " << std::strerror(errno);
    }
}

void SerialTransport::drain_wake() {
    std::uint64_t count = 0;
    while (::read(wake_fd_, &count, sizeof(count)) == static_cast<ssize_t>(sizeof(count))) {
    }
}

void SerialTransport::shutdown() {
    close();
    teardown();
}

void SerialTransport::teardown() {
    if (torn_down_) {
        return;
    }
    torn_down_ = true;
    closing_ = true;
    int fd = -1;
    {
        std::lock_guard<std::mutex> lock(io_mutex_);
        fd = channel_fd_;
        channel_fd_ = -1;
    }
    if (fd >= 0) {
        release_channel(fd);
    }
    close_endpoint();
}

void SerialTransport::release_channel(int fd) {
    ::close(fd);
}

ssize_t SerialTransport::write_some(int fd, const char* data, std::size_t size) {
    return ::write(fd, data, size);
}

bool SerialTransport::wait_interruptible(std::chrono::milliseconds wait) {
    if (closing_) {
        return true;
    }
    pollfd pfd{wake_fd_, POLLIN, 0};
    const int rc = ::poll(&pfd, 1, to_poll_timeout(wait));
    return closing_ || (rc > 0 && (pfd.revents & POLLIN));
}

void SerialTransport::install_channel(int fd) {
    set_nonblocking(fd);
    int previous = -1;
    {
        std::lock_guard<std::mutex> lock(io_mutex_);
        previous = channel_fd_;
        channel_fd_ = fd;
    }
    if (previous >= 0) {
        release_channel(previous);
    }
    framer_.reset();
    ever_connected_ = true;
    EVLOG_info << "Serial channel up on " << describe();

    ChannelCallback cb;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        cb = on_channel_;
    }
    if (cb) {
        cb();
    }
}

void SerialTransport::drop_channel(const std::string& reason) {
    int fd = -1;
    {
        std::lock_guard<std::mutex> lock(io_mutex_);
        fd = channel_fd_;
        channel_fd_ = -1;
    }
    if (fd >= 0) {
        release_channel(fd);
    }
    framer_.reset();
    // A failed-write signal for the old channel must not cut the reconnect waits short.
    drain_wake();
    {
        std::lock_guard<std::mutex> lock(io_mutex_);
        broken_fd_ = -1;
    }
    EVLOG_warning << "Serial channel down (" << reason << "), reconnecting";
}

bool SerialTransport::reconnect() {
    using namespace std::chrono;
    // The very first client may take as long as it likes; the timeout governs reconnects only.
    const bool bounded = ever_connected_ && policy_.timeout.count() > 0;
    const auto deadline = steady_clock::now() + policy_.timeout;
    auto backoff = next_backoff(policy_, milliseconds(0));
    int attempt = 0;

    while (!closing_) {
        ++attempt;
        auto wait = ever_connected_ ? backoff : milliseconds(-1);
        if (bounded) {
            const auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
            if (remaining.count() <= 0) {
                EVLOG_error << "Giving up on " << describe() << " after " << policy_.timeout.count()
                            << " s without a client";
                return false;
            }
            wait = std::min(wait, remaining);
        }
        const int fd = acquire_channel(wait);
        if (fd >= 0) {
            install_channel(fd);
            return true;
        }
        if (closing_) {
            break;
        }
        if (ever_connected_) {
            EVLOG_debug << "Reconnect attempt " << attempt << " on " << describe() << " failed, waited "
                        << wait.count() << " ms";
            backoff = next_backoff(policy_, backoff);
        }
    }
    return false;
}

ReadResult SerialTransport::read_line() {
    while (true) {
        if (auto line = framer_.next_line()) {
            return {TransportStatus::Ok, std::move(*line)};
        }
        if (closing_) {
            return {TransportStatus::Closed, {}};
        }

        int fd = -1;
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            fd = channel_fd_;
        }
        if (fd < 0) {
            if (!reconnect()) {
                return {closing_ ? TransportStatus::Closed : TransportStatus::GaveUp, {}};
            }
            continue;
        }

        pollfd fds[3]{};
        nfds_t count = 2;
        fds[0] = {fd, POLLIN, 0};
        fds[1] = {wake_fd_, POLLIN, 0};
        const int aux = auxiliary_fd();
        if (aux >= 0) {
            fds[2] = {aux, POLLIN, 0};
            count = 3;
        }

        const int rc = ::poll(fds, count, -1);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            drop_channel(std::string("poll failed: ") + std::strerror(errno));
            continue;
        }
        if (fds[1].revents != 0) {
            drain_wake();
        }
        if (closing_) {
            return {TransportStatus::Closed, {}};
        }
        if (fds[1].revents != 0) {
            bool broken = false;
            {
                std::lock_guard<std::mutex> lock(io_mutex_);
                broken = broken_fd_ >= 0 && broken_fd_ == channel_fd_;
                broken_fd_ = -1;
            }
            if (broken) {
                drop_channel("write failed");
            }
            continue;
        }
        if (count == 3 && (fds[2].revents & POLLIN)) {
            const int replacement = on_auxiliary_ready();
            if (replacement >= 0) {
                EVLOG_info << "New client on " << describe() << " replaces the active one";
                install_channel(replacement);
                continue;
            }
        }
        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL)) {
            char buf[kReadChunk];
            const ssize_t n = ::read(fd, buf, sizeof(buf));
            if (n > 0) {
                on_channel_data();
                if (!framer_.feed(buf, static_cast<std::size_t>(n))) {
                    EVLOG_warning << "Discarded over-long line on " << describe();
                }
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
                continue;
            }
            drop_channel(n == 0 ? std::string("peer closed") : std::string(std::strerror(errno)));
        }
    }
}

bool SerialTransport::write(const std::string& data) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (channel_fd_ < 0 || closing_) {
        return false;
    }
    before_write(channel_fd_);
    std::size_t offset = 0;
    while (offset < data.size()) {
        const ssize_t n = write_some(channel_fd_, data.data() + offset, data.size() - offset);
        if (n > 0) {
            offset += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{channel_fd_, POLLOUT, 0};
            if (::poll(&pfd, 1, kWriteTimeoutMs) > 0) {
                continue;
            }
            EVLOG_warning << "Write to " << describe() << " timed out, dropping " << data.size() - offset
                          << " bytes";
            mark_channel_broken();
            return false;
        }
        EVLOG_warning << "Write to " << describe() << " failed: " << std::strerror(errno);
        mark_channel_broken();
        return false;
    }
    return true;
}

void SerialTransport::mark_channel_broken() {
    // Caller holds io_mutex_. A frame may have been cut mid-line, so the reader drops the channel.
    if (broken_fd_ == channel_fd_) {
        return;
    }
    broken_fd_ = channel_fd_;
    signal_reader();
}

std::unique_ptr<SerialTransport> make_serial_transport(const SerialConfig& cfg) {
    const auto policy = make_reconnect_policy(cfg);
    if (cfg.mode == SerialMode::Tcp) {
        return std::make_unique<TcpTransport>(cfg.bind_address, cfg.tcp_port, policy);
    }
    return std::make_unique<PtyTransport>(cfg.pty_path, cfg.baudrate, policy);
}

} // namespace evsemu
