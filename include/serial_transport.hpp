// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "line_framer.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include <sys/types.h>

namespace evsemu {

enum class SerialMode { Pty, Tcp };

const char* to_string(SerialMode mode);

struct SerialConfig {
    SerialMode mode{SerialMode::Pty};
    std::string bind_address{"0.0.0.0"};
    int tcp_port{8023};
    std::string pty_path;          // empty => expose the kernel-assigned slave name
    int baudrate{115200};
    int reconnect_timeout_sec{60}; // 0 => retry forever
    int reconnect_backoff_ms{1000};
    bool append_checksum{false};
};

struct ReconnectPolicy {
    std::chrono::milliseconds initial_backoff{1000};
    std::chrono::milliseconds max_backoff{30000};
    std::chrono::seconds timeout{60}; // 0 => retry forever
};

ReconnectPolicy make_reconnect_policy(const SerialConfig& cfg);

/// \brief Wait before the next reconnect attempt: initial_backoff first, then doubling up to max_backoff.
std::chrono::milliseconds next_backoff(const ReconnectPolicy& policy, std::chrono::milliseconds current);

enum class TransportStatus { Ok, Closed, GaveUp };

struct ReadResult {
    TransportStatus status{TransportStatus::Closed};
    std::string line;
};

/// \brief Line-oriented byte channel with a shared reconnect loop.
/// Backends provide the endpoint (listening socket, pseudo-terminal) and hand out channel fds;
/// this class owns framing, the reconnect/backoff contract, and deterministic wake-up on close().
class SerialTransport {
public:
    using ChannelCallback = std::function<void()>;

    explicit SerialTransport(const ReconnectPolicy& policy);
    virtual ~SerialTransport();

    SerialTransport(const SerialTransport&) = delete;
    SerialTransport& operator=(const SerialTransport&) = delete;

    /// \brief Set up the endpoint. Throws std::runtime_error on unrecoverable configuration errors.
    void open();

    /// \brief Block until a full line arrives. Reconnects transparently; returns GaveUp once the
    /// reconnect timeout expires and Closed after close().
    ReadResult read_line();

    bool write(const std::string& data);

    /// \brief Wake any blocked read_line() and refuse further I/O. Safe from any thread.
    void close();
    /// \brief close() followed by release of the channel and the endpoint. No thread may be inside read_line().
    void shutdown();

    bool is_closing() const { return closing_; }
    bool has_channel() const;

    /// \brief Invoked (outside internal locks) each time a client channel is established.
    void set_channel_callback(ChannelCallback cb);

    virtual std::string describe() const = 0;

protected:
    virtual void open_endpoint() = 0;
    /// \brief Produce a channel fd, waiting at most `wait` (negative => forever). -1 if none.
    virtual int acquire_channel(std::chrono::milliseconds wait) = 0;
    virtual void release_channel(int fd);
    virtual void close_endpoint() = 0;
    /// \brief Extra fd watched by the read loop; when readable on_auxiliary_ready() may return a new channel.
    virtual int auxiliary_fd() const { return -1; }
    virtual int on_auxiliary_ready() { return -1; }
    virtual ssize_t write_some(int fd, const char* data, std::size_t size);
    /// \brief Called under the write lock once per message, before the first byte goes out.
    virtual void before_write(int /*fd*/) {}
    /// \brief Called by the read loop whenever the client sent bytes.
    virtual void on_channel_data() {}

    /// \brief Sleep up to `wait`; true if close() interrupted it.
    bool wait_interruptible(std::chrono::milliseconds wait);
    int wake_fd() const { return wake_fd_; }

    /// \brief Release the channel and the endpoint. Derived destructors must call this.
    void teardown();

private:
    void install_channel(int fd);
    void drop_channel(const std::string& reason);
    bool reconnect();
    void signal_reader();
    void drain_wake();
    void mark_channel_broken();

    ReconnectPolicy policy_;
    int wake_fd_{-1};
    std::atomic<bool> closing_{false};
    std::atomic<bool> ever_connected_{false};
    bool torn_down_{false};

    mutable std::mutex io_mutex_; // guards channel_fd_ and writes
    int channel_fd_{-1};
    int broken_fd_{-1}; // channel whose last write failed, pending drop by the reader

    std::mutex callback_mutex_;
    ChannelCallback on_channel_;

    LineFramer framer_; // read loop only
};

/// \brief Build the backend selected by cfg.mode.
std::unique_ptr<SerialTransport> make_serial_transport(const SerialConfig& cfg);

} // namespace evsemu
