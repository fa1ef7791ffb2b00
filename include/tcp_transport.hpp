// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "serial_transport.hpp"

#include <chrono>
#include <string>

namespace evsemu {

/// \brief TCP listener exposing one RAPI client at a time. A new connection replaces the active one.
class TcpTransport : public SerialTransport {
public:
    /// \brief port 0 binds an ephemeral port, see bound_port().
    TcpTransport(std::string bind_address, int port, const ReconnectPolicy& policy);
    ~TcpTransport() override;

    std::string describe() const override;
    int bound_port() const { return bound_port_; }

protected:
    void open_endpoint() override;
    int acquire_channel(std::chrono::milliseconds wait) override;
    void close_endpoint() override;
    int auxiliary_fd() const override;
    int on_auxiliary_ready() override;
    ssize_t write_some(int fd, const char* data, std::size_t size) override;

private:
    int accept_client();

    std::string bind_address_;
    int port_{0};
    int listen_fd_{-1};
    int bound_port_{0};
    bool accept_failed_{false}; // last accept() error was not transient; read loop only
    std::chrono::steady_clock::time_point accept_paused_until_{};
};

} // namespace evsemu
