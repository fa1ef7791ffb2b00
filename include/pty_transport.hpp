// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "serial_transport.hpp"

#include <atomic>
#include <filesystem>
#include <mutex>
#include <string>

namespace evsemu {

namespace fs = std::filesystem;

/// \brief Pseudo-terminal backend. Clients open the slave side, optionally through a stable symlink
/// that this transport owns: stale links are replaced on open and removed on shutdown.
class PtyTransport : public SerialTransport {
public:
    PtyTransport(fs::path link_path, int baudrate, const ReconnectPolicy& policy);
    ~PtyTransport() override;

    std::string describe() const override;
    std::string slave_name() const;
    const fs::path& link_path() const { return link_path_; }

protected:
    void open_endpoint() override;
    int acquire_channel(std::chrono::milliseconds wait) override;
    void release_channel(int fd) override;
    void close_endpoint() override;
    void before_write(int fd) override;
    void on_channel_data() override;

private:
    int allocate();
    bool publish_link(const std::string& target);
    void remove_link();

    fs::path link_path_;
    int baudrate_{115200};
    int slave_fd_{-1};
    std::atomic<bool> client_seen_{false}; // client has written since the PTY was allocated
    mutable std::mutex name_mutex_;
    std::string slave_name_;
};

} // namespace evsemu
