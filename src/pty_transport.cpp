// SPDX-License-Identifier: Apache-2.0
#include "pty_transport.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <termios.h>
#include <unistd.h>

#include <everest/logging.hpp>

namespace evsemu {

namespace {
speed_t to_speed(int baudrate) {
    switch (baudrate) {
    case 9600:
        return B9600;
    case 19200:
        return B19200;
    case 38400:
        return B38400;
    case 57600:
        return B57600;
    case 230400:
        return B230400;
    default:
        return B115200;
    }
}
} // namespace

PtyTransport::PtyTransport(fs::path link_path, int baudrate, const ReconnectPolicy& policy) :
    SerialTransport(policy), link_path_(std::move(link_path)), baudrate_(baudrate) {
}

PtyTransport::~PtyTransport() {
    teardown();
}

std::string PtyTransport::describe() const {
    if (!link_path_.empty()) {
        return link_path_.string();
    }
    const auto name = slave_name();
    return name.empty() ? std::string("pty (unallocated)") : name;
}

std::string PtyTransport::slave_name() const {
    std::lock_guard<std::mutex> lock(name_mutex_);
    return slave_name_;
}

void PtyTransport::open_endpoint() {
    if (link_path_.empty()) {
        return;
    }
    std::error_code ec;
    if (fs::is_symlink(link_path_, ec)) {
        EVLOG_info << "Removing stale PTY link " << link_path_.string();
        fs::remove(link_path_, ec);
        if (ec) {
            throw std::runtime_error("Cannot remove stale PTY link " + link_path_.string() + ": " + ec.message());
        }
    } else if (fs::exists(link_path_, ec)) {
        throw std::runtime_error("PTY path " + link_path_.string() + " exists and is not a symlink");
    }
}

int PtyTransport::allocate() {
    const int master = ::posix_openpt(O_RDWR | O_NOCTTY | O_CLOEXEC);
    if (master < 0) {
        EVLOG_error << "posix_openpt failed: " << std::strerror(errno);
        return -1;
    }
    char name[128] = {0};
    if (::grantpt(master) != 0 || ::unlockpt(master) != 0 || ::ptsname_r(master, name, sizeof(name)) != 0) {
        EVLOG_error << "Failed to prepare PTY: " << std::strerror(errno);
        ::close(master);
        return -1;
    }

    // Holding the slave open keeps the master readable when the client closes its side.
    const int slave = ::open(name, O_RDWR | O_NOCTTY | O_CLOEXEC);
    if (slave < 0) {
        EVLOG_error << "Failed to open PTY slave " << name << ": " << std::strerror(errno);
        ::close(master);
        return -1;
    }
    termios tio{};
    if (::tcgetattr(slave, &tio) == 0) {
        ::cfmakeraw(&tio);
        ::cfsetispeed(&tio, to_speed(baudrate_));
        ::cfsetospeed(&tio, to_speed(baudrate_));
        if (::tcsetattr(slave, TCSANOW, &tio) != 0) {
            EVLOG_warning << "Failed to set raw mode on " << name << ": " << std::strerror(errno);
        }
    }

    if (!link_path_.empty() && !publish_link(name)) {
        ::close(slave);
        ::close(master);
        return -1;
    }

    slave_fd_ = slave;
    client_seen_ = false;
    {
        std::lock_guard<std::mutex> lock(name_mutex_);
        slave_name_ = name;
    }
    EVLOG_info << "PTY allocated at " << name
               << (link_path_.empty() ? std::string() : " (linked from " + link_path_.string() + ")");
    return master;
}

bool PtyTransport::publish_link(const std::string& target) {
    std::error_code ec;
    if (fs::is_symlink(link_path_, ec)) {
        fs::remove(link_path_, ec);
    }
    fs::create_symlink(target, link_path_, ec);
    if (ec) {
        EVLOG_error << "Failed to link " << link_path_.string() << " -> " << target << ": " << ec.message();
        return false;
    }
    return true;
}

void PtyTransport::remove_link() {
    if (link_path_.empty()) {
        return;
    }
    std::error_code ec;
    if (fs::is_symlink(link_path_, ec)) {
        fs::remove(link_path_, ec);
        if (ec) {
            EVLOG_warning << "Failed to remove PTY link " << link_path_.string() << ": " << ec.message();
        }
    }
}

int PtyTransport::acquire_channel(std::chrono::milliseconds wait) {
    const int master = allocate();
    if (master >= 0) {
        return master;
    }
    wait_interruptible(wait.count() < 0 ? std::chrono::milliseconds(1000) : wait);
    return -1;
}

void PtyTransport::before_write(int /*fd*/) {
    if (client_seen_ || slave_fd_ < 0) {
        return;
    }
    // Until a client talks, unread output only piles up on the slave side. Keep just the newest message.
    if (::tcflush(slave_fd_, TCIFLUSH) != 0) {
        EVLOG_warning << "Failed to discard unread output on " << describe() << ": " << std::strerror(errno);
    }
}

void PtyTransport::on_channel_data() {
    client_seen_ = true;
}

void PtyTransport::release_channel(int fd) {
    ::close(fd);
    if (slave_fd_ >= 0) {
        ::close(slave_fd_);
        slave_fd_ = -1;
    }
    remove_link();
    std::lock_guard<std::mutex> lock(name_mutex_);
    slave_name_.clear();
}

void PtyTransport::close_endpoint() {
    remove_link();
}

} // namespace evsemu
