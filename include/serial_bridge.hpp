// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "emulator_core.hpp"
#include "serial_transport.hpp"

#include <atomic>
#include <memory>
#include <thread>

namespace evsemu {

/// \brief Joins a transport to the core: one thread answers RAPI commands, another pushes
/// `$AT` notifications. `$AB` goes out each time a client channel comes up.
class SerialBridge {
public:
    SerialBridge(EmulatorCore& core, std::unique_ptr<SerialTransport> transport);
    ~SerialBridge();

    SerialBridge(const SerialBridge&) = delete;
    SerialBridge& operator=(const SerialBridge&) = delete;

    /// \brief Open the transport and start the worker threads. Throws if the transport cannot open.
    void start();
    void stop();

    /// \brief False once stopped or after the transport gave up reconnecting.
    bool running() const { return running_; }
    SerialTransport& transport() { return *transport_; }

private:
    void reader_loop();
    void notifier_loop();

    EmulatorCore& core_;
    std::unique_ptr<SerialTransport> transport_;
    std::shared_ptr<TransitionSubscription> subscription_;
    std::atomic<bool> running_{false};
    std::thread reader_thread_;
    std::thread notifier_thread_;
};

} // namespace evsemu
