// SPDX-License-Identifier: Apache-2.0
#include "serial_bridge.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

#include <everest/logging.hpp>

namespace evsemu {

namespace {
constexpr auto kNotifierPoll = std::chrono::milliseconds(200);
}

SerialBridge::SerialBridge(EmulatorCore& core, std::unique_ptr<SerialTransport> transport) :
    core_(core), transport_(std::move(transport)) {
    if (!transport_) {
        throw std::invalid_argument("SerialBridge requires a transport");
    }
}

SerialBridge::~SerialBridge() {
    stop();
}

void SerialBridge::start() {
    if (running_) {
        return;
    }
    subscription_ = core_.subscribe_to_transitions();
    transport_->set_channel_callback([this]() {
        if (!transport_->write(core_.boot_notification())) {
            EVLOG_warning << "Failed to send boot notification on " << transport_->describe();
        }
    });
    transport_->open();
    running_ = true;
    reader_thread_ = std::thread([this]() { reader_loop(); });
    notifier_thread_ = std::thread([this]() { notifier_loop(); });
}

void SerialBridge::stop() {
    running_ = false;
    transport_->close();
    if (subscription_) {
        subscription_->close();
    }
    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }
    if (notifier_thread_.joinable()) {
        notifier_thread_.join();
    }
    if (subscription_) {
        transport_->shutdown();
    }
}

void SerialBridge::reader_loop() {
    while (running_) {
        auto result = transport_->read_line();
        if (result.status == TransportStatus::GaveUp) {
            EVLOG_error << "Serial transport " << transport_->describe()
                        << " gave up reconnecting; RAPI bridge stopped, emulator keeps running";
            running_ = false;
            if (subscription_) {
                subscription_->close();
            }
            break;
        }
        if (result.status == TransportStatus::Closed) {
            break;
        }
        EVLOG_debug << "RAPI <- " << result.line;
        const auto response = core_.execute(result.line);
        EVLOG_debug << "RAPI -> " << response.substr(0, response.size() - 1);
        if (!transport_->write(response)) {
            EVLOG_debug << "Response dropped, no client on " << transport_->describe();
        }
    }
}

void SerialBridge::notifier_loop() {
    while (running_) {
        const auto event = subscription_->next(kNotifierPoll);
        if (!event) {
            if (subscription_->closed()) {
                break;
            }
            continue;
        }
        if (event->kind != TransitionEvent::Kind::StateChanged) {
            continue;
        }
        if (!transport_->has_channel()) {
            continue;
        }
        if (!transport_->write(make_state_notification(*event))) {
            EVLOG_debug << "State notification dropped on " << transport_->describe();
        }
    }
}

} // namespace evsemu
