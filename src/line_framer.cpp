// SPDX-License-Identifier: Apache-2.0
#include "line_framer.hpp"

#include <utility>

namespace evsemu {

LineFramer::LineFramer(std::size_t max_line) : max_line_(max_line == 0 ? kDefaultMaxLine : max_line) {
}

bool LineFramer::feed(const char* data, std::size_t size) {
    bool ok = true;
    for (std::size_t i = 0; i < size; ++i) {
        const char c = data[i];
        if (c == '\r' || c == '\n') {
            if (!discarding_ && !partial_.empty()) {
                lines_.push_back(partial_);
            }
            partial_.clear();
            discarding_ = false;
            continue;
        }
        if (discarding_) {
            continue;
        }
        partial_.push_back(c);
        if (partial_.size() > max_line_) {
            // Drop everything up to the next terminator.
            partial_.clear();
            discarding_ = true;
            ok = false;
        }
    }
    return ok;
}

std::optional<std::string> LineFramer::next_line() {
    if (lines_.empty()) {
        return std::nullopt;
    }
    auto line = std::move(lines_.front());
    lines_.pop_front();
    return line;
}

void LineFramer::reset() {
    partial_.clear();
    lines_.clear();
    discarding_ = false;
}

} // namespace evsemu
