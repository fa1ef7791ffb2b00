// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <string>

namespace evsemu {

/// \brief Reassembles RAPI lines from arbitrary read chunks. CR, LF and CRLF all terminate a line.
class LineFramer {
public:
    static constexpr std::size_t kDefaultMaxLine = 512;

    explicit LineFramer(std::size_t max_line = kDefaultMaxLine);

    /// \brief Returns false if an over-long line had to be discarded.
    bool feed(const char* data, std::size_t size);
    std::optional<std::string> next_line();
    void reset();

    std::size_t buffered_lines() const { return lines_.size(); }

private:
    std::string partial_;
    std::deque<std::string> lines_;
    std::size_t max_line_;
    bool discarding_{false};
};

} // namespace evsemu
