// SPDX-License-Identifier: Apache-2.0
#include "line_framer.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace evsemu;

static bool feed(LineFramer& framer, const std::string& chunk) {
    return framer.feed(chunk.data(), chunk.size());
}

int main() {
    LineFramer framer;
    assert(!framer.next_line().has_value());

    // Split across reads
    assert(feed(framer, "$G"));
    assert(framer.buffered_lines() == 0);
    assert(feed(framer, "S\r"));
    assert(framer.next_line() == std::string("$GS"));

    // CR, LF and CRLF all terminate; blank lines vanish.
    assert(feed(framer, "$GC\r\n$GV\n\r\r$GE\r"));
    assert(framer.buffered_lines() == 3);
    assert(framer.next_line() == std::string("$GC"));
    assert(framer.next_line() == std::string("$GV"));
    assert(framer.next_line() == std::string("$GE"));
    assert(!framer.next_line().has_value());

    // An over-long line is dropped up to its terminator; the next line survives.
    LineFramer small(8);
    assert(!feed(small, "$FP 0 0 way too long"));
    assert(feed(small, " still the same line\r$GS\r"));
    assert(small.buffered_lines() == 1);
    assert(small.next_line() == std::string("$GS"));

    // Exactly at the limit is fine.
    assert(feed(small, "12345678\r"));
    assert(small.next_line() == std::string("12345678"));

    // Reset discards partial input and queued lines.
    assert(feed(framer, "$GC\r$G"));
    framer.reset();
    assert(!framer.next_line().has_value());
    assert(feed(framer, "S\r"));
    assert(framer.next_line() == std::string("S"));

    std::cout << "line_framer_tests passed\n";
    return 0;
}
